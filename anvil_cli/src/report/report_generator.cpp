#include "report_generator.hpp"
#include "../../../libanvil/include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

using namespace anvil;

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string fixed(const double v, const int precision = 2) {
    if (std::isinf(v)) return "inf";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

static std::string outcome_of(const CandidateEvaluation& e, const OptimizationResult& r) {
    if (e.index == r.winner_index) return r.fallback ? "WINNER (fallback)" : "WINNER";
    if (!e.evaluated()) return "EXCLUDED";
    return e.qualified ? "qualified" : "below threshold";
}

void print_console_report(const OptimizationResult& result,
                          const std::filesystem::path& input,
                          const std::filesystem::path& output,
                          const unsigned num_threads,
                          const bool dry_run) {
    const bool use_colors = is_stderr_a_tty();
    const unsigned term_width = get_terminal_width();
    const auto& meta = result.metadata;
    const auto& stats = result.stats;

    std::cerr << "\n" << input.filename().string() << ": "
              << meta.width << "x" << meta.height << ", "
              << meta.frame_count << " frames @ " << fixed(meta.fps, 1) << " fps"
              << (meta.has_alpha ? ", alpha" : "")
              << (meta.palette_size > 0 ? ", " + std::to_string(meta.palette_size) + " colors" : "")
              << "\n";
    if (result.dedup) {
        std::cerr << "Frames: " << result.dedup->unique_frames << " unique of " << result.dedup->total_frames
                  << " (" << result.dedup->duplicate_frames << " duplicates)\n";
    }

    // candidate table
    constexpr int w_idx = 4, w_strategy = 16, w_size = 11, w_ssim = 8, w_psnr = 8, w_de = 7, w_edge = 7, w_score = 7;
    const unsigned fixed_cols = w_idx + w_strategy + w_size + w_ssim + w_psnr + w_de + w_edge + w_score;
    const unsigned result_col = term_width > fixed_cols + 10 ? term_width - fixed_cols : 18;

    std::cerr << "\n"
              << std::left << std::setw(w_idx) << "#"
              << std::setw(w_strategy) << "Strategy"
              << std::setw(w_size) << "Size(KB)"
              << std::setw(w_ssim) << "SSIM"
              << std::setw(w_psnr) << "PSNR"
              << std::setw(w_de) << "dE"
              << std::setw(w_edge) << "Edge"
              << std::setw(w_score) << "Score"
              << std::setw(static_cast<int>(result_col)) << "Result"
              << "\n";

    auto sorted = result.evaluations;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) { return a.index < b.index; });
    for (const auto& e : sorted) {
        const std::string outcome = outcome_of(e, result);
        const char* color = e.index == result.winner_index ? "\033[1;32m"
                          : !e.evaluated()                 ? "\033[1;31m"
                          : e.qualified                    ? ""
                                                           : "\033[1;33m";
        std::cerr << std::left << std::setw(w_idx) << e.index
                  << std::setw(w_strategy) << to_string(e.config.strategy)
                  << std::setw(w_size) << fixed(e.size_kb, 1);
        if (e.metrics) {
            std::cerr << std::setw(w_ssim) << fixed(e.metrics->ssim, 4)
                      << std::setw(w_psnr) << fixed(e.metrics->psnr, 1)
                      << std::setw(w_de) << fixed(e.metrics->delta_e, 2)
                      << std::setw(w_edge) << fixed(e.metrics->edge_preservation, 2)
                      << std::setw(w_score) << fixed(e.score, 3);
        } else {
            std::cerr << std::setw(w_ssim) << "-" << std::setw(w_psnr) << "-" << std::setw(w_de) << "-"
                      << std::setw(w_edge) << "-" << std::setw(w_score) << "-";
        }
        if (use_colors && *color) {
            std::cerr << color << outcome << "\033[0m";
        } else {
            std::cerr << outcome;
        }
        if (!e.evaluated() && !e.exclusion_reason.empty()) {
            std::cerr << ": " << e.exclusion_reason;
        }
        std::cerr << "\n";
    }

    std::cerr << "\nWinner: #" << result.winner_index << " " << result.config.describe() << "\n"
              << "Quality: SSIM " << fixed(result.metrics.ssim, 4)
              << ", PSNR " << fixed(result.metrics.psnr, 2) << " dB"
              << ", dE " << fixed(result.metrics.delta_e, 2)
              << ", edges " << fixed(result.metrics.edge_preservation, 3) << "\n"
              << "Size: " << fixed(stats.original_size_kb) << " KB -> " << fixed(stats.compressed_size_kb) << " KB ("
              << fixed(stats.savings_percent) << "% saved, ratio " << fixed(stats.compression_ratio, 3)
              << ", " << fixed(stats.bits_per_pixel, 3) << " bpp, " << to_string(stats.grade()) << ")\n";
    if (stats.is_larger_than_original) {
        std::cerr << (use_colors ? "\033[1;33m" : "") << "Warning: the WebP is larger than the GIF"
                  << (use_colors ? "\033[0m" : "") << "\n";
    }
    std::cerr << "Output: " << (dry_run ? std::string("[DRY-RUN] not written") : output.string()) << "\n"
              << "Total time: " << fixed(static_cast<double>(result.elapsed.count()) / 1000.0) << " s ("
              << result.configurations << " configurations, " << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const OptimizationResult& result,
                       const std::filesystem::path& input,
                       const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write report: " + output_path.string(), "report");
        return false;
    }

    out << "Index,Strategy,Config,FilterChain,Size(KB),SSIM,PSNR,DeltaE,EdgePreservation,Qualified,Score,Result,Error\n";

    auto sorted = result.evaluations;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) { return a.index < b.index; });
    for (const auto& e : sorted) {
        out << e.index << ","
            << csv_escape(std::string(to_string(e.config.strategy))) << ","
            << csv_escape(e.config.describe()) << ","
            << csv_escape(e.filter_chain) << ","
            << fixed(e.size_kb) << ",";
        if (e.metrics) {
            out << fixed(e.metrics->ssim, 4) << ","
                << fixed(e.metrics->psnr, 2) << ","
                << fixed(e.metrics->delta_e, 3) << ","
                << fixed(e.metrics->edge_preservation, 4) << ",";
        } else {
            out << ",,,,";
        }
        out << (e.qualified ? "yes" : "no") << ","
            << fixed(e.score, 4) << ","
            << csv_escape(outcome_of(e, result)) << ","
            << csv_escape(e.exclusion_reason) << "\n";
    }

    const auto& stats = result.stats;
    out << "\n\nFile,Frames,Width,Height,Before(KB),After(KB),Savings(%),BitsPerPixel,Grade,Fallback,Time(s)\n";
    out << csv_escape(input.filename().string()) << ","
        << result.metadata.frame_count << ","
        << result.metadata.width << ","
        << result.metadata.height << ","
        << fixed(stats.original_size_kb) << ","
        << fixed(stats.compressed_size_kb) << ","
        << fixed(stats.savings_percent) << ","
        << fixed(stats.bits_per_pixel, 4) << ","
        << to_string(stats.grade()) << ","
        << (result.fallback ? "yes" : "no") << ","
        << fixed(static_cast<double>(result.elapsed.count()) / 1000.0) << "\n";
    return static_cast<bool>(out);
}
