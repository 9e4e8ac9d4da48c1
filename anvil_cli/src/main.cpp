#include <algorithm>
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libanvil/include/anvil.hpp"
#include "../../libanvil/include/errors.hpp"
#include "../../libanvil/include/file_utils.hpp"
#include "../../libanvil/include/logger.hpp"

// simple progress bar printer
inline void print_progress_bar(const std::string& phase, const double percent) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);
    const double progress = std::clamp(percent / 100.0, 0.0, 1.0);
    const auto pos = static_cast<unsigned>(bar_width * progress);

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && progress < 1.0) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << progress * 100.0 << "% "
              << std::left << std::setw(12) << phase << std::right
              << std::flush;
}

using namespace anvil;

static std::atomic<bool> interrupted{false};
static Anvil* g_anvil = nullptr;

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        std::cerr << CYAN
                  << "\n[INTERRUPT] Stop detected. Waiting for running encodes to finish..."
                  << RESET << std::endl;
        if (g_anvil) {
            g_anvil->stop();
        }
        interrupted.store(true);
    }
}

// forwards library events to the console
class ConsoleObserver final : public AnvilObserver {
public:
    explicit ConsoleObserver(const bool quiet) : quiet_(quiet) {}

    void onProgress(const std::string& phase, const double percent, const std::string&) override {
        if (!quiet_) print_progress_bar(phase, percent);
    }

    void onComplete(const uintmax_t size_before, const uintmax_t size_after, const bool fallback) override {
        if (quiet_) return;
        std::cerr << (size_after < size_before ? GREEN : YELLOW)
                  << "\n[DONE] " << size_before << " -> " << size_after << " bytes"
                  << (fallback ? " [fallback]" : "")
                  << RESET << std::endl;
    }

    void onError(const std::string& error) override {
        std::cerr << RED << "\n[FAIL] " << error << RESET << std::endl;
    }

private:
    bool quiet_;
};

int main(int argc, char* argv[]) {

    CLI::App app{"anvil: quality-guided animated GIF to WebP converter."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::clear_sinks();
    // set file logger
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << YELLOW << "Warning: cannot open log file " << settings.log_file.string() << RESET << std::endl;
        } else {
            Logger::add_sink(std::move(fileSink));
        }
    }

    // set console logger, NONE disables it
    if (const auto level = Logger::string_to_level(settings.log_level)) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = settings.quiet ? LogLevel::Error : *level;
        Logger::add_sink(std::move(consoleSink));
    }

    ConsoleObserver observer(settings.quiet);
    Anvil anvil;
    anvil.losslessPreferred(settings.lossless_preferred())
         .frameDedup(!settings.no_dedup)
         .threads(settings.num_threads);
    anvil.setObserver(&observer);

    const auto output = settings.resolved_output();
    int exit_code = 0;
    g_anvil = &anvil;
    try {
        const OptimizationResult result = anvil.optimize(settings.input);

        if (!settings.dry_run) {
            write_file(output, result.buffer);
            Logger::log(LogLevel::Info, "Wrote " + output.string(), "main");
        }
        if (!settings.quiet) {
            print_console_report(result, settings.input, output, settings.num_threads, settings.dry_run);
        }
        if (!settings.report_path.empty() && !export_csv_report(result, settings.input, settings.report_path)) {
            exit_code = 1;
        }
    } catch (const OptimizationCancelled&) {
        exit_code = 130; // standard exit code for SIGINT
    } catch (const InputError& e) {
        Logger::log(LogLevel::Error, settings.input.filename().string() + " " + e.what(), "main");
        exit_code = 2;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, settings.input.filename().string() + " " + e.what(), "main");
        exit_code = 1;
    }
    g_anvil = nullptr;

    if (interrupted.load()) {
        return 130;
    }
    return exit_code;
}
