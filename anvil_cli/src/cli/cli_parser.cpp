#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <thread>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    auto* lossless = app.add_flag("--lossless", settings.lossless,
                                  "Quality-preserving search: lossless and near-lossless first (default).");

    auto* size = app.add_flag("--size", settings.size,
                              "Size-preserving search: lossy configurations only.");
    lossless->excludes(size);

    app.add_flag("--no-dedup", settings.no_dedup,
                 "Skip the perceptual-hash frame deduplication analysis.");

    app.add_flag("--dry-run", settings.dry_run,
                 "Run the search and print the result without writing the WebP.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, summary).");

    app.add_option("-o,--output", settings.output_path,
                   "Write the WebP to PATH (default: input name with a .webp extension).");

    app.add_option("--report", settings.report_path,
                   "CSV report of every evaluated candidate.")
                   ->take_last(); // if used multiple times, take the last one

    // calculate default thread count
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("--threads", settings.num_threads,
                   "Threads to use for candidate encoding and evaluation.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("input", settings.input, "Animated GIF to convert.")
        ->required()
        ->check(CLI::ExistingFile);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.dry_run && !settings.output_path.empty()) {
            throw CLI::ValidationError("--dry-run and -o, --output cannot be used together.");
        }
        if (!settings.output_path.empty() && std::filesystem::is_directory(settings.output_path)) {
            throw CLI::ValidationError("Output path ('-o') must be a file, not a directory.");
        }
        if (!settings.output_path.empty() &&
            std::filesystem::weakly_canonical(settings.output_path) == std::filesystem::weakly_canonical(settings.input)) {
            throw CLI::ValidationError("Output path ('-o') must differ from the input.");
        }
    });
}
