#ifndef ANVIL_CLI_PARSER_HPP
#define ANVIL_CLI_PARSER_HPP

#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool lossless = false;
    bool size = false;
    bool no_dedup = false;
    bool dry_run = false;
    bool quiet = false;

    unsigned num_threads = 1;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path report_path;

    std::filesystem::path input;

    /// Quality-preserving search unless --size was given.
    [[nodiscard]] bool lossless_preferred() const { return !size; }

    /// -o if given, otherwise the input path with a .webp extension.
    [[nodiscard]] std::filesystem::path resolved_output() const {
        if (!output_path.empty()) return output_path;
        auto out = input;
        out.replace_extension(".webp");
        return out;
    }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // ANVIL_CLI_PARSER_HPP
