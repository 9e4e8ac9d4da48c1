#ifndef ANVIL_REPORT_GENERATOR_HPP
#define ANVIL_REPORT_GENERATOR_HPP

#include "../../../libanvil/include/optimizer.hpp"
#include <filesystem>
#include <string>

/**
 * @brief Prints the run summary and the candidate table to stderr.
 */
void print_console_report(const anvil::OptimizationResult& result,
                          const std::filesystem::path& input,
                          const std::filesystem::path& output,
                          unsigned num_threads,
                          bool dry_run);

/**
 * @brief Writes one CSV row per candidate, followed by a summary block.
 * @return false if the report file cannot be written.
 */
bool export_csv_report(const anvil::OptimizationResult& result,
                       const std::filesystem::path& input,
                       const std::filesystem::path& output_path);

unsigned get_terminal_width();

#endif // ANVIL_REPORT_GENERATOR_HPP
