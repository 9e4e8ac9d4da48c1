#ifndef ANVIL_FILE_UTILS_HPP
#define ANVIL_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace anvil {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::vector<uint8_t> read_file(const std::filesystem::path &path);

    /**
     * @brief Writes a buffer to a file, replacing any previous content.
     *
     * The data is written to a sibling temporary file first and renamed
     * over the target, so a failed write never leaves a truncated output.
     *
     * @throws std::runtime_error if the file cannot be written.
     */
    void write_file(const std::filesystem::path &path, std::span<const uint8_t> data);

} // namespace anvil

#endif // ANVIL_FILE_UTILS_HPP
