#ifndef ANVIL_RANDOM_UTILS_HPP
#define ANVIL_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers.
 *
 * Used to make codec scratch names unique per optimization run, so two
 * runs sharing one codec service never collide. The generator
 * (std::mt19937_64) is thread-local.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a short random hexadecimal token.
     * @param length Number of hex digits (at most 16).
     * @return Lower-case hex string, e.g. "3fa91c0e".
     */
    std::string random_suffix(std::size_t length = 8);

} // namespace RandomUtils

#endif // ANVIL_RANDOM_UTILS_HPP
