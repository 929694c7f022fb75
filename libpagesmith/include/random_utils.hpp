#ifndef PAGESMITH_RANDOM_UTILS_HPP
#define PAGESMITH_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers for unique temporary names.
 */
namespace RandomUtils {

    /// @return A random 64-bit unsigned integer.
    unsigned long long next_u64();

    /**
     * @brief Random suffix for temporary file names.
     * @return 16 lowercase hex digits.
     */
    std::string random_suffix();

} // namespace RandomUtils

#endif // PAGESMITH_RANDOM_UTILS_HPP
