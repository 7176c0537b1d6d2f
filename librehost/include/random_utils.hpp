#ifndef REHOST_RANDOM_UTILS_HPP
#define REHOST_RANDOM_UTILS_HPP

#include <string>

/**
 * @brief Thread-local random helpers for temporary object names.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief 16 lowercase hex digits, suitable as a temp-file suffix.
     */
    std::string random_suffix();

} // namespace RandomUtils

#endif // REHOST_RANDOM_UTILS_HPP
