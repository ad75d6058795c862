/**
 * @file key_generator.hpp
 * @brief Unique per-invocation object-store key prefixes
 *
 * The bucket is shared by every invocation of every sample; isolation rests
 * entirely on prefix uniqueness. A prefix combines a microsecond timestamp
 * with eight random alphanumerics:
 *
 * ```
 * {config_prefix}{operation}/2025-06-01T12:00:00.123456-a8Xk2LpQ/
 * ```
 *
 * @date 2025
 */

#pragma once

#include "stratus/core/invocation.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>

namespace stratus {
namespace core {

/// Source of wall-clock time for timestamps
using WallClock = std::function<std::chrono::system_clock::time_point()>;

/**
 * @class KeyGenerator
 * @brief Thread-safe prefix generator owned by one environment
 */
class KeyGenerator {
public:
    /// Random seed, system clock
    explicit KeyGenerator(std::string base_prefix);

    /// Deterministic suffix sequence and injected clock
    KeyGenerator(std::string base_prefix, std::uint32_t seed, WallClock clock);

    KeyGenerator(const KeyGenerator&) = delete;
    KeyGenerator& operator=(const KeyGenerator&) = delete;

    /**
     * @brief Fresh prefix for one invocation
     * @return `{base}{operation}/{iso8601}-{8 alnum}/`
     */
    std::string Prefix(Operation operation);

    /// Local time as `YYYY-MM-DDTHH:MM:SS.ffffff`
    static std::string FormatTimestamp(std::chrono::system_clock::time_point time);

private:
    std::string RandomSuffix();

    std::string base_prefix_;
    WallClock clock_;
    std::mutex mutex_;
    std::mt19937 engine_;
};

} // namespace core
} // namespace stratus
