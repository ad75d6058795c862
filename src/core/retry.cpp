/**
 * @file retry.cpp
 * @brief Default sleeper
 *
 * @date 2025
 */

#include "stratus/core/retry.hpp"

#include <thread>

namespace stratus {
namespace core {

Sleeper ThreadSleeper() {
    return [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

} // namespace core
} // namespace stratus
