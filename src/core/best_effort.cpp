/**
 * @file best_effort.cpp
 * @brief Implementation of the try-and-log operation
 *
 * @date 2025
 */

#include "stratus/core/best_effort.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace stratus {
namespace core {

bool BestEffort(const std::string& description, const std::function<void()>& action) {
    try {
        action();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to {}: {}", description, e.what());
        return false;
    }
}

} // namespace core
} // namespace stratus
