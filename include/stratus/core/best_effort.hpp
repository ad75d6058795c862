/**
 * @file best_effort.hpp
 * @brief Non-propagating "try and log" operation
 *
 * Cleanup steps (object deletion, command cancellation) must never mask the
 * real result of the call they follow. Routing them through BestEffort marks
 * each such call site explicitly.
 *
 * @date 2025
 */

#pragma once

#include <functional>
#include <string>

namespace stratus {
namespace core {

/**
 * @brief Run action; log and absorb any std::exception it throws
 *
 * @param description What the action does, for the warning message
 * @param action Work to attempt
 * @return true if the action completed without throwing
 */
bool BestEffort(const std::string& description, const std::function<void()>& action);

} // namespace core
} // namespace stratus
