/**
 * @file command_relay.cpp
 * @brief Relay status vocabulary and output key layout
 *
 * @date 2025
 */

#include "stratus/services/command_relay.hpp"

namespace stratus {
namespace services {

CommandState ParseCommandState(const std::string& status) {
    if (status == "Pending") return CommandState::PENDING;
    if (status == "InProgress") return CommandState::IN_PROGRESS;
    if (status == "Delayed") return CommandState::DELAYED;
    if (status == "Success") return CommandState::SUCCESS;
    if (status == "Cancelled") return CommandState::CANCELLED;
    if (status == "Cancelling") return CommandState::CANCELLING;
    if (status == "TimedOut") return CommandState::TIMED_OUT;
    if (status == "Failed") return CommandState::FAILED;
    // Unknown spellings keep the waiter polling
    return CommandState::PENDING;
}

std::string CommandStateToString(CommandState state) {
    switch (state) {
        case CommandState::PENDING: return "Pending";
        case CommandState::IN_PROGRESS: return "InProgress";
        case CommandState::DELAYED: return "Delayed";
        case CommandState::SUCCESS: return "Success";
        case CommandState::CANCELLED: return "Cancelled";
        case CommandState::CANCELLING: return "Cancelling";
        case CommandState::TIMED_OUT: return "TimedOut";
        case CommandState::FAILED: return "Failed";
        default: return "Unknown";
    }
}

bool IsTerminal(CommandState state) {
    switch (state) {
        case CommandState::SUCCESS:
        case CommandState::CANCELLED:
        case CommandState::CANCELLING:
        case CommandState::TIMED_OUT:
        case CommandState::FAILED:
            return true;
        default:
            return false;
    }
}

std::string CommandRelay::OutputKey(const std::string& key_prefix,
                                    const std::string& command_id,
                                    const std::string& instance_id,
                                    const std::string& stream) const {
    return key_prefix + command_id + "/" + instance_id +
           "/awsrunShellScript/0.awsrunShellScript/" + stream;
}

} // namespace services
} // namespace stratus
