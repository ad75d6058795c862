/**
 * @file command_dispatcher.cpp
 * @brief Implementation of CompletionWaiter and CommandDispatcher
 *
 * @date 2025
 */

#include "stratus/core/command_dispatcher.hpp"
#include "stratus/core/best_effort.hpp"
#include "stratus/core/errors.hpp"
#include "stratus/core/remote_diagnostics.hpp"
#include "stratus/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace stratus {
namespace core {

using services::CommandState;
using utils::StringUtils;

std::string InvocationPhaseToString(InvocationPhase phase) {
    switch (phase) {
        case InvocationPhase::SUBMITTED: return "submitted";
        case InvocationPhase::POLLING: return "polling";
        case InvocationPhase::SUCCEEDED: return "succeeded";
        case InvocationPhase::FAILED: return "failed";
        case InvocationPhase::TIMED_OUT: return "timed out";
        default: return "unknown";
    }
}

// ============================================================================
// COMPLETION WAITER
// ============================================================================

CompletionWaiter::CompletionWaiter(std::shared_ptr<services::CommandRelay> relay, Sleeper sleeper)
    : relay_(std::move(relay))
    , sleeper_(std::move(sleeper)) {
}

RetryPolicy CompletionWaiter::PolicyFor(std::chrono::seconds timeout) {
    RetryPolicy policy;
    policy.max_attempts = timeout.count() > 0 ? static_cast<int>(timeout.count()) : 1;
    policy.delay = std::chrono::seconds(1);
    policy.deadline = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
    return policy;
}

Completion CompletionWaiter::Wait(const Invocation& invocation) const {
    Completion completion;

    auto poll = PollUntil(PolicyFor(invocation.timeout), sleeper_, [&] {
        completion.status = relay_->GetInvocationStatus(invocation.command_id,
                                                        invocation.instance_id);
        return services::IsTerminal(completion.status.state);
    });
    completion.attempts = poll.attempts;

    if (!poll.satisfied) {
        completion.phase = InvocationPhase::TIMED_OUT;
    } else if (completion.status.state == CommandState::SUCCESS) {
        completion.phase = InvocationPhase::SUCCEEDED;
    } else {
        completion.phase = InvocationPhase::FAILED;
    }

    spdlog::debug("Command {} {} after {} polls (status {})",
                  invocation.command_id, InvocationPhaseToString(completion.phase),
                  completion.attempts, services::CommandStateToString(completion.status.state));
    return completion;
}

// ============================================================================
// COMMAND DISPATCHER
// ============================================================================

CommandDispatcher::CommandDispatcher(std::string instance_id,
                                     std::string bucket,
                                     const services::ServiceClients& clients,
                                     std::shared_ptr<KeyGenerator> keys,
                                     Sleeper sleeper)
    : instance_id_(std::move(instance_id))
    , bucket_(std::move(bucket))
    , relay_(clients.relay)
    , keys_(std::move(keys))
    , waiter_(clients.relay, std::move(sleeper))
    , retriever_(clients.object_store, bucket_)
    , janitor_(clients.object_store, bucket_) {
}

std::vector<std::string> CommandDispatcher::BuildExecScript(
    const std::vector<std::string>& cmd,
    const std::map<std::string, std::string>& env,
    const std::optional<std::string>& cwd) {

    std::vector<std::string> lines;
    for (const auto& [key, value] : env) {
        lines.push_back("export " + StringUtils::ShellQuote(key) + "=" + StringUtils::ShellQuote(value));
    }
    if (cwd) {
        lines.push_back("cd " + StringUtils::ShellQuote(*cwd));
    }
    lines.push_back(StringUtils::ShellJoin(cmd));
    return lines;
}

ExecOutcome CommandDispatcher::RunScript(Operation operation,
                                         const std::vector<std::string>& script_lines,
                                         std::chrono::seconds timeout) {
    Invocation invocation;
    invocation.instance_id = instance_id_;
    invocation.key_prefix = keys_->Prefix(operation);
    invocation.timeout = timeout;

    services::CommandRequest request;
    request.instance_id = instance_id_;
    request.script_lines = script_lines;
    request.execution_timeout = timeout;
    request.output_bucket = bucket_;
    request.output_key_prefix = invocation.key_prefix;

    invocation.command_id = relay_->SendCommand(request);
    invocation.stdout_key = relay_->OutputKey(invocation.key_prefix, invocation.command_id,
                                              instance_id_, "stdout");
    invocation.stderr_key = relay_->OutputKey(invocation.key_prefix, invocation.command_id,
                                              instance_id_, "stderr");
    spdlog::debug("Submitted {} command {} to {} (output under {})",
                  OperationToString(operation), invocation.command_id,
                  instance_id_, invocation.key_prefix);

    Completion completion;
    RetrievedObject out;
    RetrievedObject err;
    try {
        completion = waiter_.Wait(invocation);

        if (completion.phase == InvocationPhase::TIMED_OUT) {
            spdlog::warn("Command {} is still running, cancelling it", invocation.command_id);
            BestEffort("cancel command " + invocation.command_id, [&] {
                relay_->CancelCommand(invocation.command_id, {instance_id_});
            });
            throw ExecutionTimeout(invocation.command_id);
        }

        out = retriever_.ReadOrBlank(invocation.stdout_key, kMaxExecOutputSize);
        err = retriever_.ReadOrBlank(invocation.stderr_key, kMaxExecOutputSize);
    } catch (const std::exception&) {
        janitor_.DeleteInvocationArtifacts(invocation);
        throw;
    }
    janitor_.DeleteInvocationArtifacts(invocation);

    const bool succeeded = completion.phase == InvocationPhase::SUCCEEDED;
    ExecOutcome outcome;
    outcome.returncode = completion.status.response_code.value_or(succeeded ? 0 : 1);
    outcome.success = outcome.returncode == 0;
    outcome.stdout_output = std::move(out.content);
    outcome.stderr_output = std::move(err.content);

    if (!succeeded &&
        ClassifyExecFailure(outcome.stderr_output) == RemoteFailure::PERMISSION_DENIED) {
        throw PermissionDenied(outcome.stderr_output);
    }

    if (out.truncated) {
        throw OutputTruncated(kMaxExecOutputSizeStr, outcome.stdout_output);
    }
    if (err.truncated) {
        throw OutputTruncated(kMaxExecOutputSizeStr, outcome.stderr_output);
    }

    spdlog::debug("Command {} exited with {}", invocation.command_id, outcome.returncode);
    return outcome;
}

} // namespace core
} // namespace stratus
