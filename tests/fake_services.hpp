/**
 * @file fake_services.hpp
 * @brief In-memory collaborators for unit tests
 *
 * The three fakes share one event log so tests can assert on call order
 * (for example that `cancel:` precedes the artifact deletes).
 *
 * @date 2025
 */

#pragma once

#include "stratus/core/errors.hpp"
#include "stratus/core/retry.hpp"
#include "stratus/core/sandbox_config.hpp"
#include "stratus/services/service_clients.hpp"
#include "stratus/utils/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stratus {
namespace fakes {

using EventLog = std::vector<std::string>;

inline bool LogContains(const EventLog& log, const std::string& event) {
    return std::find(log.begin(), log.end(), event) != log.end();
}

/// Position of the first event starting with prefix, or -1
inline long IndexOf(const EventLog& log, const std::string& prefix) {
    for (std::size_t i = 0; i < log.size(); ++i) {
        if (utils::StringUtils::StartsWith(log[i], prefix)) {
            return static_cast<long>(i);
        }
    }
    return -1;
}

// ============================================================================
// OBJECT STORE
// ============================================================================

struct PresignRecord {
    services::PresignMethod method;
    std::string bucket;
    std::string key;
    std::chrono::seconds ttl;
};

class FakeObjectStore : public services::ObjectStore {
public:
    explicit FakeObjectStore(std::shared_ptr<EventLog> log = std::make_shared<EventLog>())
        : log_(std::move(log)) {}

    void PutObject(const std::string& bucket, const std::string& key,
                   const std::string& body) override {
        log_->push_back("put:" + key);
        buckets.push_back(bucket);
        objects[key] = body;
    }

    std::string GetObject(const std::string& bucket, const std::string& key,
                          const std::optional<services::ByteRange>& range) override {
        log_->push_back("get:" + key);
        buckets.push_back(bucket);
        gets.emplace_back(key, range);
        auto it = objects.find(key);
        if (it == objects.end()) {
            throw ObjectNotFound(key);
        }
        if (!range) {
            return it->second;
        }
        return it->second.substr(range->first, range->last - range->first + 1);
    }

    std::uint64_t HeadObject(const std::string& bucket, const std::string& key) override {
        log_->push_back("head:" + key);
        buckets.push_back(bucket);
        auto it = objects.find(key);
        if (it == objects.end()) {
            throw ObjectNotFound(key);
        }
        auto reported = reported_sizes.find(key);
        if (reported != reported_sizes.end()) {
            return reported->second;
        }
        return it->second.size();
    }

    void DeleteObject(const std::string& bucket, const std::string& key) override {
        log_->push_back("delete:" + key);
        buckets.push_back(bucket);
        if (fail_deletes) {
            throw ServiceError("s3", "AccessDenied", "Access Denied");
        }
        objects.erase(key);
    }

    void DeleteObjectsByPrefix(const std::string& bucket, const std::string& prefix) override {
        log_->push_back("delete_prefix:" + prefix);
        buckets.push_back(bucket);
        if (fail_deletes) {
            throw ServiceError("s3", "AccessDenied", "Access Denied");
        }
        for (auto it = objects.begin(); it != objects.end();) {
            if (utils::StringUtils::StartsWith(it->first, prefix)) {
                it = objects.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::string PresignUrl(services::PresignMethod method, const std::string& bucket,
                           const std::string& key, std::chrono::seconds ttl) override {
        log_->push_back("presign:" + key);
        presigned.push_back(PresignRecord{method, bucket, key, ttl});
        return "https://" + bucket + ".example.test/" + key + "?signed=1";
    }

    std::map<std::string, std::string> objects;
    std::map<std::string, std::uint64_t> reported_sizes;  ///< HeadObject answers overriding the body size
    std::vector<std::pair<std::string, std::optional<services::ByteRange>>> gets;
    std::vector<PresignRecord> presigned;
    std::vector<std::string> buckets;
    bool fail_deletes{false};

private:
    std::shared_ptr<EventLog> log_;
};

// ============================================================================
// COMMAND RELAY
// ============================================================================

/**
 * @struct ScriptedCommand
 * @brief How the fake relay answers one SendCommand
 */
struct ScriptedCommand {
    /// Returned by successive status polls; the last one repeats
    std::vector<services::InvocationStatus> statuses{
        services::InvocationStatus{services::CommandState::SUCCESS, 0}};
    std::optional<std::string> stdout_output;   ///< Written as the stdout object
    std::optional<std::string> stderr_output;   ///< Written as the stderr object
    std::function<void(const services::CommandRequest&)> on_send;  ///< Simulated remote side effect
};

inline ScriptedCommand Succeeds(const std::string& out = "", const std::string& err = "") {
    ScriptedCommand command;
    if (!out.empty()) command.stdout_output = out;
    if (!err.empty()) command.stderr_output = err;
    return command;
}

inline ScriptedCommand Fails(int code, const std::string& err, const std::string& out = "") {
    ScriptedCommand command;
    command.statuses = {services::InvocationStatus{services::CommandState::FAILED, code}};
    if (!out.empty()) command.stdout_output = out;
    if (!err.empty()) command.stderr_output = err;
    return command;
}

inline ScriptedCommand NeverFinishes() {
    ScriptedCommand command;
    command.statuses = {services::InvocationStatus{services::CommandState::IN_PROGRESS, std::nullopt}};
    return command;
}

class FakeCommandRelay : public services::CommandRelay {
public:
    FakeCommandRelay(std::shared_ptr<FakeObjectStore> store, std::shared_ptr<EventLog> log)
        : store_(std::move(store))
        , log_(std::move(log)) {}

    std::string SendCommand(const services::CommandRequest& request) override {
        std::string command_id = "cmd-" + std::to_string(sent.size() + 1);
        log_->push_back("send:" + command_id);
        sent.push_back(request);

        ScriptedCommand command = script.empty() ? ScriptedCommand{} : script.front();
        if (!script.empty()) {
            script.pop_front();
        }

        if (command.stdout_output) {
            store_->objects[OutputKey(request.output_key_prefix, command_id,
                                      request.instance_id, "stdout")] = *command.stdout_output;
        }
        if (command.stderr_output) {
            store_->objects[OutputKey(request.output_key_prefix, command_id,
                                      request.instance_id, "stderr")] = *command.stderr_output;
        }
        if (command.on_send) {
            command.on_send(request);
        }

        active_[command_id] = command;
        polls_[command_id] = 0;
        return command_id;
    }

    services::InvocationStatus GetInvocationStatus(const std::string& command_id,
                                                   const std::string&) override {
        log_->push_back("status:" + command_id);
        ++status_calls;
        const auto& statuses = active_.at(command_id).statuses;
        std::size_t index = std::min(polls_[command_id]++, statuses.size() - 1);
        return statuses[index];
    }

    void CancelCommand(const std::string& command_id,
                       const std::vector<std::string>& instance_ids) override {
        log_->push_back("cancel:" + command_id);
        cancelled.push_back(command_id);
        cancelled_instances = instance_ids;
        if (fail_cancel) {
            throw ServiceError("ssm", "InvalidCommandId", "already finished");
        }
    }

    std::vector<services::AgentInfo> DescribeAgentInventory(const std::string& instance_id) override {
        ++inventory_calls;
        inventory_queries.push_back(instance_id);
        if (inventory.empty()) {
            return {};
        }
        auto next = inventory.front();
        if (inventory.size() > 1) {
            inventory.pop_front();
        }
        return next();
    }

    std::optional<std::string> GetParameter(const std::string& name) override {
        parameter_queries.push_back(name);
        auto it = parameters.find(name);
        if (it == parameters.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::deque<ScriptedCommand> script;
    std::vector<services::CommandRequest> sent;
    std::vector<std::string> cancelled;
    std::vector<std::string> cancelled_instances;
    int status_calls{0};
    bool fail_cancel{false};

    /// Successive inventory answers; the last one repeats
    std::deque<std::function<std::vector<services::AgentInfo>()>> inventory;
    int inventory_calls{0};
    std::vector<std::string> inventory_queries;

    std::map<std::string, std::string> parameters;
    std::vector<std::string> parameter_queries;

private:
    std::shared_ptr<FakeObjectStore> store_;
    std::shared_ptr<EventLog> log_;
    std::map<std::string, ScriptedCommand> active_;
    std::map<std::string, std::size_t> polls_;
};

// ============================================================================
// CONTROL PLANE
// ============================================================================

class FakeControlPlane : public services::ControlPlane {
public:
    explicit FakeControlPlane(std::shared_ptr<EventLog> log = std::make_shared<EventLog>())
        : log_(std::move(log)) {}

    std::string LaunchInstance(const services::LaunchRequest& request) override {
        log_->push_back("launch");
        launches.push_back(request);
        if (launch_error) {
            throw *launch_error;
        }
        return next_instance_id;
    }

    void WaitUntilRunning(const std::string& instance_id) override {
        log_->push_back("wait_running:" + instance_id);
        if (wait_error) {
            throw *wait_error;
        }
    }

    void TerminateInstances(const std::vector<std::string>& instance_ids) override {
        log_->push_back("terminate");
        terminated.push_back(instance_ids);
        for (const auto& id : instance_ids) {
            if (std::find(fail_terminate.begin(), fail_terminate.end(), id) != fail_terminate.end()) {
                throw ServiceError("ec2", "UnauthorizedOperation", "cannot terminate " + id);
            }
        }
    }

    std::vector<services::InstanceSummary> DescribeInstances(
        const std::vector<utils::ResourceFilter>& filters) override {
        describe_filters = filters;
        return instances;
    }

    std::string next_instance_id{"i-0123456789abcdef0"};
    std::optional<ServiceError> launch_error;
    std::optional<ServiceError> wait_error;
    std::vector<services::LaunchRequest> launches;
    std::vector<std::vector<std::string>> terminated;
    std::vector<std::string> fail_terminate;   ///< Ids whose termination throws
    std::vector<services::InstanceSummary> instances;
    std::vector<utils::ResourceFilter> describe_filters;

private:
    std::shared_ptr<EventLog> log_;
};

// ============================================================================
// HELPERS
// ============================================================================

/// Complete, valid configuration
inline core::SandboxConfig MakeConfig(const std::string& key_prefix = "sandbox/") {
    core::SandboxConfig::Fields fields;
    fields.region = "us-west-2";
    fields.vpc_id = "vpc-1";
    fields.security_group_id = "sg-1";
    fields.subnet_id = "subnet-1";
    fields.ami_id = "ami-1";
    fields.instance_type = "t3a.large";
    fields.instance_profile = "sandbox-profile";
    fields.s3_bucket = "test-bucket";
    fields.s3_key_prefix = key_prefix;
    fields.extra_tags = {{"owner", "tests"}};
    return core::SandboxConfig(fields);
}

/// Sleeper that records requested pauses instead of sleeping
inline core::Sleeper RecordingSleeper(std::shared_ptr<std::vector<std::chrono::milliseconds>> pauses) {
    return [pauses](std::chrono::milliseconds duration) {
        pauses->push_back(duration);
    };
}

inline core::Sleeper NoSleep() {
    return [](std::chrono::milliseconds) {};
}

/**
 * @struct FakeWorld
 * @brief The three fakes wired together with one log
 */
struct FakeWorld {
    std::shared_ptr<EventLog> log = std::make_shared<EventLog>();
    std::shared_ptr<FakeObjectStore> store = std::make_shared<FakeObjectStore>(log);
    std::shared_ptr<FakeCommandRelay> relay = std::make_shared<FakeCommandRelay>(store, log);
    std::shared_ptr<FakeControlPlane> control_plane = std::make_shared<FakeControlPlane>(log);

    services::ServiceClients Clients() const {
        services::ServiceClients clients;
        clients.control_plane = control_plane;
        clients.relay = relay;
        clients.object_store = store;
        return clients;
    }
};

} // namespace fakes
} // namespace stratus
