/**
 * @file errors.hpp
 * @brief Exception hierarchy for sandbox provisioning and remote execution
 *
 * Every failure raised by Stratus derives from StratusError so harness code
 * can catch the whole family in one place while still telling a slow command
 * (ExecutionTimeout) apart from a crashed one, a permission problem or a
 * truncated stream.
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace stratus {

/**
 * @class StratusError
 * @brief Root of all Stratus exceptions
 */
class StratusError : public std::runtime_error {
public:
    explicit StratusError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Invalid or incomplete sandbox configuration
class ConfigError : public StratusError {
public:
    explicit ConfigError(const std::string& message)
        : StratusError(message) {}
};

/// Tag string not in `key1=value1;key2=value2` form
class TagFormatError : public ConfigError {
public:
    explicit TagFormatError(const std::string& input)
        : ConfigError("Tags must be in the format 'key1=value1;key2=value2', "
                      "but instead got " + input)
        , input_(input) {}

    const std::string& Input() const { return input_; }

private:
    std::string input_;
};

/**
 * @class ServiceError
 * @brief Error reported by an external collaborator
 *
 * Carries the service name and the service's own error code so callers can
 * branch on codes such as `NoSuchKey` without parsing the message.
 */
class ServiceError : public StratusError {
public:
    ServiceError(std::string service, std::string code, const std::string& message)
        : StratusError(service + " error (" + code + "): " + message)
        , service_(std::move(service))
        , code_(std::move(code))
        , detail_(message) {}

    const std::string& Service() const { return service_; }
    const std::string& Code() const { return code_; }
    const std::string& Detail() const { return detail_; }

private:
    std::string service_;
    std::string code_;
    std::string detail_;
};

/// Object store key does not exist
class ObjectNotFound : public ServiceError {
public:
    explicit ObjectNotFound(const std::string& key)
        : ServiceError("s3", "NoSuchKey", "object not found: " + key)
        , key_(key) {}

    const std::string& Key() const { return key_; }

private:
    std::string key_;
};

/// Control plane rejected the launch or the instance never reached running
class ProvisioningFailure : public ServiceError {
public:
    explicit ProvisioningFailure(const ServiceError& cause)
        : ServiceError(cause.Service(), cause.Code(), cause.Detail()) {}
};

/// A bounded retry loop ran out of attempts
class RetryExhausted : public StratusError {
public:
    RetryExhausted(const std::string& message, int attempts)
        : StratusError(message)
        , attempts_(attempts) {}

    int Attempts() const { return attempts_; }

private:
    int attempts_;
};

/// Relay agent never registered as online
class ReadinessTimeout : public RetryExhausted {
public:
    ReadinessTimeout(const std::string& instance_id, int attempts)
        : RetryExhausted("Instance " + instance_id + " did not register with the command relay after "
                         + std::to_string(attempts) + " attempts", attempts)
        , instance_id_(instance_id) {}

    const std::string& InstanceId() const { return instance_id_; }

private:
    std::string instance_id_;
};

/// Command did not finish within the caller's timeout (it was cancelled)
class ExecutionTimeout : public StratusError {
public:
    explicit ExecutionTimeout(const std::string& command_id)
        : StratusError("Command execution timed out (command " + command_id + ")")
        , command_id_(command_id) {}

    const std::string& CommandId() const { return command_id_; }

private:
    std::string command_id_;
};

/// Remote shell could not execute the command (exit status 126)
class PermissionDenied : public StratusError {
public:
    explicit PermissionDenied(const std::string& stderr_output)
        : StratusError("Permission denied executing command: " + stderr_output) {}
};

/**
 * @class OutputTruncated
 * @brief Retrieved stream exceeded the configured ceiling
 *
 * Exec output keeps the first `limit` bytes; file reads carry no content.
 */
class OutputTruncated : public StratusError {
public:
    OutputTruncated(const std::string& limit_str, std::optional<std::string> truncated_output)
        : StratusError("Output limit of " + limit_str + " exceeded")
        , limit_str_(limit_str)
        , truncated_output_(std::move(truncated_output)) {}

    const std::string& LimitStr() const { return limit_str_; }
    const std::optional<std::string>& TruncatedOutput() const { return truncated_output_; }

private:
    std::string limit_str_;
    std::optional<std::string> truncated_output_;
};

/// Remote path is a directory where a file was expected
class IsADirectory : public StratusError {
public:
    explicit IsADirectory(const std::string& path)
        : StratusError("Is a directory: " + path)
        , path_(path) {}

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

/// Remote file could not be read
class FileNotFound : public StratusError {
public:
    FileNotFound(const std::string& path, const std::string& detail)
        : StratusError("Failed to read file " + path + ": " + detail)
        , path_(path) {}

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

/// Generic remote I/O failure
class IOFailure : public StratusError {
public:
    explicit IOFailure(const std::string& message)
        : StratusError(message) {}
};

/// Requested operation is deliberately unsupported
class NotImplementedError : public StratusError {
public:
    explicit NotImplementedError(const std::string& message)
        : StratusError(message) {}
};

} // namespace stratus
