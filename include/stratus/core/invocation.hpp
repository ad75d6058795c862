/**
 * @file invocation.hpp
 * @brief Value types flowing through the remote execution pipeline
 *
 * @date 2025
 */

#pragma once

#include "stratus/core/sandbox_config.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stratus {
namespace core {

/// Ceiling for each exec output stream
constexpr std::size_t kMaxExecOutputSize = 10 * 1024 * 1024;
extern const char* const kMaxExecOutputSizeStr;

/// Ceiling for a file read
constexpr std::size_t kMaxReadFileSize = 100 * 1024 * 1024;
extern const char* const kMaxReadFileSizeStr;

/// Exec timeout applied when the caller gives none
constexpr std::chrono::seconds kDefaultExecTimeout{3600};

/// Lifetime of presigned transfer URLs
constexpr std::chrono::seconds kPresignedUrlTtl{60};

/**
 * @enum Operation
 * @brief Kind of call an invocation serves; names its key-prefix segment
 */
enum class Operation {
    EXEC,        ///< "exec"
    READ_FILE,   ///< "read_file"
    WRITE_FILE   ///< "write_file"
};

std::string OperationToString(Operation operation);

/**
 * @struct InstanceHandle
 * @brief One provisioned instance and the configuration it came from
 */
struct InstanceHandle {
    std::string instance_id;   ///< Control plane instance id
    std::string region;        ///< Region the instance lives in
    SandboxConfig config;      ///< Configuration used at launch
};

/**
 * @struct Invocation
 * @brief One submitted command and its object-store footprint
 */
struct Invocation {
    std::string command_id;            ///< Relay-assigned id
    std::string instance_id;           ///< Target instance
    std::string key_prefix;            ///< `{config_prefix}{operation}/{timestamp}-{rand}/`
    std::chrono::seconds timeout{0};   ///< Caller timeout
    std::string stdout_key;            ///< Relay stdout object
    std::string stderr_key;            ///< Relay stderr object

    /// Everything the relay wrote for this invocation
    std::string ArtifactPrefix() const { return key_prefix + command_id + "/"; }
};

/**
 * @struct ExecOutcome
 * @brief Result of one finished command
 */
struct ExecOutcome {
    bool success{false};        ///< returncode == 0
    int returncode{1};          ///< Exit code reported by the relay
    std::string stdout_output;  ///< Standard output (UTF-8 as produced)
    std::string stderr_output;  ///< Standard error
};

/**
 * @struct ExecRequest
 * @brief Harness-level exec call
 */
struct ExecRequest {
    std::vector<std::string> cmd;                       ///< argv
    std::optional<std::string> input;                   ///< stdin (unsupported, ignored with a warning)
    std::optional<std::string> cwd;                     ///< Working directory
    std::map<std::string, std::string> env;             ///< Extra environment
    std::optional<std::string> user;                    ///< Run-as user (unsupported, ignored with a warning)
    std::optional<std::chrono::seconds> timeout;        ///< Defaults to kDefaultExecTimeout
};

} // namespace core
} // namespace stratus
