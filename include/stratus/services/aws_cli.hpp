/**
 * @file aws_cli.hpp
 * @brief Thin driver for the `aws` command-line client
 *
 * Every call is `aws <service> <operation> <args...> --region R --output json`.
 * Stdout is parsed as JSON; a non-zero exit is mapped to ServiceError by
 * parsing the client's standard diagnostic:
 *
 * ```
 * An error occurred (NoSuchKey) when calling the GetObject operation: The specified key does not exist.
 *                   ^^^^^^^^^ code                 ^^^^^^^^^ operation  ^^^^^^^^^ message
 * ```
 *
 * @date 2025
 */

#pragma once

#include "stratus/utils/process_utils.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stratus {
namespace services {

/// Runs one argv; injected so tests can script the client's responses
using CommandRunner = std::function<utils::ProcessResult(const std::vector<std::string>&)>;

/// CommandRunner backed by ProcessUtils::Run
CommandRunner SystemCommandRunner();

/**
 * @struct AwsErrorInfo
 * @brief Parsed client diagnostic
 */
struct AwsErrorInfo {
    std::string code;        ///< Service error code, e.g. `NoSuchKey`, `404`
    std::string operation;   ///< API operation, e.g. `GetObject`
    std::string message;     ///< Human-readable message
};

/**
 * @class AwsCli
 * @brief Region-bound invoker of the aws client
 */
class AwsCli {
public:
    explicit AwsCli(std::string region,
                    CommandRunner runner = SystemCommandRunner(),
                    std::string program = "aws");

    /**
     * @brief Run one operation and parse its JSON output
     *
     * @param service CLI service name (`ec2`, `ssm`, `s3api`)
     * @param operation CLI operation (`run-instances`, ...)
     * @param args Remaining arguments
     * @return Parsed stdout, or null JSON when the operation prints nothing
     * @throws ServiceError if the client exits non-zero or prints invalid JSON
     */
    nlohmann::json Call(const std::string& service,
                        const std::string& operation,
                        const std::vector<std::string>& args = {}) const;

    /// Full argv Call would run
    std::vector<std::string> BuildArgv(const std::string& service,
                                       const std::string& operation,
                                       const std::vector<std::string>& args) const;

    /// Run without region/output decoration (credential export and similar)
    utils::ProcessResult RunRaw(const std::vector<std::string>& args) const;

    const std::string& Region() const { return region_; }

    /**
     * @brief Parse the client's `An error occurred (...)` line
     * @return std::nullopt if stderr has no such line
     */
    static std::optional<AwsErrorInfo> ParseError(const std::string& stderr_output);

private:
    std::string region_;
    CommandRunner runner_;
    std::string program_;
};

} // namespace services
} // namespace stratus
