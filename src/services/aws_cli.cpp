/**
 * @file aws_cli.cpp
 * @brief Implementation of AwsCli
 *
 * @date 2025
 */

#include "stratus/services/aws_cli.hpp"
#include "stratus/core/errors.hpp"
#include "stratus/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <regex>
#include <utility>

namespace stratus {
namespace services {

using json = nlohmann::json;
using utils::StringUtils;

CommandRunner SystemCommandRunner() {
    return [](const std::vector<std::string>& argv) {
        return utils::ProcessUtils::Run(argv);
    };
}

AwsCli::AwsCli(std::string region, CommandRunner runner, std::string program)
    : region_(std::move(region))
    , runner_(std::move(runner))
    , program_(std::move(program)) {
}

std::vector<std::string> AwsCli::BuildArgv(const std::string& service,
                                           const std::string& operation,
                                           const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {program_, service, operation};
    argv.insert(argv.end(), args.begin(), args.end());
    argv.insert(argv.end(), {"--region", region_, "--output", "json"});
    return argv;
}

json AwsCli::Call(const std::string& service,
                  const std::string& operation,
                  const std::vector<std::string>& args) const {
    spdlog::debug("aws {} {} ({})", service, operation, region_);
    auto result = runner_(BuildArgv(service, operation, args));

    if (!result.success) {
        std::string stderr_text = StringUtils::Trim(result.stderr_output);
        if (auto error = ParseError(stderr_text)) {
            throw ServiceError(service, error->code, error->message);
        }
        if (stderr_text.empty()) {
            stderr_text = "aws exited with status " + std::to_string(result.exit_code);
        }
        throw ServiceError(service, "CliError", stderr_text);
    }

    std::string body = StringUtils::Trim(result.stdout_output);
    if (body.empty()) {
        return json();
    }

    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw ServiceError(service, "InvalidResponse",
                           "Could not parse output of " + operation + ": " + e.what());
    }
}

utils::ProcessResult AwsCli::RunRaw(const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {program_};
    argv.insert(argv.end(), args.begin(), args.end());
    return runner_(argv);
}

std::optional<AwsErrorInfo> AwsCli::ParseError(const std::string& stderr_output) {
    static const std::regex error_regex(
        R"(An error occurred \(([^)]+)\) when calling the (\w+) operation(?: \([^)]*\))?: ?(.*))");

    std::smatch match;
    if (!std::regex_search(stderr_output, match, error_regex)) {
        return std::nullopt;
    }

    AwsErrorInfo info;
    info.code = match[1].str();
    info.operation = match[2].str();
    info.message = StringUtils::Trim(match[3].str());
    return info;
}

} // namespace services
} // namespace stratus
