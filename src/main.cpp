/**
 * @file main.cpp
 * @brief Stratus - Command-line interface
 *
 * Entry point for the stratus sandbox tool. Launches a disposable instance,
 * runs a command or moves a file through the command relay, and tears the
 * instance down again. Also lists and removes leftover sandbox instances.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "stratus/core/errors.hpp"
#include "stratus/core/sandbox_config.hpp"
#include "stratus/core/sandbox_environment.hpp"
#include "stratus/services/aws_clients.hpp"
#include "stratus/utils/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace core = stratus::core;
namespace services = stratus::services;
namespace utils = stratus::utils;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintInstanceTable(const std::vector<services::InstanceSummary>& instances) {
    std::size_t id_width = std::string("Instance ID").size();
    std::size_t name_width = std::string("Instance Name").size();
    for (const auto& instance : instances) {
        id_width = std::max(id_width, instance.instance_id.size());
        name_width = std::max(name_width, utils::TagCodec::Lookup(instance.tags, "Name").size());
    }

    auto rule = [&](const char* left, const char* mid, const char* right) {
        std::string line = left;
        for (std::size_t i = 0; i < id_width + 2; ++i) line += "─";
        line += mid;
        for (std::size_t i = 0; i < name_width + 2; ++i) line += "─";
        line += right;
        return line;
    };
    auto row = [&](const std::string& id, const std::string& name) {
        return "│ " + id + std::string(id_width - id.size(), ' ') +
               " │ " + name + std::string(name_width - name.size(), ' ') + " │";
    };

    std::cout << rule("┌", "┬", "┐") << "\n";
    std::cout << row("Instance ID", "Instance Name") << "\n";
    std::cout << rule("├", "┼", "┤") << "\n";
    for (const auto& instance : instances) {
        std::cout << row(instance.instance_id, utils::TagCodec::Lookup(instance.tags, "Name")) << "\n";
    }
    std::cout << rule("└", "┴", "┘") << std::endl;
}

bool ConfirmDeletion() {
    std::cout << "Are you sure you want to delete ALL the above resources? [y/n]: " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    answer = utils::StringUtils::ToLower(utils::StringUtils::Trim(answer));
    return answer == "y" || answer == "yes";
}

json ConfigToJson(const core::SandboxConfig& config) {
    json document = json::object();
    document["region"] = config.Region();
    document["vpc_id"] = config.VpcId();
    document["security_group_id"] = config.SecurityGroupId();
    document["subnet_id"] = config.SubnetId();
    document["ami_id"] = config.ImageId();
    document["instance_type"] = config.InstanceType();
    document["instance_profile"] = config.InstanceProfile();
    document["s3_bucket"] = config.Bucket();
    document["s3_key_prefix"] = config.KeyPrefix();
    document["extra_tags"] = utils::TagCodec::Pack(config.ExtraTags());
    return document;
}

/*******************************************************************************
 * Configuration and Sandbox Helpers
 ******************************************************************************/

struct GlobalOptions {
    std::string config_file;
    std::string region;
};

core::SandboxConfig LoadConfig(const GlobalOptions& options) {
    core::SandboxConfigBuilder builder;
    builder.FromSettings(core::LoadSettingsFromDotEnv(".env"))
           .FromSettings(core::LoadSettingsFromEnvironment(core::ProcessEnvironment()));

    if (!options.config_file.empty()) {
        builder.FromSettings(core::LoadSettingsFromJson(options.config_file));
    }
    if (!options.region.empty()) {
        builder.WithRegion(options.region);
    }

    return builder.Build([](const std::string& region) {
        auto clients = services::MakeAwsCliClients(region);
        return core::LookupDefaultImage(*clients.relay);
    });
}

/// Region for commands that need no full configuration
std::string ResolveRegion(const GlobalOptions& options) {
    if (!options.region.empty()) {
        return options.region;
    }

    auto settings = core::LoadSettingsFromDotEnv(".env");
    settings.MergeFrom(core::LoadSettingsFromEnvironment(core::ProcessEnvironment()));
    if (!options.config_file.empty()) {
        settings.MergeFrom(core::LoadSettingsFromJson(options.config_file));
    }
    if (settings.region) {
        return *settings.region;
    }
    if (auto aws_region = core::ProcessEnvironment()("AWS_REGION")) {
        return *aws_region;
    }
    throw stratus::ConfigError("Region must be given with --region, STRATUS_REGION or AWS_REGION");
}

/// Run action against a fresh sandbox and always run sample cleanup
template <typename Action>
int WithSandbox(const GlobalOptions& options, const std::string& task, bool keep, Action&& action) {
    auto config = LoadConfig(options);
    auto environments = core::SandboxEnvironment::SampleInit(task, config,
                                                             services::MakeAwsCliClients);
    auto& sandbox = *environments.at("default");

    int exit_code = 0;
    try {
        exit_code = action(sandbox);
    } catch (const std::exception&) {
        core::SandboxEnvironment::TryCleanup(environments, keep);
        throw;
    }
    core::SandboxEnvironment::SampleCleanup(environments, keep);

    if (keep) {
        spdlog::info("Connect with: {}", sandbox.ConnectionCommand());
    }
    return exit_code;
}

std::string ReadLocalFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw stratus::IOFailure("Cannot open local file: " + path);
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void WriteLocalFile(const std::string& path, const std::vector<std::uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw stratus::IOFailure("Cannot open local file for writing: " + path);
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Stratus - disposable remote sandboxes over a command relay"};
    app.require_subcommand(1);

    GlobalOptions options;
    bool verbose = false;

    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--config", options.config_file, "JSON settings file")
        ->check(CLI::ExistingFile);
    app.add_option("--region", options.region, "Region override");

    // config
    auto* config_cmd = app.add_subcommand("config", "Print the resolved configuration");

    // exec
    std::string task = "stratus";
    bool keep = false;
    std::optional<std::string> cwd;
    std::vector<std::string> env_pairs;
    int timeout = static_cast<int>(core::kDefaultExecTimeout.count());
    std::vector<std::string> command;

    auto* exec_cmd = app.add_subcommand("exec", "Run a command in a fresh sandbox");
    exec_cmd->add_option("--task", task, "Task name used in instance tags");
    exec_cmd->add_option("--cwd", cwd, "Remote working directory");
    exec_cmd->add_option("--env", env_pairs, "Environment variable KEY=VALUE (repeatable)");
    exec_cmd->add_option("--timeout", timeout, "Timeout in seconds")
        ->check(CLI::PositiveNumber);
    exec_cmd->add_flag("--keep", keep, "Leave the instance running afterwards");
    exec_cmd->add_option("command", command, "Command and arguments")->required();

    // read-file
    std::string remote_path;
    std::string local_path;

    auto* read_cmd = app.add_subcommand("read-file", "Copy a file out of a fresh sandbox");
    read_cmd->add_option("--task", task, "Task name used in instance tags");
    read_cmd->add_flag("--keep", keep, "Leave the instance running afterwards");
    read_cmd->add_option("remote", remote_path, "Remote file path")->required();
    read_cmd->add_option("-o,--output", local_path, "Local destination (stdout if omitted)");

    // write-file
    auto* write_cmd = app.add_subcommand("write-file", "Copy a local file into a fresh sandbox");
    write_cmd->add_option("--task", task, "Task name used in instance tags");
    write_cmd->add_flag("--keep", keep, "Leave the instance running afterwards");
    write_cmd->add_option("local", local_path, "Local file")->required()->check(CLI::ExistingFile);
    write_cmd->add_option("remote", remote_path, "Remote file path")->required();

    // cleanup
    std::string cleanup_id;
    bool assume_yes = false;

    auto* cleanup_cmd = app.add_subcommand("cleanup", "Terminate leftover sandbox instances");
    cleanup_cmd->add_option("--id", cleanup_id, "Single instance to remove");
    cleanup_cmd->add_flag("-y,--yes", assume_yes, "Do not ask for confirmation");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        if (config_cmd->parsed()) {
            std::cout << ConfigToJson(LoadConfig(options)).dump(2) << std::endl;
            return 0;
        }

        if (exec_cmd->parsed()) {
            core::ExecRequest request;
            request.cmd = command;
            request.cwd = cwd;
            request.timeout = std::chrono::seconds(timeout);
            for (const auto& pair : env_pairs) {
                auto eq = pair.find('=');
                if (eq == std::string::npos) {
                    spdlog::error("Invalid --env value '{}', expected KEY=VALUE", pair);
                    return 2;
                }
                request.env[pair.substr(0, eq)] = pair.substr(eq + 1);
            }

            return WithSandbox(options, task, keep, [&](core::SandboxEnvironment& sandbox) {
                auto outcome = sandbox.Exec(request);
                std::cout << outcome.stdout_output << std::flush;
                std::cerr << outcome.stderr_output << std::flush;
                return outcome.returncode;
            });
        }

        if (read_cmd->parsed()) {
            return WithSandbox(options, task, keep, [&](core::SandboxEnvironment& sandbox) {
                auto data = sandbox.ReadFileBytes(remote_path);
                if (local_path.empty()) {
                    std::cout.write(reinterpret_cast<const char*>(data.data()),
                                    static_cast<std::streamsize>(data.size()));
                    std::cout << std::flush;
                } else {
                    WriteLocalFile(local_path, data);
                    spdlog::info("Saved {} bytes to {}", data.size(), local_path);
                }
                return 0;
            });
        }

        if (write_cmd->parsed()) {
            std::string contents = ReadLocalFile(local_path);
            return WithSandbox(options, task, keep, [&](core::SandboxEnvironment& sandbox) {
                sandbox.WriteFile(remote_path, contents);
                return 0;
            });
        }

        if (cleanup_cmd->parsed()) {
            if (!cleanup_id.empty()) {
                core::SandboxEnvironment::Cleanup(cleanup_id);
            }

            auto clients = services::MakeAwsCliClients(ResolveRegion(options));

            core::CleanupPrompts prompts;
            prompts.display = PrintInstanceTable;
            prompts.confirm = ConfirmDeletion;
            if (assume_yes) {
                prompts.is_interactive = [] { return false; };
            }

            auto removed = core::SandboxEnvironment::BulkCleanup(*clients.control_plane, prompts);
            spdlog::info("Removed {} instance(s)", removed);
            return 0;
        }

        return 0;

    } catch (const stratus::NotImplementedError& e) {
        spdlog::error("{}", e.what());
        return 2;
    } catch (const stratus::ExecutionTimeout& e) {
        spdlog::error("Timed out: {}", e.what());
        return 124;
    } catch (const stratus::PermissionDenied& e) {
        spdlog::error("{}", e.what());
        return 126;
    } catch (const stratus::OutputTruncated& e) {
        if (e.TruncatedOutput()) {
            std::cout << *e.TruncatedOutput() << std::flush;
        }
        spdlog::error("{}", e.what());
        return 1;
    } catch (const stratus::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
