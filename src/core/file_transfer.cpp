/**
 * @file file_transfer.cpp
 * @brief Implementation of FileTransferBridge
 *
 * @date 2025
 */

#include "stratus/core/file_transfer.hpp"
#include "stratus/core/errors.hpp"
#include "stratus/core/remote_diagnostics.hpp"
#include "stratus/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <utility>

namespace stratus {
namespace core {

using utils::StringUtils;

namespace {

/// Transfer scripts run with the relay's default budget
constexpr std::chrono::seconds kTransferTimeout{3600};

std::vector<std::string> TransferPreamble(const std::string& path) {
    return {
        "#!/bin/sh",
        "set -e",
        StringUtils::ShellJoin({"test", "-d", path}) +
            " && echo '" + kDirectoryDiagnostic + "' 1>&2 && exit 1",
    };
}

} // anonymous namespace

FileTransferBridge::FileTransferBridge(CommandDispatcher& dispatcher,
                                       std::string bucket,
                                       std::shared_ptr<services::ObjectStore> store,
                                       std::shared_ptr<KeyGenerator> keys)
    : dispatcher_(dispatcher)
    , bucket_(std::move(bucket))
    , store_(std::move(store))
    , keys_(std::move(keys))
    , retriever_(store_, bucket_)
    , janitor_(store_, bucket_) {
}

std::vector<std::string> FileTransferBridge::BuildUploadScript(const std::string& path,
                                                               const std::string& url) {
    auto lines = TransferPreamble(path);
    lines.push_back(StringUtils::ShellJoin(
        {"curl", "--fail-with-body", "--verbose", "--upload-file", path, url}));
    return lines;
}

std::vector<std::string> FileTransferBridge::BuildDownloadScript(const std::string& path,
                                                                 const std::string& url) {
    auto lines = TransferPreamble(path);
    lines.push_back(StringUtils::ShellJoin(
        {"curl", "--fail-with-body", "--verbose", "--output", path, url}));
    return lines;
}

std::vector<std::uint8_t> FileTransferBridge::ToBytes(const std::string& data) {
    return std::vector<std::uint8_t>(data.begin(), data.end());
}

void FileTransferBridge::DeleteTransferObject(const std::string& key) const {
    janitor_.DeleteObject(key);
}

// ============================================================================
// READ
// ============================================================================

std::string FileTransferBridge::ReadFile(const std::string& path) {
    const std::string key = keys_->Prefix(Operation::READ_FILE) + path;
    const std::string url = store_->PresignUrl(services::PresignMethod::PUT, bucket_, key,
                                               kPresignedUrlTtl);

    ExecOutcome outcome;
    try {
        outcome = dispatcher_.RunScript(Operation::READ_FILE,
                                        BuildUploadScript(path, url), kTransferTimeout);
    } catch (const std::exception&) {
        DeleteTransferObject(key);
        throw;
    }

    if (!outcome.success) {
        DeleteTransferObject(key);
        if (ClassifyReadFailure(outcome.stderr_output) == RemoteFailure::IS_A_DIRECTORY) {
            throw IsADirectory(path);
        }
        throw FileNotFound(path, outcome.stderr_output);
    }

    std::optional<RetrievedObject> object;
    try {
        object = retriever_.Fetch(key, kMaxReadFileSize, TruncationPolicy::WITHHOLD_CONTENT);
    } catch (const std::exception&) {
        DeleteTransferObject(key);
        throw;
    }
    DeleteTransferObject(key);

    if (!object) {
        throw FileNotFound(path, "file does not exist in the transfer bucket");
    }
    if (object->truncated) {
        throw OutputTruncated(kMaxReadFileSizeStr, std::nullopt);
    }

    spdlog::debug("Read {} bytes from {}", object->content.size(), path);
    return std::move(object->content);
}

std::string FileTransferBridge::ReadFileText(const std::string& path) {
    std::string content = ReadFile(path);
    if (!StringUtils::IsValidUtf8(content)) {
        throw IOFailure("File " + path + " is not valid UTF-8 text");
    }
    return content;
}

// ============================================================================
// WRITE
// ============================================================================

void FileTransferBridge::WriteFile(const std::string& path, const std::string& contents) {
    const std::string parent = std::filesystem::path(path).parent_path().generic_string();
    if (!parent.empty()) {
        auto mkdir = dispatcher_.RunScript(
            Operation::EXEC,
            CommandDispatcher::BuildExecScript({"mkdir", "-p", parent}, {}, std::nullopt),
            kDefaultExecTimeout);
        if (!mkdir.success) {
            throw IOFailure("Failed to create sandbox directory " + parent + ": " +
                            mkdir.stderr_output);
        }
    }

    const std::string key = keys_->Prefix(Operation::WRITE_FILE) + path;

    ExecOutcome outcome;
    try {
        store_->PutObject(bucket_, key, contents);
        const std::string url = store_->PresignUrl(services::PresignMethod::GET, bucket_, key,
                                                   kPresignedUrlTtl);
        outcome = dispatcher_.RunScript(Operation::WRITE_FILE,
                                        BuildDownloadScript(path, url), kTransferTimeout);
    } catch (const std::exception&) {
        DeleteTransferObject(key);
        throw;
    }
    DeleteTransferObject(key);

    if (!outcome.success) {
        if (ClassifyTransferFailure(outcome.stderr_output) == RemoteFailure::IS_A_DIRECTORY) {
            throw IsADirectory(path);
        }
        throw IOFailure("Failed to write file " + path + ": " + outcome.stderr_output);
    }

    spdlog::info("File {} written to instance {}", path, dispatcher_.InstanceId());
}

} // namespace core
} // namespace stratus
