/**
 * @file file_transfer.hpp
 * @brief File read/write through the object store and presigned URLs
 *
 * The instance has no inbound path, so file bodies travel through the
 * bucket and the instance moves them with curl:
 *
 * ```
 * read:   presign PUT ─► remote: test -d || curl --upload-file ─► Fetch ─► delete
 * write:  mkdir -p parent ─► PutObject ─► presign GET ─► remote: curl --output ─► delete
 * ```
 *
 * @date 2025
 */

#pragma once

#include "stratus/core/command_dispatcher.hpp"
#include "stratus/core/key_generator.hpp"
#include "stratus/services/object_store.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stratus {
namespace core {

/**
 * @class FileTransferBridge
 * @brief Moves whole files between the caller and one instance
 *
 * Every path, failing or not, removes the transfer object it created.
 */
class FileTransferBridge {
public:
    FileTransferBridge(CommandDispatcher& dispatcher,
                       std::string bucket,
                       std::shared_ptr<services::ObjectStore> store,
                       std::shared_ptr<KeyGenerator> keys);

    /**
     * @brief Read a remote file as raw bytes
     *
     * @throws IsADirectory if path is a directory
     * @throws FileNotFound for any other remote failure or a missing upload
     * @throws OutputTruncated (no content) if the file reaches 100 MiB
     */
    std::string ReadFile(const std::string& path);

    /**
     * @brief Read a remote file and require valid UTF-8
     * @throws IOFailure if the content is not UTF-8
     */
    std::string ReadFileText(const std::string& path);

    /**
     * @brief Create or replace a remote file
     *
     * @throws IOFailure if the parent directory cannot be created or the download fails
     * @throws IsADirectory if the remote diagnostic mentions a directory
     */
    void WriteFile(const std::string& path, const std::string& contents);

    /// Script that uploads path to url, failing for directories
    static std::vector<std::string> BuildUploadScript(const std::string& path,
                                                      const std::string& url);

    /// Script that downloads url into path, failing for directories
    static std::vector<std::string> BuildDownloadScript(const std::string& path,
                                                        const std::string& url);

    static std::vector<std::uint8_t> ToBytes(const std::string& data);

private:
    void DeleteTransferObject(const std::string& key) const;

    CommandDispatcher& dispatcher_;
    std::string bucket_;
    std::shared_ptr<services::ObjectStore> store_;
    std::shared_ptr<KeyGenerator> keys_;
    ResultRetriever retriever_;
    ArtifactJanitor janitor_;
};

} // namespace core
} // namespace stratus
