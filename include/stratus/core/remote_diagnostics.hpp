/**
 * @file remote_diagnostics.hpp
 * @brief Translation of remote diagnostic text into error kinds
 *
 * The remote side reports failures only as free text on stderr. Every
 * heuristic that inspects that text lives here, so replacing it with a
 * structured marker protocol touches one file.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace stratus {
namespace core {

/// Relay marker for a script the shell could not execute
extern const char* const kPermissionDeniedMarker;

/// Text the transfer scripts print for a directory path
extern const char* const kDirectoryDiagnostic;

/**
 * @enum RemoteFailure
 * @brief Classified cause of a failed remote script
 */
enum class RemoteFailure {
    PERMISSION_DENIED,   ///< Exit status 126 marker present
    IS_A_DIRECTORY,      ///< Path was a directory
    OTHER                ///< Anything else
};

/**
 * @brief Classify stderr of a failed exec
 *
 * Only the permission marker is recognised; directory text is ordinary
 * output for arbitrary commands.
 */
RemoteFailure ClassifyExecFailure(const std::string& stderr_output);

/**
 * @brief Classify stderr of a failed file transfer script
 *
 * Matches "directory" case-insensitively. This can misclassify an unrelated
 * failure whose diagnostic happens to mention a directory.
 */
RemoteFailure ClassifyTransferFailure(const std::string& stderr_output);

/**
 * @brief Classify stderr of a failed upload (file read) script
 *
 * Only the exact diagnostic the upload script prints counts as a directory,
 * so a missing file whose name mentions "directory" stays a read failure.
 */
RemoteFailure ClassifyReadFailure(const std::string& stderr_output);

} // namespace core
} // namespace stratus
