/**
 * @file remote_diagnostics.cpp
 * @brief Remote stderr heuristics
 *
 * @date 2025
 */

#include "stratus/core/remote_diagnostics.hpp"
#include "stratus/utils/string_utils.hpp"

namespace stratus {
namespace core {

const char* const kPermissionDeniedMarker = "failed to run commands: exit status 126";
const char* const kDirectoryDiagnostic = "Is a directory";

using utils::StringUtils;

RemoteFailure ClassifyExecFailure(const std::string& stderr_output) {
    if (StringUtils::Contains(stderr_output, kPermissionDeniedMarker)) {
        return RemoteFailure::PERMISSION_DENIED;
    }
    return RemoteFailure::OTHER;
}

RemoteFailure ClassifyTransferFailure(const std::string& stderr_output) {
    if (StringUtils::ContainsIgnoreCase(stderr_output, "directory")) {
        return RemoteFailure::IS_A_DIRECTORY;
    }
    if (StringUtils::Contains(stderr_output, kPermissionDeniedMarker)) {
        return RemoteFailure::PERMISSION_DENIED;
    }
    return RemoteFailure::OTHER;
}

RemoteFailure ClassifyReadFailure(const std::string& stderr_output) {
    if (StringUtils::Contains(stderr_output, kDirectoryDiagnostic)) {
        return RemoteFailure::IS_A_DIRECTORY;
    }
    if (StringUtils::Contains(stderr_output, kPermissionDeniedMarker)) {
        return RemoteFailure::PERMISSION_DENIED;
    }
    return RemoteFailure::OTHER;
}

} // namespace core
} // namespace stratus
