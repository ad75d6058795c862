/**
 * @file process_utils.cpp
 * @brief popen-based command execution with stderr captured to a temp file
 *
 * popen only exposes one stream, so stderr is redirected into a scoped
 * temporary file and read back once the child has exited.
 *
 * @date 2025
 */

#include "stratus/utils/process_utils.hpp"
#include "stratus/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

namespace stratus {
namespace utils {

// ============================================================================
// SCOPED TEMP FILE
// ============================================================================

ScopedTempFile::ScopedTempFile(const std::string& stem) {
    auto pattern = (std::filesystem::temp_directory_path() / (stem + "_XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemp(buffer.data());
    if (fd < 0) {
        throw std::runtime_error("Failed to create temporary file from " + pattern);
    }
    close(fd);

    path_ = buffer.data();
}

ScopedTempFile::~ScopedTempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        spdlog::debug("Could not remove temporary file {}: {}", path_.string(), ec.message());
    }
}

void ScopedTempFile::Write(const std::string& data) const {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open file: " + path_.string());
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("Failed to write file: " + path_.string());
    }
}

std::string ScopedTempFile::Read() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open file: " + path_.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

ProcessResult ProcessUtils::Run(const std::vector<std::string>& argv) {
    ProcessResult result;

    if (argv.empty()) {
        throw std::invalid_argument("ProcessUtils::Run requires a program name");
    }

    ScopedTempFile stderr_file("stratus_stderr");
    std::string cmd = StringUtils::ShellJoin(argv) + " 2>" +
                      StringUtils::ShellQuote(stderr_file.Path().string());

    spdlog::debug("Executing: {}", argv[0] + (argv.size() > 1 ? " " + argv[1] : std::string()));

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.exit_code = -1;
        result.stderr_output = "Failed to execute command";
        return result;
    }

    std::array<char, 4096> buffer;
    std::size_t bytes_read = 0;
    while ((bytes_read = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.stdout_output.append(buffer.data(), bytes_read);
    }

    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }

    result.stderr_output = stderr_file.Read();
    result.success = (result.exit_code == 0);
    return result;
}

} // namespace utils
} // namespace stratus
