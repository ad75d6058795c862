/**
 * @file process_utils.hpp
 * @brief Child process execution with separate stdout/stderr capture
 *
 * The concrete cloud collaborators drive the `aws` command-line client; this
 * module runs such a command with every argument shell-quoted and hands back
 * exit status and both output streams.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace stratus {
namespace utils {

/**
 * @struct ProcessResult
 * @brief Outcome of a finished child process
 */
struct ProcessResult {
    int exit_code{0};            ///< Exit status (-1 if the process could not be run or was signalled)
    std::string stdout_output;   ///< Captured standard output
    std::string stderr_output;   ///< Captured standard error
    bool success{false};         ///< exit_code == 0
};

/**
 * @class ScopedTempFile
 * @brief Uniquely named temporary file removed on destruction
 */
class ScopedTempFile {
public:
    /**
     * @brief Create an empty temporary file
     * @param stem Readable prefix for the file name
     * @throws std::runtime_error if the file cannot be created
     */
    explicit ScopedTempFile(const std::string& stem = "stratus");
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::filesystem::path& Path() const { return path_; }

    /// Replace the file contents with data (binary)
    void Write(const std::string& data) const;

    /// Read the whole file (binary)
    std::string Read() const;

private:
    std::filesystem::path path_;
};

/**
 * @class ProcessUtils
 * @brief Static process helpers
 */
class ProcessUtils {
public:
    /**
     * @brief Run argv[0] with arguments and wait for it to exit
     *
     * Arguments are quoted with StringUtils::ShellQuote, so values containing
     * spaces, quotes or JSON survive intact.
     *
     * @param argv Program and arguments (must not be empty)
     * @return ProcessResult with exit code and captured streams
     */
    static ProcessResult Run(const std::vector<std::string>& argv);
};

} // namespace utils
} // namespace stratus
