//
// Created by Giuseppe Francione on 15/01/26.
//

/**
 * @file process_runner.hpp
 * @brief Runs an external program to completion and captures its output.
 */

#ifndef WEBPRESS_PROCESS_RUNNER_HPP
#define WEBPRESS_PROCESS_RUNNER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace webpress {

/**
 * @brief Exit information of a finished child process.
 */
struct ProcessResult {
    int exit_code = -1;  ///< Exit status; 128 + signal number if the child was killed
    std::string output;  ///< Merged stdout and stderr
};

/**
 * @brief Runs a program and blocks until it exits.
 *
 * The child gets no console: stdin is the null device, stdout and stderr
 * are captured through a pipe, and on Windows no window is created.
 * There is no timeout.
 *
 * @param program Path to the executable (not searched on PATH).
 * @param args Arguments, without argv[0].
 * @throws std::system_error if the process cannot be started or waited for.
 */
ProcessResult run_process(const std::filesystem::path& program,
                          const std::vector<std::string>& args);

/**
 * @brief Locates an executable.
 *
 * A name containing a directory separator is checked as-is; a bare name
 * is looked up in the PATH directories (adding ".exe" on Windows).
 *
 * @return The path of the first match, or std::nullopt.
 */
std::optional<std::filesystem::path> find_executable(const std::string& name);

} // namespace webpress

#endif // WEBPRESS_PROCESS_RUNNER_HPP
