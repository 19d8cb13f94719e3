/**
 * @file subprocess.hpp
 * @brief Runs a client tool as a child process with streamed stdin and stdout.
 *
 * No shell is involved; arguments are passed to execvp() as given.
 */

#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <string>
#include <vector>
#include <utility>
#include <expected>
#include "byte_stream.hpp"

/**
 * @brief What to connect to the child besides its argument vector.
 */
struct ProcessOptions {
    ByteProducer input;                                        ///< Fed to stdin; empty = stdin is at end of file.
    ByteSink output;                                           ///< Receives stdout in chunks; empty = discarded.
    std::vector<std::pair<std::string, std::string>> environment; ///< Added to the inherited environment.
};

/**
 * @brief Outcome of a child process that ran to completion.
 */
struct ProcessResult {
    int exitCode = 0;        ///< Exit status, or 128 + signal number if killed.
    std::string errorOutput; ///< Captured stderr, truncated to its first 64 KiB.
};

/**
 * @brief Runs @p argv and waits for it.
 *
 * If the output sink or the input producer returns an error, the child is killed and that
 * error is returned. A non-zero exit code is not an error at this level.
 *
 * @param argv Program and arguments; argv[0] is looked up in PATH unless it contains a '/'.
 * @param options Stream and environment wiring.
 * @return std::expected<ProcessResult, std::string> Exit status and stderr, or an error message.
 */
std::expected<ProcessResult, std::string> runProcess(const std::vector<std::string>& argv, const ProcessOptions& options);

#endif // SUBPROCESS_HPP
