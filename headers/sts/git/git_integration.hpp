//
// Created by gregorian-rayne on 10/9/26.
//

#ifndef STS_GIT_INTEGRATION_HPP
#define STS_GIT_INTEGRATION_HPP

/**
 * @file git_integration.hpp
 * @brief Git access for churn measurement.
 *
 * Git is run as a child process with an argument vector (never through a
 * shell), a hard timeout and an optional cancellation flag. A timed out
 * or cancelled child is terminated and reaped before the call returns.
 */

#include "sts/result.hpp"
#include "sts/error.hpp"
#include "sts/types.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace sts::git {

    /// exit_code values that do not come from the child itself.
    constexpr int EXIT_SPAWN_FAILED = -1;
    constexpr int EXIT_TIMED_OUT = -2;
    constexpr int EXIT_CANCELLED = -3;
    constexpr int EXIT_EXEC_FAILED = 127;

    /**
     * Command execution result.
     */
    struct CommandResult {
        int exit_code = 0;
        std::string stdout_output;
        std::string stderr_output;
        Duration execution_time = Duration::zero();
    };

    /**
     * Executes a git command.
     *
     * @param args Command arguments (without "git" prefix).
     * @param working_dir Working directory for the command.
     * @param timeout Maximum execution time.
     * @param cancelled Polled while waiting; when set the child is killed.
     * @return Command result, or Timeout/Cancelled/GitError. A non-zero
     *         exit status of git itself is reported in the result.
     */
    [[nodiscard]] Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        Duration timeout = std::chrono::seconds(5),
        const std::atomic<bool>* cancelled = nullptr
    );

    /**
     * Counts distinct commits touching a file within the last days.
     *
     * Checks the file with `git ls-files --error-unmatch`, then runs
     * `git log --since=<N> days ago --format=%H -- <file>` in the file's
     * directory.
     *
     * @return Commit count, NotFound when git does not track the file, or
     *         an error when the history cannot be read (not a work tree,
     *         git missing, timeout, cancellation).
     */
    [[nodiscard]] Result<std::size_t, Error> count_recent_commits(
        const fs::path& file,
        int window_days,
        Duration timeout,
        const std::atomic<bool>* cancelled = nullptr
    );

}  // namespace sts::git

#endif //STS_GIT_INTEGRATION_HPP
