//
// Created by gregorian-rayne on 10/9/26.
//

#include "sts/git/git_integration.hpp"
#include "sts/utils/string_utils.hpp"

#include <set>
#include <thread>

#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sts::git {

    namespace {

        void drain(const int fd, std::string& out) {
            char buffer[4096];
            ssize_t n;
            while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
                out.append(buffer, static_cast<std::size_t>(n));
            }
        }

        /// GitError carrying git's own diagnostic.
        Error git_failure(const CommandResult& result, const fs::path& file) {
            auto message = std::string(string_utils::trim(result.stderr_output));
            if (message.empty()) {
                message = "git exited with status " + std::to_string(result.exit_code);
            }
            return Error::git_error(message, file.string());
        }

        void terminate_child(const pid_t pid, int& status) {
            kill(pid, SIGTERM);
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
        }

        /**
         * Runs argv[0] with the remaining arguments in working_dir.
         */
        CommandResult execute_command_impl(
            const std::vector<std::string>& argv,
            const fs::path& working_dir,
            const Duration timeout,
            const std::atomic<bool>* cancelled
        ) {
            CommandResult result;
            const auto start_time = std::chrono::steady_clock::now();

            std::vector<char*> c_argv;
            c_argv.reserve(argv.size() + 1);
            for (const auto& arg : argv) {
                c_argv.push_back(const_cast<char*>(arg.c_str()));
            }
            c_argv.push_back(nullptr);

            int stdout_pipe[2];
            int stderr_pipe[2];

            if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
                result.exit_code = EXIT_SPAWN_FAILED;
                return result;
            }
            if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
                close(stdout_pipe[0]);
                close(stdout_pipe[1]);
                result.exit_code = EXIT_SPAWN_FAILED;
                return result;
            }

            const pid_t pid = fork();
            if (pid < 0) {
                close(stdout_pipe[0]);
                close(stdout_pipe[1]);
                close(stderr_pipe[0]);
                close(stderr_pipe[1]);
                result.exit_code = EXIT_SPAWN_FAILED;
                return result;
            }

            if (pid == 0) {
                // Child process
                dup2(stdout_pipe[1], STDOUT_FILENO);
                dup2(stderr_pipe[1], STDERR_FILENO);

                if (const int devnull = open("/dev/null", O_RDONLY); devnull >= 0) {
                    dup2(devnull, STDIN_FILENO);
                    close(devnull);
                }

                if (chdir(working_dir.c_str()) != 0) {
                    _exit(EXIT_EXEC_FAILED);
                }

                execvp(c_argv[0], c_argv.data());
                _exit(EXIT_EXEC_FAILED);
            }

            // Parent process
            close(stdout_pipe[1]);
            close(stderr_pipe[1]);

            fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
            fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

            const auto timeout_point = std::chrono::steady_clock::now() + timeout;
            int status = 0;
            bool finished = false;

            while (!finished) {
                if (cancelled && cancelled->load()) {
                    terminate_child(pid, status);
                    result.exit_code = EXIT_CANCELLED;
                    break;
                }

                if (std::chrono::steady_clock::now() > timeout_point) {
                    terminate_child(pid, status);
                    result.exit_code = EXIT_TIMED_OUT;
                    break;
                }

                drain(stdout_pipe[0], result.stdout_output);
                drain(stderr_pipe[0], result.stderr_output);

                if (waitpid(pid, &status, WNOHANG) > 0) {
                    drain(stdout_pipe[0], result.stdout_output);
                    drain(stderr_pipe[0], result.stderr_output);

                    if (WIFEXITED(status)) {
                        result.exit_code = WEXITSTATUS(status);
                    } else if (WIFSIGNALED(status)) {
                        result.exit_code = 128 + WTERMSIG(status);
                    }
                    finished = true;
                } else {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
            }

            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            const auto end_time = std::chrono::steady_clock::now();
            result.execution_time = std::chrono::duration_cast<Duration>(end_time - start_time);

            return result;
        }

    }  // namespace

    Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        const Duration timeout,
        const std::atomic<bool>* cancelled
    ) {
        if (std::error_code ec; !fs::is_directory(working_dir, ec)) {
            return Result<CommandResult, Error>::failure(
                Error::not_found("Working directory not found", working_dir.string())
            );
        }

        std::vector<std::string> argv;
        argv.reserve(args.size() + 1);
        argv.emplace_back("git");
        argv.insert(argv.end(), args.begin(), args.end());

        const std::string command = string_utils::join(argv, " ");
        auto result = execute_command_impl(argv, working_dir, timeout, cancelled);

        switch (result.exit_code) {
            case EXIT_TIMED_OUT:
                return Result<CommandResult, Error>::failure(
                    Error::timeout("Git command timed out", command)
                );
            case EXIT_CANCELLED:
                return Result<CommandResult, Error>::failure(
                    Error::cancelled("Git command cancelled")
                );
            case EXIT_SPAWN_FAILED:
                return Result<CommandResult, Error>::failure(
                    Error::git_error("Failed to start git", command)
                );
            case EXIT_EXEC_FAILED:
                return Result<CommandResult, Error>::failure(
                    Error::git_error("git executable not available", command)
                );
            default:
                break;
        }

        return Result<CommandResult, Error>::success(std::move(result));
    }

    Result<std::size_t, Error> count_recent_commits(
        const fs::path& file,
        const int window_days,
        const Duration timeout,
        const std::atomic<bool>* cancelled
    ) {
        std::error_code ec;
        const auto absolute = fs::absolute(file, ec);
        if (ec) {
            return Result<std::size_t, Error>::failure(
                Error::io_error("Cannot resolve path", file.string())
            );
        }

        const auto name = absolute.filename().string();
        const auto dir = absolute.parent_path();

        auto tracked = execute_git({"ls-files", "--error-unmatch", "--", name}, dir, timeout, cancelled);
        if (tracked.is_err()) {
            return Result<std::size_t, Error>::failure(tracked.error());
        }
        if (tracked.value().exit_code == 1) {
            return Result<std::size_t, Error>::failure(
                Error::not_found("path is not tracked", file.string())
            );
        }
        if (tracked.value().exit_code != 0) {
            return Result<std::size_t, Error>::failure(git_failure(tracked.value(), file));
        }

        auto result = execute_git(
            {"log",
             "--since=" + std::to_string(window_days) + " days ago",
             "--format=%H",
             "--",
             name},
            dir,
            timeout,
            cancelled
        );

        if (result.is_err()) {
            return Result<std::size_t, Error>::failure(result.error());
        }

        if (result.value().exit_code != 0) {
            return Result<std::size_t, Error>::failure(git_failure(result.value(), file));
        }

        std::set<std::string_view> hashes;
        for (const auto line : string_utils::split_lines(result.value().stdout_output)) {
            if (const auto hash = string_utils::trim(line); !hash.empty()) {
                hashes.insert(hash);
            }
        }

        return Result<std::size_t, Error>::success(hashes.size());
    }

}  // namespace sts::git
