#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace drcv::server
{

    struct CommandResult
    {
        // Exit status, 128 + signal number when killed, 127 when the program could not be executed.
        int exit_code{-1};
        std::string out;
        std::string err;
        bool timed_out{false};

        bool success() const noexcept { return exit_code == 0 && !timed_out; }
    };

    using LineCallback = std::function<void(const std::string &)>;

    // A child process that keeps running until it exits on its own or is terminated.
    class Process
    {
    public:
        virtual ~Process() = default;

        // Blocks until the child exits and returns its exit code.
        virtual int wait() = 0;

        virtual bool running() const = 0;

        // SIGTERM, then SIGKILL once `grace` has passed. No-op after exit.
        virtual void terminate(std::chrono::milliseconds grace) = 0;
    };

    class ProcessLauncher
    {
    public:
        virtual ~ProcessLauncher() = default;

        // Runs argv to completion, capturing stdout and stderr.
        virtual CommandResult run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) = 0;

        // Starts argv in the background; every stderr line is handed to `on_stderr`.
        virtual std::unique_ptr<Process> spawn(const std::vector<std::string> &argv, LineCallback on_stderr) = 0;
    };

    std::shared_ptr<ProcessLauncher> make_posix_launcher();

} // namespace drcv::server
