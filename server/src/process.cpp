#include "drcv/server/process.hpp"

#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace drcv::server
{

    namespace
    {

        constexpr int kExecFailed = 127;

        // argv in the form execvp expects, built before fork so the child does not allocate.
        class ArgvBuffer
        {
        public:
            explicit ArgvBuffer(const std::vector<std::string> &argv) : storage_(argv)
            {
                if (storage_.empty())
                {
                    throw std::invalid_argument("empty command line");
                }
                for (auto &arg : storage_)
                {
                    pointers_.push_back(arg.data());
                }
                pointers_.push_back(nullptr);
            }

            char *const *data() noexcept { return pointers_.data(); }

        private:
            std::vector<std::string> storage_;
            std::vector<char *> pointers_;
        };

        struct Pipe
        {
            int read_end{-1};
            int write_end{-1};

            Pipe()
            {
                int fds[2];
                if (::pipe2(fds, O_CLOEXEC) != 0)
                {
                    throw std::system_error(errno, std::generic_category(), "pipe2");
                }
                read_end = fds[0];
                write_end = fds[1];
            }

            ~Pipe()
            {
                close_read();
                close_write();
            }

            Pipe(const Pipe &) = delete;
            Pipe &operator=(const Pipe &) = delete;

            void close_read() noexcept
            {
                if (read_end >= 0)
                {
                    ::close(read_end);
                    read_end = -1;
                }
            }

            void close_write() noexcept
            {
                if (write_end >= 0)
                {
                    ::close(write_end);
                    write_end = -1;
                }
            }

            int release_read() noexcept
            {
                const int fd = read_end;
                read_end = -1;
                return fd;
            }
        };

        int decode_status(int status) noexcept
        {
            if (WIFEXITED(status))
            {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status))
            {
                return 128 + WTERMSIG(status);
            }
            return -1;
        }

        pid_t fork_exec(ArgvBuffer &argv, int stdout_fd, int stderr_fd)
        {
            const pid_t child = ::fork();
            if (child == 0)
            {
                const int devnull = ::open("/dev/null", O_RDWR);
                ::dup2(devnull, STDIN_FILENO);
                ::dup2(stdout_fd >= 0 ? stdout_fd : devnull, STDOUT_FILENO);
                ::dup2(stderr_fd >= 0 ? stderr_fd : devnull, STDERR_FILENO);
                ::execvp(argv.data()[0], argv.data());
                ::_exit(kExecFailed);
            }
            if (child < 0)
            {
                throw std::system_error(errno, std::generic_category(), "fork");
            }
            return child;
        }

        int wait_for_child(pid_t pid) noexcept
        {
            int status = 0;
            pid_t result = 0;
            do
            {
                result = ::waitpid(pid, &status, 0);
            } while (result < 0 && errno == EINTR);
            return result < 0 ? -1 : decode_status(status);
        }

        class PosixProcess : public Process
        {
        public:
            PosixProcess(pid_t pid, int stderr_fd, LineCallback on_stderr) : pid_(pid)
            {
                reader_ = std::thread([stderr_fd, callback = std::move(on_stderr)]
                                      { read_lines(stderr_fd, callback); });
                reaper_ = std::thread([this]
                                      { reap(); });
            }

            ~PosixProcess() override
            {
                terminate(std::chrono::milliseconds{500});
                if (reaper_.joinable())
                {
                    reaper_.join();
                }
                if (reader_.joinable())
                {
                    reader_.join();
                }
            }

            int wait() override
            {
                std::unique_lock lock(mutex_);
                exited_cv_.wait(lock, [this]
                                { return exited_; });
                return exit_code_;
            }

            bool running() const override
            {
                std::lock_guard lock(mutex_);
                return !exited_;
            }

            void terminate(std::chrono::milliseconds grace) override
            {
                std::unique_lock lock(mutex_);
                if (exited_)
                {
                    return;
                }
                ::kill(pid_, SIGTERM);
                if (exited_cv_.wait_for(lock, grace, [this]
                                        { return exited_; }))
                {
                    return;
                }
                spdlog::warn("Process {} ignored SIGTERM, sending SIGKILL", pid_);
                ::kill(pid_, SIGKILL);
                exited_cv_.wait(lock, [this]
                                { return exited_; });
            }

        private:
            void reap()
            {
                const int code = wait_for_child(pid_);
                std::lock_guard lock(mutex_);
                exited_ = true;
                exit_code_ = code;
                exited_cv_.notify_all();
            }

            static void read_lines(int fd, const LineCallback &callback)
            {
                std::string pending;
                char buffer[4096];
                for (;;)
                {
                    const auto n = ::read(fd, buffer, sizeof(buffer));
                    if (n < 0 && errno == EINTR)
                    {
                        continue;
                    }
                    if (n <= 0)
                    {
                        break;
                    }
                    pending.append(buffer, static_cast<std::size_t>(n));
                    std::size_t newline = 0;
                    while ((newline = pending.find('\n')) != std::string::npos)
                    {
                        auto line = pending.substr(0, newline);
                        pending.erase(0, newline + 1);
                        if (!line.empty() && line.back() == '\r')
                        {
                            line.pop_back();
                        }
                        deliver(callback, line);
                    }
                }
                deliver(callback, pending);
                ::close(fd);
            }

            static void deliver(const LineCallback &callback, const std::string &line)
            {
                if (line.empty() || !callback)
                {
                    return;
                }
                try
                {
                    callback(line);
                }
                catch (const std::exception &ex)
                {
                    spdlog::error("stderr handler failed: {}", ex.what());
                }
            }

            const pid_t pid_;
            mutable std::mutex mutex_;
            std::condition_variable exited_cv_;
            bool exited_{false};
            int exit_code_{-1};
            std::thread reader_;
            std::thread reaper_;
        };

        class PosixLauncher : public ProcessLauncher
        {
        public:
            CommandResult run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) override
            {
                ArgvBuffer args(argv);
                Pipe out;
                Pipe err;
                const pid_t child = fork_exec(args, out.write_end, err.write_end);
                out.close_write();
                err.close_write();

                CommandResult result{};
                const auto deadline = std::chrono::steady_clock::now() + timeout;
                pollfd fds[2] = {{out.read_end, POLLIN, 0}, {err.read_end, POLLIN, 0}};
                std::string *sinks[2] = {&result.out, &result.err};
                int open_fds = 2;
                char buffer[4096];
                while (open_fds > 0)
                {
                    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now());
                    if (remaining.count() <= 0)
                    {
                        result.timed_out = true;
                        ::kill(child, SIGKILL);
                        break;
                    }
                    const int ready = ::poll(fds, 2, static_cast<int>(remaining.count()));
                    if (ready < 0)
                    {
                        if (errno == EINTR)
                        {
                            continue;
                        }
                        ::kill(child, SIGKILL);
                        wait_for_child(child);
                        throw std::system_error(errno, std::generic_category(), "poll");
                    }
                    for (int i = 0; i < 2; ++i)
                    {
                        if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
                        {
                            continue;
                        }
                        const auto n = ::read(fds[i].fd, buffer, sizeof(buffer));
                        if (n > 0)
                        {
                            sinks[i]->append(buffer, static_cast<std::size_t>(n));
                        }
                        else if (n == 0 || errno != EINTR)
                        {
                            fds[i].fd = -1;
                            --open_fds;
                        }
                    }
                }
                result.exit_code = wait_for_child(child);
                return result;
            }

            std::unique_ptr<Process> spawn(const std::vector<std::string> &argv, LineCallback on_stderr) override
            {
                ArgvBuffer args(argv);
                Pipe err;
                const pid_t child = fork_exec(args, -1, err.write_end);
                err.close_write();
                spdlog::debug("Started {} (pid {})", argv.front(), child);
                return std::make_unique<PosixProcess>(child, err.release_read(), std::move(on_stderr));
            }
        };

    } // namespace

    std::shared_ptr<ProcessLauncher> make_posix_launcher()
    {
        return std::make_shared<PosixLauncher>();
    }

} // namespace drcv::server
