/**
 * @file process_utils.cpp
 * @brief Implementation of the fork/execvp process runner
 *
 * **Pipe layout**:
 * ```
 * parent                       child
 *   stdin_pipe[1]  ---->  stdin_pipe[0]  (fd 0)
 *   stdout_pipe[0] <----  stdout_pipe[1] (fd 1)
 *   stderr_pipe[0] <----  stderr_pipe[1] (fd 2)
 *   exec_pipe[0]   <----  exec_pipe[1]   (O_CLOEXEC, carries errno if execvp fails)
 * ```
 * All descriptors are created O_CLOEXEC; dup2 onto 0/1/2 clears the flag for
 * the three the child keeps. A successful exec closes exec_pipe[1], so a zero
 * byte read on exec_pipe[0] means the program started.
 *
 * @date 2025
 */

#include "sandcastle/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <mutex>
#include <cerrno>
#include <cstring>
#include <csignal>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace sandcastle {
namespace utils {

namespace {

constexpr std::chrono::milliseconds kPollInterval{50};
constexpr std::chrono::milliseconds kDrainAfterKill{1000};

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { Reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            Reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int Get() const { return fd_; }
    bool IsOpen() const { return fd_ >= 0; }

    void Reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

void OpenPipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    p.read_end = UniqueFd(fds[0]);
    p.write_end = UniqueFd(fds[1]);
}

void SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Writing to a child that closed stdin must yield EPIPE, not kill the host
void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Reads what is available. Returns false once the stream is closed.
bool DrainInto(UniqueFd& fd, std::string& sink, std::size_t cap, bool& truncated) {
    char buffer[8192];
    while (true) {
        ssize_t n = ::read(fd.Get(), buffer, sizeof(buffer));
        if (n > 0) {
            std::size_t count = static_cast<std::size_t>(n);
            if (cap == 0 || sink.size() + count <= cap) {
                sink.append(buffer, count);
            } else {
                if (sink.size() < cap) {
                    sink.append(buffer, cap - sink.size());
                }
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            fd.Reset();
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        fd.Reset();
        return false;
    }
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int WaitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return DecodeStatus(status);
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult ProcessUtils::Run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    ProcessResult result;
    if (argv.empty()) {
        result.launch_error = "Empty command";
        return result;
    }

    IgnoreSigpipe();

    Pipe stdin_pipe, stdout_pipe, stderr_pipe, exec_pipe;
    OpenPipe(stdin_pipe);
    OpenPipe(stdout_pipe);
    OpenPipe(stderr_pipe);
    OpenPipe(exec_pipe);

    // Build argv before fork; the child must not allocate
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    auto start_time = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("Failed to fork process: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child
        ::dup2(stdin_pipe.read_end.Get(), STDIN_FILENO);
        ::dup2(stdout_pipe.write_end.Get(), STDOUT_FILENO);
        ::dup2(stderr_pipe.write_end.Get(), STDERR_FILENO);

        ::execvp(c_argv[0], c_argv.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe.write_end.Get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent: drop the child's ends
    stdin_pipe.read_end.Reset();
    stdout_pipe.write_end.Reset();
    stderr_pipe.write_end.Reset();
    exec_pipe.write_end.Reset();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.read_end.Get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        WaitForChild(pid);
        result.launch_error = std::string("Failed to execute ") + argv[0] + ": " + std::strerror(exec_errno);
        spdlog::debug("{}", result.launch_error);
        return result;
    }

    SetNonBlocking(stdout_pipe.read_end.Get());
    SetNonBlocking(stderr_pipe.read_end.Get());

    std::size_t stdin_offset = 0;
    if (options.stdin_data && !options.stdin_data->empty()) {
        SetNonBlocking(stdin_pipe.write_end.Get());
    } else {
        stdin_pipe.write_end.Reset();
    }

    bool killed = false;
    auto kill_time = start_time;

    auto kill_child = [&]() {
        ::kill(pid, SIGKILL);
        killed = true;
        kill_time = std::chrono::steady_clock::now();
    };

    while (stdout_pipe.read_end.IsOpen() || stderr_pipe.read_end.IsOpen()) {
        std::vector<pollfd> fds;
        if (stdout_pipe.read_end.IsOpen()) {
            fds.push_back({stdout_pipe.read_end.Get(), POLLIN, 0});
        }
        if (stderr_pipe.read_end.IsOpen()) {
            fds.push_back({stderr_pipe.read_end.Get(), POLLIN, 0});
        }
        if (stdin_pipe.write_end.IsOpen()) {
            fds.push_back({stdin_pipe.write_end.Get(), POLLOUT, 0});
        }

        int ready = ::poll(fds.data(), fds.size(), static_cast<int>(kPollInterval.count()));
        if (ready < 0 && errno != EINTR) {
            spdlog::warn("poll failed: {}", std::strerror(errno));
            kill_child();
            break;
        }

        for (const auto& pfd : fds) {
            if (pfd.revents == 0) {
                continue;
            }
            if (pfd.fd == stdout_pipe.read_end.Get()) {
                DrainInto(stdout_pipe.read_end, result.stdout_output, options.max_output_bytes, result.truncated);
            } else if (pfd.fd == stderr_pipe.read_end.Get()) {
                DrainInto(stderr_pipe.read_end, result.stderr_output, options.max_output_bytes, result.truncated);
            } else if (pfd.fd == stdin_pipe.write_end.Get()) {
                const std::string& data = *options.stdin_data;
                ssize_t written = ::write(stdin_pipe.write_end.Get(),
                                          data.data() + stdin_offset,
                                          data.size() - stdin_offset);
                if (written > 0) {
                    stdin_offset += static_cast<std::size_t>(written);
                    if (stdin_offset >= data.size()) {
                        stdin_pipe.write_end.Reset();
                    }
                } else if (written < 0 && errno != EAGAIN && errno != EINTR) {
                    // EPIPE: child stopped reading
                    stdin_pipe.write_end.Reset();
                }
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (!killed) {
            if (options.timeout.count() > 0 && now - start_time >= options.timeout) {
                result.timed_out = true;
                kill_child();
            } else if (options.should_stop && options.should_stop()) {
                result.cancelled = true;
                kill_child();
            }
        } else if (now - kill_time >= kDrainAfterKill) {
            // A grandchild may still hold the pipes open
            break;
        }
    }

    stdin_pipe.write_end.Reset();

    // The child may have closed its outputs and still be running
    while (!killed) {
        int status = 0;
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            result.exit_code = DecodeStatus(status);
            break;
        }
        if (done < 0 && errno != EINTR) {
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (options.timeout.count() > 0 && now - start_time >= options.timeout) {
            result.timed_out = true;
            kill_child();
        } else if (options.should_stop && options.should_stop()) {
            result.cancelled = true;
            kill_child();
        } else {
            ::usleep(10000);
        }
    }

    if (killed) {
        result.exit_code = WaitForChild(pid);
    }
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return result;
}

} // namespace utils
} // namespace sandcastle
