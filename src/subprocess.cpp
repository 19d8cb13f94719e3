#include "subprocess.hpp"
#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <array>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <format>

extern char** environ;

namespace {

constexpr std::size_t kMaxErrorOutput = 64 * 1024;

std::string errnoMessage(const char* what) {
    return std::format("{}: {}", what, std::strerror(errno));
}

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(FileDescriptor&& other) noexcept : fd(std::exchange(other.fd, -1)) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd, -1));
        }
        return *this;
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd; }
    explicit operator bool() const { return fd >= 0; }

    void reset(int next = -1) {
        if (fd >= 0) {
            ::close(fd);
        }
        fd = next;
    }

private:
    int fd = -1;
};

struct Pipe {
    FileDescriptor readEnd;
    FileDescriptor writeEnd;
};

// Both ends are close-on-exec; dup2() in the child clears the flag on the copies it keeps.
std::expected<Pipe, std::string> makePipe() {
    int fds[2];
    if (::pipe(fds) == -1) {
        return std::unexpected(errnoMessage("Failed to create pipe"));
    }
    Pipe result{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
    if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 || ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
        return std::unexpected(errnoMessage("Failed to configure pipe"));
    }
    return result;
}

/**
 * @brief Owns a forked child; kills and reaps it unless wait() completed.
 */
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid(pid) {}
    ~ChildProcess() {
        if (pid > 0) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {
            }
        }
    }
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    std::expected<int, std::string> wait() {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR) {
                return std::unexpected(errnoMessage("waitpid failed"));
            }
        }
        pid = -1;
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return 1;
    }

private:
    pid_t pid;
};

/**
 * @brief Moves data between the parent and the child's pipes without deadlocking.
 *
 * Every poll round drains stdout and stderr, so a child that writes a lot while its stdin is
 * being fed never blocks on a full pipe.
 */
class StreamPump {
public:
    StreamPump(FileDescriptor input, FileDescriptor output, FileDescriptor errors,
               const ByteSink& sink, std::string& errorOutput)
        : input(std::move(input)), output(std::move(output)), errors(std::move(errors)),
          sink(sink), errorOutput(errorOutput) {}

    std::expected<void, std::string> feed(std::string_view data) {
        while (!data.empty()) {
            if (!input) {
                return std::unexpected("Child process stopped reading its input");
            }
            if (auto result = step(&data); !result) {
                return result;
            }
        }
        return {};
    }

    std::expected<void, std::string> finish() {
        input.reset();
        while (output || errors) {
            if (auto result = step(nullptr); !result) {
                return result;
            }
        }
        return {};
    }

    bool childClosedInput() const { return inputClosedByChild; }

private:
    std::expected<void, std::string> step(std::string_view* pending) {
        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        int outIndex = -1;
        int errIndex = -1;
        int inIndex = -1;
        if (output) {
            fds[count] = {output.get(), POLLIN, 0};
            outIndex = static_cast<int>(count++);
        }
        if (errors) {
            fds[count] = {errors.get(), POLLIN, 0};
            errIndex = static_cast<int>(count++);
        }
        if (pending && input) {
            fds[count] = {input.get(), POLLOUT, 0};
            inIndex = static_cast<int>(count++);
        }
        if (count == 0) {
            return {};
        }

        if (::poll(fds.data(), count, -1) == -1) {
            if (errno == EINTR) {
                return {};
            }
            return std::unexpected(errnoMessage("poll failed"));
        }

        if (outIndex >= 0 && fds[outIndex].revents != 0) {
            if (auto result = readFrom(output, true); !result) {
                return result;
            }
        }
        if (errIndex >= 0 && fds[errIndex].revents != 0) {
            if (auto result = readFrom(errors, false); !result) {
                return result;
            }
        }
        if (inIndex >= 0 && fds[inIndex].revents != 0) {
            ssize_t written = ::write(input.get(), pending->data(), pending->size());
            if (written < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    return {};
                }
                if (errno == EPIPE) {
                    inputClosedByChild = true;
                    input.reset();
                    return std::unexpected("Child process stopped reading its input");
                }
                return std::unexpected(errnoMessage("Failed to write to child process"));
            }
            pending->remove_prefix(static_cast<std::size_t>(written));
        }
        return {};
    }

    std::expected<void, std::string> readFrom(FileDescriptor& fd, bool isOutput) {
        char buf[kStreamChunkSize];
        ssize_t count = ::read(fd.get(), buf, sizeof(buf));
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                return {};
            }
            return std::unexpected(errnoMessage("Failed to read from child process"));
        }
        if (count == 0) {
            fd.reset();
            return {};
        }
        std::string_view chunk(buf, static_cast<std::size_t>(count));
        if (!isOutput) {
            if (errorOutput.size() < kMaxErrorOutput) {
                errorOutput.append(chunk.substr(0, kMaxErrorOutput - errorOutput.size()));
            }
            return {};
        }
        if (sink) {
            return sink(chunk);
        }
        return {};
    }

    FileDescriptor input;
    FileDescriptor output;
    FileDescriptor errors;
    const ByteSink& sink;
    std::string& errorOutput;
    bool inputClosedByChild = false;
};

} // namespace

std::expected<ProcessResult, std::string> runProcess(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) {
        return std::unexpected("No program given");
    }

    // A child that exits early must surface as EPIPE, not terminate this process.
    [[maybe_unused]] static const bool sigpipeIgnored = [] {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();

    auto stdinPipe = makePipe();
    auto stdoutPipe = makePipe();
    auto stderrPipe = makePipe();
    if (!stdinPipe || !stdoutPipe || !stderrPipe) {
        return std::unexpected(!stdinPipe ? stdinPipe.error() : !stdoutPipe ? stdoutPipe.error() : stderrPipe.error());
    }
    if (!options.input) {
        stdinPipe->writeEnd.reset();
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> envStrings;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view current(*entry);
        bool overridden = false;
        for (const auto& [key, value] : options.environment) {
            if (current.starts_with(key + "=")) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            envStrings.emplace_back(current);
        }
    }
    for (const auto& [key, value] : options.environment) {
        envStrings.push_back(std::format("{}={}", key, value));
    }
    std::vector<char*> envp;
    for (auto& entry : envStrings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::vector<std::string> argStrings(argv);
    std::vector<char*> args;
    for (auto& arg : argStrings) {
        args.push_back(arg.data());
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(errnoMessage("Failed to fork child process"));
    }
    if (pid == 0) {
        ::dup2(stdinPipe->readEnd.get(), STDIN_FILENO);
        ::dup2(stdoutPipe->writeEnd.get(), STDOUT_FILENO);
        ::dup2(stderrPipe->writeEnd.get(), STDERR_FILENO);
        environ = envp.data();
        ::execvp(args[0], args.data());
        _exit(127);
    }

    ChildProcess child(pid);
    stdinPipe->readEnd.reset();
    stdoutPipe->writeEnd.reset();
    stderrPipe->writeEnd.reset();
    if (stdinPipe->writeEnd) {
        ::fcntl(stdinPipe->writeEnd.get(), F_SETFL, O_NONBLOCK);
    }

    ProcessResult result;
    StreamPump pump(std::move(stdinPipe->writeEnd), std::move(stdoutPipe->readEnd), std::move(stderrPipe->readEnd),
                    options.output, result.errorOutput);

    if (options.input) {
        auto fed = options.input([&pump](std::string_view chunk) { return pump.feed(chunk); });
        if (!fed) {
            if (pump.childClosedInput() && pump.finish()) {
                auto exitCode = child.wait();
                if (exitCode) {
                    return std::unexpected(std::format("{} (exit code {}): {}", fed.error(), *exitCode, result.errorOutput));
                }
            }
            return std::unexpected(fed.error());
        }
    }

    if (auto drained = pump.finish(); !drained) {
        return std::unexpected(drained.error());
    }
    auto exitCode = child.wait();
    if (!exitCode) {
        return std::unexpected(exitCode.error());
    }
    result.exitCode = *exitCode;
    if (result.exitCode == 127 && result.errorOutput.empty()) {
        result.errorOutput = std::format("Failed to execute {}", argv.front());
    }
    return result;
}
