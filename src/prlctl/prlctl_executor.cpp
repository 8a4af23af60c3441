#include "prlctl/prlctl_executor.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Held from pipe creation until fork returns, so a child forked by another
// worker never inherits our pipe ends before FD_CLOEXEC is set on them.
std::mutex spawnMutex;

bool makePipe(int fds[2]) {
    if (pipe(fds) != 0) {
        return false;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

constexpr int kPollIntervalMs = 50;
// 1 MiB, the largest pipe buffer Linux allows by default
constexpr int kMaxChunksPerRead = 256;

// Reads what is currently buffered in a non-blocking pipe, at most
// kMaxChunksPerRead chunks so a writer that never pauses cannot hold us past
// the deadline. Returns false once the stream is at EOF or broken.
bool readAvailable(int fd, std::string& output, size_t limit, bool& truncated) {
    std::array<char, 4096> buffer{};
    for (int chunk = 0; chunk < kMaxChunksPerRead; ++chunk) {
        const ssize_t bytes = read(fd, buffer.data(), buffer.size());
        if (bytes < 0 && errno == EINTR) {
            continue;
        }
        if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        if (bytes <= 0) {
            return false;
        }
        const size_t remaining = limit > output.size() ? limit - output.size() : 0;
        const size_t toCopy = std::min(remaining, static_cast<size_t>(bytes));
        output.append(buffer.data(), toCopy);
        if (toCopy < static_cast<size_t>(bytes)) {
            truncated = true;
        }
    }
    return true;
}

std::string trimTrailing(const std::string& text) {
    size_t end = text.size();
    while (end > 0 && (text[end - 1] == '\n' || text[end - 1] == '\r' ||
                       text[end - 1] == ' ' || text[end - 1] == '\t')) {
        --end;
    }
    return text.substr(0, end);
}

} // namespace

PrlctlExecutor::PrlctlExecutor(const ServerConfig& config)
    : PrlctlExecutor(config.prlctlPath, config.commandTimeoutMs, config.maxOutputBytes) {
}

PrlctlExecutor::PrlctlExecutor(std::string executable, int timeoutMs, size_t maxOutputBytes)
    : executable_(std::move(executable))
    , timeoutMs_(timeoutMs)
    , maxOutputBytes_(maxOutputBytes) {
}

std::string PrlctlExecutor::formatFailure(const std::string& reason,
                                          const std::string& stdoutText,
                                          const std::string& stderrText) {
    return "prlctl command failed: " + reason +
           "\nstdout: " + trimTrailing(stdoutText) +
           "\nstderr: " + trimTrailing(stderrText);
}

std::string PrlctlExecutor::describe(const std::vector<std::string>& args) const {
    std::string line = executable_;
    for (const auto& arg : args) {
        line += " " + arg;
    }
    return line;
}

CommandResult PrlctlExecutor::execute(const std::vector<std::string>& args) {
    CommandResult result;
    const std::string commandLine = describe(args);
    Logger::debug("Running: " + commandLine);

    // Built before fork: the child may only touch memory that already exists.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable_.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    pid_t pid = -1;
    int forkErrno = 0;

    {
        std::lock_guard<std::mutex> lock(spawnMutex);
        if (!makePipe(outPipe) || !makePipe(errPipe) || !makePipe(execPipe)) {
            const int err = errno;
            for (int* fd : {&outPipe[0], &outPipe[1], &errPipe[0], &errPipe[1], &execPipe[0], &execPipe[1]}) {
                closeFd(*fd);
            }
            result.error = formatFailure(std::string("cannot create pipe: ") + std::strerror(err), "", "");
            Logger::error("Failed to run " + commandLine + ": " + std::strerror(err));
            return result;
        }

        pid = fork();
        if (pid == 0) {
            const int devNull = open("/dev/null", O_RDONLY);
            if (devNull >= 0) {
                dup2(devNull, STDIN_FILENO);
                if (devNull > STDERR_FILENO) {
                    close(devNull);
                }
            }
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(errPipe[1], STDERR_FILENO);
            execvp(argv[0], argv.data());

            const int err = errno;
            ssize_t written = write(execPipe[1], &err, sizeof(err));
            (void)written;
            _exit(127);
        }
        if (pid < 0) {
            forkErrno = errno;
        }
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    if (pid < 0) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        closeFd(execPipe[0]);
        result.error = formatFailure(std::string("fork failed: ") + std::strerror(forkErrno), "", "");
        Logger::error("Failed to run " + commandLine + ": fork failed");
        return result;
    }

    // EOF here means execvp succeeded and close-on-exec closed the pipe.
    int spawnErrno = 0;
    ssize_t received = 0;
    do {
        received = read(execPipe[0], &spawnErrno, sizeof(spawnErrno));
    } while (received < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (received == static_cast<ssize_t>(sizeof(spawnErrno))) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        result.exitCode = 127;
        const std::string reason = "cannot start '" + executable_ + "': " + std::strerror(spawnErrno);
        result.error = formatFailure(reason, "", "");
        Logger::error("Failed to run " + commandLine + ": " + reason);
        return result;
    }

    // Non-blocking, so output left behind by a background grandchild never
    // stalls the drain after the child itself has exited.
    for (int fd : {outPipe[0], errPipe[0]}) {
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
    }

    std::string stdoutText;
    std::string stderrText;
    bool stdoutTruncated = false;
    bool stderrTruncated = false;
    bool stdoutOpen = true;
    bool stderrOpen = true;
    std::string pollFailure;
    int status = 0;
    bool exited = false;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs_);

    while (!exited) {
        int waitMs = kPollIntervalMs;
        if (timeoutMs_ > 0) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                result.timedOut = true;
                break;
            }
            waitMs = static_cast<int>(std::min<long long>(remaining, kPollIntervalMs));
        }

        pollfd fds[2];
        nfds_t count = 0;
        int stdoutIndex = -1;
        int stderrIndex = -1;
        if (stdoutOpen) {
            fds[count] = pollfd{outPipe[0], POLLIN, 0};
            stdoutIndex = static_cast<int>(count++);
        }
        if (stderrOpen) {
            fds[count] = pollfd{errPipe[0], POLLIN, 0};
            stderrIndex = static_cast<int>(count++);
        }

        // With both streams closed this only waits for the child.
        const int ready = poll(count > 0 ? fds : nullptr, count, waitMs);
        if (ready < 0 && errno != EINTR) {
            pollFailure = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (ready > 0) {
            if (stdoutIndex >= 0 && fds[stdoutIndex].revents != 0) {
                stdoutOpen = readAvailable(outPipe[0], stdoutText, maxOutputBytes_, stdoutTruncated);
            }
            if (stderrIndex >= 0 && fds[stderrIndex].revents != 0) {
                stderrOpen = readAvailable(errPipe[0], stderrText, maxOutputBytes_, stderrTruncated);
            }
        }

        const pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            exited = true;
        } else if (done < 0 && errno != EINTR) {
            pollFailure = std::string("waitpid failed: ") + std::strerror(errno);
            break;
        }
    }

    if (exited) {
        // Whatever the child wrote before exiting is already in the pipes.
        if (stdoutOpen) {
            readAvailable(outPipe[0], stdoutText, maxOutputBytes_, stdoutTruncated);
        }
        if (stderrOpen) {
            readAvailable(errPipe[0], stderrText, maxOutputBytes_, stderrTruncated);
        }
    } else {
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }
    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    result.stdoutText = std::move(stdoutText);
    result.stderrText = std::move(stderrText);
    result.truncated = stdoutTruncated || stderrTruncated;
    if (result.truncated) {
        Logger::warning("Output of " + commandLine + " exceeded " +
                        std::to_string(maxOutputBytes_) + " bytes and was truncated");
    }

    std::string reason;
    if (result.timedOut) {
        reason = "timed out after " + std::to_string(timeoutMs_) + " ms";
    } else if (!pollFailure.empty()) {
        reason = pollFailure;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        if (result.exitCode != 0) {
            reason = "exit code " + std::to_string(result.exitCode);
        }
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
        reason = "terminated by signal " + std::to_string(WTERMSIG(status));
    } else {
        reason = "unexpected wait status " + std::to_string(status);
    }

    result.success = reason.empty();
    if (result.success) {
        Logger::debug("Finished: " + commandLine);
    } else {
        result.error = formatFailure(reason, result.stdoutText, result.stderrText);
        Logger::error("Command failed: " + commandLine + " (" + reason + ")");
    }
    return result;
}
