#include "ProcessRunner.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
constexpr auto kTerminateGrace = std::chrono::seconds(2);
constexpr int kPollSliceMs = 100;
constexpr int kExecFailedExitCode = 127;

// SIGTERM, then SIGKILL once the grace period passes. Always reaps the child;
// returns its wait status, or -1 if it could not be collected.
int TerminateAndReap(pid_t pid) {
    int status = 0;
    kill(pid, SIGTERM);

    const auto giveUpAt = std::chrono::steady_clock::now() + kTerminateGrace;
    while (std::chrono::steady_clock::now() < giveUpAt) {
        const pid_t reaped = waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            return status;
        }
        if (reaped < 0 && errno != EINTR) {
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::cerr << "[Process] Child " << pid << " ignored SIGTERM, sending SIGKILL" << std::endl;
    kill(pid, SIGKILL);
    pid_t reaped = -1;
    do {
        reaped = waitpid(pid, &status, 0);
    } while (reaped < 0 && errno == EINTR);
    return reaped == pid ? status : -1;
}

int DecodeWaitStatus(int status) {
    if (status < 0) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

bool DrainFd(int& fd, std::string& buffer) {
    std::array<char, 4096> chunk{};
    const ssize_t count = read(fd, chunk.data(), chunk.size());
    if (count > 0) {
        buffer.append(chunk.data(), static_cast<size_t>(count));
        return true;
    }
    if (count < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }

    close(fd);
    fd = -1;
    return false;
}

// Reads whatever is ready within waitMs. False when nothing was ready.
bool PollOutput(int& outFd, int& errFd, int waitMs, CommandResult& result) {
    pollfd fds[2] = {{outFd, POLLIN, 0}, {errFd, POLLIN, 0}};
    const int ready = poll(fds, 2, waitMs);
    if (ready <= 0) {
        return false;
    }

    if (outFd >= 0 && (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
        DrainFd(outFd, result.stdoutText);
    }
    if (errFd >= 0 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
        DrainFd(errFd, result.stderrText);
    }
    return true;
}

void ClosePipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}
} // namespace

bool ChildTracker::Attach(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        return false;
    }
    pid_ = pid;
    return true;
}

void ChildTracker::Detach(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ == pid) {
        pid_ = -1;
    }
}

void ChildTracker::Terminate() {
    pid_t target = -1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        target = pid_;
    }

    if (target > 0) {
        std::cerr << "[Process] Terminating child " << target << std::endl;
        kill(target, SIGTERM);
    }
}

bool ChildTracker::IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

CommandResult RunProcess(const CommandRequest& request) {
    CommandResult result;
    if (request.argv.empty()) {
        result.spawnFailed = true;
        result.stderrText = "empty command";
        return result;
    }

    if (request.tracker != nullptr && request.tracker->IsCancelled()) {
        result.spawnFailed = true;
        result.stderrText = "cancelled before start";
        return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe2(outPipe, O_CLOEXEC) != 0 || pipe2(errPipe, O_CLOEXEC) != 0) {
        result.spawnFailed = true;
        result.stderrText = std::string("pipe failed: ") + std::strerror(errno);
        ClosePipe(outPipe);
        ClosePipe(errPipe);
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        result.spawnFailed = true;
        result.stderrText = std::string("fork failed: ") + std::strerror(errno);
        ClosePipe(outPipe);
        ClosePipe(errPipe);
        return result;
    }

    if (pid == 0) {
        const int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        _exit(kExecFailedExitCode);
    }

    close(outPipe[1]);
    close(errPipe[1]);
    int outFd = outPipe[0];
    int errFd = errPipe[0];

    if (request.tracker != nullptr && !request.tracker->Attach(pid)) {
        std::cerr << "[Process] Cancelled while starting: " << FormatCommand(request.argv) << std::endl;
    }

    const bool hasDeadline = request.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + request.timeout;
    int status = -1;

    // Stops when the child exits, not at EOF: a detached descendant may keep the pipes open.
    while (true) {
        if (request.tracker != nullptr && request.tracker->IsCancelled()) {
            std::cerr << "[Process] Cancelled: " << FormatCommand(request.argv) << std::endl;
            status = TerminateAndReap(pid);
            break;
        }

        int waitMs = kPollSliceMs;
        if (hasDeadline) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timedOut = true;
                std::cerr << "[Process] Timed out after " << request.timeout.count() << "ms: "
                          << FormatCommand(request.argv) << std::endl;
                status = TerminateAndReap(pid);
                break;
            }
            waitMs = std::min(waitMs, static_cast<int>(remaining.count()));
        }

        PollOutput(outFd, errFd, waitMs, result);

        const pid_t reaped = waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            break;
        }
        if (reaped < 0 && errno != EINTR) {
            status = -1;
            break;
        }
    }

    // Collect what the child wrote before exiting without waiting on descendants.
    while (PollOutput(outFd, errFd, 0, result)) {
    }

    if (outFd >= 0) {
        close(outFd);
    }
    if (errFd >= 0) {
        close(errFd);
    }

    if (request.tracker != nullptr) {
        request.tracker->Detach(pid);
    }

    result.exitCode = DecodeWaitStatus(status);
    return result;
}

CommandRequest MakeRequest(std::vector<std::string> argv, const CallContext& context) {
    CommandRequest request;
    request.argv = std::move(argv);
    request.timeout = context.timeout;
    request.tracker = context.tracker;
    return request;
}

std::string FormatCommand(const std::vector<std::string>& argv) {
    std::ostringstream output;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            output << ' ';
        }
        output << argv[i];
    }
    return output.str();
}

std::string ShellQuote(const std::string& value) {
    if (!value.empty()
        && value.find_first_not_of(
               "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-./=:@%+,") == std::string::npos) {
        return value;
    }

    std::string quoted = "'";
    for (const char ch : value) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted += ch;
        }
    }
    quoted += "'";
    return quoted;
}

std::string JoinShellCommand(const std::vector<std::string>& argv) {
    std::string command;
    for (const auto& arg : argv) {
        if (!command.empty()) {
            command += ' ';
        }
        command += ShellQuote(arg);
    }
    return command;
}

std::string TrimOutput(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}
