#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

struct CommandResult {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
    bool timedOut = false;
    bool spawnFailed = false;

    bool Succeeded() const { return exitCode == 0 && !timedOut && !spawnFailed; }
};

// Records the child process of the call it is attached to so another thread
// can deliver a real termination signal to it.
class ChildTracker {
public:
    // Returns false when the tracker was cancelled before the child started.
    bool Attach(pid_t pid);
    void Detach(pid_t pid);

    // Sends SIGTERM to the live child. RunProcess follows up with SIGKILL if
    // the child outlives the grace period.
    void Terminate();
    bool IsCancelled() const;

private:
    mutable std::mutex mutex_;
    pid_t pid_ = -1;
    bool cancelled_ = false;
};

struct CallContext {
    std::chrono::milliseconds timeout{0};
    ChildTracker* tracker = nullptr;
};

struct CommandRequest {
    std::vector<std::string> argv;
    std::chrono::milliseconds timeout{0};
    ChildTracker* tracker = nullptr;
};

using CommandRunner = std::function<CommandResult(const CommandRequest&)>;

CommandResult RunProcess(const CommandRequest& request);

CommandRequest MakeRequest(std::vector<std::string> argv, const CallContext& context = {});
std::string FormatCommand(const std::vector<std::string>& argv);
std::string ShellQuote(const std::string& value);
std::string JoinShellCommand(const std::vector<std::string>& argv);
std::string TrimOutput(const std::string& text);
