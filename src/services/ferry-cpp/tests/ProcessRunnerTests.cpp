#include "ProcessRunner.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <string>
#include <thread>

int main() {
    CommandRequest echo;
    echo.argv = {"sh", "-c", "printf out; printf err >&2; exit 3"};
    const CommandResult captured = RunProcess(echo);
    if (captured.exitCode != 3 || captured.stdoutText != "out" || captured.stderrText != "err") {
        return Fail("Exit code and output streams should be captured separately.");
    }
    if (captured.Succeeded() || captured.timedOut || captured.spawnFailed) {
        return Fail("Non-zero exit is a plain failure.");
    }

    CommandRequest missing;
    missing.argv = {"/nonexistent/ferry-binary"};
    const CommandResult notFound = RunProcess(missing);
    if (notFound.exitCode != 127) {
        return Fail("Exec failure should exit 127, got " + std::to_string(notFound.exitCode));
    }

    if (!RunProcess(CommandRequest()).spawnFailed) {
        return Fail("Empty argv should be a spawn failure.");
    }

    CommandRequest slow;
    slow.argv = {"sleep", "5"};
    slow.timeout = std::chrono::milliseconds(200);
    const auto started = std::chrono::steady_clock::now();
    const CommandResult timedOut = RunProcess(slow);
    if (!timedOut.timedOut || timedOut.Succeeded()) {
        return Fail("Slow command should time out.");
    }
    if (std::chrono::steady_clock::now() - started > std::chrono::seconds(4)) {
        return Fail("Timed out command was not terminated promptly.");
    }

    ChildTracker tracker;
    CommandRequest tracked;
    tracked.argv = {"sleep", "5"};
    tracked.tracker = &tracker;
    std::thread canceller([&tracker] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        tracker.Terminate();
    });
    const CommandResult terminated = RunProcess(tracked);
    canceller.join();
    if (terminated.Succeeded() || terminated.exitCode != 128 + 15) {
        return Fail("Terminated child should report SIGTERM, got " + std::to_string(terminated.exitCode));
    }
    if (!RunProcess(tracked).spawnFailed) {
        return Fail("A cancelled tracker must refuse new children.");
    }

    ChildTracker stubbornTracker;
    CommandRequest stubborn;
    stubborn.argv = {"sh", "-c", "trap '' TERM; exec sleep 30"};
    stubborn.tracker = &stubbornTracker;
    std::thread stubbornCanceller([&stubbornTracker] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        stubbornTracker.Terminate();
    });
    const auto killStarted = std::chrono::steady_clock::now();
    const CommandResult killed = RunProcess(stubborn);
    stubbornCanceller.join();
    if (killed.exitCode != 128 + 9) {
        return Fail("Child ignoring SIGTERM should be killed, got " + std::to_string(killed.exitCode));
    }
    if (std::chrono::steady_clock::now() - killStarted > std::chrono::seconds(10)) {
        return Fail("SIGKILL should follow the grace period.");
    }

    CommandRequest detaching;
    detaching.argv = {"sh", "-c", "printf done; sleep 5 & exit 0"};
    const auto detachStarted = std::chrono::steady_clock::now();
    const CommandResult detached = RunProcess(detaching);
    if (!detached.Succeeded() || detached.stdoutText != "done") {
        return Fail("Command leaving a background child should still succeed with its output.");
    }
    if (std::chrono::steady_clock::now() - detachStarted > std::chrono::seconds(3)) {
        return Fail("Return should not wait for descendants holding the output pipes.");
    }

    if (ShellQuote("/data/local/tmp") != "/data/local/tmp" || ShellQuote("it's") != "'it'\\''s'" || ShellQuote("") != "''") {
        return Fail("Unexpected shell quoting.");
    }
    if (JoinShellCommand({"docker", "ps", "--filter", "name=web app"}) != "docker ps --filter 'name=web app'") {
        return Fail("Unexpected joined shell command.");
    }
    if (TrimOutput("  abc\n") != "abc" || !TrimOutput(" \n").empty()) {
        return Fail("Unexpected trimmed output.");
    }

    return 0;
}
