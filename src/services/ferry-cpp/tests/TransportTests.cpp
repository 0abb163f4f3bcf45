#include "RemoteTransport.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

int main() {
    TransportOptions options;
    options.connectTimeout = std::chrono::seconds(7);

    if (MakeTransport("", options)) {
        return Fail("An empty target host has no transport.");
    }

    auto serial = MakeTransport("adb:emulator-5554", options);
    if (!serial || serial->Kind() != TransportKind::DeviceBridge || serial->Describe() != "adb:emulator-5554") {
        return Fail("adb:<serial> should select the device bridge.");
    }

    const auto* device = dynamic_cast<const AdbTransport*>(serial.get());
    const std::vector<std::string> expectedPush = {"adb", "-s", "emulator-5554", "push", "/tmp/a.tar.gz", "/data/a.tar.gz"};
    if (device == nullptr || device->BuildPushCommand("/tmp/a.tar.gz", "/data/a.tar.gz") != expectedPush) {
        return Fail("Unexpected adb push command.");
    }

    for (const std::string host : {"adb:", "adb:default"}) {
        auto only = MakeTransport(host, options);
        const auto* onlyDevice = dynamic_cast<const AdbTransport*>(only.get());
        const std::vector<std::string> expectedShell = {"adb", "shell", "echo hi"};
        if (onlyDevice == nullptr || onlyDevice->BuildExecCommand("echo hi") != expectedShell) {
            return Fail(host + " should address the only attached device without -s.");
        }
    }

    auto remote = MakeTransport("pi@10.0.0.5", options);
    const auto* shell = dynamic_cast<const SshTransport*>(remote.get());
    if (shell == nullptr || remote->Kind() != TransportKind::RemoteShell) {
        return Fail("Anything else should select the remote shell.");
    }

    const std::vector<std::string> expectedScp = {
        "scp", "-o", "BatchMode=yes", "-o", "ConnectTimeout=7", "-C", "/tmp/a.tar.gz", "pi@10.0.0.5:/srv/a.tar.gz"};
    if (shell->BuildPushCommand("/tmp/a.tar.gz", "/srv/a.tar.gz", true) != expectedScp) {
        return Fail("Unexpected scp command.");
    }
    if (HasArg(shell->BuildPushCommand("/tmp/a.tar.gz", "/srv/a.tar.gz", false), "-C")) {
        return Fail("Uncompressed push should not pass -C.");
    }

    const std::vector<std::string> expectedSsh = {
        "ssh", "-o", "BatchMode=yes", "-o", "ConnectTimeout=7", "pi@10.0.0.5", "docker ps -q"};
    if (shell->BuildExecCommand("docker ps -q") != expectedSsh) {
        return Fail("Unexpected ssh command.");
    }

    std::vector<CommandRequest> requests;
    int exitCode = 0;
    CommandRunner runner = [&](const CommandRequest& request) {
        requests.push_back(request);
        return exitCode == 0 ? Ok("ferry-probe\n") : Exit(exitCode, "ssh: connect to host 10.0.0.5 port 22: No route to host");
    };

    SshTransport probed("pi@10.0.0.5", options, runner);
    if (!probed.Probe(std::chrono::seconds(3))) {
        return Fail("Probe should succeed when echo succeeds.");
    }
    if (requests.back().timeout != std::chrono::milliseconds(3000) || requests.back().argv.back() != "echo ferry-probe") {
        return Fail("Probe should run echo with its own timeout.");
    }

    exitCode = 255;
    if (probed.Probe(std::chrono::seconds(3))) {
        return Fail("Probe should fail when the host is unreachable.");
    }

    ChildTracker tracker;
    CallContext context;
    context.timeout = std::chrono::milliseconds(1500);
    context.tracker = &tracker;
    exitCode = 0;
    AdbTransport bridged("", options, runner);
    if (!bridged.Push("/tmp/a", "/data/a", true, context).Succeeded()) {
        return Fail("Push should succeed with a healthy runner.");
    }
    if (requests.back().timeout != context.timeout || requests.back().tracker != &tracker) {
        return Fail("Push should forward the call budget and tracker.");
    }

    return 0;
}
