#include "RemoteTransport.hpp"

#include <iostream>
#include <utility>

namespace {
constexpr const char* kDevicePrefix = "adb:";
constexpr const char* kProbeToken = "ferry-probe";

CommandResult Dispatch(const CommandRunner& runner, CommandRequest request) {
    if (runner) {
        return runner(request);
    }
    return RunProcess(request);
}
} // namespace

bool RemoteTransport::Probe(std::chrono::seconds timeout, ChildTracker* tracker) const {
    CallContext context;
    context.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
    context.tracker = tracker;

    const CommandResult result = Exec(std::string("echo ") + kProbeToken, context);
    if (!result.Succeeded()) {
        std::cerr << "[Transport] Probe of " << Describe() << " failed: " << TrimOutput(result.stderrText) << std::endl;
        return false;
    }
    return true;
}

AdbTransport::AdbTransport(std::string device, TransportOptions options, CommandRunner runner)
    : device_(std::move(device)),
      options_(std::move(options)),
      runner_(std::move(runner)) {}

TransportKind AdbTransport::Kind() const {
    return TransportKind::DeviceBridge;
}

std::string AdbTransport::Describe() const {
    return std::string(kDevicePrefix) + (device_.empty() ? "default" : device_);
}

CommandResult AdbTransport::Push(
    const std::string& localPath,
    const std::string& remotePath,
    bool compress,
    const CallContext& context) const {
    (void)compress;
    return Run(BuildPushCommand(localPath, remotePath), context);
}

CommandResult AdbTransport::Exec(const std::string& command, const CallContext& context) const {
    return Run(BuildExecCommand(command), context);
}

std::vector<std::string> AdbTransport::BuildPushCommand(const std::string& localPath, const std::string& remotePath) const {
    auto command = BaseCommand();
    command.insert(command.end(), {"push", localPath, remotePath});
    return command;
}

std::vector<std::string> AdbTransport::BuildExecCommand(const std::string& command) const {
    auto argv = BaseCommand();
    argv.insert(argv.end(), {"shell", command});
    return argv;
}

std::vector<std::string> AdbTransport::BaseCommand() const {
    std::vector<std::string> command = {options_.adbBinary};
    if (!device_.empty() && device_ != "default") {
        command.insert(command.end(), {"-s", device_});
    }
    return command;
}

CommandResult AdbTransport::Run(std::vector<std::string> argv, const CallContext& context) const {
    return Dispatch(runner_, MakeRequest(std::move(argv), context));
}

SshTransport::SshTransport(std::string host, TransportOptions options, CommandRunner runner)
    : host_(std::move(host)),
      options_(std::move(options)),
      runner_(std::move(runner)) {}

TransportKind SshTransport::Kind() const {
    return TransportKind::RemoteShell;
}

std::string SshTransport::Describe() const {
    return host_;
}

CommandResult SshTransport::Push(
    const std::string& localPath,
    const std::string& remotePath,
    bool compress,
    const CallContext& context) const {
    return Run(BuildPushCommand(localPath, remotePath, compress), context);
}

CommandResult SshTransport::Exec(const std::string& command, const CallContext& context) const {
    return Run(BuildExecCommand(command), context);
}

std::vector<std::string> SshTransport::BuildPushCommand(
    const std::string& localPath, const std::string& remotePath, bool compress) const {
    std::vector<std::string> command = {options_.scpBinary};
    const auto connect = ConnectOptions();
    command.insert(command.end(), connect.begin(), connect.end());
    if (compress) {
        command.emplace_back("-C");
    }
    command.insert(command.end(), {localPath, host_ + ":" + remotePath});
    return command;
}

std::vector<std::string> SshTransport::BuildExecCommand(const std::string& command) const {
    std::vector<std::string> argv = {options_.sshBinary};
    const auto connect = ConnectOptions();
    argv.insert(argv.end(), connect.begin(), connect.end());
    argv.insert(argv.end(), {host_, command});
    return argv;
}

std::vector<std::string> SshTransport::ConnectOptions() const {
    return {
        "-o", "BatchMode=yes",
        "-o", "ConnectTimeout=" + std::to_string(options_.connectTimeout.count())
    };
}

CommandResult SshTransport::Run(std::vector<std::string> argv, const CallContext& context) const {
    return Dispatch(runner_, MakeRequest(std::move(argv), context));
}

std::unique_ptr<RemoteTransport> MakeTransport(
    const std::string& targetHost,
    const TransportOptions& options,
    CommandRunner runner) {
    if (targetHost.empty()) {
        return nullptr;
    }

    const std::string prefix(kDevicePrefix);
    if (targetHost.rfind(prefix, 0) == 0) {
        return std::make_unique<AdbTransport>(targetHost.substr(prefix.size()), options, std::move(runner));
    }

    return std::make_unique<SshTransport>(targetHost, options, std::move(runner));
}
