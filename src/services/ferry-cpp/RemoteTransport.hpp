#pragma once

#include "ProcessRunner.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

enum class TransportKind {
    DeviceBridge,
    RemoteShell
};

struct TransportOptions {
    std::string adbBinary = "adb";
    std::string sshBinary = "ssh";
    std::string scpBinary = "scp";
    std::chrono::seconds connectTimeout{10};
    std::chrono::seconds probeTimeout{15};
};

// Moves files to a target host and runs commands there.
class RemoteTransport {
public:
    virtual ~RemoteTransport() = default;

    virtual TransportKind Kind() const = 0;
    virtual std::string Describe() const = 0;

    virtual CommandResult Push(
        const std::string& localPath,
        const std::string& remotePath,
        bool compress,
        const CallContext& context) const = 0;
    virtual CommandResult Exec(const std::string& command, const CallContext& context) const = 0;

    // Liveness probe: `echo` on the target with a short fixed timeout.
    bool Probe(std::chrono::seconds timeout, ChildTracker* tracker = nullptr) const;
};

class AdbTransport : public RemoteTransport {
public:
    AdbTransport(std::string device, TransportOptions options, CommandRunner runner = CommandRunner());

    TransportKind Kind() const override;
    std::string Describe() const override;
    CommandResult Push(
        const std::string& localPath,
        const std::string& remotePath,
        bool compress,
        const CallContext& context) const override;
    CommandResult Exec(const std::string& command, const CallContext& context) const override;

    std::vector<std::string> BuildPushCommand(const std::string& localPath, const std::string& remotePath) const;
    std::vector<std::string> BuildExecCommand(const std::string& command) const;

private:
    std::vector<std::string> BaseCommand() const;
    CommandResult Run(std::vector<std::string> argv, const CallContext& context) const;

    std::string device_;
    TransportOptions options_;
    CommandRunner runner_;
};

class SshTransport : public RemoteTransport {
public:
    SshTransport(std::string host, TransportOptions options, CommandRunner runner = CommandRunner());

    TransportKind Kind() const override;
    std::string Describe() const override;
    CommandResult Push(
        const std::string& localPath,
        const std::string& remotePath,
        bool compress,
        const CallContext& context) const override;
    CommandResult Exec(const std::string& command, const CallContext& context) const override;

    std::vector<std::string> BuildPushCommand(
        const std::string& localPath, const std::string& remotePath, bool compress) const;
    std::vector<std::string> BuildExecCommand(const std::string& command) const;

private:
    std::vector<std::string> ConnectOptions() const;
    CommandResult Run(std::vector<std::string> argv, const CallContext& context) const;

    std::string host_;
    TransportOptions options_;
    CommandRunner runner_;
};

// "adb:<device>" selects the device bridge ("adb:" and "adb:default" mean the
// only attached device); anything else is a remote-shell host. Returns null
// for an empty host.
std::unique_ptr<RemoteTransport> MakeTransport(
    const std::string& targetHost,
    const TransportOptions& options,
    CommandRunner runner = CommandRunner());
