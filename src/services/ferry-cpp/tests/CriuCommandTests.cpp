#include "CriuManager.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

int main() {
    CheckpointFlags flags;
    const std::vector<std::string> expectedDump = {
        "criu", "dump", "-t", "4321", "-D", "/tmp/snapshots", "-v4", "--log-file", "/tmp/snapshots/dump.log",
        "--tcp-established", "--shell-job", "--ext-unix-sk", "--file-locks"};
    const auto dumpCommand = CriuManager::BuildDumpCommand("criu", 4321, "/tmp/snapshots", flags);
    if (dumpCommand != expectedDump) {
        return Fail("Unexpected dump command: " + FormatCommand(dumpCommand));
    }

    flags.leaveRunning = true;
    flags.tcpEstablished = false;
    if (!HasArg(CriuManager::BuildDumpCommand("criu", 1, "/tmp/x", flags), "--leave-running")) {
        return Fail("leaveRunning should map to --leave-running.");
    }
    if (HasArg(CriuManager::BuildDumpCommand("criu", 1, "/tmp/x", flags), "--tcp-established")) {
        return Fail("tcpEstablished=false should drop --tcp-established.");
    }
    if (!CriuManager::BuildDumpCommand("criu", 0, "/tmp/x", flags).empty()) {
        return Fail("Dump command must be empty for an invalid PID.");
    }

    const std::vector<std::string> expectedRestore = {
        "criu", "restore", "-D", "/tmp/snapshots", "-v4", "--log-file", "/tmp/snapshots/restore.log",
        "--restore-detached", "--tcp-established", "--shell-job", "--ext-unix-sk", "--file-locks"};
    const auto restoreCommand = CriuManager::BuildRestoreCommand("criu", "/tmp/snapshots", CheckpointFlags());
    if (restoreCommand != expectedRestore) {
        return Fail("Unexpected restore command: " + FormatCommand(restoreCommand));
    }
    if (!CriuManager::BuildRestoreCommand("criu", "", CheckpointFlags()).empty()) {
        return Fail("Restore command must be empty for an empty directory.");
    }

    TempDir base("ferry-criu");
    nlohmann::json container = RunningContainer("web");
    int criuExit = 0;
    std::vector<std::vector<std::string>> calls;
    std::vector<CommandRequest> requests;

    CommandRunner runner = [&](const CommandRequest& request) -> CommandResult {
        calls.push_back(request.argv);
        requests.push_back(request);
        const auto& argv = request.argv;
        if (argv[0] == "docker") {
            if (argv.size() == 3 && argv[1] == "inspect") {
                return Ok(InspectOutput(container));
            }
            if (argv[1] == "inspect" && argv[2] == "-f") {
                return Ok("4242\n");
            }
            if (argv[1] == "--version") {
                return Ok("Docker version 24.0.7\n");
            }
        }
        if (argv[0] == "criu" && argv[1] == "dump") {
            WriteFile(std::filesystem::path(ArgAfter(argv, "-D")) / "dump.log", "dump finished\n");
            return criuExit == 0 ? Ok() : Exit(criuExit, "Error (criu/cr-dump.c): dump failed");
        }
        if (argv[0] == "criu" && argv[1] == "restore") {
            return criuExit == 0 ? Ok() : Exit(criuExit, "restore failed");
        }
        return Exit(1, "unexpected command");
    };

    CriuManager manager("criu", base.Str(), ContainerRuntime("docker", runner), runner);

    CheckpointConfig config;
    config.containerId = "web";
    config.tcpEstablished = false;
    ChildTracker tracker;
    CallContext context;
    context.timeout = std::chrono::seconds(30);
    context.tracker = &tracker;
    const CheckpointStatus dumped = manager.Dump(config, context);
    if (!dumped.success || !dumped.checkpointPath) {
        return Fail("Dump should succeed: " + dumped.errorMessage.value_or(""));
    }
    if (*dumped.checkpointPath != (base.Path() / "web").string()) {
        return Fail("Dump directory should be <base>/<container>: " + *dumped.checkpointPath);
    }

    std::vector<std::string> dumpCall;
    for (const auto& call : calls) {
        if (call[0] == "criu" && call[1] == "dump") {
            dumpCall = call;
        }
    }
    if (ArgAfter(dumpCall, "-t") != "4242") {
        return Fail("Dump should target the container's root PID.");
    }
    for (const auto& request : requests) {
        if (request.timeout != context.timeout || request.tracker != &tracker) {
            return Fail("Every call made by Dump should carry the caller's budget: " + FormatCommand(request.argv));
        }
    }

    const auto metadata = nlohmann::json::parse(ReadFile(base.Path() / "web" / "metadata.json"));
    for (const char* field : {"container_id", "checkpoint_time", "architecture", "kernel_version", "runtime_version"}) {
        if (!metadata.contains(field)) {
            return Fail(std::string("metadata.json missing ") + field);
        }
    }
    if (metadata["runtime_version"] != "Docker version 24.0.7" || metadata["flags"]["tcp_established"] != false) {
        return Fail("metadata.json should record runtime version and dump flags.");
    }

    const CheckpointStatus valid = manager.ValidateDump(*dumped.checkpointPath);
    if (!valid.success || !valid.warnings.empty()) {
        return Fail("Fresh checkpoint should validate cleanly.");
    }

    calls.clear();
    const CheckpointStatus restored = manager.Restore(*dumped.checkpointPath, std::string("web-restored"));
    if (!restored.success || calls.empty()) {
        return Fail("Restore should succeed: " + restored.errorMessage.value_or(""));
    }
    if (HasArg(calls.back(), "--tcp-established") || !HasArg(calls.back(), "--shell-job")) {
        return Fail("Restore should reuse the flags recorded at dump time: " + FormatCommand(calls.back()));
    }
    if (restored.warnings.empty()) {
        return Fail("Restoring under a new id should warn.");
    }

    // Checkpoints written before flags were recorded restore with the historical set.
    WriteFile(base.Path() / "legacy" / "metadata.json",
              R"({"container_id":"legacy","checkpoint_time":"2024-01-01T00:00:00Z","architecture":"x86_64"})");
    const CheckpointFlags legacy = CriuManager::LoadRecordedFlags((base.Path() / "legacy").string());
    if (legacy.tcpEstablished || !legacy.shellJob || !legacy.extUnixSk || !legacy.fileLocks || legacy.leaveRunning) {
        return Fail("Legacy checkpoints should default to shell-job, ext-unix-sk and file-locks.");
    }

    const CheckpointStatus missingLog = manager.ValidateDump((base.Path() / "legacy").string());
    if (missingLog.success) {
        return Fail("A checkpoint without dump.log must not validate.");
    }

    criuExit = 1;
    config.containerId = "broken";
    const CheckpointStatus failed = manager.Dump(config);
    if (failed.success || failed.errorKind != ErrorKind::Checkpoint) {
        return Fail("Non-zero dump exit should be a checkpoint error.");
    }
    if (!failed.checkpointPath || !std::filesystem::exists(*failed.checkpointPath)) {
        return Fail("Partial dump directory should be kept for inspection.");
    }
    if (failed.errorMessage.value_or("").find("CRIU dump failed") == std::string::npos) {
        return Fail("Dump failure message should carry the tool diagnostics.");
    }

    criuExit = 127;
    if (manager.Dump(config).errorKind != ErrorKind::Environment) {
        return Fail("Missing checkpoint tool should be an environment error.");
    }
    criuExit = 0;

    container["State"]["Status"] = "exited";
    calls.clear();
    const CheckpointStatus stopped = manager.Dump(config);
    if (stopped.success || stopped.errorKind != ErrorKind::Validation) {
        return Fail("Dump of a stopped container should be a validation error.");
    }
    for (const auto& call : calls) {
        if (call[0] == "criu") {
            return Fail("Checkpoint tool must not run for a stopped container.");
        }
    }

    container = RunningContainer("web");
    container["HostConfig"]["Privileged"] = true;
    container["HostConfig"]["Binds"] = nlohmann::json::array({"/srv:/srv"});
    const auto [ok, warnings] = manager.ValidateForCheckpoint("web");
    if (!ok || warnings.size() != 2) {
        return Fail("Privileged mode and bind mounts should be soft warnings.");
    }

    container = RunningContainer("web");
    container["HostConfig"]["NetworkMode"] = "host";
    container["Config"]["ExposedPorts"] = {{"80/tcp", nlohmann::json::object()}};
    const auto [networkedOk, networkWarnings] = manager.ValidateForCheckpoint("web");
    if (!networkedOk || networkWarnings.size() != 2
        || networkWarnings[0] != "Container uses host networking"
        || networkWarnings[1] != "Container has exposed ports") {
        return Fail("Host networking and exposed ports should be soft warnings.");
    }
    container = RunningContainer("web");

    if (manager.RuntimeVersion() != "Docker version 24.0.7") {
        return Fail("RuntimeVersion should report the runtime's --version output.");
    }

    const auto checkpoints = manager.ListCheckpoints();
    // "broken" never got a metadata.json, so only web and legacy are listed.
    if (checkpoints.size() != 2) {
        return Fail("Expected 2 checkpoints, got " + std::to_string(checkpoints.size()));
    }

    if (!manager.CleanupCheckpoint((base.Path() / "broken").string())
        || std::filesystem::exists(base.Path() / "broken")) {
        return Fail("CleanupCheckpoint should remove the directory.");
    }
    if (!manager.CleanupCheckpoint((base.Path() / "missing").string())) {
        return Fail("Cleaning up a missing checkpoint should succeed.");
    }

    CriuManager broken("criu", base.Str(), ContainerRuntime("docker", [](const CommandRequest&) {
        return Exit(1, "Cannot connect to the Docker daemon");
    }));
    if (broken.RuntimeVersion() != "unknown") {
        return Fail("Unreachable runtime should report an unknown version.");
    }

    CriuManager absent("/nonexistent/ferry/criu", base.Str(), ContainerRuntime("docker", runner), runner);
    const CheckpointStatus environment = absent.ConfigureEnvironment();
    if (environment.success || environment.errorKind != ErrorKind::Environment) {
        return Fail("Missing checkpoint binary should be an environment error.");
    }

    return 0;
}
