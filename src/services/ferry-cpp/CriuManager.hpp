#pragma once

#include "ContainerRuntime.hpp"
#include "MigrationTypes.hpp"
#include "ProcessRunner.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

class CriuManager {
public:
    CriuManager(
        std::string criuBinary,
        std::string checkpointBaseDir,
        ContainerRuntime runtime,
        CommandRunner runner = CommandRunner());

    // Binary present, executable and `criu check` exits 0.
    CheckpointStatus ConfigureEnvironment(const CallContext& context = {}) const;
    std::pair<bool, std::vector<std::string>> ValidateForCheckpoint(
        const std::string& containerId, const CallContext& context = {}) const;

    CheckpointStatus Dump(const CheckpointConfig& config, const CallContext& context = {}) const;
    CheckpointStatus ValidateDump(const std::string& checkpointPath) const;
    CheckpointStatus Restore(
        const std::string& checkpointPath,
        const std::optional<std::string>& newContainerId = std::nullopt,
        const CallContext& context = {}) const;

    std::vector<nlohmann::json> ListCheckpoints() const;
    bool CleanupCheckpoint(const std::string& checkpointPath) const;

    // Container runtime `--version`, "unknown" when it cannot be queried.
    std::string RuntimeVersion(const CallContext& context = {}) const { return runtime_.Version(context); }

    static std::vector<std::string> BuildDumpCommand(
        const std::string& criuBinary,
        int pid,
        const std::string& outputDir,
        const CheckpointFlags& flags);
    static std::vector<std::string> BuildRestoreCommand(
        const std::string& criuBinary,
        const std::string& inputDir,
        const CheckpointFlags& flags);

    // Flags recorded in metadata.json at dump time. Checkpoints written before
    // flags were recorded restore with shell-job, ext-unix-sk and file-locks.
    static CheckpointFlags LoadRecordedFlags(const std::string& checkpointPath);

private:
    CommandResult Run(std::vector<std::string> argv, const CallContext& context = {}) const;

    std::string criuBinary_;
    std::string checkpointBaseDir_;
    ContainerRuntime runtime_;
    CommandRunner runner_;
};
