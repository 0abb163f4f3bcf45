#pragma once

#include "CheckpointPackageManager.hpp"
#include "ContainerRuntime.hpp"
#include "CriuManager.hpp"
#include "MigrationRegistry.hpp"
#include "MigrationTypes.hpp"
#include "RemoteTransport.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct OrchestratorOptions {
    std::string workDir = "/data/local/tmp/migration";
    std::string remoteWorkDir = "/data/local/tmp/migration";
    std::string remoteCriuBinary = "criu";
    std::string remoteDockerBinary = "docker";
    std::string deviceCriuBinary = "/data/local/tmp/criu";
    std::string deviceLibraryPath = "/data/local/tmp/lib";
    std::chrono::seconds probeTimeout{15};
    std::chrono::milliseconds validationPollInterval{1000};
};

struct PrerequisiteReport {
    bool ok = false;
    std::vector<std::string> errors;
    ErrorKind errorKind = ErrorKind::None;
};

struct MigrationRun;

// Drives checkpoint -> package -> transfer -> remote restore -> validation for
// one container, rolling the source back on failure. Distinct containers may
// migrate concurrently from different threads; a second migration of the same
// container is rejected while the first is tracked.
class MigrationOrchestrator {
public:
    using TransportFactory = CheckpointPackageManager::TransportFactory;
    using StatusObserver = std::function<void(const std::string& containerId, MigrationStatus status)>;

    MigrationOrchestrator(
        CriuManager criu,
        CheckpointPackageManager packages,
        ContainerRuntime runtime,
        TransportFactory transports,
        OrchestratorOptions options);

    PrerequisiteReport ValidatePrerequisites(const MigrationConfig& config, const CallContext& context = {}) const;
    CompatibilityCheck CheckCompatibility(
        const std::string& containerId,
        const std::string& targetArch = "aarch64",
        const CallContext& context = {}) const;
    MigrationResult Migrate(const MigrationConfig& config);

    std::optional<MigrationResult> GetMigrationStatus(const std::string& containerId) const;
    std::vector<MigrationResult> ListActiveMigrations() const;
    // Marks the tracked migration FAILED, terminates its running child process
    // and removes the source checkpoint. False if nothing is tracked. The
    // container cannot be migrated again until the cancelled call returns.
    bool CancelMigration(const std::string& containerId);
    bool IsTracked(const std::string& containerId) const;

    // Must be set before migrations start; invoked on every status transition.
    void SetStatusObserver(StatusObserver observer);

    const CriuManager& Criu() const { return criu_; }
    const CheckpointPackageManager& Packages() const { return packages_; }

    std::string RemotePackagePath(const std::string& containerId) const;
    std::string RemoteCheckpointDir(const std::string& containerId) const;
    std::string BuildRemoteRestoreCommand(
        TransportKind kind,
        const std::string& checkpointDir,
        const CheckpointFlags& flags) const;
    std::string BuildRemoteLivenessCommand(const std::string& containerId) const;

private:
    void RunPipeline(MigrationRun& run);
    bool CreateCheckpoint(MigrationRun& run);
    bool PackageCheckpoint(MigrationRun& run);
    bool TransferCheckpoint(MigrationRun& run);
    bool RestoreOnTarget(MigrationRun& run);
    bool ValidateSuccess(MigrationRun& run);
    void RollBack(MigrationRun& run);

    bool Transition(MigrationRun& run, MigrationStatus next);
    void Fail(MigrationRun& run, ErrorKind kind, const std::string& message);
    bool Interrupted(MigrationRun& run, const std::string& step, ErrorKind deadlineKind);

    CriuManager criu_;
    CheckpointPackageManager packages_;
    ContainerRuntime runtime_;
    TransportFactory transports_;
    OrchestratorOptions options_;
    MigrationRegistry registry_;
    StatusObserver observer_;
};
