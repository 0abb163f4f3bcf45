#include "MigrationOrchestrator.hpp"

#include "ArchiveManager.hpp"
#include "Tracing.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

using Clock = std::chrono::steady_clock;

struct MigrationRun {
    const MigrationConfig& config;
    MigrationResult& result;
    ActiveMigration* entry;
    Clock::time_point deadline;
    std::optional<CheckpointPackage> package;
    std::unique_ptr<RemoteTransport> transport;
    bool rollbackAttempted = false;
};

namespace {
constexpr const char* kCancelledMessage = "Migration cancelled by user";

std::string Join(const std::vector<std::string>& items, const std::string& separator) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += item;
    }
    return joined;
}

std::string NormalizeArchitecture(const std::string& arch) {
    if (arch == "x86_64" || arch == "amd64") {
        return "amd64";
    }
    if (arch == "aarch64" || arch == "arm64") {
        return "arm64";
    }
    return arch;
}

bool HasEntries(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return false;
    }
    return (it->is_array() || it->is_object()) && !it->empty();
}

bool Expired(const MigrationRun& run) {
    return run.deadline != Clock::time_point::max() && Clock::now() >= run.deadline;
}

CallContext Budget(const MigrationRun& run) {
    CallContext context;
    if (run.entry != nullptr) {
        context.tracker = &run.entry->Child();
    }
    if (run.deadline == Clock::time_point::max()) {
        return context;
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(run.deadline - Clock::now());
    context.timeout = std::max(remaining, std::chrono::milliseconds(1));
    return context;
}

void Publish(MigrationRun& run) {
    if (run.entry != nullptr) {
        run.entry->Publish(run.result);
    }
}

bool IsCancelled(const MigrationRun& run) {
    return run.entry != nullptr && run.entry->IsCancelled();
}
} // namespace

MigrationOrchestrator::MigrationOrchestrator(
    CriuManager criu,
    CheckpointPackageManager packages,
    ContainerRuntime runtime,
    TransportFactory transports,
    OrchestratorOptions options)
    : criu_(std::move(criu)),
      packages_(std::move(packages)),
      runtime_(std::move(runtime)),
      transports_(std::move(transports)),
      options_(std::move(options)) {}

PrerequisiteReport MigrationOrchestrator::ValidatePrerequisites(
    const MigrationConfig& config, const CallContext& context) const {
    PrerequisiteReport report;
    auto addError = [&report](ErrorKind kind, std::string message) {
        if (report.errorKind == ErrorKind::None) {
            report.errorKind = kind;
        }
        report.errors.push_back(std::move(message));
    };

    try {
        const auto info = runtime_.Inspect(config.containerId, nullptr, context);
        if (!info) {
            addError(ErrorKind::Validation, "Container " + config.containerId + " not found on source");
            return report;
        }

        const auto& state = info->value("State", nlohmann::json::object());
        if (state.value("Status", "") != "running") {
            addError(ErrorKind::Validation, "Container " + config.containerId + " is not running");
        }

        const CheckpointStatus environment = criu_.ConfigureEnvironment(context);
        if (!environment.success) {
            addError(ErrorKind::Environment,
                     "Checkpoint tool not usable: " + environment.errorMessage.value_or("unknown error"));
        }

        std::unique_ptr<RemoteTransport> transport;
        if (transports_) {
            transport = transports_(config.targetHost);
        }
        if (!transport) {
            addError(ErrorKind::Validation, "Unsupported target host '" + config.targetHost + "'");
        } else if (!transport->Probe(options_.probeTimeout, context.tracker)) {
            addError(ErrorKind::Validation, "Cannot connect to target host: " + transport->Describe());
        }
    } catch (const std::exception& ex) {
        addError(ErrorKind::Validation, std::string("Prerequisites validation failed: ") + ex.what());
    }

    report.ok = report.errors.empty();
    return report;
}

CompatibilityCheck MigrationOrchestrator::CheckCompatibility(
    const std::string& containerId, const std::string& targetArch, const CallContext& context) const {
    CompatibilityCheck check;

    try {
        const auto info = runtime_.Inspect(containerId, nullptr, context);
        if (!info) {
            check.issues.push_back("Container " + containerId + " not found");
            return check;
        }

        const auto& config = info->value("Config", nlohmann::json::object());
        const auto& hostConfig = info->value("HostConfig", nlohmann::json::object());

        check.architectureCompatible = true;
        const std::string imageArch = runtime_.ImageArchitecture(config.value("Image", ""), context);
        if (imageArch != "amd64" && imageArch != "arm64" && imageArch != "unknown") {
            check.architectureCompatible = false;
            check.issues.push_back("Unsupported image architecture: " + imageArch);
        } else if (imageArch != "unknown" && NormalizeArchitecture(imageArch) != NormalizeArchitecture(targetArch)) {
            check.issues.push_back("Image architecture " + imageArch + " differs from target " + targetArch);
            check.recommendations.push_back("Use a multi-architecture image that provides a " + targetArch + " variant");
        }

        check.kernelCompatible = true;
        if (hostConfig.value("Privileged", false)) {
            check.kernelCompatible = false;
            check.issues.push_back("Privileged containers may not migrate properly");
            check.recommendations.push_back("Consider running without privileged mode");
        }

        check.runtimeCompatible = true;
        if (hostConfig.value("NetworkMode", "") == "host") {
            check.runtimeCompatible = false;
            check.issues.push_back("Host networking mode not compatible with migration");
            check.recommendations.push_back("Use bridge or custom network mode");
        }

        if (HasEntries(hostConfig, "Devices")) {
            check.runtimeCompatible = false;
            check.issues.push_back("Device mounts may not be available on target");
            check.recommendations.push_back("Remove device dependencies or ensure target compatibility");
        }

        if (HasEntries(hostConfig, "Binds")) {
            check.issues.push_back("Host bind mounts may not exist on target");
            check.recommendations.push_back("Ensure bind mount paths exist on target or use volumes");
        }

        if (HasEntries(hostConfig, "CapAdd")) {
            check.issues.push_back("Additional capabilities may not be available on target");
            check.recommendations.push_back("Verify capability support on target kernel");
        }

        check.isCompatible = check.architectureCompatible && check.kernelCompatible && check.runtimeCompatible;
    } catch (const std::exception& ex) {
        std::cerr << "[Migration] Compatibility check failed for " << containerId << ": " << ex.what() << std::endl;
        check = CompatibilityCheck{};
        check.issues.push_back(std::string("Compatibility check failed: ") + ex.what());
    }

    return check;
}

MigrationResult MigrationOrchestrator::Migrate(const MigrationConfig& config) {
    const auto started = Clock::now();

    MigrationResult result;
    result.containerId = config.containerId;

    StepSpan span("migration.run", config.containerId);
    span.Annotate("target.host", config.targetHost);
    std::cout << "[Migration] Starting migration of " << config.containerId << " to " << config.targetHost
              << " (trace " << span.TraceParent() << ")" << std::endl;

    const auto deadline = config.validationTimeout.count() > 0
        ? started + config.validationTimeout
        : Clock::time_point::max();

    std::shared_ptr<ActiveMigration> entry;
    if (!config.containerId.empty()) {
        entry = registry_.TryAcquire(config.containerId, result);
    }

    if (!entry) {
        MigrationRun rejected{config, result, nullptr, deadline, std::nullopt, nullptr};
        Fail(rejected,
             ErrorKind::Validation,
             config.containerId.empty()
                 ? std::string("Container id is required")
                 : "Migration already in progress for container " + config.containerId);
        result.migrationTime = Clock::now() - started;
        return result;
    }

    MigrationLease lease(registry_, config.containerId, entry);
    MigrationRun run{config, result, entry.get(), deadline, std::nullopt, nullptr};

    try {
        RunPipeline(run);
    } catch (const std::exception& ex) {
        std::cerr << "[Migration] Migration of " << config.containerId << " failed with exception: " << ex.what() << std::endl;
        Fail(run, ErrorKind::Checkpoint, std::string("Migration failed: ") + ex.what());
        if (!run.rollbackAttempted) {
            RollBack(run);
        }
    }

    // A checkpoint finished after CancelMigration already ran its cleanup.
    if (IsCancelled(run) && result.sourceCheckpointPath && !criu_.CleanupCheckpoint(*result.sourceCheckpointPath)) {
        result.warnings.push_back("Failed to clean up checkpoint " + *result.sourceCheckpointPath);
    }

    result.migrationTime = Clock::now() - started;
    Publish(run);

    if (result.success) {
        span.Succeed();
        std::cout << "[Migration] Migration of " << config.containerId << " completed in "
                  << result.migrationTime.count() << "s" << std::endl;
    } else {
        std::cerr << "[Migration] Migration of " << config.containerId << " ended " << ToString(result.status)
                  << ": " << result.errorMessage.value_or("unknown error") << std::endl;
    }
    return result;
}

void MigrationOrchestrator::RunPipeline(MigrationRun& run) {
    const MigrationConfig& config = run.config;
    Transition(run, MigrationStatus::IN_PROGRESS);

    {
        StepSpan span("migration.prerequisites", config.containerId);
        std::cout << "[Migration] Validating migration prerequisites..." << std::endl;
        const PrerequisiteReport report = ValidatePrerequisites(config, Budget(run));
        if (!report.ok) {
            Fail(run, report.errorKind, "Prerequisites validation failed: " + Join(report.errors, "; "));
            return;
        }
        span.Succeed();
    }

    {
        StepSpan span("migration.compatibility", config.containerId);
        std::cout << "[Migration] Checking container compatibility..." << std::endl;
        const CompatibilityCheck compatibility = CheckCompatibility(config.containerId, config.targetArch, Budget(run));
        if (!compatibility.isCompatible) {
            Fail(run, ErrorKind::Validation, "Container not compatible: " + Join(compatibility.issues, "; "));
            return;
        }
        run.result.warnings.insert(run.result.warnings.end(), compatibility.issues.begin(), compatibility.issues.end());
        if (!config.preserveVolumes) {
            run.result.warnings.emplace_back("Volume contents are not carried to the target");
        }
        span.Succeed();
    }

    if (config.dryRun) {
        run.result.warnings.emplace_back("Dry run: stopped after compatibility check, container untouched");
        run.result.success = true;
        Transition(run, MigrationStatus::COMPLETED);
        return;
    }

    if (!CreateCheckpoint(run) || !PackageCheckpoint(run) || !TransferCheckpoint(run)
        || !RestoreOnTarget(run) || !ValidateSuccess(run)) {
        RollBack(run);
        return;
    }

    run.result.success = true;
    Transition(run, MigrationStatus::COMPLETED);
}

bool MigrationOrchestrator::CreateCheckpoint(MigrationRun& run) {
    if (Interrupted(run, "checkpoint", ErrorKind::Checkpoint)) {
        return false;
    }

    StepSpan span("migration.checkpoint", run.config.containerId);
    std::cout << "[Migration] Creating checkpoint on source..." << std::endl;

    CheckpointConfig checkpoint;
    checkpoint.containerId = run.config.containerId;
    checkpoint.checkpointDir = (std::filesystem::path(options_.workDir) / "source_checkpoints").string();
    checkpoint.leaveRunning = false;
    checkpoint.tcpEstablished = run.config.preserveNetworking;
    checkpoint.shellJob = true;
    checkpoint.extUnixSk = true;
    checkpoint.fileLocks = true;

    CheckpointStatus status = criu_.Dump(checkpoint, Budget(run));
    run.result.warnings.insert(run.result.warnings.end(), status.warnings.begin(), status.warnings.end());
    if (!status.success) {
        Fail(run,
             status.errorKind == ErrorKind::None ? ErrorKind::Checkpoint : status.errorKind,
             "Checkpoint creation failed: " + status.errorMessage.value_or("unknown error"));
        return false;
    }

    run.result.sourceCheckpointPath = status.checkpointPath;
    Publish(run);
    span.Succeed();
    return true;
}

bool MigrationOrchestrator::PackageCheckpoint(MigrationRun& run) {
    if (Interrupted(run, "packaging", ErrorKind::Checkpoint)) {
        return false;
    }

    StepSpan span("migration.package", run.config.containerId);
    std::cout << "[Migration] Packaging checkpoint for transfer..." << std::endl;

    run.package = packages_.Package(*run.result.sourceCheckpointPath, std::nullopt, Budget(run));
    if (!run.package) {
        Fail(run, ErrorKind::Checkpoint, "Failed to package checkpoint");
        return false;
    }

    span.Annotate("package.checksum", run.package->checksum);
    span.Succeed();
    return true;
}

bool MigrationOrchestrator::TransferCheckpoint(MigrationRun& run) {
    if (Interrupted(run, "transfer", ErrorKind::Transfer)) {
        return false;
    }

    StepSpan span("migration.transfer", run.config.containerId);
    std::cout << "[Migration] Transferring checkpoint to target..." << std::endl;

    if (transports_) {
        run.transport = transports_(run.config.targetHost);
    }
    if (!run.transport) {
        Fail(run, ErrorKind::Transfer, "No transport for target host '" + run.config.targetHost + "'");
        return false;
    }

    const CommandResult prepared = run.transport->Exec("mkdir -p " + ShellQuote(options_.remoteWorkDir), Budget(run));
    if (!prepared.Succeeded()) {
        Fail(run,
             ClassifyFailure(Tool::RemoteExec, prepared),
             "Failed to prepare target directory: " + DescribeFailure(Tool::RemoteExec, prepared));
        return false;
    }

    TransferConfig transfer;
    transfer.sourcePath = run.package->packagePath;
    transfer.targetHost = run.config.targetHost;
    transfer.targetPath = RemotePackagePath(run.config.containerId);
    transfer.compress = true;
    transfer.verifyChecksum = true;
    transfer.cleanupSource = false;

    TransferOutcome outcome = packages_.Transfer(transfer, Budget(run));
    run.result.warnings.insert(run.result.warnings.end(), outcome.warnings.begin(), outcome.warnings.end());
    if (!outcome.success) {
        Fail(run,
             outcome.errorKind == ErrorKind::None ? ErrorKind::Transfer : outcome.errorKind,
             "Failed to transfer checkpoint to target: " + outcome.errorMessage);
        return false;
    }

    span.Succeed();
    return true;
}

bool MigrationOrchestrator::RestoreOnTarget(MigrationRun& run) {
    if (Interrupted(run, "restore", ErrorKind::Checkpoint)) {
        return false;
    }

    StepSpan span("migration.restore", run.config.containerId);
    std::cout << "[Migration] Restoring container on target..." << std::endl;

    const std::string remoteDir = RemoteCheckpointDir(run.config.containerId);
    const CommandResult unpacked = run.transport->Exec(
        ArchiveManager::BuildRemoteExtractCommand(RemotePackagePath(run.config.containerId), remoteDir), Budget(run));
    if (!unpacked.Succeeded()) {
        Fail(run,
             ClassifyFailure(Tool::RemoteExec, unpacked),
             "Failed to unpack checkpoint on target: " + DescribeFailure(Tool::RemoteExec, unpacked));
        return false;
    }

    if (Interrupted(run, "restore", ErrorKind::Checkpoint)) {
        return false;
    }

    const CheckpointFlags flags = CriuManager::LoadRecordedFlags(*run.result.sourceCheckpointPath);
    const CommandResult restored = run.transport->Exec(
        BuildRemoteRestoreCommand(run.transport->Kind(), remoteDir, flags), Budget(run));
    if (!restored.Succeeded()) {
        Fail(run,
             ClassifyFailure(Tool::RemoteCheckpointTool, restored),
             "Failed to restore container on target: " + DescribeFailure(Tool::RemoteCheckpointTool, restored));
        return false;
    }

    run.result.targetCheckpointPath = remoteDir;
    Publish(run);
    span.Succeed();
    return true;
}

bool MigrationOrchestrator::ValidateSuccess(MigrationRun& run) {
    if (Interrupted(run, "validation", ErrorKind::Checkpoint)) {
        return false;
    }

    StepSpan span("migration.validate", run.config.containerId);
    std::cout << "[Migration] Validating migration success..." << std::endl;

    const std::string command = BuildRemoteLivenessCommand(run.config.containerId);
    int attempts = 0;
    while (true) {
        if (IsCancelled(run)) {
            Fail(run, ErrorKind::Cancelled, kCancelledMessage);
            return false;
        }

        ++attempts;
        const CommandResult probe = run.transport->Exec(command, Budget(run));
        if (probe.Succeeded() && TrimOutput(probe.stdoutText) == "true") {
            std::cout << "[Migration] Container " << run.config.containerId << " is running on target" << std::endl;
            span.Succeed();
            return true;
        }

        if (Expired(run) || run.deadline == Clock::time_point::max()) {
            break;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(run.deadline - Clock::now());
        std::this_thread::sleep_for(std::min(options_.validationPollInterval, remaining));
        if (Expired(run)) {
            break;
        }
    }

    std::cerr << "[Migration] Container " << run.config.containerId << " not running on target after "
              << attempts << " probe(s)" << std::endl;
    run.result.warnings.emplace_back("Container validation failed - not running on target");
    Fail(run,
         ErrorKind::Checkpoint,
         "Migration validation failed: container " + run.config.containerId + " not running on target after restore");
    return false;
}

void MigrationOrchestrator::RollBack(MigrationRun& run) {
    if (!run.config.rollbackOnFailure || run.rollbackAttempted) {
        return;
    }
    run.rollbackAttempted = true;

    StepSpan span("migration.rollback", run.config.containerId);
    std::cout << "[Migration] Attempting rollback..." << std::endl;

    try {
        if (IsCancelled(run)) {
            run.result.warnings.emplace_back("Rollback skipped: migration cancelled");
            return;
        }

        if (!run.result.sourceCheckpointPath) {
            run.result.warnings.emplace_back("Rollback skipped: no checkpoint available");
            std::cerr << "[Migration] No checkpoint available for rollback" << std::endl;
            return;
        }

        CallContext context;
        if (run.entry != nullptr) {
            context.tracker = &run.entry->Child();
        }

        const CheckpointStatus restored = criu_.Restore(*run.result.sourceCheckpointPath, std::nullopt, context);
        if (restored.success) {
            Transition(run, MigrationStatus::ROLLED_BACK);
            run.result.warnings.emplace_back("Migration rolled back successfully");
            std::cout << "[Migration] Migration rolled back successfully" << std::endl;
            span.Succeed();
        } else {
            const std::string reason = restored.errorMessage.value_or("unknown error");
            run.result.warnings.push_back("Rollback failed: " + reason);
            std::cerr << "[Migration] Rollback failed: " << reason << std::endl;
        }
    } catch (const std::exception& ex) {
        run.result.warnings.push_back(std::string("Rollback failed: ") + ex.what());
        std::cerr << "[Migration] Rollback failed: " << ex.what() << std::endl;
    }

    Publish(run);
}

bool MigrationOrchestrator::Transition(MigrationRun& run, MigrationStatus next) {
    const MigrationStatus current = run.result.status;
    if (!IsValidTransition(current, next)) {
        std::cerr << "[Migration] Ignoring status change " << ToString(current) << " -> " << ToString(next)
                  << " for " << run.config.containerId << std::endl;
        return false;
    }

    run.result.status = next;
    Publish(run);
    if (observer_) {
        observer_(run.config.containerId, next);
    }
    return true;
}

void MigrationOrchestrator::Fail(MigrationRun& run, ErrorKind kind, const std::string& message) {
    std::cerr << "[Migration] " << message << std::endl;
    run.result.success = false;
    if (IsCancelled(run)) {
        // A step killed by CancelMigration reports the cancellation, not the step error.
        run.result.errorMessage = kCancelledMessage;
        run.result.errorKind = ErrorKind::Cancelled;
    } else if (!run.result.errorMessage) {
        run.result.errorMessage = message;
        run.result.errorKind = kind;
    }

    if (run.result.status == MigrationStatus::PENDING) {
        Transition(run, MigrationStatus::IN_PROGRESS);
    }
    if (run.result.status == MigrationStatus::IN_PROGRESS) {
        Transition(run, MigrationStatus::FAILED);
    }
}

bool MigrationOrchestrator::Interrupted(MigrationRun& run, const std::string& step, ErrorKind deadlineKind) {
    if (IsCancelled(run)) {
        Fail(run, ErrorKind::Cancelled, kCancelledMessage);
        return true;
    }

    if (Expired(run)) {
        Fail(run,
             deadlineKind,
             "Migration deadline of " + std::to_string(run.config.validationTimeout.count())
                 + "s exceeded before " + step);
        return true;
    }
    return false;
}

std::optional<MigrationResult> MigrationOrchestrator::GetMigrationStatus(const std::string& containerId) const {
    const auto entry = registry_.Find(containerId);
    if (!entry) {
        return std::nullopt;
    }
    return entry->Snapshot();
}

std::vector<MigrationResult> MigrationOrchestrator::ListActiveMigrations() const {
    return registry_.List();
}

bool MigrationOrchestrator::CancelMigration(const std::string& containerId) {
    const auto entry = registry_.Find(containerId);
    if (!entry) {
        return false;
    }

    if (!entry->MarkCancelled(kCancelledMessage)) {
        return false;
    }

    std::cout << "[Migration] Cancelling migration of " << containerId << std::endl;
    entry->Child().Terminate();

    const MigrationResult snapshot = entry->Snapshot();
    if (snapshot.sourceCheckpointPath && !criu_.CleanupCheckpoint(*snapshot.sourceCheckpointPath)) {
        std::cerr << "[Migration] Failed to clean up checkpoint of cancelled migration: "
                  << *snapshot.sourceCheckpointPath << std::endl;
    }

    if (!registry_.Retire(containerId, entry)) {
        std::cout << "[Migration] Migration of " << containerId << " finished while cancelling" << std::endl;
    }
    return true;
}

bool MigrationOrchestrator::IsTracked(const std::string& containerId) const {
    return registry_.Contains(containerId);
}

void MigrationOrchestrator::SetStatusObserver(StatusObserver observer) {
    observer_ = std::move(observer);
}

std::string MigrationOrchestrator::RemotePackagePath(const std::string& containerId) const {
    return (std::filesystem::path(options_.remoteWorkDir) / (containerId + "_checkpoint.tar.gz")).string();
}

std::string MigrationOrchestrator::RemoteCheckpointDir(const std::string& containerId) const {
    return (std::filesystem::path(options_.remoteWorkDir) / (containerId + "_restored")).string();
}

std::string MigrationOrchestrator::BuildRemoteRestoreCommand(
    TransportKind kind,
    const std::string& checkpointDir,
    const CheckpointFlags& flags) const {
    if (kind == TransportKind::DeviceBridge) {
        const std::string command =
            JoinShellCommand(CriuManager::BuildRestoreCommand(options_.deviceCriuBinary, checkpointDir, flags));
        if (options_.deviceLibraryPath.empty()) {
            return command;
        }
        return "LD_LIBRARY_PATH=" + ShellQuote(options_.deviceLibraryPath) + " " + command;
    }

    return JoinShellCommand(CriuManager::BuildRestoreCommand(options_.remoteCriuBinary, checkpointDir, flags));
}

std::string MigrationOrchestrator::BuildRemoteLivenessCommand(const std::string& containerId) const {
    return JoinShellCommand({options_.remoteDockerBinary, "inspect", "-f", "{{.State.Running}}", containerId});
}
