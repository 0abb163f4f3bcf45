#include "ArchiveManager.hpp"
#include "CheckpointPackageManager.hpp"
#include "ContainerRuntime.hpp"
#include "CriuManager.hpp"
#include "MigrationOrchestrator.hpp"
#include "Settings.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {
constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  ferryctl check <container> [--target-arch A]\n"
              << "  ferryctl migrate <container> <target-host> [--source-arch A] [--target-arch A]\n"
              << "                   [--no-preserve-networking] [--no-preserve-volumes] [--no-rollback]\n"
              << "                   [--timeout S] [--dry-run]\n"
              << "  ferryctl restore <checkpoint-dir>\n"
              << "  ferryctl checkpoints\n"
              << "  ferryctl packages\n"
              << "Target hosts: adb:<serial> (or adb: for the only device) or an ssh destination.\n";
}

std::optional<long> ParseSeconds(const std::string& text) {
    try {
        size_t index = 0;
        const long value = std::stol(text, &index);
        if (index == text.size()) {
            return value;
        }
    } catch (const std::exception&) {
    }
    return std::nullopt;
}

void PrintList(const char* title, const std::vector<std::string>& items) {
    if (items.empty()) {
        return;
    }
    std::cout << title << ":\n";
    for (const auto& item : items) {
        std::cout << "  - " << item << "\n";
    }
}

void PrintCompatibility(const std::string& containerId, const CompatibilityCheck& check) {
    std::cout << "Compatibility report for " << containerId << "\n"
              << "  compatible:   " << (check.isCompatible ? "yes" : "no") << "\n"
              << "  architecture: " << (check.architectureCompatible ? "ok" : "incompatible") << "\n"
              << "  kernel:       " << (check.kernelCompatible ? "ok" : "incompatible") << "\n"
              << "  runtime:      " << (check.runtimeCompatible ? "ok" : "incompatible") << "\n";
    PrintList("Issues", check.issues);
    PrintList("Recommendations", check.recommendations);
}

void PrintMigration(const MigrationResult& result) {
    std::cout << "Migration report for " << result.containerId << "\n"
              << "  status:   " << ToString(result.status) << "\n"
              << "  success:  " << (result.success ? "yes" : "no") << "\n"
              << "  duration: " << result.migrationTime.count() << "s\n";
    if (result.sourceCheckpointPath) {
        std::cout << "  source checkpoint: " << *result.sourceCheckpointPath << "\n";
    }
    if (result.targetCheckpointPath) {
        std::cout << "  target checkpoint: " << *result.targetCheckpointPath << "\n";
    }
    if (result.errorMessage) {
        std::cout << "  error (" << ToString(result.errorKind) << "): " << *result.errorMessage << "\n";
    }
    PrintList("Warnings", result.warnings);
}

MigrationOrchestrator BuildOrchestrator(const FerrySettings& settings) {
    const TransportOptions transportOptions = settings.transport;
    auto transports = [transportOptions](const std::string& targetHost) {
        return MakeTransport(targetHost, transportOptions);
    };

    ContainerRuntime runtime(settings.dockerBinary);
    CriuManager criu(settings.criuBinary, settings.checkpointDir, runtime);
    CheckpointPackageManager packages(settings.workDir, ArchiveManager(CommandRunner(), settings.tarBinary), transports);

    OrchestratorOptions options;
    options.workDir = settings.workDir;
    options.remoteWorkDir = settings.remoteWorkDir;
    options.remoteCriuBinary = settings.remoteCriuBinary;
    options.remoteDockerBinary = settings.remoteDockerBinary;
    options.deviceCriuBinary = settings.deviceCriuBinary;
    options.deviceLibraryPath = settings.deviceLibraryPath;
    options.probeTimeout = settings.transport.probeTimeout;
    options.validationPollInterval = settings.validationPollInterval;

    return MigrationOrchestrator(std::move(criu), std::move(packages), std::move(runtime), transports, options);
}

int RunCheck(MigrationOrchestrator& orchestrator, const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    std::string targetArch = "aarch64";
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--target-arch" && i + 1 < args.size()) {
            targetArch = args[++i];
        } else {
            std::cerr << "[Ferry] Unknown option for check: " << args[i] << std::endl;
            return kExitUsage;
        }
    }

    const CompatibilityCheck check = orchestrator.CheckCompatibility(args[0], targetArch);
    PrintCompatibility(args[0], check);
    std::cout << "  source runtime: " << orchestrator.Criu().RuntimeVersion() << "\n";
    return check.isCompatible ? kExitOk : kExitFailed;
}

int RunMigrate(MigrationOrchestrator& orchestrator, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        PrintUsage();
        return kExitUsage;
    }

    MigrationConfig config;
    config.containerId = args[0];
    config.targetHost = args[1];

    for (size_t i = 2; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool hasValue = i + 1 < args.size();
        if (arg == "--source-arch" && hasValue) {
            config.sourceArch = args[++i];
        } else if (arg == "--target-arch" && hasValue) {
            config.targetArch = args[++i];
        } else if (arg == "--no-preserve-networking") {
            config.preserveNetworking = false;
        } else if (arg == "--no-preserve-volumes") {
            config.preserveVolumes = false;
        } else if (arg == "--no-rollback") {
            config.rollbackOnFailure = false;
        } else if (arg == "--dry-run") {
            config.dryRun = true;
        } else if (arg == "--timeout" && hasValue) {
            const auto seconds = ParseSeconds(args[++i]);
            if (!seconds) {
                std::cerr << "[Ferry] Invalid timeout: " << args[i] << std::endl;
                return kExitUsage;
            }
            config.validationTimeout = std::chrono::seconds(*seconds);
        } else {
            std::cerr << "[Ferry] Unknown option for migrate: " << arg << std::endl;
            return kExitUsage;
        }
    }

    const MigrationResult result = orchestrator.Migrate(config);
    PrintMigration(result);
    return result.success ? kExitOk : kExitFailed;
}

int RunRestore(const MigrationOrchestrator& orchestrator, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        PrintUsage();
        return kExitUsage;
    }

    const CheckpointStatus status = orchestrator.Criu().Restore(args[0]);
    if (!status.success) {
        std::cerr << "[Ferry] Restore failed (" << ToString(status.errorKind)
                  << "): " << status.errorMessage.value_or("unknown error") << std::endl;
        return kExitFailed;
    }

    std::cout << "Restored checkpoint " << args[0] << "\n";
    PrintList("Warnings", status.warnings);
    return kExitOk;
}

int RunListCheckpoints(const MigrationOrchestrator& orchestrator) {
    for (const auto& checkpoint : orchestrator.Criu().ListCheckpoints()) {
        std::cout << checkpoint.value("checkpoint_path", "") << "  "
                  << checkpoint.value("container_id", "?") << "  "
                  << checkpoint.value("checkpoint_time", "?") << "  "
                  << checkpoint.value("architecture", "?") << "\n";
    }
    return kExitOk;
}

int RunListPackages(const MigrationOrchestrator& orchestrator) {
    for (const auto& package : orchestrator.Packages().ListPackages()) {
        std::cout << package.value("package_path", "") << "  "
                  << package.value("size_bytes", 0) << " bytes  "
                  << (package.value("verified", false) ? "verified" : "UNVERIFIED") << "\n";
    }
    return kExitOk;
}
} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        PrintUsage();
        return args.empty() ? kExitUsage : kExitOk;
    }

    const FerrySettings settings = LoadSettingsFromEnv();
    Tracer::Instance().Configure(settings.tracing);

    const std::string command = args[0];
    args.erase(args.begin());

    int exitCode = kExitUsage;
    try {
        MigrationOrchestrator orchestrator = BuildOrchestrator(settings);
        if (command == "check") {
            exitCode = RunCheck(orchestrator, args);
        } else if (command == "migrate") {
            exitCode = RunMigrate(orchestrator, args);
        } else if (command == "restore") {
            exitCode = RunRestore(orchestrator, args);
        } else if (command == "checkpoints") {
            exitCode = RunListCheckpoints(orchestrator);
        } else if (command == "packages") {
            exitCode = RunListPackages(orchestrator);
        } else {
            std::cerr << "[Ferry] Unknown command: " << command << std::endl;
            PrintUsage();
        }
    } catch (const std::exception& ex) {
        std::cerr << "[Ferry] " << ex.what() << std::endl;
        exitCode = kExitFailed;
    }

    Tracer::Instance().Shutdown();
    return exitCode;
}
