#pragma once

#include "ErrorClassifier.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct CheckpointFlags {
    bool leaveRunning = false;
    bool tcpEstablished = true;
    bool shellJob = true;
    bool extUnixSk = true;
    bool fileLocks = true;
};

struct CheckpointConfig {
    std::string containerId;
    std::string checkpointDir;
    bool leaveRunning = false;
    bool tcpEstablished = true;
    bool shellJob = true;
    bool extUnixSk = true;
    bool fileLocks = true;

    CheckpointFlags Flags() const;
};

struct CheckpointStatus {
    bool success = false;
    std::optional<std::string> checkpointPath;
    std::optional<std::string> errorMessage;
    std::vector<std::string> warnings;
    ErrorKind errorKind = ErrorKind::None;
};

struct CheckpointPackage {
    std::string packagePath;
    std::string checksum;
    std::uintmax_t sizeBytes = 0;
    std::string containerId;
    nlohmann::json metadata;
};

struct TransferConfig {
    std::string sourcePath;
    std::string targetHost;
    std::string targetPath;
    bool compress = true;
    bool verifyChecksum = true;
    bool cleanupSource = false;
};

struct TransferOutcome {
    bool success = false;
    std::string errorMessage;
    std::vector<std::string> warnings;
    ErrorKind errorKind = ErrorKind::None;
};

struct MigrationConfig {
    std::string containerId;
    std::string sourceHost = "localhost";
    std::string targetHost;
    std::string sourceArch = "x86_64";
    std::string targetArch = "aarch64";
    bool preserveNetworking = true;
    bool preserveVolumes = true;
    bool rollbackOnFailure = true;
    std::chrono::seconds validationTimeout{300};
    bool dryRun = false;
};

enum class MigrationStatus {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED,
    ROLLED_BACK
};

struct MigrationResult {
    bool success = false;
    MigrationStatus status = MigrationStatus::PENDING;
    std::string containerId;
    std::optional<std::string> sourceCheckpointPath;
    std::optional<std::string> targetCheckpointPath;
    std::optional<std::string> errorMessage;
    ErrorKind errorKind = ErrorKind::None;
    std::vector<std::string> warnings;
    std::chrono::duration<double> migrationTime{0.0};
};

struct CompatibilityCheck {
    bool isCompatible = false;
    bool architectureCompatible = false;
    bool kernelCompatible = false;
    bool runtimeCompatible = false;
    std::vector<std::string> issues;
    std::vector<std::string> recommendations;
};

std::string ToString(MigrationStatus status);

// PENDING -> IN_PROGRESS -> {COMPLETED | FAILED}, FAILED -> ROLLED_BACK.
bool IsValidTransition(MigrationStatus from, MigrationStatus to);
