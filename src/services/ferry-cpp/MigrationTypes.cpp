#include "MigrationTypes.hpp"

CheckpointFlags CheckpointConfig::Flags() const {
    CheckpointFlags flags;
    flags.leaveRunning = leaveRunning;
    flags.tcpEstablished = tcpEstablished;
    flags.shellJob = shellJob;
    flags.extUnixSk = extUnixSk;
    flags.fileLocks = fileLocks;
    return flags;
}

std::string ToString(MigrationStatus status) {
    switch (status) {
    case MigrationStatus::PENDING:
        return "PENDING";
    case MigrationStatus::IN_PROGRESS:
        return "IN_PROGRESS";
    case MigrationStatus::COMPLETED:
        return "COMPLETED";
    case MigrationStatus::FAILED:
        return "FAILED";
    case MigrationStatus::ROLLED_BACK:
        return "ROLLED_BACK";
    }
    return "UNKNOWN";
}

bool IsValidTransition(MigrationStatus from, MigrationStatus to) {
    switch (from) {
    case MigrationStatus::PENDING:
        return to == MigrationStatus::IN_PROGRESS;
    case MigrationStatus::IN_PROGRESS:
        return to == MigrationStatus::COMPLETED || to == MigrationStatus::FAILED;
    case MigrationStatus::FAILED:
        return to == MigrationStatus::ROLLED_BACK;
    case MigrationStatus::COMPLETED:
    case MigrationStatus::ROLLED_BACK:
        return false;
    }
    return false;
}
