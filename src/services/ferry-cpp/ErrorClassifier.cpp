#include "ErrorClassifier.hpp"

#include <array>
#include <sstream>

namespace {
enum class Condition {
    SpawnFailure,
    ExitCode,
    AnyFailure
};

struct ClassificationRule {
    Tool tool;
    Condition condition;
    int exitCode;
    ErrorKind kind;
};

// First matching rule wins.
constexpr std::array<ClassificationRule, 14> kRules = {{
    {Tool::CheckpointTool, Condition::SpawnFailure, 0, ErrorKind::Environment},
    {Tool::CheckpointTool, Condition::ExitCode, 126, ErrorKind::Environment},
    {Tool::CheckpointTool, Condition::ExitCode, 127, ErrorKind::Environment},
    {Tool::CheckpointTool, Condition::AnyFailure, 0, ErrorKind::Checkpoint},
    {Tool::RemoteCheckpointTool, Condition::ExitCode, 255, ErrorKind::Transfer},
    {Tool::RemoteCheckpointTool, Condition::SpawnFailure, 0, ErrorKind::Transfer},
    {Tool::RemoteCheckpointTool, Condition::AnyFailure, 0, ErrorKind::Checkpoint},
    {Tool::ContainerRuntime, Condition::SpawnFailure, 0, ErrorKind::Environment},
    {Tool::ContainerRuntime, Condition::ExitCode, 127, ErrorKind::Environment},
    {Tool::ContainerRuntime, Condition::AnyFailure, 0, ErrorKind::Validation},
    {Tool::Archive, Condition::ExitCode, 127, ErrorKind::Environment},
    {Tool::Archive, Condition::AnyFailure, 0, ErrorKind::Checkpoint},
    {Tool::RemoteCopy, Condition::AnyFailure, 0, ErrorKind::Transfer},
    {Tool::RemoteExec, Condition::AnyFailure, 0, ErrorKind::Transfer},
}};

bool Matches(const ClassificationRule& rule, const CommandResult& result) {
    switch (rule.condition) {
    case Condition::SpawnFailure:
        return result.spawnFailed;
    case Condition::ExitCode:
        return !result.spawnFailed && !result.timedOut && result.exitCode == rule.exitCode;
    case Condition::AnyFailure:
        return true;
    }
    return false;
}
} // namespace

ErrorKind ClassifyFailure(Tool tool, const CommandResult& result) {
    if (result.Succeeded()) {
        return ErrorKind::None;
    }

    for (const auto& rule : kRules) {
        if (rule.tool == tool && Matches(rule, result)) {
            return rule.kind;
        }
    }
    return ErrorKind::Checkpoint;
}

std::string ToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Environment:
        return "EnvironmentError";
    case ErrorKind::Validation:
        return "ValidationError";
    case ErrorKind::Checkpoint:
        return "CheckpointError";
    case ErrorKind::Transfer:
        return "TransferError";
    case ErrorKind::Integrity:
        return "IntegrityError";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

std::string ToString(Tool tool) {
    switch (tool) {
    case Tool::CheckpointTool:
        return "checkpoint tool";
    case Tool::RemoteCheckpointTool:
        return "remote checkpoint tool";
    case Tool::ContainerRuntime:
        return "container runtime";
    case Tool::Archive:
        return "archiver";
    case Tool::RemoteCopy:
        return "remote copy";
    case Tool::RemoteExec:
        return "remote exec";
    }
    return "unknown tool";
}

std::string DescribeFailure(Tool tool, const CommandResult& result) {
    std::ostringstream output;
    output << ToString(tool);
    if (result.spawnFailed) {
        output << " could not be started";
    } else if (result.timedOut) {
        output << " timed out";
    } else {
        output << " exited with " << result.exitCode;
    }

    const std::string detail = TrimOutput(result.stderrText);
    if (!detail.empty()) {
        output << ": " << detail;
    }
    return output.str();
}
