#pragma once

#include "ProcessRunner.hpp"

#include <string>

enum class ErrorKind {
    None,
    Environment,
    Validation,
    Checkpoint,
    Transfer,
    Integrity,
    Cancelled
};

enum class Tool {
    CheckpointTool,
    RemoteCheckpointTool,
    ContainerRuntime,
    Archive,
    RemoteCopy,
    RemoteExec
};

ErrorKind ClassifyFailure(Tool tool, const CommandResult& result);

std::string ToString(ErrorKind kind);
std::string ToString(Tool tool);

// "<tool> exited with <code>: <stderr>" or the timeout/spawn equivalent.
std::string DescribeFailure(Tool tool, const CommandResult& result);
