#pragma once

#include "RemoteTransport.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <string>

struct FerrySettings {
    std::string criuBinary = "/data/local/tmp/criu";
    std::string dockerBinary = "docker";
    std::string tarBinary = "tar";
    std::string checkpointDir = "/data/local/tmp/checkpoints";
    std::string workDir = "/data/local/tmp/migration";

    std::string remoteWorkDir = "/data/local/tmp/migration";
    std::string remoteCriuBinary = "criu";
    std::string remoteDockerBinary = "docker";
    std::string deviceCriuBinary = "/data/local/tmp/criu";
    std::string deviceLibraryPath = "/data/local/tmp/lib";

    TransportOptions transport;
    std::chrono::milliseconds validationPollInterval{1000};

    TraceConfig tracing;
};

FerrySettings LoadSettingsFromEnv();

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue);
bool GetEnvBool(const char* name, bool defaultValue);
long GetEnvLong(const char* name, long defaultValue);
