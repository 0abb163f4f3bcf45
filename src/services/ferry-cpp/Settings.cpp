#include "Settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>

FerrySettings LoadSettingsFromEnv() {
    FerrySettings settings;

    settings.criuBinary = GetEnvOrDefault("FERRY_CRIU_BINARY", settings.criuBinary);
    settings.dockerBinary = GetEnvOrDefault("FERRY_DOCKER_BINARY", settings.dockerBinary);
    settings.tarBinary = GetEnvOrDefault("FERRY_TAR_BINARY", settings.tarBinary);
    settings.checkpointDir = GetEnvOrDefault("FERRY_CHECKPOINT_DIR", settings.checkpointDir);
    settings.workDir = GetEnvOrDefault("FERRY_WORK_DIR", settings.workDir);

    settings.remoteWorkDir = GetEnvOrDefault("FERRY_REMOTE_WORK_DIR", settings.remoteWorkDir);
    settings.remoteCriuBinary = GetEnvOrDefault("FERRY_REMOTE_CRIU_BINARY", settings.remoteCriuBinary);
    settings.remoteDockerBinary = GetEnvOrDefault("FERRY_REMOTE_DOCKER_BINARY", settings.remoteDockerBinary);
    settings.deviceCriuBinary = GetEnvOrDefault("FERRY_DEVICE_CRIU_BINARY", settings.deviceCriuBinary);
    settings.deviceLibraryPath = GetEnvOrDefault("FERRY_DEVICE_LIBRARY_PATH", settings.deviceLibraryPath);

    settings.transport.adbBinary = GetEnvOrDefault("FERRY_ADB_BINARY", settings.transport.adbBinary);
    settings.transport.sshBinary = GetEnvOrDefault("FERRY_SSH_BINARY", settings.transport.sshBinary);
    settings.transport.scpBinary = GetEnvOrDefault("FERRY_SCP_BINARY", settings.transport.scpBinary);
    settings.transport.connectTimeout = std::chrono::seconds(
        GetEnvLong("FERRY_CONNECT_TIMEOUT", static_cast<long>(settings.transport.connectTimeout.count())));
    settings.transport.probeTimeout = std::chrono::seconds(
        GetEnvLong("FERRY_PROBE_TIMEOUT", static_cast<long>(settings.transport.probeTimeout.count())));

    settings.validationPollInterval = std::chrono::milliseconds(
        GetEnvLong("FERRY_VALIDATION_POLL_MS", static_cast<long>(settings.validationPollInterval.count())));

    settings.tracing.enabled = GetEnvBool("FERRY_OTEL_ENABLED", false);
    settings.tracing.endpoint = GetEnvOrDefault("FERRY_OTEL_ENDPOINT", "");
    settings.tracing.serviceName = GetEnvOrDefault("FERRY_OTEL_SERVICE_NAME", "ferry-migration");
    return settings;
}

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    return defaultValue;
}

long GetEnvLong(const char* name, long defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    try {
        size_t index = 0;
        const std::string text(value);
        const long parsed = std::stol(text, &index);
        if (index == text.size() && parsed >= 0) {
            return parsed;
        }
    } catch (const std::exception&) {
    }

    return defaultValue;
}
