#include "Settings.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <cstdlib>

int main() {
    unsetenv("FERRY_CRIU_BINARY");
    unsetenv("FERRY_PROBE_TIMEOUT");
    const FerrySettings defaults = LoadSettingsFromEnv();
    if (defaults.criuBinary != "/data/local/tmp/criu" || defaults.workDir != "/data/local/tmp/migration"
        || defaults.transport.probeTimeout != std::chrono::seconds(15) || defaults.tracing.enabled) {
        return Fail("Unexpected default settings.");
    }
    if (defaults.tracing.serviceName != "ferry-migration") {
        return Fail("Default service name should be ferry-migration.");
    }

    setenv("FERRY_CRIU_BINARY", "/usr/sbin/criu", 1);
    setenv("FERRY_REMOTE_DOCKER_BINARY", "podman", 1);
    setenv("FERRY_CONNECT_TIMEOUT", "3", 1);
    setenv("FERRY_PROBE_TIMEOUT", "soon", 1);
    setenv("FERRY_VALIDATION_POLL_MS", "250", 1);
    setenv("FERRY_OTEL_ENABLED", "YES", 1);
    const FerrySettings custom = LoadSettingsFromEnv();
    if (custom.criuBinary != "/usr/sbin/criu" || custom.remoteDockerBinary != "podman") {
        return Fail("String settings should come from the environment.");
    }
    if (custom.transport.connectTimeout != std::chrono::seconds(3)
        || custom.validationPollInterval != std::chrono::milliseconds(250)) {
        return Fail("Numeric settings should come from the environment.");
    }
    if (custom.transport.probeTimeout != std::chrono::seconds(15)) {
        return Fail("Unparsable numbers should fall back to the default.");
    }
    if (!custom.tracing.enabled) {
        return Fail("Booleans should parse case-insensitively.");
    }

    setenv("FERRY_TEST_FLAG", "maybe", 1);
    if (!GetEnvBool("FERRY_TEST_FLAG", true) || GetEnvBool("FERRY_TEST_FLAG", false)) {
        return Fail("Unrecognised booleans should fall back to the default.");
    }
    setenv("FERRY_TEST_FLAG", "0", 1);
    if (GetEnvBool("FERRY_TEST_FLAG", true)) {
        return Fail("0 should parse as false.");
    }

    setenv("FERRY_TEST_NUMBER", "-5", 1);
    if (GetEnvLong("FERRY_TEST_NUMBER", 9) != 9) {
        return Fail("Negative numbers should fall back to the default.");
    }

    return 0;
}
