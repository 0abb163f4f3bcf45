#pragma once

#include "ProcessRunner.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

// Thin wrapper over the container runtime CLI (`docker inspect` and friends).
class ContainerRuntime {
public:
    explicit ContainerRuntime(std::string binary = "docker", CommandRunner runner = CommandRunner());

    // First element of `inspect <id>`; nullopt when the container is unknown.
    std::optional<nlohmann::json> Inspect(
        const std::string& containerId, std::string* error = nullptr, const CallContext& context = {}) const;
    std::optional<int> RootPid(
        const std::string& containerId, std::string* error = nullptr, const CallContext& context = {}) const;
    std::string ImageArchitecture(const std::string& image, const CallContext& context = {}) const;
    std::string Version(const CallContext& context = {}) const;

    static std::vector<std::string> BuildInspectCommand(const std::string& binary, const std::string& containerId);
    static std::vector<std::string> BuildPidCommand(const std::string& binary, const std::string& containerId);

private:
    CommandResult Run(std::vector<std::string> argv, const CallContext& context) const;

    std::string binary_;
    CommandRunner runner_;
};
