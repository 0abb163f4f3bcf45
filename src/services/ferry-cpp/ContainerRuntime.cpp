#include "ContainerRuntime.hpp"

#include "ErrorClassifier.hpp"

#include <exception>
#include <utility>

ContainerRuntime::ContainerRuntime(std::string binary, CommandRunner runner)
    : binary_(std::move(binary)),
      runner_(std::move(runner)) {}

std::optional<nlohmann::json> ContainerRuntime::Inspect(
    const std::string& containerId, std::string* error, const CallContext& context) const {
    if (containerId.empty()) {
        if (error != nullptr) {
            *error = "empty container id";
        }
        return std::nullopt;
    }

    const CommandResult result = Run(BuildInspectCommand(binary_, containerId), context);
    if (!result.Succeeded()) {
        if (error != nullptr) {
            *error = DescribeFailure(Tool::ContainerRuntime, result);
        }
        return std::nullopt;
    }

    auto json = nlohmann::json::parse(result.stdoutText, nullptr, false);
    if (json.is_discarded() || !json.is_array() || json.empty() || !json[0].is_object()) {
        if (error != nullptr) {
            *error = "unexpected inspect output for " + containerId;
        }
        return std::nullopt;
    }

    return json[0];
}

std::optional<int> ContainerRuntime::RootPid(
    const std::string& containerId, std::string* error, const CallContext& context) const {
    const CommandResult result = Run(BuildPidCommand(binary_, containerId), context);
    if (!result.Succeeded()) {
        if (error != nullptr) {
            *error = DescribeFailure(Tool::ContainerRuntime, result);
        }
        return std::nullopt;
    }

    const std::string text = TrimOutput(result.stdoutText);
    try {
        size_t index = 0;
        const int pid = std::stoi(text, &index);
        if (index == text.size() && pid > 0) {
            return pid;
        }
    } catch (const std::exception&) {
    }

    if (error != nullptr) {
        *error = "container " + containerId + " has no running process (pid '" + text + "')";
    }
    return std::nullopt;
}

std::string ContainerRuntime::ImageArchitecture(const std::string& image, const CallContext& context) const {
    if (image.empty()) {
        return "unknown";
    }

    const CommandResult result = Run({binary_, "image", "inspect", "-f", "{{.Architecture}}", image}, context);
    const std::string arch = TrimOutput(result.stdoutText);
    if (!result.Succeeded() || arch.empty()) {
        return "unknown";
    }
    return arch;
}

std::string ContainerRuntime::Version(const CallContext& context) const {
    const CommandResult result = Run({binary_, "--version"}, context);
    if (!result.Succeeded()) {
        return "unknown";
    }
    return TrimOutput(result.stdoutText);
}

std::vector<std::string> ContainerRuntime::BuildInspectCommand(const std::string& binary, const std::string& containerId) {
    return {binary, "inspect", containerId};
}

std::vector<std::string> ContainerRuntime::BuildPidCommand(const std::string& binary, const std::string& containerId) {
    return {binary, "inspect", "-f", "{{.State.Pid}}", containerId};
}

CommandResult ContainerRuntime::Run(std::vector<std::string> argv, const CallContext& context) const {
    const CommandRequest request = MakeRequest(std::move(argv), context);
    if (runner_) {
        return runner_(request);
    }

    return RunProcess(request);
}
