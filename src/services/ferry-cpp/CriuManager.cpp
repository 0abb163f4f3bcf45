#include "CriuManager.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#include <sys/utsname.h>
#include <unistd.h>

namespace {
constexpr const char* kMetadataFile = "metadata.json";
constexpr const char* kDumpLog = "dump.log";
constexpr const char* kRestoreLog = "restore.log";

std::string FormatIsoTimestamp() {
    const auto nowTime = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utcTime = {};
    gmtime_r(&nowTime, &utcTime);

    std::ostringstream output;
    output << std::put_time(&utcTime, "%Y-%m-%dT%H:%M:%SZ");
    return output.str();
}

std::string SanitizeContainerId(const std::string& containerId) {
    std::string safe = containerId;
    for (auto& ch : safe) {
        if (ch == '/' || ch == '\\') {
            ch = '_';
        }
    }
    return safe;
}

std::pair<std::string, std::string> DescribeHost() {
    struct utsname info;
    if (uname(&info) == 0) {
        return {info.machine, info.release};
    }
    return {"unknown", "unknown"};
}

bool IsExecutable(const std::string& binary) {
    if (binary.find('/') != std::string::npos) {
        return access(binary.c_str(), X_OK) == 0;
    }

    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return false;
    }

    std::istringstream paths(pathEnv);
    std::string dir;
    while (std::getline(paths, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const std::string candidate = dir + "/" + binary;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

nlohmann::json FlagsToJson(const CheckpointFlags& flags) {
    return {
        {"leave_running", flags.leaveRunning},
        {"tcp_established", flags.tcpEstablished},
        {"shell_job", flags.shellJob},
        {"ext_unix_sk", flags.extUnixSk},
        {"file_locks", flags.fileLocks}
    };
}

std::optional<nlohmann::json> ReadJsonFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return std::nullopt;
    }

    auto json = nlohmann::json::parse(input, nullptr, false);
    if (json.is_discarded()) {
        return std::nullopt;
    }
    return json;
}

CheckpointStatus Failure(ErrorKind kind, std::string message, std::vector<std::string> warnings = {}) {
    CheckpointStatus status;
    status.success = false;
    status.errorKind = kind;
    status.errorMessage = std::move(message);
    status.warnings = std::move(warnings);
    return status;
}
} // namespace

CriuManager::CriuManager(
    std::string criuBinary,
    std::string checkpointBaseDir,
    ContainerRuntime runtime,
    CommandRunner runner)
    : criuBinary_(std::move(criuBinary)),
      checkpointBaseDir_(std::move(checkpointBaseDir)),
      runtime_(std::move(runtime)),
      runner_(std::move(runner)) {}

CheckpointStatus CriuManager::ConfigureEnvironment(const CallContext& context) const {
    try {
        if (criuBinary_.find('/') != std::string::npos && !std::filesystem::exists(criuBinary_)) {
            std::cerr << "[Criu] Binary not found at " << criuBinary_ << std::endl;
            return Failure(ErrorKind::Environment, "CRIU binary not found at " + criuBinary_);
        }

        if (!IsExecutable(criuBinary_)) {
            std::cerr << "[Criu] Binary is not executable: " << criuBinary_ << std::endl;
            return Failure(ErrorKind::Environment, "CRIU binary is not executable: " + criuBinary_);
        }

        const CommandResult result = Run({criuBinary_, "check"}, context);
        if (!result.Succeeded()) {
            std::cerr << "[Criu] check failed: " << TrimOutput(result.stderrText) << std::endl;
            return Failure(ErrorKind::Environment, "CRIU check failed: " + DescribeFailure(Tool::CheckpointTool, result));
        }
    } catch (const std::exception& ex) {
        return Failure(ErrorKind::Environment, std::string("Failed to configure CRIU environment: ") + ex.what());
    }

    std::cout << "[Criu] Environment configured (" << criuBinary_ << ")" << std::endl;
    CheckpointStatus status;
    status.success = true;
    return status;
}

std::pair<bool, std::vector<std::string>> CriuManager::ValidateForCheckpoint(
    const std::string& containerId, const CallContext& context) const {
    std::vector<std::string> warnings;

    try {
        std::string error;
        const auto info = runtime_.Inspect(containerId, &error, context);
        if (!info) {
            return {false, {"Container " + containerId + " not found"}};
        }

        const auto& state = info->value("State", nlohmann::json::object());
        if (state.value("Status", "") != "running") {
            return {false, {"Container " + containerId + " is not running"}};
        }

        const auto& config = info->value("Config", nlohmann::json::object());
        const auto& hostConfig = info->value("HostConfig", nlohmann::json::object());

        if (hostConfig.value("Privileged", false)) {
            warnings.emplace_back("Container is running in privileged mode");
        }
        if (hostConfig.value("NetworkMode", "") == "host") {
            warnings.emplace_back("Container uses host networking");
        }

        const auto binds = hostConfig.find("Binds");
        if (binds != hostConfig.end() && binds->is_array() && !binds->empty()) {
            warnings.emplace_back("Container has bind mounts");
        }

        const auto ports = config.find("ExposedPorts");
        if (ports != config.end() && ports->is_object() && !ports->empty()) {
            warnings.emplace_back("Container has exposed ports");
        }
    } catch (const std::exception& ex) {
        std::cerr << "[Criu] Failed to validate container " << containerId << ": " << ex.what() << std::endl;
        return {false, {std::string("Validation error: ") + ex.what()}};
    }

    return {true, warnings};
}

CheckpointStatus CriuManager::Dump(const CheckpointConfig& config, const CallContext& context) const {
    try {
        auto [valid, warnings] = ValidateForCheckpoint(config.containerId, context);
        if (!valid) {
            std::ostringstream message;
            message << "Container validation failed:";
            for (const auto& warning : warnings) {
                message << ' ' << warning << ';';
            }
            return Failure(ErrorKind::Validation, message.str());
        }

        const std::filesystem::path baseDir = config.checkpointDir.empty() ? checkpointBaseDir_ : config.checkpointDir;
        const std::filesystem::path checkpointPath = baseDir / SanitizeContainerId(config.containerId);
        std::filesystem::create_directories(checkpointPath);

        std::string pidError;
        const auto pid = runtime_.RootPid(config.containerId, &pidError, context);
        if (!pid) {
            return Failure(ErrorKind::Validation, "Failed to get container PID: " + pidError, warnings);
        }

        const CheckpointFlags flags = config.Flags();
        std::cout << "[Criu] Creating checkpoint for container " << config.containerId
                  << " (pid " << *pid << ") in " << checkpointPath.string() << std::endl;

        const CommandResult result = Run(BuildDumpCommand(criuBinary_, *pid, checkpointPath.string(), flags), context);
        if (!result.Succeeded()) {
            std::cerr << "[Criu] Dump failed for " << config.containerId
                      << "; partial checkpoint kept at " << checkpointPath.string() << std::endl;
            CheckpointStatus status = Failure(
                ClassifyFailure(Tool::CheckpointTool, result),
                "CRIU dump failed: " + DescribeFailure(Tool::CheckpointTool, result),
                warnings);
            status.checkpointPath = checkpointPath.string();
            return status;
        }

        const auto [architecture, kernelVersion] = DescribeHost();
        nlohmann::json metadata = {
            {"container_id", config.containerId},
            {"checkpoint_time", FormatIsoTimestamp()},
            {"architecture", architecture},
            {"kernel_version", kernelVersion},
            {"runtime_version", runtime_.Version(context)},
            {"warnings", warnings},
            {"flags", FlagsToJson(flags)}
        };

        std::ofstream output(checkpointPath / kMetadataFile, std::ios::trunc);
        output << metadata.dump(2);
        if (!output.good()) {
            return Failure(ErrorKind::Checkpoint, "Failed to write checkpoint metadata in " + checkpointPath.string(), warnings);
        }

        std::cout << "[Criu] Checkpoint created at " << checkpointPath.string() << std::endl;
        CheckpointStatus status;
        status.success = true;
        status.checkpointPath = checkpointPath.string();
        status.warnings = std::move(warnings);
        return status;
    } catch (const std::exception& ex) {
        std::cerr << "[Criu] Checkpoint creation failed: " << ex.what() << std::endl;
        return Failure(ErrorKind::Checkpoint, std::string("Checkpoint creation failed: ") + ex.what());
    }
}

CheckpointStatus CriuManager::ValidateDump(const std::string& checkpointPath) const {
    try {
        const std::filesystem::path dir(checkpointPath);
        if (checkpointPath.empty() || !std::filesystem::is_directory(dir)) {
            return Failure(ErrorKind::Checkpoint, "Checkpoint directory not found: " + checkpointPath);
        }

        std::vector<std::string> missingFiles;
        for (const char* name : {kMetadataFile, kDumpLog}) {
            if (!std::filesystem::exists(dir / name)) {
                missingFiles.emplace_back(name);
            }
        }
        if (!missingFiles.empty()) {
            std::string message = "Missing checkpoint files:";
            for (const auto& name : missingFiles) {
                message += " " + name;
            }
            return Failure(ErrorKind::Checkpoint, message);
        }

        const auto metadata = ReadJsonFile(dir / kMetadataFile);
        if (!metadata || !metadata->is_object()) {
            return Failure(ErrorKind::Checkpoint, "Unreadable checkpoint metadata in " + checkpointPath);
        }

        std::string missingFields;
        for (const char* field : {"container_id", "checkpoint_time", "architecture"}) {
            if (!metadata->contains(field)) {
                missingFields += std::string(" ") + field;
            }
        }
        if (!missingFields.empty()) {
            return Failure(ErrorKind::Checkpoint, "Missing metadata fields:" + missingFields);
        }

        std::ifstream logInput(dir / kDumpLog);
        std::stringstream logContent;
        logContent << logInput.rdbuf();
        const std::string log = logContent.str();

        CheckpointStatus status;
        status.success = true;
        status.checkpointPath = checkpointPath;
        if (log.find("Error") != std::string::npos) {
            status.warnings.emplace_back("Errors found in dump log");
        }
        if (log.find("Warning") != std::string::npos) {
            status.warnings.emplace_back("Warnings found in dump log");
        }
        return status;
    } catch (const std::exception& ex) {
        return Failure(ErrorKind::Checkpoint, std::string("Checkpoint validation failed: ") + ex.what());
    }
}

CheckpointStatus CriuManager::Restore(
    const std::string& checkpointPath,
    const std::optional<std::string>& newContainerId,
    const CallContext& context) const {
    try {
        CheckpointStatus validation = ValidateDump(checkpointPath);
        if (!validation.success) {
            return validation;
        }

        const CheckpointFlags flags = LoadRecordedFlags(checkpointPath);
        std::cout << "[Criu] Restoring checkpoint from " << checkpointPath << std::endl;
        const CommandResult result = Run(BuildRestoreCommand(criuBinary_, checkpointPath, flags), context);
        if (!result.Succeeded()) {
            std::cerr << "[Criu] Restore failed: " << TrimOutput(result.stderrText) << std::endl;
            return Failure(
                ClassifyFailure(Tool::CheckpointTool, result),
                "CRIU restore failed: " + DescribeFailure(Tool::CheckpointTool, result),
                validation.warnings);
        }

        CheckpointStatus status;
        status.success = true;
        status.checkpointPath = checkpointPath;
        status.warnings = std::move(validation.warnings);

        const auto metadata = ReadJsonFile(std::filesystem::path(checkpointPath) / kMetadataFile);
        const std::string originalId = metadata ? metadata->value("container_id", "") : "";
        if (newContainerId && *newContainerId != originalId) {
            status.warnings.push_back(
                "Restored processes keep the identity of " + originalId + "; rename to " + *newContainerId
                + " must be applied by the container runtime");
        }

        std::cout << "[Criu] Checkpoint restored from " << checkpointPath << std::endl;
        return status;
    } catch (const std::exception& ex) {
        return Failure(ErrorKind::Checkpoint, std::string("Checkpoint restore failed: ") + ex.what());
    }
}

std::vector<nlohmann::json> CriuManager::ListCheckpoints() const {
    std::vector<nlohmann::json> checkpoints;

    std::error_code ec;
    if (!std::filesystem::is_directory(checkpointBaseDir_, ec)) {
        return checkpoints;
    }

    for (const auto& entry : std::filesystem::directory_iterator(checkpointBaseDir_, ec)) {
        if (!entry.is_directory(ec)) {
            continue;
        }

        auto metadata = ReadJsonFile(entry.path() / kMetadataFile);
        if (!metadata || !metadata->is_object()) {
            continue;
        }

        (*metadata)["checkpoint_path"] = entry.path().string();
        checkpoints.push_back(std::move(*metadata));
    }

    if (ec) {
        std::cerr << "[Criu] Failed to list checkpoints: " << ec.message() << std::endl;
    }
    return checkpoints;
}

bool CriuManager::CleanupCheckpoint(const std::string& checkpointPath) const {
    if (checkpointPath.empty()) {
        return false;
    }

    std::error_code ec;
    std::filesystem::remove_all(checkpointPath, ec);
    if (ec) {
        std::cerr << "[Criu] Failed to clean up checkpoint " << checkpointPath << ": " << ec.message() << std::endl;
        return false;
    }

    std::cout << "[Criu] Checkpoint cleaned up: " << checkpointPath << std::endl;
    return true;
}

std::vector<std::string> CriuManager::BuildDumpCommand(
    const std::string& criuBinary,
    int pid,
    const std::string& outputDir,
    const CheckpointFlags& flags) {
    if (pid <= 0 || outputDir.empty()) {
        return {};
    }

    std::vector<std::string> command = {
        criuBinary, "dump",
        "-t", std::to_string(pid),
        "-D", outputDir,
        "-v4",
        "--log-file", (std::filesystem::path(outputDir) / kDumpLog).string()
    };

    if (flags.leaveRunning) {
        command.emplace_back("--leave-running");
    }
    if (flags.tcpEstablished) {
        command.emplace_back("--tcp-established");
    }
    if (flags.shellJob) {
        command.emplace_back("--shell-job");
    }
    if (flags.extUnixSk) {
        command.emplace_back("--ext-unix-sk");
    }
    if (flags.fileLocks) {
        command.emplace_back("--file-locks");
    }
    return command;
}

std::vector<std::string> CriuManager::BuildRestoreCommand(
    const std::string& criuBinary,
    const std::string& inputDir,
    const CheckpointFlags& flags) {
    if (inputDir.empty()) {
        return {};
    }

    std::vector<std::string> command = {
        criuBinary, "restore",
        "-D", inputDir,
        "-v4",
        "--log-file", (std::filesystem::path(inputDir) / kRestoreLog).string(),
        "--restore-detached"
    };

    if (flags.tcpEstablished) {
        command.emplace_back("--tcp-established");
    }
    if (flags.shellJob) {
        command.emplace_back("--shell-job");
    }
    if (flags.extUnixSk) {
        command.emplace_back("--ext-unix-sk");
    }
    if (flags.fileLocks) {
        command.emplace_back("--file-locks");
    }
    return command;
}

CheckpointFlags CriuManager::LoadRecordedFlags(const std::string& checkpointPath) {
    CheckpointFlags flags;
    flags.leaveRunning = false;
    flags.tcpEstablished = false;
    flags.shellJob = true;
    flags.extUnixSk = true;
    flags.fileLocks = true;

    const auto metadata = ReadJsonFile(std::filesystem::path(checkpointPath) / kMetadataFile);
    if (!metadata || !metadata->is_object()) {
        return flags;
    }

    const auto recorded = metadata->find("flags");
    if (recorded == metadata->end() || !recorded->is_object()) {
        return flags;
    }

    flags.leaveRunning = recorded->value("leave_running", flags.leaveRunning);
    flags.tcpEstablished = recorded->value("tcp_established", flags.tcpEstablished);
    flags.shellJob = recorded->value("shell_job", flags.shellJob);
    flags.extUnixSk = recorded->value("ext_unix_sk", flags.extUnixSk);
    flags.fileLocks = recorded->value("file_locks", flags.fileLocks);
    return flags;
}

CommandResult CriuManager::Run(std::vector<std::string> argv, const CallContext& context) const {
    const CommandRequest request = MakeRequest(std::move(argv), context);
    if (runner_) {
        return runner_(request);
    }

    return RunProcess(request);
}
