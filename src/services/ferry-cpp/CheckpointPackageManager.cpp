#include "CheckpointPackageManager.hpp"

#include "Checksum.hpp"

#include <chrono>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace {
constexpr const char* kSidecarSuffix = ".metadata.json";
constexpr const char* kPackageSuffix = ".tar.gz";

std::string FormatIsoTimestamp() {
    const auto nowTime = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utcTime = {};
    gmtime_r(&nowTime, &utcTime);

    std::ostringstream output;
    output << std::put_time(&utcTime, "%Y-%m-%dT%H:%M:%SZ");
    return output.str();
}

std::optional<nlohmann::json> ReadJsonFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return std::nullopt;
    }

    auto json = nlohmann::json::parse(input, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    return json;
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

TransferOutcome TransferFailure(ErrorKind kind, std::string message, std::vector<std::string> warnings) {
    std::cerr << "[Package] " << message << std::endl;
    TransferOutcome outcome;
    outcome.success = false;
    outcome.errorKind = kind;
    outcome.errorMessage = std::move(message);
    outcome.warnings = std::move(warnings);
    return outcome;
}
} // namespace

CheckpointPackageManager::CheckpointPackageManager(
    std::string workDir, ArchiveManager archive, TransportFactory transports)
    : workDir_(std::move(workDir)),
      archive_(std::move(archive)),
      transports_(std::move(transports)) {}

std::optional<CheckpointPackage> CheckpointPackageManager::Package(
    const std::string& checkpointDir,
    const std::optional<std::string>& outputPath,
    const CallContext& context) const {
    try {
        if (!std::filesystem::is_directory(checkpointDir)) {
            std::cerr << "[Package] Checkpoint directory not found: " << checkpointDir << std::endl;
            return std::nullopt;
        }

        const auto metadata = ReadJsonFile(std::filesystem::path(checkpointDir) / "metadata.json");
        if (!metadata) {
            std::cerr << "[Package] Checkpoint metadata not found in " << checkpointDir << std::endl;
            return std::nullopt;
        }

        const std::string containerId = metadata->value("container_id", "unknown");
        std::filesystem::path packagePath;
        if (outputPath) {
            packagePath = *outputPath;
        } else {
            packagePath = std::filesystem::path(workDir_) / (containerId + "_checkpoint" + kPackageSuffix);
        }
        if (packagePath.has_parent_path()) {
            std::filesystem::create_directories(packagePath.parent_path());
        }

        std::cout << "[Package] Packaging checkpoint: " << checkpointDir << " -> " << packagePath.string() << std::endl;
        if (!archive_.Compress(checkpointDir, packagePath.string(), context)) {
            std::cerr << "[Package] Compression failed for " << checkpointDir << std::endl;
            return std::nullopt;
        }

        CheckpointPackage package;
        package.packagePath = packagePath.string();
        package.checksum = Sha256File(package.packagePath);
        package.sizeBytes = std::filesystem::file_size(packagePath);
        package.containerId = containerId;
        package.metadata = *metadata;

        const nlohmann::json sidecar = {
            {"package_path", package.packagePath},
            {"checksum", package.checksum},
            {"size_bytes", package.sizeBytes},
            {"container_id", package.containerId},
            {"original_metadata", package.metadata},
            {"package_time", FormatIsoTimestamp()}
        };

        std::ofstream output(SidecarPath(package.packagePath), std::ios::trunc);
        output << sidecar.dump(2);
        if (!output.good()) {
            std::cerr << "[Package] Failed to write sidecar for " << package.packagePath << std::endl;
            return std::nullopt;
        }

        std::cout << "[Package] Packaged " << package.packagePath << " (" << package.sizeBytes
                  << " bytes, sha256 " << package.checksum << ")" << std::endl;
        return package;
    } catch (const std::exception& ex) {
        std::cerr << "[Package] Failed to package checkpoint: " << ex.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<std::string> CheckpointPackageManager::Unpack(
    const std::string& packagePath,
    const std::optional<std::string>& outputDir,
    const CallContext& context) const {
    try {
        if (!std::filesystem::exists(packagePath)) {
            std::cerr << "[Package] Package not found: " << packagePath << std::endl;
            return std::nullopt;
        }

        if (!VerifyIntegrity(packagePath)) {
            std::cerr << "[Package] Refusing to unpack " << packagePath << ": integrity check failed" << std::endl;
            return std::nullopt;
        }

        std::filesystem::path targetDir;
        if (outputDir) {
            targetDir = *outputDir;
        } else {
            const auto sidecar = ReadJsonFile(SidecarPath(packagePath));
            const std::string containerId = sidecar ? sidecar->value("container_id", "unknown") : "unknown";
            targetDir = std::filesystem::path(workDir_) / (containerId + "_restored");
        }
        std::filesystem::create_directories(targetDir);

        std::cout << "[Package] Unpacking " << packagePath << " -> " << targetDir.string() << std::endl;
        if (!archive_.Decompress(packagePath, targetDir.string(), context)) {
            std::cerr << "[Package] Extraction failed for " << packagePath << std::endl;
            return std::nullopt;
        }

        return targetDir.string();
    } catch (const std::exception& ex) {
        std::cerr << "[Package] Failed to unpack checkpoint: " << ex.what() << std::endl;
        return std::nullopt;
    }
}

TransferOutcome CheckpointPackageManager::Transfer(const TransferConfig& config, const CallContext& context) const {
    std::vector<std::string> warnings;

    try {
        if (!std::filesystem::exists(config.sourcePath)) {
            return TransferFailure(ErrorKind::Transfer, "Source package not found: " + config.sourcePath, warnings);
        }

        if (config.verifyChecksum && !VerifyIntegrity(config.sourcePath)) {
            return TransferFailure(
                ErrorKind::Integrity, "Source package integrity check failed: " + config.sourcePath, warnings);
        }

        std::unique_ptr<RemoteTransport> transport;
        if (transports_) {
            transport = transports_(config.targetHost);
        }
        if (!transport) {
            return TransferFailure(ErrorKind::Transfer, "No transport for target host '" + config.targetHost + "'", warnings);
        }

        std::cout << "[Package] Transferring " << config.sourcePath << " -> "
                  << transport->Describe() << ":" << config.targetPath << std::endl;
        const CommandResult pushed = transport->Push(config.sourcePath, config.targetPath, config.compress, context);
        if (!pushed.Succeeded()) {
            return TransferFailure(
                ClassifyFailure(Tool::RemoteCopy, pushed),
                "Transfer failed: " + DescribeFailure(Tool::RemoteCopy, pushed),
                warnings);
        }

        const std::string sidecar = SidecarPath(config.sourcePath);
        if (std::filesystem::exists(sidecar)) {
            const CommandResult sidecarPushed =
                transport->Push(sidecar, SidecarPath(config.targetPath), config.compress, context);
            if (!sidecarPushed.Succeeded()) {
                warnings.push_back("Failed to transfer package metadata: " + DescribeFailure(Tool::RemoteCopy, sidecarPushed));
                std::cerr << "[Package] " << warnings.back() << std::endl;
            }
        }

        if (config.verifyChecksum) {
            const std::string localChecksum = Sha256File(config.sourcePath);
            const CommandResult remote = transport->Exec("sha256sum " + ShellQuote(config.targetPath), context);
            std::string remoteChecksum;
            if (remote.Succeeded()) {
                std::istringstream fields(remote.stdoutText);
                fields >> remoteChecksum;
            }

            if (!remote.Succeeded() || remoteChecksum != localChecksum) {
                std::string detail = remote.Succeeded()
                    ? "expected " + localChecksum + ", got '" + remoteChecksum + "'"
                    : DescribeFailure(Tool::RemoteExec, remote);
                warnings.push_back("Remote checksum verification failed: " + detail);
                return TransferFailure(
                    remote.Succeeded() ? ErrorKind::Transfer : ClassifyFailure(Tool::RemoteExec, remote),
                    "Remote checksum verification failed for " + transport->Describe() + ":" + config.targetPath,
                    warnings);
            }
        }

        if (config.cleanupSource && !config.verifyChecksum) {
            warnings.emplace_back("Source package kept: cleanup requires a verified transfer");
            std::cerr << "[Package] " << warnings.back() << std::endl;
        } else if (config.cleanupSource) {
            std::error_code ec;
            std::filesystem::remove(config.sourcePath, ec);
            if (!ec) {
                std::filesystem::remove(sidecar, ec);
            }
            if (ec) {
                warnings.push_back("Failed to clean up source package: " + ec.message());
            } else {
                std::cout << "[Package] Source package cleaned up: " << config.sourcePath << std::endl;
            }
        }

        std::cout << "[Package] Transfer to " << transport->Describe() << " completed" << std::endl;
        TransferOutcome outcome;
        outcome.success = true;
        outcome.warnings = std::move(warnings);
        return outcome;
    } catch (const std::exception& ex) {
        return TransferFailure(ErrorKind::Transfer, std::string("Failed to transfer checkpoint: ") + ex.what(), warnings);
    }
}

bool CheckpointPackageManager::VerifyIntegrity(const std::string& packagePath) const {
    try {
        const auto sidecar = ReadJsonFile(SidecarPath(packagePath));
        if (!sidecar) {
            std::cerr << "[Package] No integrity record for " << packagePath << std::endl;
            return false;
        }

        const std::string expected = sidecar->value("checksum", "");
        if (expected.empty()) {
            std::cerr << "[Package] Integrity record for " << packagePath << " has no checksum" << std::endl;
            return false;
        }

        const std::string actual = Sha256File(packagePath);
        if (actual != expected) {
            std::cerr << "[Package] Checksum mismatch for " << packagePath << ": expected " << expected
                      << ", got " << actual << std::endl;
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        std::cerr << "[Package] Failed to verify package integrity: " << ex.what() << std::endl;
        return false;
    }
}

std::vector<nlohmann::json> CheckpointPackageManager::ListPackages(const std::optional<std::string>& directory) const {
    std::vector<nlohmann::json> packages;
    const std::string searchDir = directory.value_or(workDir_);

    std::error_code ec;
    if (!std::filesystem::is_directory(searchDir, ec)) {
        return packages;
    }

    for (const auto& entry : std::filesystem::directory_iterator(searchDir, ec)) {
        const std::string name = entry.path().filename().string();
        if (!entry.is_regular_file(ec) || !EndsWith(name, kPackageSuffix)) {
            continue;
        }

        auto info = GetPackageInfo(entry.path().string());
        if (info) {
            packages.push_back(std::move(*info));
        }
    }

    if (ec) {
        std::cerr << "[Package] Failed to list packages in " << searchDir << ": " << ec.message() << std::endl;
    }
    return packages;
}

std::optional<nlohmann::json> CheckpointPackageManager::GetPackageInfo(const std::string& packagePath) const {
    try {
        if (!std::filesystem::exists(packagePath)) {
            return std::nullopt;
        }

        nlohmann::json info = nlohmann::json::object();
        const auto sidecar = ReadJsonFile(SidecarPath(packagePath));
        if (sidecar) {
            info.update(*sidecar);
        }

        // Measured values win over whatever the sidecar recorded.
        info["package_path"] = packagePath;
        info["size_bytes"] = std::filesystem::file_size(packagePath);
        info["current_checksum"] = Sha256File(packagePath);
        info["verified"] = sidecar && sidecar->value("checksum", "") == info["current_checksum"].get<std::string>();
        return info;
    } catch (const std::exception& ex) {
        std::cerr << "[Package] Failed to read package info for " << packagePath << ": " << ex.what() << std::endl;
        return std::nullopt;
    }
}

bool CheckpointPackageManager::CleanupPackage(const std::string& packagePath) const {
    bool ok = true;
    for (const auto& path : {packagePath, SidecarPath(packagePath)}) {
        std::error_code ec;
        if (std::filesystem::remove(path, ec)) {
            std::cout << "[Package] Removed " << path << std::endl;
        }
        if (ec) {
            std::cerr << "[Package] Failed to remove " << path << ": " << ec.message() << std::endl;
            ok = false;
        }
    }
    return ok;
}

std::string CheckpointPackageManager::SidecarPath(const std::string& packagePath) {
    return packagePath + kSidecarSuffix;
}
