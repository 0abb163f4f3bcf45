#pragma once

#include "ArchiveManager.hpp"
#include "MigrationTypes.hpp"
#include "RemoteTransport.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class CheckpointPackageManager {
public:
    using TransportFactory = std::function<std::unique_ptr<RemoteTransport>(const std::string& targetHost)>;

    CheckpointPackageManager(std::string workDir, ArchiveManager archive, TransportFactory transports);

    // Archives a checkpoint directory and writes the `<package>.metadata.json` sidecar.
    std::optional<CheckpointPackage> Package(
        const std::string& checkpointDir,
        const std::optional<std::string>& outputPath = std::nullopt,
        const CallContext& context = {}) const;
    // Extracts only after VerifyIntegrity passes.
    std::optional<std::string> Unpack(
        const std::string& packagePath,
        const std::optional<std::string>& outputDir = std::nullopt,
        const CallContext& context = {}) const;
    TransferOutcome Transfer(const TransferConfig& config, const CallContext& context = {}) const;

    // Fails closed: a missing sidecar or checksum is an integrity failure.
    bool VerifyIntegrity(const std::string& packagePath) const;

    std::vector<nlohmann::json> ListPackages(const std::optional<std::string>& directory = std::nullopt) const;
    std::optional<nlohmann::json> GetPackageInfo(const std::string& packagePath) const;
    bool CleanupPackage(const std::string& packagePath) const;

    static std::string SidecarPath(const std::string& packagePath);

private:
    std::string workDir_;
    ArchiveManager archive_;
    TransportFactory transports_;
};
