#include "CheckpointPackageManager.hpp"
#include "Checksum.hpp"
#include "TestSupport.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace {
void WriteCheckpoint(const std::filesystem::path& dir, const std::string& containerId) {
    WriteFile(dir / "metadata.json",
              nlohmann::json{{"container_id", containerId},
                             {"checkpoint_time", "2024-05-01T10:00:00Z"},
                             {"architecture", "x86_64"}}
                  .dump());
    WriteFile(dir / "dump.log", "dump finished\n");
    WriteFile(dir / "pages-1.img", std::string(4096, 'p'));
}
} // namespace

int main() {
    TempDir work("ferry-package");
    const auto checkpointDir = work.Path() / "checkpoints" / "web";
    WriteCheckpoint(checkpointDir, "web");

    // Remote side of the fake transport: pushed files land under work/remote.
    const auto remoteRoot = work.Path() / "remote";
    std::filesystem::create_directories(remoteRoot);
    std::vector<std::vector<std::string>> remoteCalls;
    bool corruptRemote = false;
    bool failPush = false;

    CommandRunner remoteRunner = [&](const CommandRequest& request) -> CommandResult {
        remoteCalls.push_back(request.argv);
        const auto& argv = request.argv;
        if (argv[1] == "push") {
            if (failPush) {
                return Exit(1, "adb: error: failed to copy");
            }
            const auto target = remoteRoot / std::filesystem::path(argv[3]).filename();
            std::filesystem::copy_file(argv[2], target, std::filesystem::copy_options::overwrite_existing);
            return Ok();
        }
        if (argv[1] == "shell" && argv[2].rfind("sha256sum ", 0) == 0) {
            const auto target = remoteRoot / std::filesystem::path(argv[2].substr(10)).filename();
            const std::string checksum = corruptRemote ? std::string(64, '0') : Sha256File(target.string());
            return Ok(checksum + "  " + argv[2].substr(10) + "\n");
        }
        return Exit(1, "unexpected command");
    };

    CheckpointPackageManager manager(
        (work.Path() / "packages").string(),
        ArchiveManager(),
        [&](const std::string& host) { return MakeTransport(host, TransportOptions(), remoteRunner); });

    const auto package = manager.Package(checkpointDir.string());
    if (!package) {
        return Fail("Packaging a valid checkpoint should succeed.");
    }
    if (package->packagePath != (work.Path() / "packages" / "web_checkpoint.tar.gz").string()) {
        return Fail("Default package path should be <work>/<id>_checkpoint.tar.gz: " + package->packagePath);
    }
    if (package->checksum != Sha256File(package->packagePath) || package->checksum.size() != 64) {
        return Fail("Package checksum should be the SHA-256 of the archive.");
    }
    if (package->sizeBytes != std::filesystem::file_size(package->packagePath) || package->containerId != "web") {
        return Fail("Package size and container id should be recorded.");
    }

    const auto sidecar = nlohmann::json::parse(ReadFile(CheckpointPackageManager::SidecarPath(package->packagePath)));
    if (sidecar.value("checksum", "") != package->checksum || !sidecar.contains("original_metadata")
        || !sidecar.contains("package_time")) {
        return Fail("Sidecar should carry checksum, original metadata and package time.");
    }

    if (!manager.VerifyIntegrity(package->packagePath)) {
        return Fail("Freshly written package should verify.");
    }

    const auto restoredDir = manager.Unpack(package->packagePath);
    if (!restoredDir || *restoredDir != (work.Path() / "packages" / "web_restored").string()) {
        return Fail("Default unpack dir should be <work>/<id>_restored.");
    }
    if (ReadFile(std::filesystem::path(*restoredDir) / "pages-1.img") != std::string(4096, 'p')) {
        return Fail("Unpacked checkpoint content does not match.");
    }

    const auto info = manager.GetPackageInfo(package->packagePath);
    if (!info || !info->value("verified", false) || info->value("current_checksum", "") != package->checksum) {
        return Fail("Package info should report a verified checksum.");
    }
    if (manager.ListPackages().size() != 1) {
        return Fail("ListPackages should find the one package.");
    }

    TransferConfig transfer;
    transfer.sourcePath = package->packagePath;
    transfer.targetHost = "adb:default";
    transfer.targetPath = "/data/local/tmp/migration/web_checkpoint.tar.gz";
    const TransferOutcome sent = manager.Transfer(transfer);
    if (!sent.success || !sent.warnings.empty()) {
        return Fail("Transfer should succeed: " + sent.errorMessage);
    }
    if (!std::filesystem::exists(remoteRoot / "web_checkpoint.tar.gz.metadata.json")) {
        return Fail("Transfer should push the sidecar next to the package.");
    }

    corruptRemote = true;
    const TransferOutcome mismatch = manager.Transfer(transfer);
    corruptRemote = false;
    if (mismatch.success || mismatch.warnings.empty()
        || mismatch.warnings.back().find("Remote checksum verification failed") == std::string::npos) {
        return Fail("Remote checksum mismatch should fail the transfer with a warning.");
    }

    failPush = true;
    const TransferOutcome pushFailed = manager.Transfer(transfer);
    failPush = false;
    if (pushFailed.success || pushFailed.errorKind != ErrorKind::Transfer) {
        return Fail("Push failure should be a transfer error.");
    }

    transfer.targetHost = "";
    if (manager.Transfer(transfer).success) {
        return Fail("Transfer without a transport should fail.");
    }
    transfer.targetHost = "adb:default";

    // Tampering with the archive must block both unpack and transfer.
    const auto tampered = work.Path() / "packages" / "tampered.tar.gz";
    std::filesystem::copy_file(package->packagePath, tampered);
    std::filesystem::copy_file(
        CheckpointPackageManager::SidecarPath(package->packagePath), CheckpointPackageManager::SidecarPath(tampered.string()));
    WriteFile(tampered, "not the archive");
    if (manager.VerifyIntegrity(tampered.string()) || manager.Unpack(tampered.string(), (work.Path() / "t").string())) {
        return Fail("Tampered package must fail integrity and not unpack.");
    }
    if (std::filesystem::exists(work.Path() / "t" / "pages-1.img")) {
        return Fail("Nothing may be extracted from a tampered package.");
    }

    remoteCalls.clear();
    transfer.sourcePath = tampered.string();
    const TransferOutcome blocked = manager.Transfer(transfer);
    if (blocked.success || blocked.errorKind != ErrorKind::Integrity || !remoteCalls.empty()) {
        return Fail("Tampered package must not leave the host.");
    }

    // No sidecar means no integrity record: fail closed.
    const auto orphan = work.Path() / "packages" / "orphan.tar.gz";
    std::filesystem::copy_file(package->packagePath, orphan);
    if (manager.VerifyIntegrity(orphan.string())) {
        return Fail("A package without a sidecar must not verify.");
    }
    const auto orphanInfo = manager.GetPackageInfo(orphan.string());
    if (!orphanInfo || orphanInfo->value("verified", true)) {
        return Fail("Package info for an orphan should be unverified.");
    }

    if (manager.Package((work.Path() / "missing").string())) {
        return Fail("Packaging a missing directory should fail.");
    }
    std::filesystem::create_directories(work.Path() / "no-metadata");
    if (manager.Package((work.Path() / "no-metadata").string())) {
        return Fail("Packaging a directory without metadata.json should fail.");
    }

    transfer.sourcePath = package->packagePath;
    transfer.cleanupSource = true;
    transfer.verifyChecksum = false;
    const TransferOutcome unverified = manager.Transfer(transfer);
    if (!unverified.success || !std::filesystem::exists(package->packagePath)
        || !std::filesystem::exists(CheckpointPackageManager::SidecarPath(package->packagePath))) {
        return Fail("cleanupSource must keep the local package when the transfer was not verified.");
    }
    if (unverified.warnings.empty() || unverified.warnings.back().find("Source package kept") == std::string::npos) {
        return Fail("Skipped cleanup should be reported as a warning.");
    }

    transfer.verifyChecksum = true;
    if (!manager.Transfer(transfer).success || std::filesystem::exists(package->packagePath)) {
        return Fail("cleanupSource should remove the local package after transfer.");
    }

    if (!manager.CleanupPackage(orphan.string()) || std::filesystem::exists(orphan)) {
        return Fail("CleanupPackage should remove the package.");
    }

    return 0;
}
