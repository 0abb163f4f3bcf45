#include "ArchiveManager.hpp"

#include "ErrorClassifier.hpp"

#include <iostream>
#include <utility>

ArchiveManager::ArchiveManager(CommandRunner runner, std::string tarBinary)
    : runner_(std::move(runner)),
      tarBinary_(std::move(tarBinary)) {}

bool ArchiveManager::Compress(const std::string& dir, const std::string& tarPath, const CallContext& context) const {
    if (dir.empty() || tarPath.empty()) {
        return false;
    }

    auto command = BuildCompressCommand(dir, tarPath, tarBinary_);
    if (command.empty()) {
        return false;
    }

    return Run(std::move(command), context);
}

bool ArchiveManager::Decompress(
    const std::string& tarPath, const std::string& outputDir, const CallContext& context) const {
    if (tarPath.empty() || outputDir.empty()) {
        return false;
    }

    auto command = BuildDecompressCommand(tarPath, outputDir, tarBinary_);
    if (command.empty()) {
        return false;
    }

    return Run(std::move(command), context);
}

std::vector<std::string> ArchiveManager::BuildCompressCommand(
    const std::string& dir, const std::string& tarPath, const std::string& tarBinary) {
    if (dir.empty() || tarPath.empty()) {
        return {};
    }

    return {tarBinary, "-czf", tarPath, "-C", dir, "."};
}

std::vector<std::string> ArchiveManager::BuildDecompressCommand(
    const std::string& tarPath, const std::string& outputDir, const std::string& tarBinary) {
    if (tarPath.empty() || outputDir.empty()) {
        return {};
    }

    return {tarBinary, "-xzf", tarPath, "-C", outputDir};
}

std::string ArchiveManager::BuildRemoteExtractCommand(const std::string& tarPath, const std::string& outputDir) {
    if (tarPath.empty() || outputDir.empty()) {
        return {};
    }

    return "mkdir -p " + ShellQuote(outputDir) + " && tar -xzf " + ShellQuote(tarPath) + " -C " + ShellQuote(outputDir);
}

bool ArchiveManager::Run(std::vector<std::string> argv, const CallContext& context) const {
    const CommandRequest request = MakeRequest(std::move(argv), context);
    const CommandResult result = runner_ ? runner_(request) : RunProcess(request);
    if (!result.Succeeded()) {
        std::cerr << "[Package] " << DescribeFailure(Tool::Archive, result) << std::endl;
        return false;
    }
    return true;
}
