#pragma once

#include "ProcessRunner.hpp"

#include <string>
#include <vector>

class ArchiveManager {
public:
    explicit ArchiveManager(CommandRunner runner = CommandRunner(), std::string tarBinary = "tar");

    bool Compress(const std::string& dir, const std::string& tarPath, const CallContext& context = {}) const;
    bool Decompress(const std::string& tarPath, const std::string& outputDir, const CallContext& context = {}) const;

    static std::vector<std::string> BuildCompressCommand(
        const std::string& dir, const std::string& tarPath, const std::string& tarBinary = "tar");
    static std::vector<std::string> BuildDecompressCommand(
        const std::string& tarPath, const std::string& outputDir, const std::string& tarBinary = "tar");
    // Shell form run on the target host through a remote transport.
    static std::string BuildRemoteExtractCommand(const std::string& tarPath, const std::string& outputDir);

private:
    bool Run(std::vector<std::string> argv, const CallContext& context) const;

    CommandRunner runner_;
    std::string tarBinary_;
};
