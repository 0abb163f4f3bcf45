#pragma once

#include "ProcessRunner.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include <unistd.h>

inline int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path()
            / (prefix + "-" + std::to_string(getpid()) + "-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    std::string Str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline CommandResult Ok(const std::string& stdoutText = "") {
    CommandResult result;
    result.exitCode = 0;
    result.stdoutText = stdoutText;
    return result;
}

inline CommandResult Exit(int code, const std::string& stderrText = "") {
    CommandResult result;
    result.exitCode = code;
    result.stderrText = stderrText;
    return result;
}

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::trunc);
    output << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

// `docker inspect` payload for a running bridge-networked container.
inline nlohmann::json RunningContainer(const std::string& id) {
    return {
        {"Id", id},
        {"State", {{"Status", "running"}, {"Running", true}, {"Pid", 4242}}},
        {"Config", {{"Image", "nginx:alpine"}, {"ExposedPorts", nlohmann::json::object()}}},
        {"HostConfig", {
            {"Privileged", false},
            {"NetworkMode", "bridge"},
            {"Binds", nlohmann::json::array()},
            {"Devices", nlohmann::json::array()},
            {"CapAdd", nullptr}
        }}
    };
}

inline std::string InspectOutput(const nlohmann::json& container) {
    return nlohmann::json::array({container}).dump();
}

// Value following `flag` in argv, empty when absent.
inline std::string ArgAfter(const std::vector<std::string>& argv, const std::string& flag) {
    for (size_t i = 0; i + 1 < argv.size(); ++i) {
        if (argv[i] == flag) {
            return argv[i + 1];
        }
    }
    return {};
}

inline bool HasArg(const std::vector<std::string>& argv, const std::string& arg) {
    for (const auto& item : argv) {
        if (item == arg) {
            return true;
        }
    }
    return false;
}
