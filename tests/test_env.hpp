#pragma once

#include "ffi/handle.hpp"
#include "log/debug_log.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace voiceflow::test {

// Points XDG_CONFIG_HOME and XDG_DATA_HOME at a fresh temporary directory so
// tests never touch the real configuration or model store.
class IsolatedEnvTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/voiceflow_test_XXXXXX";
        char* dir = mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        root_ = dir;
        setenv("XDG_CONFIG_HOME", (root_ / "config").c_str(), 1);
        setenv("XDG_DATA_HOME", (root_ / "data").c_str(), 1);
    }

    void TearDown() override {
        ffi::setPipelineFactory(nullptr);
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path configPath() const { return root_ / "config" / "voiceflow" / "config.json"; }
    std::filesystem::path modelsDir() const { return root_ / "data" / "voiceflow" / "models"; }

    static void writeFile(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path root_;
};

inline std::string readDebugLog() {
    std::ifstream in(debugLogPath());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Unique per process and call, so assertions on the shared log file cannot
// match lines written by another run.
inline std::string uniqueToken(const char* prefix) {
    static std::atomic<int> counter{0};
    return std::string(prefix) + "-" + std::to_string(getpid()) + "-" + std::to_string(counter++);
}

} // namespace voiceflow::test
