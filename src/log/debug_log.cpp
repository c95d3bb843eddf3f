#include "log/debug_log.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>

namespace voiceflow {

namespace {

constexpr const char* kDebugLogPath = "/tmp/voiceflow_debug.log";

std::int64_t unixSeconds() noexcept {
    using namespace std::chrono;
    const auto since = system_clock::now().time_since_epoch();
    if (since.count() < 0) return 0;
    return duration_cast<seconds>(since).count();
}

} // namespace

const char* debugLogPath() noexcept {
    return kDebugLogPath;
}

void debugLog(const char* message) noexcept {
    std::ofstream file;
    file.open(kDebugLogPath, std::ios::out | std::ios::app);
    if (!file.is_open()) return;
    file << '[' << unixSeconds() << "] " << (message ? message : "") << '\n';
}

void debugLog(const std::string& message) noexcept {
    debugLog(message.c_str());
}

} // namespace voiceflow
