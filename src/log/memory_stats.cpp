#include "log/memory_stats.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace voiceflow {

namespace {

// "VmRSS:\t  123456 kB" -> 123456 * 1024
bool readKbField(const std::string& line, const char* key, std::uint64_t& bytes) {
    const std::string prefix = std::string(key) + ":";
    if (line.compare(0, prefix.size(), prefix) != 0) return false;
    std::istringstream in(line.substr(prefix.size()));
    std::uint64_t kb = 0;
    if (in >> kb) bytes = kb * 1024;
    return true;
}

} // namespace

MemoryStats parseProcStatus(std::istream& status) {
    MemoryStats stats;
    std::string line;
    while (std::getline(status, line)) {
        if (readKbField(line, "VmRSS", stats.residentBytes)) continue;
        if (readKbField(line, "VmSize", stats.virtualBytes)) continue;
        readKbField(line, "VmHWM", stats.peakBytes);
    }
    return stats;
}

MemoryStats currentMemoryStats() {
    std::ifstream status("/proc/self/status");
    if (!status.is_open()) return {};
    return parseProcStatus(status);
}

} // namespace voiceflow
