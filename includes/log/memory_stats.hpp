#pragma once

#include <cstdint>
#include <istream>

namespace voiceflow {

struct MemoryStats {
    std::uint64_t residentBytes{0};
    std::uint64_t virtualBytes{0};
    std::uint64_t peakBytes{0};
};

// Reads VmRSS, VmSize and VmHWM (kB) from /proc/<pid>/status text.
// Missing fields stay 0.
MemoryStats parseProcStatus(std::istream& status);

// The calling process. All zero where /proc is not available.
MemoryStats currentMemoryStats();

} // namespace voiceflow
