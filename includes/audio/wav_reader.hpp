#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace voiceflow {

struct WavAudio {
    uint32_t sampleRate{0};
    uint16_t channels{0};
    std::vector<float> samples; // mono, [-1, 1]
};

// Reads a 16-bit PCM RIFF/WAVE file. Multi-channel input is averaged to mono.
// On failure returns false and describes the problem in *error.
bool readWavFile(const std::string& path, WavAudio* out, std::string* error);

} // namespace voiceflow
