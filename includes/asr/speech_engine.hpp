#pragma once

#include <cstddef>
#include <string>

namespace voiceflow {

// A speech-to-text backend working on 16 kHz mono float PCM.
class SpeechEngine {
public:
    static constexpr int SAMPLE_RATE = 16000;

    virtual ~SpeechEngine() = default;

    // Loads the model. Returns false (and logs why) if it cannot be loaded.
    virtual bool init() = 0;
    virtual void release() = 0;
    virtual bool isReady() const = 0;

    // Throws std::runtime_error if the engine is not ready or decoding fails.
    virtual std::string processAudio(const float* samples, size_t numSamples) = 0;

    virtual const char* name() const = 0;
};

} // namespace voiceflow
