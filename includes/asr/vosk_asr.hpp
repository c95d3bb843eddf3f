#pragma once

#include "asr/speech_engine.hpp"

#include <memory>
#include <string>
#include <vosk_api.h>

namespace voiceflow {

class VoskASR : public SpeechEngine {
public:
    struct Config {
        std::string modelPath;
        float sampleRate = static_cast<float>(SAMPLE_RATE);
    };

    explicit VoskASR(const Config& config) : config_(config) {}

    bool init() override;
    void release() override;
    bool isReady() const override { return recognizer_ != nullptr; }
    std::string processAudio(const float* samples, size_t numSamples) override;
    const char* name() const override { return "vosk"; }

private:
    Config config_;
    struct VoskModelDeleter {
        void operator()(VoskModel* p) { if (p) vosk_model_free(p); }
    };
    struct VoskRecognizerDeleter {
        void operator()(VoskRecognizer* p) { if (p) vosk_recognizer_free(p); }
    };

    std::unique_ptr<VoskModel, VoskModelDeleter> model_;
    std::unique_ptr<VoskRecognizer, VoskRecognizerDeleter> recognizer_;
};

} // namespace voiceflow
