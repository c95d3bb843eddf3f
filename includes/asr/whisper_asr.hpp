#pragma once

#include "asr/speech_engine.hpp"

#include <memory>
#include <string>
#include "whisper.h"

namespace voiceflow {

class WhisperASR : public SpeechEngine {
public:
    struct Config {
        std::string modelPath;
        std::string language = "en";
        bool translateToEnglish = false;
        int threadCount = 4;
    };

    explicit WhisperASR(const Config& config);

    bool init() override;
    void release() override { ctx_.reset(); }
    bool isReady() const override { return ctx_ != nullptr; }
    std::string processAudio(const float* samples, size_t numSamples) override;
    const char* name() const override { return "whisper"; }

private:
    struct WhisperContextDeleter {
        void operator()(whisper_context* p) { if (p) whisper_free(p); }
    };

    Config config_;
    std::unique_ptr<whisper_context, WhisperContextDeleter> ctx_;
};

} // namespace voiceflow
