#pragma once

#include "asr/speech_engine.hpp"
#include "config/config.hpp"
#include "format/text_formatter.hpp"
#include "llm/text_refiner.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace voiceflow {

// A failure the pipeline reports for a particular input (model missing,
// decoding failed). Anything else thrown out of a pipeline is a bug.
class PipelineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Timings {
    std::uint64_t transcriptionMs{0};
    std::uint64_t formattingMs{0};
    std::uint64_t totalMs{0};
};

struct PipelineOutput {
    std::string formattedText;
    std::string rawTranscript;
    Timings timings;
};

// Speech-to-text followed by formatting. Not thread-safe.
class Pipeline {
public:
    virtual ~Pipeline() = default;

    // `samples` is 16 kHz mono float PCM. Throws PipelineError.
    virtual PipelineOutput process(const float* samples, size_t numSamples,
                                   const std::optional<std::string>& context) = 0;

    // Formatting stage only. Throws PipelineError.
    virtual PipelineOutput formatText(const std::string& text,
                                      const std::optional<std::string>& context) = 0;

    virtual void unloadModels() = 0;
};

std::unique_ptr<SpeechEngine> makeSpeechEngine(const Config& config);

// The language model selected by llm_model (or custom_model_path).
std::unique_ptr<TextRefiner> makeTextRefiner(const Config& config);

// Transcript formatting runs the selected language model, then the
// rule-based TextFormatter over its output. When the model file has not been
// downloaded the rules run alone.
class VoicePipeline : public Pipeline {
public:
    // Models are loaded on first use unless config.preloadModels is set.
    // Throws std::runtime_error for an unusable configuration, or when
    // preloading fails.
    explicit VoicePipeline(const Config& config);

    // Takes the language model from the caller instead of from config.
    VoicePipeline(const Config& config, std::unique_ptr<TextRefiner> refiner);

    PipelineOutput process(const float* samples, size_t numSamples,
                           const std::optional<std::string>& context) override;
    PipelineOutput formatText(const std::string& text,
                              const std::optional<std::string>& context) override;
    void unloadModels() override;

private:
    Config config_;
    std::unique_ptr<SpeechEngine> engine_;
    std::unique_ptr<TextRefiner> refiner_;
    TextFormatter formatter_;

    void ensureEngineReady();
    bool ensureRefinerReady();
    std::string formatTranscript(const std::string& raw,
                                 const std::optional<std::string>& context);
    std::string modelLocation() const;
};

} // namespace voiceflow
