#include "pipeline/pipeline.hpp"
#include "asr/vosk_asr.hpp"
#include "asr/whisper_asr.hpp"
#include "llm/llama_refiner.hpp"
#include "log/debug_log.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace voiceflow {

namespace {

using Clock = std::chrono::steady_clock;

std::uint64_t elapsedMs(Clock::time_point since) {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count());
}

} // namespace

std::unique_ptr<SpeechEngine> makeSpeechEngine(const Config& config) {
    switch (config.sttEngine) {
    case SttEngine::Vosk:
        return std::make_unique<VoskASR>(VoskASR::Config{
            .modelPath = config.voskModelPath().string()
        });
    case SttEngine::Whisper:
        break;
    }
    return std::make_unique<WhisperASR>(WhisperASR::Config{
        .modelPath = config.speechModelPath(config.speechModel).string(),
        .language = config.language,
        .threadCount = config.threads
    });
}

std::unique_ptr<TextRefiner> makeTextRefiner(const Config& config) {
    const auto path = config.llmModelPath(config.llmModel);
    return std::make_unique<LlamaRefiner>(LlamaRefiner::Config{
        .modelPath = path ? path->string() : std::string(),
        .threadCount = config.threads
    });
}

VoicePipeline::VoicePipeline(const Config& config)
    : VoicePipeline(config, makeTextRefiner(config)) {}

VoicePipeline::VoicePipeline(const Config& config, std::unique_ptr<TextRefiner> refiner)
    : config_(config),
      engine_(makeSpeechEngine(config)),
      refiner_(std::move(refiner)),
      formatter_(config.formatter) {
    if (!refiner_) {
        throw std::invalid_argument("VoicePipeline needs a text refiner");
    }
    if (config_.llmModel == LlmModel::Custom && config_.customModelPath.empty()) {
        throw std::runtime_error("llm_model is 'custom' but custom_model_path is empty");
    }

    debugLog(std::string("Pipeline: stt=") + std::string(toId(config_.sttEngine)) +
             " speech_model=" + std::string(toId(config_.speechModel)) +
             " llm=" + std::string(toId(config_.llmModel)) +
             " llm_path=" + refiner_->modelPath());

    if (config_.preloadModels) {
        if (!engine_->init()) {
            throw std::runtime_error(std::string("Failed to load ") + engine_->name() +
                                     " model from " + modelLocation());
        }
        ensureRefinerReady();
    }
}

std::string VoicePipeline::modelLocation() const {
    if (config_.sttEngine == SttEngine::Vosk) return config_.voskModelPath().string();
    return config_.speechModelPath(config_.speechModel).string();
}

void VoicePipeline::ensureEngineReady() {
    if (engine_->isReady()) return;
    if (!engine_->init()) {
        throw PipelineError(std::string("Failed to load ") + engine_->name() +
                            " model from " + modelLocation());
    }
}

// False when the model has not been downloaded. A model file that is present
// but does not load is an error.
bool VoicePipeline::ensureRefinerReady() {
    if (refiner_->isReady()) return true;
    if (!refiner_->available()) {
        debugLog("Pipeline: LLM model not downloaded (" + refiner_->modelPath() +
                 "), rule-based formatting only");
        return false;
    }
    if (!refiner_->init()) {
        throw PipelineError("Failed to load LLM model from " + refiner_->modelPath());
    }
    return true;
}

std::string VoicePipeline::formatTranscript(const std::string& raw,
                                            const std::optional<std::string>& context) {
    // Nothing left after the rules (silence, annotations only) is not worth a model run.
    std::string ruled = formatter_.format(raw, context);
    if (ruled.empty() || !ensureRefinerReady()) return ruled;

    std::string refined;
    try {
        refined = refiner_->refine(raw, context);
    } catch (const std::runtime_error& e) {
        throw PipelineError(std::string("LLM formatting failed: ") + e.what());
    }
    if (refined.empty()) {
        debugLog("Pipeline: LLM returned nothing, keeping rule-based text");
        return ruled;
    }
    return formatter_.format(refined, context);
}

PipelineOutput VoicePipeline::process(const float* samples, size_t numSamples,
                                      const std::optional<std::string>& context) {
    const auto start = Clock::now();
    PipelineOutput out;

    if (!samples || numSamples == 0) {
        debugLog("Pipeline: empty audio, nothing to transcribe");
        return out;
    }

    ensureEngineReady();

    try {
        out.rawTranscript = engine_->processAudio(samples, numSamples);
    } catch (const std::runtime_error& e) {
        throw PipelineError(std::string("Transcription failed: ") + e.what());
    }
    out.timings.transcriptionMs = elapsedMs(start);

    const auto formatStart = Clock::now();
    out.formattedText = formatTranscript(out.rawTranscript, context);
    out.timings.formattingMs = elapsedMs(formatStart);
    out.timings.totalMs = elapsedMs(start);
    return out;
}

PipelineOutput VoicePipeline::formatText(const std::string& text,
                                         const std::optional<std::string>& context) {
    const auto start = Clock::now();
    PipelineOutput out;
    out.rawTranscript = text;
    out.formattedText = formatTranscript(text, context);
    out.timings.formattingMs = elapsedMs(start);
    out.timings.totalMs = out.timings.formattingMs;
    return out;
}

void VoicePipeline::unloadModels() {
    if (engine_->isReady()) {
        engine_->release();
        debugLog(std::string("Pipeline: unloaded ") + engine_->name() + " model");
    }
    if (refiner_->isReady()) {
        refiner_->release();
        debugLog("Pipeline: unloaded LLM model");
    }
}

} // namespace voiceflow
