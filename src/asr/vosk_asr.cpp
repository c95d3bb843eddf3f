// vosk_asr.cpp
#include "asr/vosk_asr.hpp"
#include "log/debug_log.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>

namespace voiceflow {

bool VoskASR::init() {
    if (recognizer_) return true;

    vosk_set_log_level(-1); // Vosk would print to stderr

    std::error_code ec;
    if (!std::filesystem::is_directory(config_.modelPath, ec)) {
        debugLog("Vosk model directory not found: " + config_.modelPath);
        return false;
    }

    auto* model = vosk_model_new(config_.modelPath.c_str());
    if (!model) {
        debugLog("Failed to create Vosk model from " + config_.modelPath);
        return false;
    }
    model_.reset(model);

    auto* recognizer = vosk_recognizer_new(model_.get(), config_.sampleRate);
    if (!recognizer) {
        debugLog("Failed to create Vosk recognizer");
        model_.reset();
        return false;
    }
    recognizer_.reset(recognizer);

    debugLog("Vosk model loaded from " + config_.modelPath);
    return true;
}

void VoskASR::release() {
    // Recognizer references the model, free it first.
    recognizer_.reset();
    model_.reset();
}

std::string VoskASR::processAudio(const float* samples, size_t numSamples) {
    if (!recognizer_) {
        throw std::runtime_error("Vosk model not initialized");
    }

    if (!samples || numSamples == 0) {
        return "";
    }

    // Vosk takes 16-bit PCM
    std::vector<int16_t> pcmSamples;
    pcmSamples.reserve(numSamples);
    for (size_t i = 0; i < numSamples; ++i) {
        const float sample = std::max(-1.0f, std::min(1.0f, samples[i]));
        pcmSamples.push_back(static_cast<int16_t>(sample * 32767.0f));
    }

    const size_t CHUNK_SIZE = 8192;
    for (size_t offset = 0; offset < pcmSamples.size(); offset += CHUNK_SIZE) {
        const size_t chunk = std::min(CHUNK_SIZE, pcmSamples.size() - offset);
        if (vosk_recognizer_accept_waveform_s(recognizer_.get(),
                                              pcmSamples.data() + offset,
                                              static_cast<int>(chunk)) < 0) {
            vosk_recognizer_reset(recognizer_.get());
            throw std::runtime_error("Vosk rejected audio chunk");
        }
    }

    const char* raw = vosk_recognizer_final_result(recognizer_.get());
    std::string json = raw ? raw : "";
    vosk_recognizer_reset(recognizer_.get());

    debugLog("Vosk: " + std::to_string(numSamples) + " samples, output " + json);

    if (json.empty()) {
        return "";
    }
    try {
        auto j = nlohmann::json::parse(json);
        return j.value("text", std::string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Unreadable Vosk result: ") + e.what());
    }
}

} // namespace voiceflow
