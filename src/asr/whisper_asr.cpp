#include "asr/whisper_asr.hpp"
#include "log/debug_log.hpp"

#include <climits>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace voiceflow {

namespace {

// whisper.cpp prints to stderr by default; a GUI host never sees that.
void forwardWhisperLog(ggml_log_level level, const char* text, void* /*userData*/) {
    if (!text || level < GGML_LOG_LEVEL_WARN) return;
    std::string line(text);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    if (!line.empty()) debugLog("whisper: " + line);
}

} // namespace

WhisperASR::WhisperASR(const Config& config) : config_(config) {}

bool WhisperASR::init() {
    if (ctx_) return true;

    whisper_log_set(forwardWhisperLog, nullptr);

    const std::filesystem::path path(config_.modelPath);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        debugLog("Whisper model not found: " + path.string());
        return false;
    }

    debugLog("Loading Whisper model from: " + path.string());
    ctx_.reset(whisper_init_from_file_with_params(path.string().c_str(),
                                                  whisper_context_default_params()));
    if (!ctx_) {
        debugLog("Failed to load Whisper model: " + path.string());
        return false;
    }

    debugLog("Whisper model loaded");
    return true;
}

std::string WhisperASR::processAudio(const float* samples, size_t numSamples) {
    // whisper_full takes an int sample count.
    if (numSamples > static_cast<size_t>(INT_MAX)) {
        throw std::runtime_error("Audio buffer too long for Whisper: " +
                                 std::to_string(numSamples) + " samples");
    }

    if (!ctx_) {
        throw std::runtime_error("Whisper model not initialized");
    }

    if (!samples || numSamples == 0) {
        return "";
    }

    // RMS of the buffer, to spot silent input in the log
    double sumSquares = 0.0;
    for (size_t i = 0; i < numSamples; ++i) {
        sumSquares += static_cast<double>(samples[i]) * samples[i];
    }
    const double rms = std::sqrt(sumSquares / static_cast<double>(numSamples));
    std::ostringstream msg;
    msg << "Whisper: " << numSamples << " samples, RMS " << rms;
    debugLog(msg.str());

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = config_.translateToEnglish;
    wparams.language         = config_.language.c_str();
    wparams.n_threads        = config_.threadCount;
    wparams.offset_ms        = 0;
    wparams.duration_ms      = 0;
    wparams.no_context       = true;

    if (whisper_full(ctx_.get(), wparams, samples, static_cast<int>(numSamples)) != 0) {
        throw std::runtime_error("Failed to process audio with Whisper");
    }

    std::string result;
    const int nSegments = whisper_full_n_segments(ctx_.get());
    for (int i = 0; i < nSegments; ++i) {
        const char* text = whisper_full_get_segment_text(ctx_.get(), i);
        if (!text) continue;
        std::string segment(text);
        const auto start = segment.find_first_not_of(' ');
        if (start == std::string::npos) continue;
        if (!result.empty()) {
            result += " ";
        }
        result += segment.substr(start);
    }

    debugLog("Whisper: " + std::to_string(nSegments) + " segments");
    return result;
}

} // namespace voiceflow
