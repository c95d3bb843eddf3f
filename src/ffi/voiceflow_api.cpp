// voiceflow_api.cpp - pipeline lifecycle and processing entry points.
#include "voiceflow/voiceflow.h"

#include "ffi/guard.hpp"
#include "ffi/handle.hpp"
#include "ffi/transfer.hpp"
#include "format/text_formatter.hpp"
#include "llm/llama_refiner.hpp"
#include "log/debug_log.hpp"
#include "log/memory_stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <new>
#include <sstream>

#ifndef VOICEFLOW_VERSION_STRING
#define VOICEFLOW_VERSION_STRING "0.0.0"
#endif

using namespace voiceflow;
using namespace voiceflow::ffi;

namespace {

constexpr float kSampleRate = 16000.0f;

PipelineFactory& pipelineFactory() {
    static PipelineFactory factory;
    return factory;
}

VoiceFlowResult internalErrorResult(const char* description) noexcept {
    if (!description) description = "Unknown panic";
    try {
        const std::string message = std::string("Internal error: ") + description;
        return errorResult(message.c_str());
    } catch (const std::bad_alloc&) {
        // Truncated rather than lost.
        char message[512];
        std::snprintf(message, sizeof(message), "Internal error: %s", description);
        return errorResult(message);
    }
}

VoiceFlowHandle* noHandle(const char*) noexcept {
    return nullptr;
}

char* noString(const char*) noexcept {
    return nullptr;
}

void nothing(const char*) noexcept {}

VoiceFlowMemoryInfo noMemoryInfo(const char*) noexcept {
    return VoiceFlowMemoryInfo{0, 0, 0};
}

std::string describeAudio(const float* audio, size_t len) {
    float peak = 0.0f;
    for (size_t i = 0; i < len; ++i) {
        peak = std::max(peak, std::fabs(audio[i]));
    }
    std::ostringstream out;
    out << std::fixed << "Audio duration: " << std::setprecision(2)
        << static_cast<float>(len) / kSampleRate << "s, max amplitude: "
        << std::setprecision(4) << peak;
    return out.str();
}

} // namespace

namespace voiceflow::ffi {

std::unique_ptr<Pipeline> createPipeline(const Config& config) {
    if (pipelineFactory()) {
        return pipelineFactory()(config);
    }
    return std::make_unique<VoicePipeline>(config);
}

void setPipelineFactory(PipelineFactory factory) {
    pipelineFactory() = std::move(factory);
}

} // namespace voiceflow::ffi

extern "C" VoiceFlowHandle* voiceflow_init(const char* config_path) {
    return guarded("voiceflow_init", [&]() -> VoiceFlowHandle* {
        debugLog("voiceflow_init called");

        std::optional<std::string> path;
        if (config_path) {
            path = decodeInput(config_path);
            if (!path) {
                debugLog("voiceflow_init: config path is not valid UTF-8");
                return nullptr;
            }
        }

        Config config;
        try {
            config = load_config(path);
        } catch (const std::runtime_error& e) {
            debugLog(std::string("Failed to load config: ") + e.what());
            return nullptr;
        }
        debugLog("Config loaded: STT=" + std::string(toId(config.sttEngine)));

        debugLog("Creating pipeline...");
        std::unique_ptr<Pipeline> pipeline;
        try {
            pipeline = createPipeline(config);
        } catch (const std::runtime_error& e) {
            debugLog(std::string("Failed to create pipeline: ") + e.what());
            return nullptr;
        }
        if (!pipeline) {
            debugLog("Failed to create pipeline: no pipeline returned");
            return nullptr;
        }

        auto handle = std::make_unique<VoiceFlowHandle>();
        handle->pipeline = std::move(pipeline);
        debugLog("voiceflow_init complete - returning handle");
        return handle.release();
    }, noHandle);
}

extern "C" void voiceflow_destroy(VoiceFlowHandle* handle) {
    delete handle;
}

extern "C" VoiceFlowResult voiceflow_process(VoiceFlowHandle* handle,
                                             const float* audio_data,
                                             size_t audio_len,
                                             const char* context) {
    if (!handle || !audio_data) {
        debugLog("ERROR - Invalid handle or audio data");
        return errorResult("Invalid handle or audio data");
    }

    return guarded("voiceflow_process", [&]() -> VoiceFlowResult {
        debugLog("voiceflow_process called with " + std::to_string(audio_len) + " samples");
        debugLog(describeAudio(audio_data, audio_len));

        // Undecodable context is the same as no context.
        const auto contextText = decodeInput(context);

        debugLog("Calling pipeline.process()...");
        try {
            const PipelineOutput out = handle->pipeline->process(audio_data, audio_len, contextText);
            debugLog("Success! Raw transcript: '" + out.rawTranscript + "'");
            debugLog("Formatted text: '" + out.formattedText + "'");
            return successResult(out.formattedText, out.rawTranscript,
                                 out.timings.transcriptionMs, out.timings.formattingMs,
                                 out.timings.totalMs);
        } catch (const PipelineError& e) {
            debugLog(std::string("ERROR - pipeline.process failed: ") + e.what());
            return errorResult(e.what());
        }
    }, internalErrorResult);
}

extern "C" VoiceFlowResult voiceflow_format_text(VoiceFlowHandle* handle,
                                                 const char* text,
                                                 const char* context) {
    if (!handle || !text) {
        debugLog("ERROR - Invalid handle or text");
        return errorResult("Invalid handle or text");
    }

    return guarded("voiceflow_format_text", [&]() -> VoiceFlowResult {
        const auto input = decodeInput(text);
        if (!input) {
            return errorResult("Text is not valid UTF-8");
        }
        const auto contextText = decodeInput(context);

        try {
            const PipelineOutput out = handle->pipeline->formatText(*input, contextText);
            return successResult(out.formattedText, out.rawTranscript, 0,
                                 out.timings.formattingMs, out.timings.totalMs);
        } catch (const PipelineError& e) {
            debugLog(std::string("ERROR - pipeline.formatText failed: ") + e.what());
            return errorResult(e.what());
        }
    }, internalErrorResult);
}

extern "C" void voiceflow_unload_models(VoiceFlowHandle* handle) {
    if (!handle) return;
    guarded("voiceflow_unload_models", [&] {
        handle->pipeline->unloadModels();
    }, nothing);
}

extern "C" void voiceflow_prepare_shutdown(void) {
    guarded("voiceflow_prepare_shutdown", [] {
        debugLog("voiceflow_prepare_shutdown called");
        shutdownLlamaBackend();
    }, nothing);
}

extern "C" VoiceFlowMemoryInfo voiceflow_memory_info(void) {
    return guarded("voiceflow_memory_info", []() -> VoiceFlowMemoryInfo {
        const MemoryStats stats = currentMemoryStats();
        return VoiceFlowMemoryInfo{stats.residentBytes, stats.virtualBytes, stats.peakBytes};
    }, noMemoryInfo);
}

extern "C" void voiceflow_free_result(VoiceFlowResult result) {
    releaseResult(result);
}

extern "C" void voiceflow_free_string(char* s) {
    releaseCString(s);
}

extern "C" const char* voiceflow_version(void) {
    return VOICEFLOW_VERSION_STRING;
}

extern "C" char* voiceflow_post_process_text(const char* text) {
    return guarded("voiceflow_post_process_text", [&]() -> char* {
        const auto input = decodeInput(text);
        if (!input) return nullptr;
        const Config config = load_config_or_default();
        return toOwnedCString(TextFormatter(config.formatter).format(*input));
    }, noString);
}
