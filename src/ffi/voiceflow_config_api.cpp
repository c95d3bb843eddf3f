// voiceflow_config_api.cpp - model catalogs and configuration get/set entry points.
//
// Every call reloads the config file; setters write it back before returning.
// Nothing is cached between calls and a running pipeline never sees a change.
#include "voiceflow/voiceflow.h"

#include "config/config.hpp"
#include "config/model_catalog.hpp"
#include "ffi/guard.hpp"
#include "ffi/transfer.hpp"
#include "log/debug_log.hpp"

#include <optional>
#include <string>

using namespace voiceflow;
using namespace voiceflow::ffi;

namespace {

char* noString(const char*) noexcept {
    return nullptr;
}

bool no(const char*) noexcept {
    return false;
}

VoiceFlowModelInfo noModelInfo(const char*) noexcept {
    return emptyModelInfo();
}

VoiceFlowSpeechModelInfo noSpeechModelInfo(const char*) noexcept {
    return emptySpeechModelInfo();
}

// Load, mutate, persist. Returns whether the file was written.
template <typename Mutate>
bool updateConfig(const char* entryPoint, Mutate&& mutate) {
    Config config = load_config_or_default();
    mutate(config);
    try {
        save_config(config);
    } catch (const std::runtime_error& e) {
        debugLog(std::string(entryPoint) + ": failed to save config: " + e.what());
        return false;
    }
    return true;
}

template <typename Enum, typename Parse>
std::optional<Enum> parseId(const char* entryPoint, const char* id, Parse parse) {
    const auto text = decodeInput(id);
    if (!text) return std::nullopt;
    auto value = parse(*text);
    if (!value) {
        debugLog(std::string(entryPoint) + ": unknown id '" + *text + "'");
    }
    return value;
}

} // namespace

// ------------------------------------------------------------
// Language models
// ------------------------------------------------------------

extern "C" char* voiceflow_models_dir(void) {
    return guarded("voiceflow_models_dir", []() -> char* {
        return toOwnedCString(load_config_or_default().modelsDir().string());
    }, noString);
}

extern "C" size_t voiceflow_model_count(void) {
    return llmCatalog().size();
}

extern "C" VoiceFlowModelInfo voiceflow_model_info(size_t index) {
    if (index >= llmCatalog().size()) {
        return emptyModelInfo();
    }

    return guarded("voiceflow_model_info", [&]() -> VoiceFlowModelInfo {
        const LlmModelEntry& entry = llmCatalog()[index];
        const bool downloaded = load_config_or_default().llmModelDownloaded(entry.model);

        VoiceFlowModelInfo info = emptyModelInfo();
        info.id = toOwnedCString(toId(entry.model));
        info.display_name = toOwnedCString(entry.displayName);
        info.filename = toOwnedCString(entry.filename);
        info.size_gb = entry.sizeGb;
        info.is_downloaded = downloaded;
        return info;
    }, noModelInfo);
}

extern "C" void voiceflow_free_model_info(VoiceFlowModelInfo info) {
    releaseModelInfo(info);
}

extern "C" char* voiceflow_current_model(void) {
    return guarded("voiceflow_current_model", []() -> char* {
        return toOwnedCString(toId(load_config_or_default().llmModel));
    }, noString);
}

extern "C" bool voiceflow_set_model(const char* model_id) {
    return guarded("voiceflow_set_model", [&] {
        const auto model = parseId<LlmModel>("voiceflow_set_model", model_id, llmModelFromId);
        // "custom" needs a path, see voiceflow_set_custom_model.
        if (!model || *model == LlmModel::Custom) return false;
        return updateConfig("voiceflow_set_model", [&](Config& config) {
            config.llmModel = *model;
        });
    }, no);
}

extern "C" bool voiceflow_set_custom_model(const char* model_path) {
    return guarded("voiceflow_set_custom_model", [&] {
        const auto path = decodeInput(model_path);
        if (!path || path->empty()) return false;
        return updateConfig("voiceflow_set_custom_model", [&](Config& config) {
            config.llmModel = LlmModel::Custom;
            config.customModelPath = *path;
        });
    }, no);
}

extern "C" bool voiceflow_model_downloaded(const char* model_id) {
    return guarded("voiceflow_model_downloaded", [&] {
        const auto model = parseId<LlmModel>("voiceflow_model_downloaded", model_id, llmModelFromId);
        if (!model) return false;
        return load_config_or_default().llmModelDownloaded(*model);
    }, no);
}

extern "C" char* voiceflow_model_download_url(const char* model_id) {
    return guarded("voiceflow_model_download_url", [&]() -> char* {
        const auto model = parseId<LlmModel>("voiceflow_model_download_url", model_id, llmModelFromId);
        if (!model) return nullptr;
        const auto url = llmDownloadUrl(*model);
        if (!url) return nullptr;
        return toOwnedCString(*url);
    }, noString);
}

// ------------------------------------------------------------
// Speech recognition engine
// ------------------------------------------------------------

extern "C" char* voiceflow_current_stt_engine(void) {
    return guarded("voiceflow_current_stt_engine", []() -> char* {
        return toOwnedCString(toId(load_config_or_default().sttEngine));
    }, noString);
}

extern "C" bool voiceflow_set_stt_engine(const char* engine_id) {
    return guarded("voiceflow_set_stt_engine", [&] {
        const auto engine = parseId<SttEngine>("voiceflow_set_stt_engine", engine_id, sttEngineFromId);
        if (!engine) return false;
        return updateConfig("voiceflow_set_stt_engine", [&](Config& config) {
            config.sttEngine = *engine;
        });
    }, no);
}

// ------------------------------------------------------------
// Speech models
// ------------------------------------------------------------

extern "C" char* voiceflow_current_speech_model(void) {
    return guarded("voiceflow_current_speech_model", []() -> char* {
        return toOwnedCString(toId(load_config_or_default().speechModel));
    }, noString);
}

extern "C" bool voiceflow_set_speech_model(const char* model_id) {
    return guarded("voiceflow_set_speech_model", [&] {
        const auto model = parseId<SpeechModel>("voiceflow_set_speech_model", model_id, speechModelFromId);
        if (!model) return false;
        return updateConfig("voiceflow_set_speech_model", [&](Config& config) {
            config.speechModel = *model;
        });
    }, no);
}

extern "C" size_t voiceflow_speech_model_count(void) {
    return speechCatalog().size();
}

extern "C" VoiceFlowSpeechModelInfo voiceflow_speech_model_info(size_t index) {
    if (index >= speechCatalog().size()) {
        return emptySpeechModelInfo();
    }

    return guarded("voiceflow_speech_model_info", [&]() -> VoiceFlowSpeechModelInfo {
        const SpeechModelEntry& entry = speechCatalog()[index];
        const bool downloaded = load_config_or_default().speechModelDownloaded(entry.model);

        VoiceFlowSpeechModelInfo info = emptySpeechModelInfo();
        info.id = toOwnedCString(toId(entry.model));
        info.display_name = toOwnedCString(entry.displayName);
        info.size_mb = entry.sizeMb;
        info.is_downloaded = downloaded;
        return info;
    }, noSpeechModelInfo);
}

extern "C" void voiceflow_free_speech_model_info(VoiceFlowSpeechModelInfo info) {
    releaseSpeechModelInfo(info);
}

extern "C" bool voiceflow_speech_model_downloaded(const char* model_id) {
    return guarded("voiceflow_speech_model_downloaded", [&] {
        const auto model = parseId<SpeechModel>("voiceflow_speech_model_downloaded", model_id, speechModelFromId);
        if (!model) return false;
        return load_config_or_default().speechModelDownloaded(*model);
    }, no);
}

extern "C" char* voiceflow_speech_model_download_url(const char* model_id) {
    return guarded("voiceflow_speech_model_download_url", [&]() -> char* {
        const auto model = parseId<SpeechModel>("voiceflow_speech_model_download_url", model_id, speechModelFromId);
        if (!model) return nullptr;
        return toOwnedCString(speechModelDownloadUrl(*model));
    }, noString);
}

extern "C" char* voiceflow_speech_models_dir(void) {
    return guarded("voiceflow_speech_models_dir", []() -> char* {
        return toOwnedCString(load_config_or_default().speechModelsDir().string());
    }, noString);
}
