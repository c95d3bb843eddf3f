#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace voiceflow {

// String ids are persisted in config files and exchanged with the host.
// Never rename an existing id.

enum class LlmModel {
    Qwen3_1_7B,
    Qwen3_4B,
    SmolLM3_3B,
    Gemma2_2B,
    Phi2,
    Custom
};

enum class SttEngine {
    Whisper,
    Vosk
};

enum class SpeechModel {
    Tiny,
    Base
};

template <typename Enum>
struct EnumId {
    Enum value;
    std::string_view id;
};

inline constexpr std::array<EnumId<LlmModel>, 6> kLlmModelIds{{
    {LlmModel::Qwen3_1_7B, "qwen3-1.7b"},
    {LlmModel::Qwen3_4B, "qwen3-4b"},
    {LlmModel::SmolLM3_3B, "smollm3-3b"},
    {LlmModel::Gemma2_2B, "gemma2-2b"},
    {LlmModel::Phi2, "phi-2"},
    {LlmModel::Custom, "custom"},
}};

inline constexpr std::array<EnumId<SttEngine>, 2> kSttEngineIds{{
    {SttEngine::Whisper, "whisper"},
    {SttEngine::Vosk, "vosk"},
}};

inline constexpr std::array<EnumId<SpeechModel>, 2> kSpeechModelIds{{
    {SpeechModel::Tiny, "tiny"},
    {SpeechModel::Base, "base"},
}};

template <typename Enum, std::size_t N>
std::optional<Enum> enumFromId(const std::array<EnumId<Enum>, N>& table, std::string_view id) {
    for (const auto& entry : table) {
        if (entry.id == id) return entry.value;
    }
    return std::nullopt;
}

template <typename Enum, std::size_t N>
std::string_view enumToId(const std::array<EnumId<Enum>, N>& table, Enum value) {
    for (const auto& entry : table) {
        if (entry.value == value) return entry.id;
    }
    return {};
}

inline std::string_view toId(LlmModel m) { return enumToId(kLlmModelIds, m); }
inline std::string_view toId(SttEngine e) { return enumToId(kSttEngineIds, e); }
inline std::string_view toId(SpeechModel m) { return enumToId(kSpeechModelIds, m); }

inline std::optional<LlmModel> llmModelFromId(std::string_view id) { return enumFromId(kLlmModelIds, id); }
inline std::optional<SttEngine> sttEngineFromId(std::string_view id) { return enumFromId(kSttEngineIds, id); }
inline std::optional<SpeechModel> speechModelFromId(std::string_view id) { return enumFromId(kSpeechModelIds, id); }

// Downloadable GGUF language models. Custom is not part of the catalog.
struct LlmModelEntry {
    LlmModel model;
    std::string_view displayName;
    std::string_view filename;
    float sizeGb;
    std::string_view hfRepo;
};

// Whisper ggml models used by the whisper engine.
struct SpeechModelEntry {
    SpeechModel model;
    std::string_view displayName;
    std::string_view filename;
    unsigned sizeMb;
};

const std::array<LlmModelEntry, 5>& llmCatalog();
const std::array<SpeechModelEntry, 2>& speechCatalog();

std::optional<LlmModelEntry> findLlmModel(LlmModel model);
const SpeechModelEntry& findSpeechModel(SpeechModel model);

// https://huggingface.co/<repo>/resolve/main/<file>, or nullopt when the model
// has no fixed download location (Custom).
std::optional<std::string> llmDownloadUrl(LlmModel model);
std::string speechModelDownloadUrl(SpeechModel model);

} // namespace voiceflow
