#include "config/model_catalog.hpp"

namespace voiceflow {

namespace {

constexpr std::string_view kHuggingFace = "https://huggingface.co/";
constexpr std::string_view kWhisperRepo = "ggerganov/whisper.cpp";

std::string resolveUrl(std::string_view repo, std::string_view filename) {
    std::string url(kHuggingFace);
    url += repo;
    url += "/resolve/main/";
    url += filename;
    return url;
}

} // namespace

const std::array<LlmModelEntry, 5>& llmCatalog() {
    static const std::array<LlmModelEntry, 5> catalog{{
        {LlmModel::Qwen3_1_7B, "Qwen3 1.7B", "qwen3-1.7b-q4_k_m.gguf", 1.1f, "Qwen/Qwen3-1.7B-GGUF"},
        {LlmModel::Qwen3_4B, "Qwen3 4B", "Qwen3-4B-Q4_K_M.gguf", 2.5f, "Qwen/Qwen3-4B-GGUF"},
        {LlmModel::SmolLM3_3B, "SmolLM3 3B", "SmolLM3-Q4_K_M.gguf", 1.92f, "ggml-org/SmolLM3-3B-GGUF"},
        {LlmModel::Gemma2_2B, "Gemma 2 2B", "gemma-2-2b-it-Q4_K_M.gguf", 1.71f, "bartowski/gemma-2-2b-it-GGUF"},
        {LlmModel::Phi2, "Phi-2", "phi-2.Q4_K_M.gguf", 1.79f, "TheBloke/phi-2-GGUF"},
    }};
    return catalog;
}

const std::array<SpeechModelEntry, 2>& speechCatalog() {
    static const std::array<SpeechModelEntry, 2> catalog{{
        {SpeechModel::Tiny, "Whisper Tiny", "ggml-tiny.bin", 75},
        {SpeechModel::Base, "Whisper Base", "ggml-base.bin", 142},
    }};
    return catalog;
}

std::optional<LlmModelEntry> findLlmModel(LlmModel model) {
    for (const auto& entry : llmCatalog()) {
        if (entry.model == model) return entry;
    }
    return std::nullopt;
}

const SpeechModelEntry& findSpeechModel(SpeechModel model) {
    for (const auto& entry : speechCatalog()) {
        if (entry.model == model) return entry;
    }
    // SpeechModel is closed and every value is in the catalog.
    return speechCatalog().front();
}

std::optional<std::string> llmDownloadUrl(LlmModel model) {
    auto entry = findLlmModel(model);
    if (!entry) return std::nullopt;
    return resolveUrl(entry->hfRepo, entry->filename);
}

std::string speechModelDownloadUrl(SpeechModel model) {
    return resolveUrl(kWhisperRepo, findSpeechModel(model).filename);
}

} // namespace voiceflow
