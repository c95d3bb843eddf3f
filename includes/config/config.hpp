#pragma once

#include "config/model_catalog.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace voiceflow {

struct FormatterSettings {
    bool removeFillers = true;      // remove_fillers
    bool voiceCommands = true;      // voice_commands
    bool autoPunctuate = true;      // auto_punctuate
    std::map<std::string, std::string> replacements; // replacements { "spoken": "written" }
};

struct Config {
    SttEngine sttEngine = SttEngine::Whisper;          // stt_engine
    LlmModel llmModel = LlmModel::Qwen3_1_7B;          // llm_model
    std::string customModelPath;                       // custom_model_path, used by LlmModel::Custom
    SpeechModel speechModel = SpeechModel::Base;       // speech_model
    std::string voskModel = "vosk-model-small-en-us-0.15"; // vosk_model
    std::string language = "en";                       // language
    int threads = 4;                                    // threads
    bool preloadModels = false;                         // preload_models
    FormatterSettings formatter;
    std::optional<std::string> modelsDirOverride;       // models_dir

    std::filesystem::path modelsDir() const;
    std::filesystem::path speechModelsDir() const;
    std::filesystem::path speechModelPath(SpeechModel model) const;
    std::filesystem::path voskModelPath() const;

    // nullopt for Custom without a configured path.
    std::optional<std::filesystem::path> llmModelPath(LlmModel model) const;

    // Checked on disk on every call, nothing is cached.
    bool speechModelDownloaded(SpeechModel model) const;
    bool llmModelDownloaded(LlmModel model) const;
};

// Returns $XDG_CONFIG_HOME/voiceflow/config.json or ~/.config/voiceflow/config.json
std::string default_config_path();

// Returns $XDG_DATA_HOME/voiceflow/models or ~/.local/share/voiceflow/models
std::string default_models_dir();

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

// Load the JSON config at `path` (default_config_path() when empty).
// A missing file yields the defaults. A file that exists but cannot be
// parsed throws std::runtime_error.
Config load_config(const std::optional<std::string>& path = std::nullopt);

// Like load_config() on the default path, but falls back to the defaults on
// any error. The failure is written to the debug log.
Config load_config_or_default();

// Writes the config as JSON, creating parent directories. Throws std::runtime_error.
void save_config(const Config& cfg, const std::optional<std::string>& path = std::nullopt);

Config config_from_json(const nlohmann::json& j);
nlohmann::json config_to_json(const Config& cfg);

} // namespace voiceflow
