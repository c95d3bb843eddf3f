#include "config/config.hpp"
#include "log/debug_log.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

using std::string;
using nlohmann::json;

namespace voiceflow {

namespace {

string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? string(v) : string();
}

template <typename T>
void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) out = it->get<T>();
}

template <typename Enum, typename Parse>
void read_enum(const json& j, const char* key, Enum& out, Parse parse) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    const auto id = it->get<string>();
    auto value = parse(id);
    if (!value) {
        throw std::runtime_error(string("Unknown ") + key + " '" + id + "'");
    }
    out = *value;
}

bool path_exists(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::exists(p, ec);
}

} // namespace

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const string home = env_or_empty("HOME");
        if (!home.empty()) return home + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const string xdg = env_or_empty("XDG_CONFIG_HOME");
    if (!xdg.empty()) return xdg + "/voiceflow/config.json";
    const string home = env_or_empty("HOME");
    string base = !home.empty() ? home + "/.config" : string(".config");
    return base + "/voiceflow/config.json";
}

std::string default_models_dir() {
    const string xdg = env_or_empty("XDG_DATA_HOME");
    if (!xdg.empty()) return xdg + "/voiceflow/models";
    const string home = env_or_empty("HOME");
    string base = !home.empty() ? home + "/.local/share" : string(".local/share");
    return base + "/voiceflow/models";
}

std::filesystem::path Config::modelsDir() const {
    if (modelsDirOverride && !modelsDirOverride->empty()) {
        return expand_path(*modelsDirOverride);
    }
    return default_models_dir();
}

std::filesystem::path Config::speechModelsDir() const {
    return modelsDir() / "whisper";
}

std::filesystem::path Config::speechModelPath(SpeechModel model) const {
    return speechModelsDir() / string(findSpeechModel(model).filename);
}

std::filesystem::path Config::voskModelPath() const {
    return modelsDir() / "vosk" / voskModel;
}

std::optional<std::filesystem::path> Config::llmModelPath(LlmModel model) const {
    if (model == LlmModel::Custom) {
        if (customModelPath.empty()) return std::nullopt;
        return std::filesystem::path(expand_path(customModelPath));
    }
    auto entry = findLlmModel(model);
    if (!entry) return std::nullopt;
    return modelsDir() / string(entry->filename);
}

bool Config::speechModelDownloaded(SpeechModel model) const {
    return path_exists(speechModelPath(model));
}

bool Config::llmModelDownloaded(LlmModel model) const {
    auto p = llmModelPath(model);
    return p && path_exists(*p);
}

Config config_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    Config cfg;
    read_enum(j, "stt_engine", cfg.sttEngine, sttEngineFromId);
    read_enum(j, "llm_model", cfg.llmModel, llmModelFromId);
    read_enum(j, "speech_model", cfg.speechModel, speechModelFromId);
    read_key(j, "custom_model_path", cfg.customModelPath);
    read_key(j, "vosk_model", cfg.voskModel);
    read_key(j, "language", cfg.language);
    read_key(j, "threads", cfg.threads);
    read_key(j, "preload_models", cfg.preloadModels);
    read_key(j, "remove_fillers", cfg.formatter.removeFillers);
    read_key(j, "voice_commands", cfg.formatter.voiceCommands);
    read_key(j, "auto_punctuate", cfg.formatter.autoPunctuate);
    read_key(j, "replacements", cfg.formatter.replacements);

    string modelsDir;
    read_key(j, "models_dir", modelsDir);
    if (!modelsDir.empty()) cfg.modelsDirOverride = modelsDir;

    if (cfg.threads < 1) cfg.threads = 1;
    return cfg;
}

json config_to_json(const Config& cfg) {
    json j;
    j["stt_engine"] = string(toId(cfg.sttEngine));
    j["llm_model"] = string(toId(cfg.llmModel));
    if (!cfg.customModelPath.empty()) j["custom_model_path"] = cfg.customModelPath;
    j["speech_model"] = string(toId(cfg.speechModel));
    j["vosk_model"] = cfg.voskModel;
    j["language"] = cfg.language;
    j["threads"] = cfg.threads;
    j["preload_models"] = cfg.preloadModels;
    j["remove_fillers"] = cfg.formatter.removeFillers;
    j["voice_commands"] = cfg.formatter.voiceCommands;
    j["auto_punctuate"] = cfg.formatter.autoPunctuate;
    j["replacements"] = cfg.formatter.replacements;
    if (cfg.modelsDirOverride) j["models_dir"] = *cfg.modelsDirOverride;
    return j;
}

Config load_config(const std::optional<std::string>& path) {
    const string file = (path && !path->empty()) ? expand_path(*path) : default_config_path();

    std::ifstream f(file);
    if (!f.good()) {
        if (path_exists(file)) {
            throw std::runtime_error("Cannot read config file " + file);
        }
        return Config{}; // missing is fine
    }

    try {
        return config_from_json(json::parse(f));
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse config " + file + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid config " + file + ": " + e.what());
    }
}

Config load_config_or_default() {
    try {
        return load_config();
    } catch (const std::exception& e) {
        debugLog(string("Config load failed, using defaults: ") + e.what());
        return Config{};
    }
}

void save_config(const Config& cfg, const std::optional<std::string>& path) {
    const std::filesystem::path file = (path && !path->empty()) ? expand_path(*path) : default_config_path();

    std::error_code ec;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create config directory " +
                                     file.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(file, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open config file for writing: " + file.string());
    }
    out << config_to_json(cfg).dump(2) << "\n";
    out.close();
    if (out.fail()) {
        throw std::runtime_error("Failed to write config file: " + file.string());
    }
}

} // namespace voiceflow
