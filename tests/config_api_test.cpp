#include "voiceflow/voiceflow.h"
#include "test_env.hpp"

#include <gtest/gtest.h>

#include <cstdint>

using namespace voiceflow::test;

namespace {

// Copies and releases a string returned by the library.
std::string take(char* s) {
    if (!s) return "<null>";
    std::string out(s);
    voiceflow_free_string(s);
    return out;
}

} // namespace

class ConfigApiTest : public IsolatedEnvTest {};

TEST_F(ConfigApiTest, Defaults) {
    EXPECT_EQ(take(voiceflow_current_model()), "qwen3-1.7b");
    EXPECT_EQ(take(voiceflow_current_stt_engine()), "whisper");
    EXPECT_EQ(take(voiceflow_current_speech_model()), "base");
}

TEST_F(ConfigApiTest, SetModelPersists) {
    EXPECT_TRUE(voiceflow_set_model("qwen3-4b"));
    EXPECT_EQ(take(voiceflow_current_model()), "qwen3-4b");
    EXPECT_NE(readFile(configPath()).find("\"qwen3-4b\""), std::string::npos);
}

TEST_F(ConfigApiTest, UnknownModelLeavesConfigUnchanged) {
    ASSERT_TRUE(voiceflow_set_model("gemma2-2b"));
    EXPECT_FALSE(voiceflow_set_model("bogus"));
    EXPECT_FALSE(voiceflow_set_model(""));
    EXPECT_FALSE(voiceflow_set_model(nullptr));
    EXPECT_FALSE(voiceflow_set_model("qwen3-4b\xFF"));
    EXPECT_EQ(take(voiceflow_current_model()), "gemma2-2b");
}

TEST_F(ConfigApiTest, CustomModelNeedsAPath) {
    EXPECT_FALSE(voiceflow_set_model("custom"));
    EXPECT_FALSE(voiceflow_set_custom_model(""));
    EXPECT_FALSE(voiceflow_set_custom_model(nullptr));
    EXPECT_EQ(take(voiceflow_current_model()), "qwen3-1.7b");

    const auto model = root_ / "mine.gguf";
    EXPECT_TRUE(voiceflow_set_custom_model(model.c_str()));
    EXPECT_EQ(take(voiceflow_current_model()), "custom");
    EXPECT_FALSE(voiceflow_model_downloaded("custom"));

    writeFile(model, "gguf");
    EXPECT_TRUE(voiceflow_model_downloaded("custom"));
}

TEST_F(ConfigApiTest, SttEngine) {
    EXPECT_TRUE(voiceflow_set_stt_engine("vosk"));
    EXPECT_EQ(take(voiceflow_current_stt_engine()), "vosk");
    EXPECT_FALSE(voiceflow_set_stt_engine("moonshine"));
    EXPECT_FALSE(voiceflow_set_stt_engine(nullptr));
    EXPECT_EQ(take(voiceflow_current_stt_engine()), "vosk");
}

TEST_F(ConfigApiTest, SpeechModel) {
    EXPECT_TRUE(voiceflow_set_speech_model("tiny"));
    EXPECT_EQ(take(voiceflow_current_speech_model()), "tiny");
    EXPECT_FALSE(voiceflow_set_speech_model("large"));
    EXPECT_EQ(take(voiceflow_current_speech_model()), "tiny");
}

TEST_F(ConfigApiTest, SettersKeepOtherFields) {
    writeFile(configPath(), R"({"language": "de", "replacements": {"a": "b"}})");
    ASSERT_TRUE(voiceflow_set_speech_model("tiny"));

    const auto j = nlohmann::json::parse(readFile(configPath()));
    EXPECT_EQ(j.at("language").get<std::string>(), "de");
    EXPECT_EQ(j.at("replacements").at("a").get<std::string>(), "b");
    EXPECT_EQ(j.at("speech_model").get<std::string>(), "tiny");
}

TEST_F(ConfigApiTest, UnwritableConfigFailsSetter) {
    // A regular file where the config directory should be.
    const auto blocker = root_ / "blocker";
    writeFile(blocker, "");
    setenv("XDG_CONFIG_HOME", blocker.c_str(), 1);

    EXPECT_FALSE(voiceflow_set_model("qwen3-4b"));
    EXPECT_EQ(take(voiceflow_current_model()), "qwen3-1.7b");
}

TEST_F(ConfigApiTest, ModelCatalog) {
    ASSERT_EQ(voiceflow_model_count(), 5u);

    VoiceFlowModelInfo info = voiceflow_model_info(0);
    ASSERT_NE(info.id, nullptr);
    EXPECT_STREQ(info.id, "qwen3-1.7b");
    EXPECT_STREQ(info.display_name, "Qwen3 1.7B");
    EXPECT_STREQ(info.filename, "qwen3-1.7b-q4_k_m.gguf");
    EXPECT_FLOAT_EQ(info.size_gb, 1.1f);
    EXPECT_FALSE(info.is_downloaded);
    voiceflow_free_model_info(info);

    writeFile(modelsDir() / "qwen3-1.7b-q4_k_m.gguf", "gguf");
    info = voiceflow_model_info(0);
    EXPECT_TRUE(info.is_downloaded);
    voiceflow_free_model_info(info);
    EXPECT_TRUE(voiceflow_model_downloaded("qwen3-1.7b"));
    EXPECT_FALSE(voiceflow_model_downloaded("qwen3-4b"));
    EXPECT_FALSE(voiceflow_model_downloaded("bogus"));
}

TEST_F(ConfigApiTest, OutOfRangeInfoIsASentinel) {
    for (size_t index : {voiceflow_model_count(), size_t{99}, static_cast<size_t>(SIZE_MAX)}) {
        VoiceFlowModelInfo info = voiceflow_model_info(index);
        EXPECT_EQ(info.id, nullptr);
        EXPECT_EQ(info.display_name, nullptr);
        EXPECT_EQ(info.filename, nullptr);
        EXPECT_EQ(info.size_gb, 0.0f);
        EXPECT_FALSE(info.is_downloaded);
        voiceflow_free_model_info(info);
    }

    VoiceFlowSpeechModelInfo speech = voiceflow_speech_model_info(voiceflow_speech_model_count());
    EXPECT_EQ(speech.id, nullptr);
    EXPECT_EQ(speech.display_name, nullptr);
    EXPECT_EQ(speech.size_mb, 0u);
    EXPECT_FALSE(speech.is_downloaded);
    voiceflow_free_speech_model_info(speech);
}

TEST_F(ConfigApiTest, SpeechModelCatalog) {
    ASSERT_EQ(voiceflow_speech_model_count(), 2u);

    VoiceFlowSpeechModelInfo info = voiceflow_speech_model_info(1);
    ASSERT_NE(info.id, nullptr);
    EXPECT_STREQ(info.id, "base");
    EXPECT_STREQ(info.display_name, "Whisper Base");
    EXPECT_EQ(info.size_mb, 142u);
    EXPECT_FALSE(info.is_downloaded);
    voiceflow_free_speech_model_info(info);

    EXPECT_FALSE(voiceflow_speech_model_downloaded("tiny"));
    writeFile(modelsDir() / "whisper" / "ggml-tiny.bin", "ggml");
    EXPECT_TRUE(voiceflow_speech_model_downloaded("tiny"));
    EXPECT_FALSE(voiceflow_speech_model_downloaded("base"));
    EXPECT_FALSE(voiceflow_speech_model_downloaded(nullptr));
}

TEST_F(ConfigApiTest, DownloadUrls) {
    EXPECT_EQ(take(voiceflow_model_download_url("phi-2")),
              "https://huggingface.co/TheBloke/phi-2-GGUF/resolve/main/phi-2.Q4_K_M.gguf");
    EXPECT_EQ(voiceflow_model_download_url("custom"), nullptr);
    EXPECT_EQ(voiceflow_model_download_url("bogus"), nullptr);
    EXPECT_EQ(voiceflow_model_download_url(nullptr), nullptr);

    EXPECT_EQ(take(voiceflow_speech_model_download_url("base")),
              "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.bin");
    EXPECT_EQ(voiceflow_speech_model_download_url("qwen3-4b"), nullptr);
}

TEST_F(ConfigApiTest, Directories) {
    EXPECT_EQ(take(voiceflow_models_dir()), modelsDir().string());
    EXPECT_EQ(take(voiceflow_speech_models_dir()), (modelsDir() / "whisper").string());

    writeFile(configPath(), R"({"models_dir": "/srv/models"})");
    EXPECT_EQ(take(voiceflow_models_dir()), "/srv/models");
    EXPECT_EQ(take(voiceflow_speech_models_dir()), "/srv/models/whisper");
}

TEST_F(ConfigApiTest, CorruptConfigReadsAsDefaults) {
    writeFile(configPath(), "{ not json");
    EXPECT_EQ(take(voiceflow_current_model()), "qwen3-1.7b");
    EXPECT_EQ(take(voiceflow_current_stt_engine()), "whisper");
}
