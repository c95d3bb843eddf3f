#include "audio/audio_capture.hpp"
#include "audio/wav_reader.hpp"
#include "voiceflow/voiceflow.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

struct Args {
    std::optional<std::string> config_path{};
    std::string command;
    std::vector<std::string> operands;
    std::optional<std::string> context{};
    std::optional<int> device_index{};
    int seconds = 5;
};

static void print_usage() {
    std::cout << "VoiceFlow " << voiceflow_version() << " - dictation pipeline host\n"
              << "Usage: voiceflow-cli [--config <path>] <command> [options]\n"
              << "Commands:\n"
              << "  transcribe <file.wav>              Transcribe a 16 kHz PCM16 WAV file\n"
              << "  record                             Record from the microphone, then transcribe\n"
              << "  devices                            List audio input devices\n"
              << "  models                             List language models\n"
              << "  speech-models                      List speech models\n"
              << "  get <model|stt-engine|speech-model>\n"
              << "  set <model|stt-engine|speech-model> <id>\n"
              << "  set custom-model <path>            Use a local GGUF file\n"
              << "  url <model-id>                     Print a model download URL\n"
              << "  version                            Print the library version\n"
              << "Options:\n"
              << "      --config <path>                Config file for transcribe/record\n"
              << "      --context <text>               Text preceding the dictation\n"
              << "  -d, --device <index>               Input device for record\n"
              << "  -s, --seconds <n>                  Recording length (default 5)\n";
}

static bool parse_args(int argc, char** argv, Args& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if      (s == "--config" && i + 1 < argc) a.config_path = argv[++i];
        else if (s == "--context" && i + 1 < argc) a.context = argv[++i];
        else if ((s == "--device" || s == "-d") && i + 1 < argc) a.device_index = std::stoi(argv[++i]);
        else if ((s == "--seconds" || s == "-s") && i + 1 < argc) a.seconds = std::stoi(argv[++i]);
        else if (s == "--help" || s == "-h") {
            print_usage();
            std::exit(0);
        }
        else if (!s.empty() && s[0] == '-') {
            std::cerr << "Unknown option: " << s << "\n";
            return false;
        }
        else if (a.command.empty()) a.command = s;
        else a.operands.push_back(s);
    }
    return !a.command.empty();
}

// Takes ownership of a string returned by the library.
static std::string take_string(char* s) {
    if (!s) return {};
    std::string out(s);
    voiceflow_free_string(s);
    return out;
}

static int run_pipeline(const Args& args, const std::vector<float>& samples) {
    VoiceFlowHandle* handle = voiceflow_init(args.config_path ? args.config_path->c_str() : nullptr);
    if (!handle) {
        std::cerr << "Error: failed to initialize pipeline (see /tmp/voiceflow_debug.log)\n";
        return 1;
    }

    VoiceFlowResult result = voiceflow_process(handle, samples.data(), samples.size(),
                                               args.context ? args.context->c_str() : nullptr);
    int status = 0;
    if (result.success) {
        std::cout << (result.formatted_text ? result.formatted_text : "") << "\n";
        std::cerr << "raw: " << (result.raw_transcript ? result.raw_transcript : "") << "\n"
                  << "transcription " << result.transcription_ms << " ms, formatting "
                  << result.llm_ms << " ms, total " << result.total_ms << " ms\n";
    } else {
        std::cerr << "Error: " << (result.error_message ? result.error_message : "unknown error") << "\n";
        status = 1;
    }

    voiceflow_free_result(result);

    const VoiceFlowMemoryInfo memory = voiceflow_memory_info();
    std::cerr << "peak memory " << memory.peak_bytes / (1024 * 1024) << " MB\n";

    voiceflow_unload_models(handle);
    voiceflow_prepare_shutdown();
    voiceflow_destroy(handle);
    return status;
}

static int cmd_transcribe(const Args& args) {
    if (args.operands.size() != 1) {
        std::cerr << "Usage: voiceflow-cli transcribe <file.wav>\n";
        return 1;
    }

    voiceflow::WavAudio wav;
    std::string error;
    if (!voiceflow::readWavFile(args.operands[0], &wav, &error)) {
        std::cerr << "Error: " << args.operands[0] << ": " << error << "\n";
        return 1;
    }
    if (wav.sampleRate != static_cast<uint32_t>(voiceflow::AudioCapture::DEFAULT_SAMPLE_RATE)) {
        std::cerr << "Error: expected " << voiceflow::AudioCapture::DEFAULT_SAMPLE_RATE
                  << " Hz audio, got " << wav.sampleRate << " Hz\n";
        return 1;
    }
    return run_pipeline(args, wav.samples);
}

static int cmd_record(const Args& args) {
    if (args.seconds <= 0) {
        std::cerr << "Error: --seconds must be positive\n";
        return 1;
    }

    std::vector<float> samples;
    {
        voiceflow::AudioCapture audio;
        if (args.device_index && !audio.setDevice(*args.device_index)) {
            std::cerr << "Error: invalid input device " << *args.device_index << "\n";
            return 1;
        }
        if (!audio.start()) {
            return 1;
        }

        std::cerr << "Recording for " << args.seconds << " s... (Ctrl+C to stop early)\n";
        const auto t0 = std::chrono::steady_clock::now();
        while (!g_stop.load() &&
               std::chrono::steady_clock::now() - t0 < std::chrono::seconds(args.seconds)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        audio.stop();
        samples = audio.takeSamples();
    }

    std::cerr << "Captured " << samples.size() << " samples\n";
    return run_pipeline(args, samples);
}

static int cmd_devices() {
    voiceflow::AudioCapture audio;
    for (const auto& device : audio.listDevices()) {
        std::cout << "[" << device.index << "] " << device.name
                  << " (" << device.maxInputChannels << " ch, "
                  << device.defaultSampleRate << " Hz)\n";
    }
    return 0;
}

static int cmd_models() {
    const std::string current = take_string(voiceflow_current_model());
    std::cout << "Models directory: " << take_string(voiceflow_models_dir()) << "\n";
    for (size_t i = 0; i < voiceflow_model_count(); ++i) {
        VoiceFlowModelInfo info = voiceflow_model_info(i);
        if (!info.id) continue;
        std::cout << (current == info.id ? "* " : "  ")
                  << std::left << std::setw(12) << info.id << " "
                  << std::setw(12) << (info.display_name ? info.display_name : "") << " "
                  << std::fixed << std::setprecision(2) << info.size_gb << " GB  "
                  << (info.is_downloaded ? "downloaded" : "missing") << "\n";
        voiceflow_free_model_info(info);
    }
    return 0;
}

static int cmd_speech_models() {
    const std::string current = take_string(voiceflow_current_speech_model());
    std::cout << "Speech models directory: " << take_string(voiceflow_speech_models_dir()) << "\n";
    for (size_t i = 0; i < voiceflow_speech_model_count(); ++i) {
        VoiceFlowSpeechModelInfo info = voiceflow_speech_model_info(i);
        if (!info.id) continue;
        std::cout << (current == info.id ? "* " : "  ")
                  << std::left << std::setw(6) << info.id << " "
                  << std::setw(14) << (info.display_name ? info.display_name : "") << " "
                  << info.size_mb << " MB  "
                  << (info.is_downloaded ? "downloaded" : "missing") << "\n";
        voiceflow_free_speech_model_info(info);
    }
    return 0;
}

static int cmd_get(const Args& args) {
    if (args.operands.size() != 1) {
        std::cerr << "Usage: voiceflow-cli get <model|stt-engine|speech-model>\n";
        return 1;
    }
    const std::string& key = args.operands[0];
    char* value = nullptr;
    if      (key == "model")        value = voiceflow_current_model();
    else if (key == "stt-engine")   value = voiceflow_current_stt_engine();
    else if (key == "speech-model") value = voiceflow_current_speech_model();
    else {
        std::cerr << "Unknown setting: " << key << "\n";
        return 1;
    }
    if (!value) {
        std::cerr << "Error: could not read " << key << "\n";
        return 1;
    }
    std::cout << take_string(value) << "\n";
    return 0;
}

static int cmd_set(const Args& args) {
    if (args.operands.size() != 2) {
        std::cerr << "Usage: voiceflow-cli set <model|custom-model|stt-engine|speech-model> <value>\n";
        return 1;
    }
    const std::string& key = args.operands[0];
    const char* value = args.operands[1].c_str();
    bool ok = false;
    if      (key == "model")        ok = voiceflow_set_model(value);
    else if (key == "custom-model") ok = voiceflow_set_custom_model(value);
    else if (key == "stt-engine")   ok = voiceflow_set_stt_engine(value);
    else if (key == "speech-model") ok = voiceflow_set_speech_model(value);
    else {
        std::cerr << "Unknown setting: " << key << "\n";
        return 1;
    }
    if (!ok) {
        std::cerr << "Error: could not set " << key << " to '" << value << "'\n";
        return 1;
    }
    return 0;
}

static int cmd_url(const Args& args) {
    if (args.operands.size() != 1) {
        std::cerr << "Usage: voiceflow-cli url <model-id>\n";
        return 1;
    }
    const char* id = args.operands[0].c_str();
    char* url = voiceflow_model_download_url(id);
    if (!url) url = voiceflow_speech_model_download_url(id);
    if (!url) {
        std::cerr << "No download URL for '" << id << "'\n";
        return 1;
    }
    std::cout << take_string(url) << "\n";
    return 0;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);

    Args args;
    try {
        if (!parse_args(argc, argv, args)) {
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid argument: " << e.what() << "\n";
        return 1;
    }

    try {
        const std::string& c = args.command;
        if (c == "transcribe")    return cmd_transcribe(args);
        if (c == "record")        return cmd_record(args);
        if (c == "devices")       return cmd_devices();
        if (c == "models")        return cmd_models();
        if (c == "speech-models") return cmd_speech_models();
        if (c == "get")           return cmd_get(args);
        if (c == "set")           return cmd_set(args);
        if (c == "url")           return cmd_url(args);
        if (c == "version") {
            std::cout << voiceflow_version() << "\n";
            return 0;
        }
        std::cerr << "Unknown command: " << c << "\n";
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
