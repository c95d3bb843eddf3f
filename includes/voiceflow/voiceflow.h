// voiceflow.h - C interface to the VoiceFlow speech pipeline.
//
// Every string returned as `char*` is owned by the caller and must be released
// exactly once with the matching free function. NULL means "absent" and needs
// no release. Strings returned as `const char*` are static and must not be freed.
// All text is UTF-8 and null-terminated.
//
// A handle must not be used from two threads at the same time.
#pragma once

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32)
	#ifdef VOICEFLOW_EXPORTS
		#define VOICEFLOW_API __declspec(dllexport)
	#else
		#define VOICEFLOW_API __declspec(dllimport)
	#endif
#else
	#define VOICEFLOW_API __attribute__((visibility("default")))
#endif

typedef struct VoiceFlowHandle VoiceFlowHandle;

// Result of voiceflow_process / voiceflow_format_text.
// success == true:  formatted_text and raw_transcript may be set, error_message is NULL.
// success == false: formatted_text and raw_transcript are NULL, error_message is set,
//                   all timings are 0.
// Release with voiceflow_free_result().
typedef struct VoiceFlowResult {
	bool success;
	char* formatted_text;
	char* raw_transcript;
	char* error_message;
	uint64_t transcription_ms;
	uint64_t llm_ms;
	uint64_t total_ms;
} VoiceFlowResult;

// Language model catalog entry. An out-of-range query returns all fields
// NULL/0/false; check `id` before using the rest.
typedef struct VoiceFlowModelInfo {
	char* id;
	char* display_name;
	char* filename;
	float size_gb;
	bool is_downloaded;
} VoiceFlowModelInfo;

// Process memory usage in bytes. All fields are 0 when it cannot be read.
typedef struct VoiceFlowMemoryInfo {
	uint64_t resident_bytes;
	uint64_t virtual_bytes;
	uint64_t peak_bytes;
} VoiceFlowMemoryInfo;

// Speech model catalog entry. Same sentinel rule as VoiceFlowModelInfo.
typedef struct VoiceFlowSpeechModelInfo {
	char* id;
	char* display_name;
	uint32_t size_mb;
	bool is_downloaded;
} VoiceFlowSpeechModelInfo;

// ------------------------------------------------------------
// Pipeline lifecycle
// ------------------------------------------------------------

// Create a pipeline. config_path may be NULL for the default configuration file.
// Returns NULL on failure (details in the debug log).
VOICEFLOW_API VoiceFlowHandle* voiceflow_init(const char* config_path);

// Destroy a handle returned by voiceflow_init. NULL is a no-op.
VOICEFLOW_API void voiceflow_destroy(VoiceFlowHandle* handle);

// Transcribe and format 16 kHz mono float PCM. audio_len is in samples.
// context may be NULL.
VOICEFLOW_API VoiceFlowResult voiceflow_process(VoiceFlowHandle* handle,
                                                const float* audio_data,
                                                size_t audio_len,
                                                const char* context);

// Run only the formatting stage on already transcribed text.
VOICEFLOW_API VoiceFlowResult voiceflow_format_text(VoiceFlowHandle* handle,
                                                    const char* text,
                                                    const char* context);

// Release loaded models. They are loaded again on the next call that needs them.
VOICEFLOW_API void voiceflow_unload_models(VoiceFlowHandle* handle);

VOICEFLOW_API void voiceflow_free_result(VoiceFlowResult result);
VOICEFLOW_API void voiceflow_free_string(char* s);

// Frees process-wide model backend state before the host exits. Call after
// voiceflow_unload_models() on every handle. Safe to call more than once; a
// later voiceflow_init() starts the backend again.
VOICEFLOW_API void voiceflow_prepare_shutdown(void);

// Current, virtual and peak resident memory of the process.
VOICEFLOW_API VoiceFlowMemoryInfo voiceflow_memory_info(void);

// Library version. Static, do not free.
VOICEFLOW_API const char* voiceflow_version(void);

// Rule-based clean-up of a transcript using the stored formatter settings.
VOICEFLOW_API char* voiceflow_post_process_text(const char* text);

// ------------------------------------------------------------
// Language model selection
// ------------------------------------------------------------

VOICEFLOW_API char* voiceflow_models_dir(void);
VOICEFLOW_API size_t voiceflow_model_count(void);
VOICEFLOW_API VoiceFlowModelInfo voiceflow_model_info(size_t index);
VOICEFLOW_API void voiceflow_free_model_info(VoiceFlowModelInfo info);

VOICEFLOW_API char* voiceflow_current_model(void);
// Takes effect on the next voiceflow_init.
VOICEFLOW_API bool voiceflow_set_model(const char* model_id);
VOICEFLOW_API bool voiceflow_set_custom_model(const char* model_path);
VOICEFLOW_API bool voiceflow_model_downloaded(const char* model_id);
// NULL for "custom" and unknown ids.
VOICEFLOW_API char* voiceflow_model_download_url(const char* model_id);

// ------------------------------------------------------------
// Speech recognition engine ("whisper" or "vosk")
// ------------------------------------------------------------

VOICEFLOW_API char* voiceflow_current_stt_engine(void);
VOICEFLOW_API bool voiceflow_set_stt_engine(const char* engine_id);

// ------------------------------------------------------------
// Speech model size ("tiny" or "base")
// ------------------------------------------------------------

VOICEFLOW_API char* voiceflow_current_speech_model(void);
VOICEFLOW_API bool voiceflow_set_speech_model(const char* model_id);
VOICEFLOW_API size_t voiceflow_speech_model_count(void);
VOICEFLOW_API VoiceFlowSpeechModelInfo voiceflow_speech_model_info(size_t index);
VOICEFLOW_API void voiceflow_free_speech_model_info(VoiceFlowSpeechModelInfo info);
VOICEFLOW_API bool voiceflow_speech_model_downloaded(const char* model_id);
VOICEFLOW_API char* voiceflow_speech_model_download_url(const char* model_id);
VOICEFLOW_API char* voiceflow_speech_models_dir(void);

#ifdef __cplusplus
}
#endif
