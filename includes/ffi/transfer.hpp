#pragma once

#include "voiceflow/voiceflow.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace voiceflow::ffi {

// Ownership hand-off for values crossing the C boundary.
//
// Outgoing strings are malloc'd copies owned by the caller and released by
// releaseCString(), which the voiceflow_free_* entry points call exactly once
// per buffer. Incoming strings are borrowed and copied.

// nullptr when `s` contains an interior NUL or allocation fails.
char* toOwnedCString(std::string_view s) noexcept;
void releaseCString(char* s) noexcept;

bool isValidUtf8(std::string_view s) noexcept;

// nullopt for NULL or for text that is not valid UTF-8.
std::optional<std::string> decodeInput(const char* s);

VoiceFlowResult errorResult(const char* message) noexcept;
VoiceFlowResult successResult(const std::string& formatted, const std::string& raw,
                              std::uint64_t transcriptionMs, std::uint64_t llmMs,
                              std::uint64_t totalMs) noexcept;
void releaseResult(VoiceFlowResult& result) noexcept;

// All fields NULL/0/false.
VoiceFlowModelInfo emptyModelInfo() noexcept;
VoiceFlowSpeechModelInfo emptySpeechModelInfo() noexcept;
void releaseModelInfo(VoiceFlowModelInfo& info) noexcept;
void releaseSpeechModelInfo(VoiceFlowSpeechModelInfo& info) noexcept;

} // namespace voiceflow::ffi
