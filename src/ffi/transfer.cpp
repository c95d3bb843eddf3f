#include "ffi/transfer.hpp"

#include <cstdlib>
#include <cstring>

namespace voiceflow::ffi {

char* toOwnedCString(std::string_view s) noexcept {
    if (s.find('\0') != std::string_view::npos) return nullptr;
    char* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (!out) return nullptr;
    std::memcpy(out, s.data(), s.size());
    out[s.size()] = '\0';
    return out;
}

void releaseCString(char* s) noexcept {
    std::free(s);
}

bool isValidUtf8(std::string_view s) noexcept {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;      // overlong
            if (c == 0xED) hi = 0x9F;      // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;      // overlong
            if (c == 0xF4) hi = 0x8F;      // > U+10FFFF
        } else {
            return false;
        }

        if (i + len > n) return false;
        const auto c1 = static_cast<unsigned char>(s[i + 1]);
        if (c1 < lo || c1 > hi) return false;
        for (size_t k = 2; k < len; ++k) {
            const auto ck = static_cast<unsigned char>(s[i + k]);
            if (ck < 0x80 || ck > 0xBF) return false;
        }
        i += len;
    }
    return true;
}

std::optional<std::string> decodeInput(const char* s) {
    if (!s) return std::nullopt;
    std::string_view view(s);
    if (!isValidUtf8(view)) return std::nullopt;
    return std::string(view);
}

VoiceFlowResult errorResult(const char* message) noexcept {
    VoiceFlowResult r{};
    r.success = false;
    r.error_message = toOwnedCString(message ? message : "Unknown error");
    return r;
}

VoiceFlowResult successResult(const std::string& formatted, const std::string& raw,
                              std::uint64_t transcriptionMs, std::uint64_t llmMs,
                              std::uint64_t totalMs) noexcept {
    VoiceFlowResult r{};
    r.success = true;
    r.formatted_text = toOwnedCString(formatted);
    r.raw_transcript = toOwnedCString(raw);
    r.transcription_ms = transcriptionMs;
    r.llm_ms = llmMs;
    r.total_ms = totalMs;
    return r;
}

void releaseResult(VoiceFlowResult& result) noexcept {
    releaseCString(result.formatted_text);
    releaseCString(result.raw_transcript);
    releaseCString(result.error_message);
    result.formatted_text = nullptr;
    result.raw_transcript = nullptr;
    result.error_message = nullptr;
}

VoiceFlowModelInfo emptyModelInfo() noexcept {
    VoiceFlowModelInfo info{};
    info.id = nullptr;
    info.display_name = nullptr;
    info.filename = nullptr;
    info.size_gb = 0.0f;
    info.is_downloaded = false;
    return info;
}

VoiceFlowSpeechModelInfo emptySpeechModelInfo() noexcept {
    VoiceFlowSpeechModelInfo info{};
    info.id = nullptr;
    info.display_name = nullptr;
    info.size_mb = 0;
    info.is_downloaded = false;
    return info;
}

void releaseModelInfo(VoiceFlowModelInfo& info) noexcept {
    releaseCString(info.id);
    releaseCString(info.display_name);
    releaseCString(info.filename);
    info.id = nullptr;
    info.display_name = nullptr;
    info.filename = nullptr;
}

void releaseSpeechModelInfo(VoiceFlowSpeechModelInfo& info) noexcept {
    releaseCString(info.id);
    releaseCString(info.display_name);
    info.id = nullptr;
    info.display_name = nullptr;
}

} // namespace voiceflow::ffi
