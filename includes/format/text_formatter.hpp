#pragma once

#include "config/config.hpp"

#include <optional>
#include <string>

namespace voiceflow {

// Turns a raw transcript into text ready to be inserted where the user is typing.
//
// Steps, in order: drop non-speech annotations ("[BLANK_AUDIO]", "(music)"),
// user replacements, filler words, spoken commands ("new line",
// "new paragraph"), spacing around punctuation, capitalization, final period.
//
// `context` is the text just before the insertion point. When it does not end
// a sentence the first word is left in lower case.
class TextFormatter {
public:
    explicit TextFormatter(const FormatterSettings& settings);

    std::string format(const std::string& text,
                       const std::optional<std::string>& context = std::nullopt) const;

private:
    FormatterSettings settings_;

    std::string stripAnnotations(const std::string& text) const;
    std::string applyReplacements(const std::string& text) const;
    std::string removeFillers(const std::string& text) const;
    std::string applyVoiceCommands(const std::string& text) const;
    std::string fixSpacing(const std::string& text) const;
    std::string capitalize(const std::string& text, bool capitalizeFirst) const;
    std::string finishSentence(const std::string& text) const;

    static bool endsSentence(const std::optional<std::string>& context);
    static std::string escapeRegex(const std::string& text);
};

} // namespace voiceflow
