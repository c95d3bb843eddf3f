#include "format/text_formatter.hpp"

#include <cctype>
#include <regex>
#include <sstream>

namespace voiceflow {

namespace {

const auto kIcase = std::regex::ECMAScript | std::regex::icase;

bool isTerminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isLetter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

// The period in "i.e." or "e.g.": follows a lone letter and is followed by
// another letter, or closes a dotted run.
bool isAbbreviationDot(const std::string& s, size_t i) {
    if (i == 0 || !isLetter(s[i - 1])) return false;
    if (i >= 2 && isLetter(s[i - 2])) return false;
    const bool letterAfter = i + 1 < s.size() && isLetter(s[i + 1]);
    const bool dotBefore = i >= 2 && s[i - 2] == '.';
    return letterAfter || dotBefore;
}

// "$" is the only special character in an ECMAScript format string.
std::string escapeFormat(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '$') out += '$';
        out += c;
    }
    return out;
}

std::string trim(const std::string& s) {
    const auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

TextFormatter::TextFormatter(const FormatterSettings& settings) : settings_(settings) {}

std::string TextFormatter::format(const std::string& text,
                                  const std::optional<std::string>& context) const {
    std::string out = stripAnnotations(text);
    out = applyReplacements(out);
    if (settings_.removeFillers) out = removeFillers(out);
    if (settings_.voiceCommands) out = applyVoiceCommands(out);
    out = fixSpacing(out);
    if (out.empty()) return out;
    out = capitalize(out, endsSentence(context));
    if (settings_.autoPunctuate) out = finishSentence(out);
    return out;
}

std::string TextFormatter::stripAnnotations(const std::string& text) const {
    static const std::regex brackets("\\[[^\\]]*\\]");
    static const std::regex sounds(
        "\\((?:music|applause|laughter|laughs|silence|noise|background noise|inaudible)\\)", kIcase);
    std::string out = std::regex_replace(text, brackets, " ");
    return std::regex_replace(out, sounds, " ");
}

std::string TextFormatter::applyReplacements(const std::string& text) const {
    std::string out = text;
    for (const auto& [spoken, written] : settings_.replacements) {
        const std::string key = trim(spoken);
        if (key.empty()) continue;
        // \b only holds next to a word character; "c++" has none on its right.
        std::string pattern = escapeRegex(key);
        if (isWordChar(key.front())) pattern = "\\b" + pattern;
        if (isWordChar(key.back())) pattern += "\\b";
        const std::regex word(pattern, kIcase);
        out = std::regex_replace(out, word, escapeFormat(written));
    }
    return out;
}

std::string TextFormatter::removeFillers(const std::string& text) const {
    static const std::regex fillers(
        "\\b(?:m+-?h+m+|u+h-h+u+h+|u+h-u+h+|u+m-h+u*m+|u+m+|u+h+|uhm|erm|er|a+h+|hm+|mm+)\\b[,.]?",
        kIcase);
    return std::regex_replace(text, fillers, " ");
}

std::string TextFormatter::applyVoiceCommands(const std::string& text) const {
    static const std::regex paragraph("[ \\t,]*\\bnew paragraph\\b[,.]?[ \\t]*", kIcase);
    static const std::regex line("[ \\t,]*\\bnew line\\b[,.]?[ \\t]*", kIcase);
    std::string out = std::regex_replace(text, paragraph, "\n\n");
    return std::regex_replace(out, line, "\n");
}

std::string TextFormatter::fixSpacing(const std::string& text) const {
    static const std::regex spaces("[ \\t]+");
    static const std::regex beforePunct(" +([,.!?;:])");
    static const std::regex repeatedComma(",(?:\\s*,)+");
    static const std::regex leadingPunct("^[,;:]+ *");

    std::istringstream in(text);
    std::string line;
    std::string out;
    bool first = true;
    while (std::getline(in, line)) {
        line = std::regex_replace(line, spaces, " ");
        line = std::regex_replace(line, beforePunct, "$1");
        line = std::regex_replace(line, repeatedComma, ",");
        line = trim(line);
        line = std::regex_replace(line, leadingPunct, "");
        if (!first) out += '\n';
        out += line;
        first = false;
    }

    // Surrounding blank lines are not part of the dictation, inner ones are.
    const auto start = out.find_first_not_of(" \n");
    if (start == std::string::npos) return "";
    const auto end = out.find_last_not_of(" \n");
    return out.substr(start, end - start + 1);
}

std::string TextFormatter::capitalize(const std::string& text, bool capitalizeFirst) const {
    static const std::regex pronoun("\\bi\\b(?!\\.[a-zA-Z])");
    std::string out = std::regex_replace(text, pronoun, "I");

    bool capitalizeNext = capitalizeFirst;
    for (size_t i = 0; i < out.size(); ++i) {
        const auto c = static_cast<unsigned char>(out[i]);
        if (out[i] == '.' && isAbbreviationDot(out, i)) {
            continue;
        } else if (isTerminal(out[i]) || out[i] == '\n') {
            capitalizeNext = true;
        } else if (std::isalpha(c)) {
            if (capitalizeNext) out[i] = static_cast<char>(std::toupper(c));
            capitalizeNext = false;
        } else if (std::isdigit(c) || c >= 0x80) {
            capitalizeNext = false;
        }
    }
    return out;
}

std::string TextFormatter::finishSentence(const std::string& text) const {
    std::string out = text;
    const char last = out.back();
    if (isTerminal(last) || last == '\n') return out;
    if (last == ',' || last == ';' || last == ':') {
        out.back() = '.';
        return out;
    }
    return out + ".";
}

bool TextFormatter::endsSentence(const std::optional<std::string>& context) {
    if (!context) return true;
    const auto end = context->find_last_not_of(" \t");
    if (end == std::string::npos) return true;
    const char last = (*context)[end];
    return isTerminal(last) || last == '\n' || last == '\r';
}

std::string TextFormatter::escapeRegex(const std::string& text) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

} // namespace voiceflow
