#include "format/text_formatter.hpp"

#include <gtest/gtest.h>

using namespace voiceflow;

namespace {

std::string fmt(const std::string& text, const std::optional<std::string>& context = std::nullopt) {
    return TextFormatter(FormatterSettings{}).format(text, context);
}

} // namespace

TEST(TextFormatterTest, CapitalizesAndTerminates) {
    EXPECT_EQ(fmt("hello world"), "Hello world.");
    EXPECT_EQ(fmt("one. two? three"), "One. Two? Three.");
    EXPECT_EQ(fmt("is it done!"), "Is it done!");
}

TEST(TextFormatterTest, EmptyAndBlankInput) {
    EXPECT_EQ(fmt(""), "");
    EXPECT_EQ(fmt("   "), "");
    EXPECT_EQ(fmt("[BLANK_AUDIO]"), "");
}

TEST(TextFormatterTest, StripsAnnotations) {
    EXPECT_EQ(fmt("(music) hello [BLANK_AUDIO] there"), "Hello there.");
    EXPECT_EQ(fmt("[Applause] thanks"), "Thanks.");
}

TEST(TextFormatterTest, RemovesFillers) {
    EXPECT_EQ(fmt("Um, so i think uh we should go"), "So I think we should go.");
    EXPECT_EQ(fmt("hmm okay"), "Okay.");
    // Only whole words.
    EXPECT_EQ(fmt("the user never erred"), "The user never erred.");
}

TEST(TextFormatterTest, RemovesHyphenatedFillersWhole) {
    EXPECT_EQ(fmt("Mm-hmm yes"), "Yes.");
    EXPECT_EQ(fmt("uh-huh that works"), "That works.");
    EXPECT_EQ(fmt("it was, um-hmm, fine"), "It was, fine.");
}

TEST(TextFormatterTest, SingleLetterAbbreviationsDoNotEndSentence) {
    EXPECT_EQ(fmt("i.e. this"), "I.e. this.");
    EXPECT_EQ(fmt("use a tool e.g. a hammer"), "Use a tool e.g. a hammer.");
    EXPECT_EQ(fmt("plan a. then plan b"), "Plan a. Then plan b.");
}

TEST(TextFormatterTest, FillersKeptWhenDisabled) {
    FormatterSettings settings;
    settings.removeFillers = false;
    EXPECT_EQ(TextFormatter(settings).format("um okay"), "Um okay.");
}

TEST(TextFormatterTest, PronounI) {
    EXPECT_EQ(fmt("yes i'm sure i am"), "Yes I'm sure I am.");
    EXPECT_EQ(fmt("this is it"), "This is it.");
}

TEST(TextFormatterTest, FixesSpacingAroundPunctuation) {
    EXPECT_EQ(fmt("hello , world ."), "Hello, world.");
    EXPECT_EQ(fmt("a,, b"), "A, b.");
    EXPECT_EQ(fmt("  lots    of   space  "), "Lots of space.");
}

TEST(TextFormatterTest, TrailingPunctuationBecomesPeriod) {
    EXPECT_EQ(fmt("yes,"), "Yes.");
    EXPECT_EQ(fmt("as follows:"), "As follows.");
}

TEST(TextFormatterTest, VoiceCommands) {
    EXPECT_EQ(fmt("first line new line second line"), "First line\nSecond line.");
    EXPECT_EQ(fmt("hello new paragraph world"), "Hello\n\nWorld.");
}

TEST(TextFormatterTest, VoiceCommandsKeptWhenDisabled) {
    FormatterSettings settings;
    settings.voiceCommands = false;
    EXPECT_EQ(TextFormatter(settings).format("add a new line here"), "Add a new line here.");
}

TEST(TextFormatterTest, NoPeriodWhenAutoPunctuateOff) {
    FormatterSettings settings;
    settings.autoPunctuate = false;
    EXPECT_EQ(TextFormatter(settings).format("hello world"), "Hello world");
}

TEST(TextFormatterTest, ContextMidSentenceKeepsLowerCase) {
    EXPECT_EQ(fmt("world", std::string("hello ")), "world.");
    EXPECT_EQ(fmt("world", std::string("Done.")), "World.");
    EXPECT_EQ(fmt("world", std::string("Done?  ")), "World.");
    EXPECT_EQ(fmt("world", std::string("")), "World.");
}

TEST(TextFormatterTest, Replacements) {
    FormatterSettings settings;
    settings.replacements["gonna"] = "going to";
    settings.replacements["c plus plus"] = "C++";
    const TextFormatter formatter(settings);

    EXPECT_EQ(formatter.format("i'm gonna go"), "I'm going to go.");
    EXPECT_EQ(formatter.format("i like C Plus Plus"), "I like C++.");
    EXPECT_EQ(formatter.format("gonnado"), "Gonnado.");
}

TEST(TextFormatterTest, ReplacementValueIsInsertedLiterally) {
    FormatterSettings settings;
    settings.replacements["dollars"] = "$&&";
    settings.replacements["first"] = "$1 $$";
    const TextFormatter formatter(settings);

    EXPECT_EQ(formatter.format("pay dollars now"), "Pay $&& now.");
    EXPECT_EQ(formatter.format("the first one"), "The $1 $$ one.");
}

TEST(TextFormatterTest, ReplacementKeysWithSymbolEdges) {
    FormatterSettings settings;
    settings.replacements["c++"] = "C++";
    settings.replacements[".net"] = ".NET";
    const TextFormatter formatter(settings);

    EXPECT_EQ(formatter.format("i like c++ a lot"), "I like C++ a lot.");
    EXPECT_EQ(formatter.format("we ship on .net today"), "We ship on .NET today.");
    // A word character on the key's edge still needs a word boundary.
    EXPECT_EQ(formatter.format("abc++ stays"), "Abc++ stays.");
}
