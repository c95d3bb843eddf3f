#include "ffi/transfer.hpp"

#include <gtest/gtest.h>

#include <cstring>

using namespace voiceflow::ffi;

TEST(TransferTest, OwnedStringIsACopy) {
    std::string source = "hello";
    char* s = toOwnedCString(source);
    ASSERT_NE(s, nullptr);
    source[0] = 'j';
    EXPECT_STREQ(s, "hello");
    releaseCString(s);
}

TEST(TransferTest, EmptyStringIsNotNull) {
    char* s = toOwnedCString("");
    ASSERT_NE(s, nullptr);
    EXPECT_STREQ(s, "");
    releaseCString(s);
}

TEST(TransferTest, InteriorNulYieldsNull) {
    EXPECT_EQ(toOwnedCString(std::string_view("a\0b", 3)), nullptr);
}

TEST(TransferTest, ReleasingNullIsANoOp) {
    releaseCString(nullptr);
}

TEST(TransferTest, Utf8Validation) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("plain ascii"));
    EXPECT_TRUE(isValidUtf8("caf\xC3\xA9"));
    EXPECT_TRUE(isValidUtf8("\xE2\x82\xAC"));          // euro sign
    EXPECT_TRUE(isValidUtf8("\xF0\x9F\x98\x80"));      // emoji

    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));             // overlong
    EXPECT_FALSE(isValidUtf8("\xE2\x82"));             // truncated
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));         // surrogate
    EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80"));     // above U+10FFFF
    EXPECT_FALSE(isValidUtf8("\xFF"));
    EXPECT_FALSE(isValidUtf8("ab\x80"));               // stray continuation
}

TEST(TransferTest, DecodeInput) {
    EXPECT_FALSE(decodeInput(nullptr));
    EXPECT_FALSE(decodeInput("bad \xFF"));
    EXPECT_EQ(decodeInput("ok"), "ok");
}

TEST(TransferTest, ErrorResult) {
    VoiceFlowResult r = errorResult("went wrong");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.formatted_text, nullptr);
    EXPECT_EQ(r.raw_transcript, nullptr);
    ASSERT_NE(r.error_message, nullptr);
    EXPECT_STREQ(r.error_message, "went wrong");
    EXPECT_EQ(r.transcription_ms, 0u);
    EXPECT_EQ(r.llm_ms, 0u);
    EXPECT_EQ(r.total_ms, 0u);
    releaseResult(r);
    EXPECT_EQ(r.error_message, nullptr);
}

TEST(TransferTest, SuccessResult) {
    VoiceFlowResult r = successResult("Hello.", "hello", 10, 2, 13);
    EXPECT_TRUE(r.success);
    EXPECT_STREQ(r.formatted_text, "Hello.");
    EXPECT_STREQ(r.raw_transcript, "hello");
    EXPECT_EQ(r.error_message, nullptr);
    EXPECT_EQ(r.transcription_ms, 10u);
    EXPECT_EQ(r.llm_ms, 2u);
    EXPECT_EQ(r.total_ms, 13u);
    releaseResult(r);
    EXPECT_EQ(r.formatted_text, nullptr);
    EXPECT_EQ(r.raw_transcript, nullptr);
}

TEST(TransferTest, EmptyInfos) {
    const VoiceFlowModelInfo info = emptyModelInfo();
    EXPECT_EQ(info.id, nullptr);
    EXPECT_EQ(info.display_name, nullptr);
    EXPECT_EQ(info.filename, nullptr);
    EXPECT_EQ(info.size_gb, 0.0f);
    EXPECT_FALSE(info.is_downloaded);

    const VoiceFlowSpeechModelInfo speech = emptySpeechModelInfo();
    EXPECT_EQ(speech.id, nullptr);
    EXPECT_EQ(speech.size_mb, 0u);
    EXPECT_FALSE(speech.is_downloaded);
}
