#include "audio/wav_reader.hpp"
#include "test_env.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <fstream>
#include <vector>

using namespace voiceflow;
using voiceflow::test::IsolatedEnvTest;

namespace {

void put32(std::ofstream& out, uint32_t v) { out.write(reinterpret_cast<const char*>(&v), 4); }
void put16(std::ofstream& out, uint16_t v) { out.write(reinterpret_cast<const char*>(&v), 2); }

void writePcm16(const std::filesystem::path& path, uint16_t channels, uint32_t rate,
                const std::vector<int16_t>& pcm, bool withListChunk = false) {
    const uint32_t dataBytes = static_cast<uint32_t>(pcm.size() * 2);
    std::ofstream out(path, std::ios::binary);
    out.write("RIFF", 4);
    put32(out, 36 + dataBytes + (withListChunk ? 12 : 0));
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put32(out, 16);
    put16(out, 1);
    put16(out, channels);
    put32(out, rate);
    put32(out, rate * channels * 2);
    put16(out, static_cast<uint16_t>(channels * 2));
    put16(out, 16);
    if (withListChunk) {
        out.write("LIST", 4);
        put32(out, 4);
        out.write("INFO", 4);
    }
    out.write("data", 4);
    put32(out, dataBytes);
    out.write(reinterpret_cast<const char*>(pcm.data()), dataBytes);
}

} // namespace

class WavReaderTest : public IsolatedEnvTest {};

TEST_F(WavReaderTest, ReadsMonoPcm16) {
    const auto path = root_ / "mono.wav";
    writePcm16(path, 1, 16000, {0, 16384, -16384, 32767}, true);

    WavAudio wav;
    std::string error;
    ASSERT_TRUE(readWavFile(path.string(), &wav, &error)) << error;
    EXPECT_EQ(wav.sampleRate, 16000u);
    EXPECT_EQ(wav.channels, 1u);
    ASSERT_EQ(wav.samples.size(), 4u);
    EXPECT_FLOAT_EQ(wav.samples[0], 0.0f);
    EXPECT_FLOAT_EQ(wav.samples[1], 0.5f);
    EXPECT_FLOAT_EQ(wav.samples[2], -0.5f);
}

TEST_F(WavReaderTest, AveragesStereo) {
    const auto path = root_ / "stereo.wav";
    writePcm16(path, 2, 16000, {16384, 0, -16384, -16384});

    WavAudio wav;
    std::string error;
    ASSERT_TRUE(readWavFile(path.string(), &wav, &error)) << error;
    ASSERT_EQ(wav.samples.size(), 2u);
    EXPECT_FLOAT_EQ(wav.samples[0], 0.25f);
    EXPECT_FLOAT_EQ(wav.samples[1], -0.5f);
}

TEST_F(WavReaderTest, RejectsOtherFiles) {
    WavAudio wav;
    std::string error;
    EXPECT_FALSE(readWavFile((root_ / "missing.wav").string(), &wav, &error));
    EXPECT_FALSE(error.empty());

    const auto text = root_ / "text.wav";
    writeFile(text, "this is not audio at all");
    EXPECT_FALSE(readWavFile(text.string(), &wav, &error));
}
