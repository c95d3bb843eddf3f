#include "audio/wav_reader.hpp"
#include <fstream>

namespace voiceflow {

namespace {

bool fail(std::string* error, const char* message) {
    if (error) {
        *error = message;
    }
    return false;
}

} // namespace

bool readWavFile(const std::string& path, WavAudio* out, std::string* error) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return fail(error, "failed to open audio file");
    }

    auto readU32 = [&input](uint32_t* value) {
        input.read(reinterpret_cast<char*>(value), sizeof(uint32_t));
        return input.good();
    };
    auto readU16 = [&input](uint16_t* value) {
        input.read(reinterpret_cast<char*>(value), sizeof(uint16_t));
        return input.good();
    };

    char tag[4] = {};
    uint32_t riffSize = 0;
    input.read(tag, 4);
    if (!input || std::string(tag, 4) != "RIFF" || !readU32(&riffSize)) {
        return fail(error, "not a RIFF file");
    }
    input.read(tag, 4);
    if (!input || std::string(tag, 4) != "WAVE") {
        return fail(error, "not a WAVE file");
    }

    bool fmtFound = false;
    bool dataFound = false;
    uint16_t audioFormat = 0;
    uint16_t bitsPerSample = 0;
    std::vector<int16_t> pcm;

    while (input && !dataFound) {
        uint32_t chunkSize = 0;
        input.read(tag, 4);
        if (!input || !readU32(&chunkSize)) {
            break;
        }
        const std::string chunkId(tag, 4);

        if (chunkId == "fmt ") {
            uint32_t byteRate = 0;
            uint16_t blockAlign = 0;
            if (chunkSize < 16 ||
                !readU16(&audioFormat) || !readU16(&out->channels) ||
                !readU32(&out->sampleRate) || !readU32(&byteRate) ||
                !readU16(&blockAlign) || !readU16(&bitsPerSample)) {
                return fail(error, "invalid fmt chunk");
            }
            input.seekg(chunkSize - 16, std::ios::cur);
            fmtFound = true;
        } else if (chunkId == "data") {
            if (!fmtFound) {
                return fail(error, "data chunk before fmt chunk");
            }
            pcm.resize(chunkSize / sizeof(int16_t));
            input.read(reinterpret_cast<char*>(pcm.data()),
                       static_cast<std::streamsize>(pcm.size() * sizeof(int16_t)));
            // Tolerate a truncated final chunk.
            pcm.resize(static_cast<size_t>(input.gcount()) / sizeof(int16_t));
            dataFound = true;
        } else {
            input.seekg(chunkSize + (chunkSize & 1u), std::ios::cur);
        }
    }

    if (!fmtFound || !dataFound) {
        return fail(error, "missing fmt or data chunk");
    }
    if (audioFormat != 1 || bitsPerSample != 16) {
        return fail(error, "only 16-bit PCM is supported");
    }
    if (out->channels == 0) {
        return fail(error, "invalid channel count");
    }

    const size_t frames = pcm.size() / out->channels;
    out->samples.assign(frames, 0.0f);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (uint16_t c = 0; c < out->channels; ++c) {
            sum += static_cast<float>(pcm[i * out->channels + c]) / 32768.0f;
        }
        out->samples[i] = sum / static_cast<float>(out->channels);
    }
    return true;
}

} // namespace voiceflow
