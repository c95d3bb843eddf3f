#pragma once
#include <portaudio.h>
#include <mutex>
#include <string>
#include <vector>

namespace voiceflow {

struct AudioDevice {
    int index;
    std::string name;
    int maxInputChannels;
    double defaultSampleRate;
};

// Records mono float PCM from an input device into memory.
class AudioCapture {
public:
    AudioCapture();
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    std::vector<AudioDevice> listDevices() const;
    bool setDevice(int deviceIndex);

    bool start(int sampleRate = DEFAULT_SAMPLE_RATE,
               int framesPerBuffer = DEFAULT_FRAMES_PER_BUFFER);
    void stop();
    bool isRunning() const { return stream_ != nullptr; }

    // Moves out everything recorded so far.
    std::vector<float> takeSamples();

    static constexpr int DEFAULT_SAMPLE_RATE = 16000;     // what the pipeline expects
    static constexpr int DEFAULT_FRAMES_PER_BUFFER = 480; // 30ms at 16kHz

private:
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* timeInfo,
                          PaStreamCallbackFlags statusFlags,
                          void* userData);

    PaStream* stream_{nullptr};
    int selectedDevice_{-1};
    int channels_{1};

    std::mutex samplesMutex_;
    std::vector<float> samples_;
};

} // namespace voiceflow
