#include "audio/audio_capture.hpp"
#include <stdexcept>
#include <iostream>

namespace voiceflow {

AudioCapture::AudioCapture() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw std::runtime_error("Failed to initialize PortAudio: " +
                                 std::string(Pa_GetErrorText(err)));
    }
}

AudioCapture::~AudioCapture() {
    stop();
    Pa_Terminate();
}

std::vector<AudioDevice> AudioCapture::listDevices() const {
    std::vector<AudioDevice> inputs;
    const int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;
        inputs.push_back({
            .index = i,
            .name = info->name,
            .maxInputChannels = info->maxInputChannels,
            .defaultSampleRate = info->defaultSampleRate
        });
    }
    return inputs;
}

bool AudioCapture::setDevice(int deviceIndex) {
    if (stream_) {
        stop();
    }

    if (deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        return false;
    }
    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(deviceIndex);
    if (deviceInfo && deviceInfo->maxInputChannels > 0) {
        selectedDevice_ = deviceIndex;
        return true;
    }
    return false;
}

bool AudioCapture::start(int sampleRate, int framesPerBuffer) {
    if (stream_) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(samplesMutex_);
        samples_.clear();
    }

    PaStreamParameters inputParams = {};
    inputParams.device = selectedDevice_ >= 0 ? selectedDevice_ : Pa_GetDefaultInputDevice();
    if (inputParams.device == paNoDevice) {
        std::cerr << "Error: no input device available\n";
        return false;
    }

    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(inputParams.device);
    if (!deviceInfo) {
        std::cerr << "Error: no device info for input device " << inputParams.device << "\n";
        return false;
    }

    // Some devices refuse mono; take the first channel of a stereo stream then.
    channels_ = 1;
    inputParams.channelCount = channels_;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = deviceInfo->defaultLowInputLatency;

    PaError err = Pa_IsFormatSupported(&inputParams, nullptr, sampleRate);
    if (err != paFormatIsSupported && deviceInfo->maxInputChannels >= 2) {
        channels_ = 2;
        inputParams.channelCount = channels_;
        err = Pa_IsFormatSupported(&inputParams, nullptr, sampleRate);
    }
    if (err != paFormatIsSupported) {
        std::cerr << "Error: " << deviceInfo->name << " cannot record float32 at "
                  << sampleRate << " Hz: " << Pa_GetErrorText(err) << "\n";
        return false;
    }

    err = Pa_OpenStream(&stream_,
                        &inputParams,
                        nullptr,
                        sampleRate,
                        framesPerBuffer,
                        paClipOff,
                        AudioCapture::paCallback,
                        this);

    if (err != paNoError) {
        std::cerr << "Error: Pa_OpenStream failed: " << Pa_GetErrorText(err) << "\n";
        stream_ = nullptr;
        return false;
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::cerr << "Error: Pa_StartStream failed: " << Pa_GetErrorText(err) << "\n";
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        return false;
    }

    return true;
}

void AudioCapture::stop() {
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
}

std::vector<float> AudioCapture::takeSamples() {
    std::lock_guard<std::mutex> lock(samplesMutex_);
    std::vector<float> out;
    out.swap(samples_);
    return out;
}

int AudioCapture::paCallback(const void* input, void* output,
                             unsigned long frameCount,
                             const PaStreamCallbackTimeInfo* timeInfo,
                             PaStreamCallbackFlags statusFlags,
                             void* userData) {
    (void)output;
    (void)timeInfo;
    (void)statusFlags;

    auto* self = static_cast<AudioCapture*>(userData);
    const float* inputBuffer = static_cast<const float*>(input);
    if (!inputBuffer) {
        return paContinue;
    }

    std::lock_guard<std::mutex> lock(self->samplesMutex_);
    for (unsigned long i = 0; i < frameCount; ++i) {
        self->samples_.push_back(inputBuffer[i * self->channels_]);
    }

    return paContinue;
}

} // namespace voiceflow
