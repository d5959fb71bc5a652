#include "audio_device.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <portaudio.h>

namespace dictate {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// PortAudio has no transport type; onboard codecs are recognised by name
bool looks_built_in(const std::string& name) {
    static const char* markers[] = {
        "built-in", "builtin", "internal", "hda intel", "hda-intel", "pch", "sof-hda", "acp",
    };
    std::string lower = to_lower(name);
    for (const char* marker : markers) {
        if (lower.find(marker) != std::string::npos) return true;
    }
    return false;
}

class PortAudioInputStream : public InputStream {
public:
    PortAudioInputStream(int channels, AudioBackend::FrameCallback callback)
        : channels_(channels)
        , callback_(std::move(callback)) {
    }

    ~PortAudioInputStream() override {
        if (stream_) {
            if (started_) {
                Pa_AbortStream(stream_);
            }
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
    }

    bool open(int device, double sample_rate, std::string& error) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
        if (!info) {
            error = "unknown device index " + std::to_string(device);
            return false;
        }

        PaStreamParameters input_params;
        input_params.device = device;
        input_params.channelCount = channels_;
        input_params.sampleFormat = paFloat32;
        input_params.suggestedLatency = info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        PaError err = Pa_IsFormatSupported(&input_params, nullptr, sample_rate);
        if (err != paFormatIsSupported) {
            error = Pa_GetErrorText(err);
            return false;
        }

        err = Pa_OpenStream(&stream_,
                            &input_params,
                            nullptr,  // No output
                            sample_rate,
                            paFramesPerBufferUnspecified,
                            paClipOff,
                            pa_callback,
                            this);
        if (err != paNoError) {
            stream_ = nullptr;
            error = Pa_GetErrorText(err);
            return false;
        }
        return true;
    }

    bool start() override {
        PaError err = Pa_StartStream(stream_);
        if (err != paNoError) {
            std::cerr << "[audio] Failed to start stream: " << Pa_GetErrorText(err) << std::endl;
            return false;
        }
        started_ = true;
        return true;
    }

    bool stop() override {
        if (!started_) return true;
        started_ = false;

        // Pa_StopStream returns after the last callback has completed
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            std::cerr << "[audio] Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
            return false;
        }
        return true;
    }

private:
    static int pa_callback(const void* input, void* output,
                           unsigned long frame_count,
                           const PaStreamCallbackTimeInfo* time_info,
                           PaStreamCallbackFlags status_flags,
                           void* user_data) {
        (void)output;
        (void)time_info;
        (void)status_flags;

        auto* stream = static_cast<PortAudioInputStream*>(user_data);
        if (input && stream->callback_) {
            stream->callback_(static_cast<const float*>(input), frame_count, stream->channels_);
        }
        return paContinue;
    }

    PaStream* stream_ = nullptr;
    int channels_;
    bool started_ = false;
    AudioBackend::FrameCallback callback_;
};

class PortAudioBackend : public AudioBackend {
public:
    ~PortAudioBackend() override {
        shutdown();
    }

    bool initialize() override {
        if (initialized_) return true;

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            std::cerr << "[audio] PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
            return false;
        }
        initialized_ = true;
        return true;
    }

    void shutdown() override {
        if (!initialized_) return;
        Pa_Terminate();
        initialized_ = false;
    }

    std::vector<AudioDeviceInfo> input_devices() override {
        std::vector<AudioDeviceInfo> devices;
        if (!initialized_) return devices;

        int count = Pa_GetDeviceCount();
        if (count < 0) {
            std::cerr << "[audio] Failed to enumerate devices: " << Pa_GetErrorText(count) << std::endl;
            return devices;
        }

        for (int i = 0; i < count; ++i) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info || info->maxInputChannels <= 0) continue;

            const PaHostApiInfo* host = Pa_GetHostApiInfo(info->hostApi);
            AudioDeviceInfo device;
            device.index = i;
            device.name = info->name ? info->name : "Unknown";
            device.uid = std::string(host && host->name ? host->name : "unknown") + ":" + device.name;
            device.input_channels = info->maxInputChannels;
            device.default_sample_rate = info->defaultSampleRate;
            device.built_in = looks_built_in(device.name);
            devices.push_back(device);
        }

        std::sort(devices.begin(), devices.end(), [](const AudioDeviceInfo& a, const AudioDeviceInfo& b) {
            return to_lower(a.name) < to_lower(b.name);
        });
        return devices;
    }

    int default_input_device() override {
        if (!initialized_) return NO_DEVICE;
        PaDeviceIndex device = Pa_GetDefaultInputDevice();
        return device == paNoDevice ? NO_DEVICE : device;
    }

    std::unique_ptr<InputStream> open_input(int device, int channels, double sample_rate,
                                            FrameCallback callback, std::string& error) override {
        if (!initialized_) {
            error = "PortAudio not initialized";
            return nullptr;
        }

        auto stream = std::make_unique<PortAudioInputStream>(channels, std::move(callback));
        if (!stream->open(device, sample_rate, error)) {
            return nullptr;
        }
        return stream;
    }

private:
    bool initialized_ = false;
};

} // namespace

std::unique_ptr<AudioBackend> create_portaudio_backend() {
    return std::make_unique<PortAudioBackend>();
}

} // namespace dictate
