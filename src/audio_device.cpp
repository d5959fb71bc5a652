#include "audio_device.hpp"
#include <iostream>
#include <algorithm>
#include <cmath>

namespace dictate {

AudioDeviceSelector::AudioDeviceSelector(AudioBackend& backend)
    : backend_(backend) {
}

int AudioDeviceSelector::device_for_uid(const std::string& uid) {
    if (uid.empty()) return NO_DEVICE;
    for (const auto& device : backend_.input_devices()) {
        if (device.uid == uid) return device.index;
    }
    return NO_DEVICE;
}

int AudioDeviceSelector::built_in_microphone() {
    for (const auto& device : backend_.input_devices()) {
        if (device.built_in) return device.index;
    }
    return NO_DEVICE;
}

int AudioDeviceSelector::input_channel_count(int device) {
    for (const auto& info : backend_.input_devices()) {
        if (info.index == device) return info.input_channels;
    }
    return 0;
}

int AudioDeviceSelector::resolve(const std::string& preferred_uid) {
    if (!preferred_uid.empty() && preferred_uid != SYSTEM_DEFAULT_DEVICE) {
        int device = device_for_uid(preferred_uid);
        if (device != NO_DEVICE) return device;
        std::cerr << "[audio] Preferred input '" << preferred_uid << "' not found, using default" << std::endl;
    }

    int default_device = backend_.default_input_device();
    if (default_device == NO_DEVICE) return NO_DEVICE;

    // Multi-channel defaults are usually audio interfaces, not a dictation mic
    if (input_channel_count(default_device) > 2) {
        int built_in = built_in_microphone();
        if (built_in != NO_DEVICE) {
            std::cout << "[audio] Default input has more than 2 channels, using built-in microphone" << std::endl;
            return built_in;
        }
    }
    return default_device;
}

ChannelSelector::ChannelSelector(int preferred_index)
    : preferred_index_(std::max(0, preferred_index)) {
}

int ChannelSelector::loudest_channel(const float* interleaved, size_t frames, int channels,
                                     std::vector<float>* peaks) {
    if (channels <= 0) return 0;

    std::vector<float> channel_peaks(static_cast<size_t>(channels), 0.0f);
    for (size_t frame = 0; frame < frames; ++frame) {
        const float* sample = interleaved + frame * static_cast<size_t>(channels);
        for (int ch = 0; ch < channels; ++ch) {
            float value = std::fabs(sample[ch]);
            if (value > channel_peaks[ch]) channel_peaks[ch] = value;
        }
    }

    int best = 0;
    for (int ch = 1; ch < channels; ++ch) {
        if (channel_peaks[ch] > channel_peaks[best]) best = ch;
    }

    if (peaks) *peaks = std::move(channel_peaks);
    return best;
}

int ChannelSelector::resolve(const float* interleaved, size_t frames, int channels) {
    int current = selected_.load();
    if (current >= 0) return current;

    int chosen = 0;
    if (channels <= 1) {
        chosen = 0;
    } else if (preferred_index_ > 0) {
        chosen = std::min(preferred_index_, channels) - 1;
    } else {
        std::vector<float> peaks;
        chosen = loudest_channel(interleaved, frames, channels, &peaks);

        std::cout << "[audio] Channel peaks: [";
        for (size_t i = 0; i < peaks.size(); ++i) {
            if (i > 0) std::cout << ", ";
            std::cout << peaks[i];
        }
        std::cout << "] using=" << chosen << std::endl;
    }

    selected_.store(chosen);
    return chosen;
}

} // namespace dictate
