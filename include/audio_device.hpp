#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <atomic>

namespace dictate {

constexpr int NO_DEVICE = -1;

// Settings value meaning "whatever the system default is"
constexpr const char* SYSTEM_DEFAULT_DEVICE = "system";

struct AudioDeviceInfo {
    int index = NO_DEVICE;
    std::string name;
    std::string uid;            // "<host api>:<device name>", stable across runs
    int input_channels = 0;
    double default_sample_rate = 0.0;
    bool built_in = false;      // laptop/onboard microphone
};

// An open capture stream. Destroying it closes the device.
class InputStream {
public:
    virtual ~InputStream() = default;

    virtual bool start() = 0;

    // Returns once no further frame callback can run
    virtual bool stop() = 0;
};

// Device access seam; PortAudio in production, fakes in tests
class AudioBackend {
public:
    // Interleaved float frames, called on the audio thread
    using FrameCallback = std::function<void(const float* input, unsigned long frame_count, int channels)>;

    virtual ~AudioBackend() = default;

    virtual bool initialize() = 0;
    virtual void shutdown() = 0;

    virtual std::vector<AudioDeviceInfo> input_devices() = 0;
    virtual int default_input_device() = 0;

    // nullptr on failure, with the reason in `error`
    virtual std::unique_ptr<InputStream> open_input(int device, int channels, double sample_rate,
                                                    FrameCallback callback, std::string& error) = 0;
};

std::unique_ptr<AudioBackend> create_portaudio_backend();

class AudioDeviceSelector {
public:
    explicit AudioDeviceSelector(AudioBackend& backend);

    // Preferred UID if it resolves; else the default input, unless that is
    // a multi-channel interface and a built-in microphone exists.
    int resolve(const std::string& preferred_uid);

    int device_for_uid(const std::string& uid);
    int built_in_microphone();
    int input_channel_count(int device);

private:
    AudioBackend& backend_;
};

// Picks which channel of a multi-channel input to keep. Once chosen the
// channel never changes for the lifetime of the selector.
class ChannelSelector {
public:
    // preferred_index: 0 = loudest channel, otherwise 1-based channel number
    explicit ChannelSelector(int preferred_index = 0);

    // 0-based channel for this interleaved buffer (memoized after first call)
    int resolve(const float* interleaved, size_t frames, int channels);

    bool is_resolved() const { return selected_.load() >= 0; }
    int selected() const { return selected_.load(); }
    int preferred_index() const { return preferred_index_; }

    // Index of the channel with the highest absolute peak; ties go to the lower index
    static int loudest_channel(const float* interleaved, size_t frames, int channels,
                               std::vector<float>* peaks = nullptr);

private:
    int preferred_index_;
    std::atomic<int> selected_{-1};
};

} // namespace dictate
