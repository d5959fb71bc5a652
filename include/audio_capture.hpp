#pragma once

#include "audio_device.hpp"
#include "errors.hpp"
#include "wav_file.hpp"

#include <vector>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <cstdint>

namespace dictate {

class Permissions;

struct CaptureStatus {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string detail;     // backend message, log only
};

struct CaptureResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string path;
    uint64_t frames = 0;
    double duration_seconds = 0.0;
};

// Records the selected channel of an input device into a temporary
// mono 16-bit WAV file. One session at a time.
class AudioCapture {
public:
    static constexpr double PRIMARY_SAMPLE_RATE = 44100.0;
    static constexpr double FALLBACK_SAMPLE_RATE = 48000.0;

    AudioCapture(AudioBackend& backend, Permissions& permissions);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    // preferred_uid: device UID, "" or "system" for the default.
    // preferred_channel: 0 = loudest, else 1-based.
    // Returns success without doing anything if already recording.
    CaptureStatus start(const std::string& preferred_uid, int preferred_channel);

    CaptureResult stop();

    bool is_recording() const { return recording_.load(); }
    double sample_rate() const { return sample_rate_; }
    const std::string& recording_path() const { return path_; }

    void set_temp_directory(const std::string& dir) { temp_dir_ = dir; }

private:
    // None, FileCreateFailed or DeviceOpenFailed
    ErrorKind open_session(int device, int channels, double sample_rate, std::string& error);
    void release_session();
    void on_frames(const float* input, unsigned long frame_count, int channels);

    AudioBackend& backend_;
    Permissions& permissions_;
    std::string temp_dir_;

    std::unique_ptr<InputStream> stream_;
    std::unique_ptr<ChannelSelector> channel_selector_;
    std::string path_;
    double sample_rate_ = 0.0;
    std::atomic<bool> recording_{false};

    // Guards the writer between the audio thread and stop()
    std::mutex writer_mutex_;
    WavWriter writer_;
    std::vector<int16_t> scratch_;
};

} // namespace dictate
