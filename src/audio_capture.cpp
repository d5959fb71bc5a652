#include "audio_capture.hpp"
#include "permissions.hpp"
#include "temp_files.hpp"
#include <iostream>
#include <algorithm>
#include <cmath>

namespace dictate {

AudioCapture::AudioCapture(AudioBackend& backend, Permissions& permissions)
    : backend_(backend)
    , permissions_(permissions)
    , temp_dir_(temp_directory()) {
}

AudioCapture::~AudioCapture() {
    if (recording_.load()) {
        stop();
    }
    release_session();
}

CaptureStatus AudioCapture::start(const std::string& preferred_uid, int preferred_channel) {
    CaptureStatus status;
    if (recording_.load()) {
        status.success = true;
        return status;
    }

    if (!permissions_.microphone_authorized()) {
        status.error = ErrorKind::PermissionDenied;
        return status;
    }
    if (!backend_.initialize()) {
        status.error = ErrorKind::NoInputDevice;
        return status;
    }

    AudioDeviceSelector selector(backend_);
    int device = selector.resolve(preferred_uid);
    if (device == NO_DEVICE) {
        status.error = ErrorKind::NoInputDevice;
        return status;
    }
    int channels = std::max(1, selector.input_channel_count(device));

    path_ = make_temp_path(temp_dir_, "dictate_recording_", ".wav");
    channel_selector_ = std::make_unique<ChannelSelector>(preferred_channel);

    std::string error;
    ErrorKind failure = open_session(device, channels, PRIMARY_SAMPLE_RATE, error);
    if (failure == ErrorKind::DeviceOpenFailed) {
        std::cerr << "[audio] Recorder start failed at " << PRIMARY_SAMPLE_RATE / 1000.0
                  << "k: " << error << std::endl;
        failure = open_session(device, channels, FALLBACK_SAMPLE_RATE, error);
        if (failure == ErrorKind::DeviceOpenFailed) {
            std::cerr << "[audio] Recorder start failed at " << FALLBACK_SAMPLE_RATE / 1000.0
                      << "k: " << error << std::endl;
        }
    }
    if (failure != ErrorKind::None) {
        if (failure == ErrorKind::FileCreateFailed) {
            std::cerr << "[audio] " << error << std::endl;
        }
        release_session();
        remove_file(path_, "audio");
        path_.clear();
        status.error = failure;
        status.detail = error;
        return status;
    }

    std::cout << "[audio] Recording start: device=" << device << " channels=" << channels
              << " rate=" << sample_rate_ << " path=" << path_ << std::endl;
    status.success = true;
    return status;
}

ErrorKind AudioCapture::open_session(int device, int channels, double sample_rate, std::string& error) {
    release_session();

    {
        std::lock_guard<std::mutex> lock(writer_mutex_);
        if (!writer_.open(path_, static_cast<uint32_t>(sample_rate), 1)) {
            error = "cannot create " + path_;
            return ErrorKind::FileCreateFailed;
        }
    }

    stream_ = backend_.open_input(device, channels, sample_rate,
        [this](const float* input, unsigned long frame_count, int stream_channels) {
            on_frames(input, frame_count, stream_channels);
        },
        error);
    if (!stream_) {
        return ErrorKind::DeviceOpenFailed;
    }

    sample_rate_ = sample_rate;
    // Buffers can arrive before start() returns
    recording_.store(true);
    if (!stream_->start()) {
        recording_.store(false);
        error = "stream did not start";
        return ErrorKind::DeviceOpenFailed;
    }
    return ErrorKind::None;
}

void AudioCapture::release_session() {
    if (stream_) {
        stream_->stop();
        stream_.reset();
    }
    std::lock_guard<std::mutex> lock(writer_mutex_);
    if (writer_.is_open()) {
        writer_.close();
    }
}

void AudioCapture::on_frames(const float* input, unsigned long frame_count, int channels) {
    if (!recording_.load() || !input || frame_count == 0 || channels <= 0) return;

    int channel = channel_selector_->resolve(input, frame_count, channels);

    std::lock_guard<std::mutex> lock(writer_mutex_);
    scratch_.resize(frame_count);
    for (unsigned long i = 0; i < frame_count; ++i) {
        float sample = input[i * static_cast<unsigned long>(channels) + channel];
        sample = std::max(-1.0f, std::min(1.0f, sample));
        scratch_[i] = static_cast<int16_t>(std::lround(sample * 32767.0f));
    }
    writer_.write(scratch_.data(), scratch_.size());
}

CaptureResult AudioCapture::stop() {
    CaptureResult result;
    if (!recording_.load()) {
        result.error = ErrorKind::NotRecording;
        return result;
    }

    recording_.store(false);
    release_session();

    std::string path = path_;
    path_.clear();
    if (path.empty() || !file_exists(path)) {
        result.error = ErrorKind::MissingRecording;
        return result;
    }

    result.success = true;
    result.path = path;

    WavInfo info;
    if (read_wav_info(path, info)) {
        result.frames = info.frame_count();
        result.duration_seconds = info.duration_seconds();
        std::cout << "[audio] Recording stop: frames=" << result.frames
                  << " dur=" << result.duration_seconds << "s" << std::endl;
    } else {
        std::cerr << "[audio] Failed to read recording: " << path << std::endl;
    }
    return result;
}

} // namespace dictate
