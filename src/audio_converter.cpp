#include "audio_converter.hpp"
#include "audio_device.hpp"
#include "temp_files.hpp"
#include <iostream>
#include <algorithm>
#include <cmath>

namespace dictate {

namespace {

constexpr float PI = 3.14159265358979323846f;

// Keep the pass band below the target Nyquist frequency
constexpr double ANTI_ALIAS_FRACTION = 0.45;

} // namespace

LowPassFilter::LowPassFilter(float sample_rate, float cutoff_hz) {
    // Butterworth, Q = 0.707
    float omega = 2.0f * PI * cutoff_hz / sample_rate;
    float cos_omega = std::cos(omega);
    float sin_omega = std::sin(omega);
    float alpha = sin_omega / (2.0f * 0.707f);

    float a0 = 1.0f + alpha;
    b0_ = (1.0f - cos_omega) / 2.0f / a0;
    b1_ = (1.0f - cos_omega) / a0;
    b2_ = (1.0f - cos_omega) / 2.0f / a0;
    a1_ = -2.0f * cos_omega / a0;
    a2_ = (1.0f - alpha) / a0;
}

void LowPassFilter::reset() {
    x1_ = x2_ = 0.0f;
    y1_ = y2_ = 0.0f;
}

void LowPassFilter::process(std::vector<float>& audio) {
    // y[n] = b0*x[n] + b1*x[n-1] + b2*x[n-2] - a1*y[n-1] - a2*y[n-2]
    for (float& sample : audio) {
        float x0 = sample;
        float y0 = b0_ * x0 + b1_ * x1_ + b2_ * x2_ - a1_ * y1_ - a2_ * y2_;

        x2_ = x1_;
        x1_ = x0;
        y2_ = y1_;
        y1_ = y0;

        sample = y0;
    }
}

Resampler::Resampler(double input_rate, double output_rate)
    : input_rate_(input_rate)
    , output_rate_(output_rate) {
}

size_t Resampler::convert(std::vector<float>& output, size_t capacity, const InputBlock& input) {
    std::vector<float> source;
    while (input(source) == InputStatus::HaveData) {
    }

    output.clear();
    if (source.empty() || capacity == 0 || input_rate_ <= 0.0 || output_rate_ <= 0.0) {
        return 0;
    }

    if (output_rate_ < input_rate_) {
        LowPassFilter filter(static_cast<float>(input_rate_),
                             static_cast<float>(output_rate_ * ANTI_ALIAS_FRACTION));
        filter.process(source);
    }

    const double step = ratio();
    size_t out_len = static_cast<size_t>(std::llround(static_cast<double>(source.size()) * step));
    out_len = std::min(out_len, capacity);
    output.resize(out_len);

    // Linear interpolation on sample positions
    for (size_t i = 0; i < out_len; ++i) {
        double src_pos = static_cast<double>(i) / step;
        size_t i0 = std::min(static_cast<size_t>(src_pos), source.size() - 1);
        size_t i1 = std::min(i0 + 1, source.size() - 1);
        double frac = src_pos - static_cast<double>(i0);
        output[i] = static_cast<float>((1.0 - frac) * source[i0] + frac * source[i1]);
    }
    return out_len;
}

AudioConverter::AudioConverter()
    : temp_dir_(temp_directory()) {
}

AudioConverter::AudioConverter(std::string temp_dir)
    : temp_dir_(std::move(temp_dir)) {
}

std::vector<float> AudioConverter::select_channel(const WavData& data, int* channel) {
    const int channels = data.info.channels;
    if (channels <= 1) {
        if (channel) *channel = 0;
        return data.samples;
    }

    const size_t frames = data.samples.size() / static_cast<size_t>(channels);
    ChannelSelector selector;
    int chosen = selector.resolve(data.samples.data(), frames, channels);
    if (channel) *channel = chosen;

    std::vector<float> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        mono[i] = data.samples[i * static_cast<size_t>(channels) + static_cast<size_t>(chosen)];
    }
    return mono;
}

std::vector<int16_t> AudioConverter::to_target_rate(const std::vector<float>& mono, double sample_rate) {
    const size_t capacity = static_cast<size_t>(
        static_cast<double>(mono.size()) * TARGET_SAMPLE_RATE / sample_rate) + 1;

    // The whole buffer goes in on the first pull; the second pull ends the stream
    bool supplied = false;
    Resampler resampler(sample_rate, TARGET_SAMPLE_RATE);
    std::vector<float> resampled;
    resampler.convert(resampled, capacity, [&](std::vector<float>& buffer) {
        if (supplied) return Resampler::InputStatus::EndOfStream;
        buffer.insert(buffer.end(), mono.begin(), mono.end());
        supplied = true;
        return Resampler::InputStatus::HaveData;
    });

    std::vector<int16_t> pcm(resampled.size());
    for (size_t i = 0; i < resampled.size(); ++i) {
        float sample = std::max(-1.0f, std::min(1.0f, resampled[i]));
        pcm[i] = static_cast<int16_t>(std::lround(sample * 32767.0f));
    }
    return pcm;
}

ConversionResult AudioConverter::convert_to_16k_mono_pcm(const std::string& input_path) {
    ConversionResult result;

    WavData data;
    if (!read_wav(input_path, data) || data.info.sample_rate == 0) {
        result.error = ErrorKind::ConversionFailed;
        return result;
    }

    int channel = 0;
    std::vector<float> mono = select_channel(data, &channel);
    if (data.info.channels > 1) {
        std::cout << "[audio] Conversion using channel " << channel
                  << " of " << data.info.channels << std::endl;
    }

    std::vector<int16_t> pcm;
    if (!mono.empty()) {
        pcm = to_target_rate(mono, data.info.sample_rate);
    }
    if (pcm.empty()) {
        result.error = ErrorKind::EmptyResult;
        return result;
    }

    std::string output_path = make_temp_path(temp_dir_, "dictate_resampled_", ".wav");
    if (!write_pcm16_wav(output_path, TARGET_SAMPLE_RATE, pcm)) {
        result.error = ErrorKind::ConversionFailed;
        return result;
    }

    std::cout << "[audio] Converted " << data.info.frame_count() << " frames @ " << data.info.sample_rate
              << " Hz to " << pcm.size() << " frames @ " << TARGET_SAMPLE_RATE << " Hz" << std::endl;

    result.success = true;
    result.path = output_path;
    result.frames = pcm.size();
    return result;
}

} // namespace dictate
