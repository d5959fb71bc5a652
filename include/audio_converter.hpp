#pragma once

#include "errors.hpp"
#include "wav_file.hpp"

#include <vector>
#include <string>
#include <functional>
#include <cstdint>

namespace dictate {

struct ConversionResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string path;
    uint64_t frames = 0;
};

// Second-order Butterworth low-pass, used as the anti-alias stage
class LowPassFilter {
public:
    LowPassFilter(float sample_rate, float cutoff_hz);

    void process(std::vector<float>& audio);
    void reset();

private:
    float b0_, b1_, b2_, a1_, a2_;
    float x1_ = 0.0f, x2_ = 0.0f;
    float y1_ = 0.0f, y2_ = 0.0f;
};

// Pull-model sample-rate converter. The input block is called until it
// reports end of stream; linear interpolation runs over everything it
// supplied, with a low-pass first when downsampling.
class Resampler {
public:
    enum class InputStatus {
        HaveData,
        EndOfStream
    };

    // Appends samples to `buffer` or reports that no more will come
    using InputBlock = std::function<InputStatus(std::vector<float>& buffer)>;

    Resampler(double input_rate, double output_rate);

    // Writes at most `capacity` frames into `output`; returns the count
    size_t convert(std::vector<float>& output, size_t capacity, const InputBlock& input);

    double ratio() const { return output_rate_ / input_rate_; }

private:
    double input_rate_;
    double output_rate_;
};

// Normalizes a finished recording for the speech engine
class AudioConverter {
public:
    static constexpr uint32_t TARGET_SAMPLE_RATE = 16000;

    AudioConverter();
    explicit AudioConverter(std::string temp_dir);

    // Writes <tmp>/dictate_resampled_<token>.wav: mono, 16 kHz, 16-bit PCM
    ConversionResult convert_to_16k_mono_pcm(const std::string& input_path);

    // Mono passthrough, else the loudest channel of the whole buffer
    static std::vector<float> select_channel(const WavData& data, int* channel = nullptr);

    // Resampled and quantized samples at TARGET_SAMPLE_RATE
    static std::vector<int16_t> to_target_rate(const std::vector<float>& mono, double sample_rate);

private:
    std::string temp_dir_;
};

} // namespace dictate
