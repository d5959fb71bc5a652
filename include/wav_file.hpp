#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <cstdint>

namespace dictate {

constexpr size_t WAV_HEADER_SIZE = 44;

struct WavInfo {
    uint16_t format_tag = 1;        // 1 = PCM, 3 = IEEE float
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint32_t byte_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits_per_sample = 0;
    uint32_t data_size = 0;         // bytes in the data chunk

    uint64_t frame_count() const {
        return block_align ? data_size / block_align : 0;
    }
    double duration_seconds() const {
        return sample_rate ? static_cast<double>(frame_count()) / sample_rate : 0.0;
    }
};

// Whole-file contents, samples interleaved and scaled to [-1, 1]
struct WavData {
    WavInfo info;
    std::vector<float> samples;
};

// The canonical 44-byte header: RIFF, WAVE, 16-byte fmt chunk, data chunk
std::vector<uint8_t> make_wav_header(uint16_t channels, uint32_t sample_rate,
                                     uint16_t bits_per_sample, uint32_t data_size,
                                     uint16_t format_tag = 1);

// Writes a finished mono 16-bit PCM file in one go
bool write_pcm16_wav(const std::string& path, uint32_t sample_rate,
                     const std::vector<int16_t>& samples);

// Header and chunk sizes only
bool read_wav_info(const std::string& path, WavInfo& info);

// Reads PCM 16-bit or 32-bit float files
bool read_wav(const std::string& path, WavData& out);

// Streams 16-bit PCM samples to disk; sizes are patched on close()
class WavWriter {
public:
    WavWriter() = default;
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    bool open(const std::string& path, uint32_t sample_rate, uint16_t channels = 1);
    bool write(const int16_t* samples, size_t count);
    bool close();

    bool is_open() const { return file_.is_open(); }
    uint64_t frames_written() const { return channels_ ? samples_written_ / channels_ : 0; }
    const std::string& path() const { return path_; }

private:
    std::ofstream file_;
    std::string path_;
    uint32_t sample_rate_ = 0;
    uint16_t channels_ = 1;
    uint64_t samples_written_ = 0;
};

} // namespace dictate
