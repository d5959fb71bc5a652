#include "wav_file.hpp"
#include <iostream>
#include <cstring>
#include <array>
#include <limits>
#include <cstdio>
#include <cerrno>

namespace dictate {

namespace {

void append_u16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void append_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

void append_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

bool read_u16(std::istream& in, uint16_t& value) {
    uint8_t bytes[2];
    in.read(reinterpret_cast<char*>(bytes), 2);
    if (in.gcount() != 2) return false;
    value = static_cast<uint16_t>(bytes[0] | (bytes[1] << 8));
    return true;
}

bool read_u32(std::istream& in, uint32_t& value) {
    uint8_t bytes[4];
    in.read(reinterpret_cast<char*>(bytes), 4);
    if (in.gcount() != 4) return false;
    value = static_cast<uint32_t>(bytes[0]) |
            (static_cast<uint32_t>(bytes[1]) << 8) |
            (static_cast<uint32_t>(bytes[2]) << 16) |
            (static_cast<uint32_t>(bytes[3]) << 24);
    return true;
}

// Walks the chunk list and leaves the stream at the start of the data chunk
bool parse_header(std::istream& in, WavInfo& info) {
    std::array<char, 4> tag{};
    uint32_t riff_size = 0;

    in.read(tag.data(), 4);
    if (in.gcount() != 4 || std::memcmp(tag.data(), "RIFF", 4) != 0) return false;
    if (!read_u32(in, riff_size)) return false;
    in.read(tag.data(), 4);
    if (in.gcount() != 4 || std::memcmp(tag.data(), "WAVE", 4) != 0) return false;

    bool fmt_found = false;
    while (in) {
        in.read(tag.data(), 4);
        if (in.gcount() != 4) return false;
        uint32_t chunk_size = 0;
        if (!read_u32(in, chunk_size)) return false;

        if (std::memcmp(tag.data(), "fmt ", 4) == 0) {
            if (chunk_size < 16) return false;
            if (!read_u16(in, info.format_tag) ||
                !read_u16(in, info.channels) ||
                !read_u32(in, info.sample_rate) ||
                !read_u32(in, info.byte_rate) ||
                !read_u16(in, info.block_align) ||
                !read_u16(in, info.bits_per_sample)) {
                return false;
            }
            // WAVE_FORMAT_EXTENSIBLE carries the real tag in its sub-format
            if (info.format_tag == 0xFFFE && chunk_size >= 26) {
                uint16_t extension_size = 0, valid_bits = 0;
                uint32_t channel_mask = 0;
                uint16_t sub_format = 0;
                if (!read_u16(in, extension_size) || !read_u16(in, valid_bits) ||
                    !read_u32(in, channel_mask) || !read_u16(in, sub_format)) {
                    return false;
                }
                info.format_tag = sub_format;
                in.seekg(chunk_size - 26, std::ios::cur);
            } else if (chunk_size > 16) {
                in.seekg(chunk_size - 16, std::ios::cur);
            }
            fmt_found = true;
        } else if (std::memcmp(tag.data(), "data", 4) == 0) {
            if (!fmt_found) return false;
            info.data_size = chunk_size;
            return true;
        } else {
            // Skip LIST, fact, etc. Chunks are word aligned.
            in.seekg(chunk_size + (chunk_size & 1), std::ios::cur);
        }
    }
    return false;
}

} // namespace

std::vector<uint8_t> make_wav_header(uint16_t channels, uint32_t sample_rate,
                                     uint16_t bits_per_sample, uint32_t data_size,
                                     uint16_t format_tag) {
    const uint16_t bytes_per_sample = bits_per_sample / 8;
    const uint16_t block_align = static_cast<uint16_t>(channels * bytes_per_sample);
    const uint32_t byte_rate = sample_rate * block_align;

    std::vector<uint8_t> header;
    header.reserve(WAV_HEADER_SIZE);
    append_tag(header, "RIFF");
    append_u32(header, 36 + data_size);
    append_tag(header, "WAVE");
    append_tag(header, "fmt ");
    append_u32(header, 16);             // PCM fmt chunk size
    append_u16(header, format_tag);
    append_u16(header, channels);
    append_u32(header, sample_rate);
    append_u32(header, byte_rate);
    append_u16(header, block_align);
    append_u16(header, bits_per_sample);
    append_tag(header, "data");
    append_u32(header, data_size);
    return header;
}

bool write_pcm16_wav(const std::string& path, uint32_t sample_rate,
                     const std::vector<int16_t>& samples) {
    const uint64_t data_bytes = static_cast<uint64_t>(samples.size()) * sizeof(int16_t);
    if (data_bytes > std::numeric_limits<uint32_t>::max() - 36) {
        std::cerr << "[audio] Audio too long for a WAV container: " << samples.size() << " samples" << std::endl;
        return false;
    }

    std::vector<uint8_t> bytes = make_wav_header(1, sample_rate, 16, static_cast<uint32_t>(data_bytes));
    bytes.reserve(WAV_HEADER_SIZE + data_bytes);
    for (int16_t sample : samples) {
        append_u16(bytes, static_cast<uint16_t>(sample));
    }

    // Write to a sibling and rename so readers never see a partial file
    std::string tmp_path = path + ".part";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "[audio] Failed to create " << tmp_path << std::endl;
            return false;
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            std::cerr << "[audio] Failed to write " << tmp_path << std::endl;
            std::remove(tmp_path.c_str());
            return false;
        }
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        std::cerr << "[audio] Failed to move " << tmp_path << " to " << path << ": " << std::strerror(errno) << std::endl;
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

bool read_wav_info(const std::string& path, WavInfo& info) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    return parse_header(file, info);
}

bool read_wav(const std::string& path, WavData& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[audio] Cannot open " << path << std::endl;
        return false;
    }

    WavInfo info;
    if (!parse_header(file, info)) {
        std::cerr << "[audio] Not a WAV file: " << path << std::endl;
        return false;
    }
    if (info.channels == 0 || info.sample_rate == 0) {
        std::cerr << "[audio] Invalid WAV format in " << path << std::endl;
        return false;
    }

    bool pcm16 = info.format_tag == 1 && info.bits_per_sample == 16;
    bool float32 = info.format_tag == 3 && info.bits_per_sample == 32;
    if (!pcm16 && !float32) {
        std::cerr << "[audio] Unsupported WAV encoding (tag " << info.format_tag
                  << ", " << info.bits_per_sample << " bits): " << path << std::endl;
        return false;
    }

    std::vector<char> raw(info.data_size);
    file.read(raw.data(), static_cast<std::streamsize>(raw.size()));
    // A writer that crashed may leave a short data chunk; keep what is there
    size_t available = static_cast<size_t>(file.gcount());
    info.data_size = static_cast<uint32_t>(available - available % (info.block_align ? info.block_align : 1));

    out.info = info;
    out.samples.clear();

    if (pcm16) {
        size_t count = info.data_size / 2;
        out.samples.resize(count);
        for (size_t i = 0; i < count; ++i) {
            auto lo = static_cast<uint8_t>(raw[2 * i]);
            auto hi = static_cast<uint8_t>(raw[2 * i + 1]);
            auto value = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
            out.samples[i] = static_cast<float>(value) / 32768.0f;
        }
    } else {
        size_t count = info.data_size / 4;
        out.samples.resize(count);
        for (size_t i = 0; i < count; ++i) {
            uint32_t bits = static_cast<uint32_t>(static_cast<uint8_t>(raw[4 * i])) |
                            (static_cast<uint32_t>(static_cast<uint8_t>(raw[4 * i + 1])) << 8) |
                            (static_cast<uint32_t>(static_cast<uint8_t>(raw[4 * i + 2])) << 16) |
                            (static_cast<uint32_t>(static_cast<uint8_t>(raw[4 * i + 3])) << 24);
            float value;
            std::memcpy(&value, &bits, sizeof(value));
            out.samples[i] = value;
        }
    }
    return true;
}

WavWriter::~WavWriter() {
    if (is_open()) {
        close();
    }
}

bool WavWriter::open(const std::string& path, uint32_t sample_rate, uint16_t channels) {
    if (is_open()) close();

    file_.open(path, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        std::cerr << "[audio] Failed to open " << path << " for writing" << std::endl;
        return false;
    }

    path_ = path;
    sample_rate_ = sample_rate;
    channels_ = channels;
    samples_written_ = 0;

    // Placeholder sizes until close()
    std::vector<uint8_t> header = make_wav_header(channels_, sample_rate_, 16, 0);
    file_.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
    return static_cast<bool>(file_);
}

bool WavWriter::write(const int16_t* samples, size_t count) {
    if (!is_open()) return false;

    std::vector<uint8_t> bytes;
    bytes.reserve(count * 2);
    for (size_t i = 0; i < count; ++i) {
        append_u16(bytes, static_cast<uint16_t>(samples[i]));
    }
    file_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    samples_written_ += count;
    return static_cast<bool>(file_);
}

bool WavWriter::close() {
    if (!is_open()) return false;

    uint64_t data_bytes = samples_written_ * 2;
    if (data_bytes > std::numeric_limits<uint32_t>::max() - 36) {
        data_bytes = std::numeric_limits<uint32_t>::max() - 36;
    }

    std::vector<uint8_t> header = make_wav_header(channels_, sample_rate_, 16, static_cast<uint32_t>(data_bytes));
    file_.seekp(0, std::ios::beg);
    file_.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
    bool ok = static_cast<bool>(file_);
    file_.close();

    if (!ok) {
        std::cerr << "[audio] Failed to finalize " << path_ << std::endl;
    }
    return ok;
}

} // namespace dictate
