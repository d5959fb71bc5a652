// Tests for WAV header layout, streaming writer and reader

#include "wav_file.hpp"
#include "test_support.hpp"
#include <iostream>
#include <fstream>
#include <cassert>
#include <cmath>
#include <cstring>

using namespace dictate;
using dictate_test::ScratchDir;

namespace {

uint32_t u32_at(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint32_t>(bytes[offset]) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

uint16_t u16_at(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

std::vector<uint8_t> read_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

void write_bytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

void append(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

void append_u32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
}

void append_u16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>(value >> 8));
}

} // namespace

void test_header_layout() {
    std::cout << "Testing 44-byte header..." << std::endl;

    std::vector<uint8_t> header = make_wav_header(1, 16000, 16, 3200);
    assert(header.size() == WAV_HEADER_SIZE);
    assert(std::memcmp(header.data(), "RIFF", 4) == 0);
    assert(u32_at(header, 4) == 36 + 3200);
    assert(std::memcmp(header.data() + 8, "WAVE", 4) == 0);
    assert(std::memcmp(header.data() + 12, "fmt ", 4) == 0);
    assert(u32_at(header, 16) == 16);
    assert(u16_at(header, 20) == 1);
    assert(u16_at(header, 22) == 1);
    assert(u32_at(header, 24) == 16000);
    assert(u32_at(header, 28) == 32000);
    assert(u16_at(header, 32) == 2);
    assert(u16_at(header, 34) == 16);
    assert(std::memcmp(header.data() + 36, "data", 4) == 0);
    assert(u32_at(header, 40) == 3200);

    std::cout << "  PASS: Little-endian RIFF/WAVE/fmt/data layout" << std::endl;
}

void test_write_pcm16() {
    std::cout << "Testing one-shot PCM writer..." << std::endl;

    ScratchDir dir("wav_write");
    std::string path = dir.file("out.wav");
    std::vector<int16_t> samples = {0, 1000, -1000, 32767, -32768};
    assert(write_pcm16_wav(path, 16000, samples));

    std::vector<uint8_t> bytes = read_bytes(path);
    assert(bytes.size() == WAV_HEADER_SIZE + samples.size() * 2);
    assert(u32_at(bytes, 40) == samples.size() * 2);
    assert(static_cast<int16_t>(u16_at(bytes, 44 + 2 * 3)) == 32767);
    assert(static_cast<int16_t>(u16_at(bytes, 44 + 2 * 4)) == -32768);

    // No partial file left behind
    assert(dir.count_with_prefix("out.wav.part") == 0);

    std::cout << "  PASS: Samples follow the header" << std::endl;
}

void test_streaming_writer() {
    std::cout << "Testing streaming writer..." << std::endl;

    ScratchDir dir("wav_stream");
    std::string path = dir.file("stream.wav");

    WavWriter writer;
    assert(writer.open(path, 44100, 1));
    std::vector<int16_t> block(441, 500);
    for (int i = 0; i < 10; ++i) {
        assert(writer.write(block.data(), block.size()));
    }
    assert(writer.frames_written() == 4410);
    assert(writer.close());

    WavInfo info;
    assert(read_wav_info(path, info));
    assert(info.sample_rate == 44100);
    assert(info.channels == 1);
    assert(info.frame_count() == 4410);
    assert(std::fabs(info.duration_seconds() - 0.1) < 1e-9);

    std::cout << "  PASS: Sizes are patched on close" << std::endl;
}

void test_read_float_with_extra_chunks() {
    std::cout << "Testing float WAV with a LIST chunk..." << std::endl;

    ScratchDir dir("wav_float");
    std::string path = dir.file("float.wav");

    std::vector<uint8_t> bytes;
    append(bytes, "RIFF");
    append_u32(bytes, 0);  // readers ignore the RIFF size
    append(bytes, "WAVE");
    append(bytes, "LIST");
    append_u32(bytes, 5);
    bytes.insert(bytes.end(), {'I', 'N', 'F', 'O', 'x', 0});  // odd size plus pad byte
    append(bytes, "fmt ");
    append_u32(bytes, 16);
    append_u16(bytes, 3);
    append_u16(bytes, 2);
    append_u32(bytes, 48000);
    append_u32(bytes, 48000 * 8);
    append_u16(bytes, 8);
    append_u16(bytes, 32);
    append(bytes, "data");
    append_u32(bytes, 16);
    float values[4] = {0.25f, -0.5f, 0.75f, -1.0f};
    for (float v : values) {
        uint32_t bits;
        std::memcpy(&bits, &v, 4);
        append_u32(bytes, bits);
    }
    write_bytes(path, bytes);

    WavData data;
    assert(read_wav(path, data));
    assert(data.info.channels == 2);
    assert(data.info.sample_rate == 48000);
    assert(data.info.frame_count() == 2);
    assert(data.samples.size() == 4);
    assert(data.samples[1] == -0.5f);
    assert(data.samples[3] == -1.0f);

    std::cout << "  PASS: Unknown chunks are skipped" << std::endl;
}

void test_truncated_data() {
    std::cout << "Testing truncated data chunk..." << std::endl;

    ScratchDir dir("wav_trunc");
    std::string path = dir.file("trunc.wav");

    std::vector<uint8_t> bytes = make_wav_header(1, 16000, 16, 1000);
    for (int i = 0; i < 10; ++i) append_u16(bytes, 100);
    write_bytes(path, bytes);

    WavData data;
    assert(read_wav(path, data));
    assert(data.samples.size() == 10);
    assert(data.info.data_size == 20);

    std::cout << "  PASS: Short files keep what is there" << std::endl;
}

void test_rejects_non_wav() {
    std::cout << "Testing invalid input..." << std::endl;

    ScratchDir dir("wav_bad");
    std::string path = dir.file("bad.wav");
    write_bytes(path, {'n', 'o', 't', ' ', 'a', ' ', 'w', 'a', 'v'});

    WavData data;
    WavInfo info;
    assert(!read_wav(path, data));
    assert(!read_wav_info(path, info));
    assert(!read_wav(dir.file("missing.wav"), data));

    std::cout << "  PASS: Garbage and missing files are rejected" << std::endl;
}

int main() {
    std::cout << "\n=== WAV File Test Suite ===" << std::endl << std::endl;

    test_header_layout();
    test_write_pcm16();
    test_streaming_writer();
    test_read_float_with_extra_chunks();
    test_truncated_data();
    test_rejects_non_wav();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
