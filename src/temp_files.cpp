#include "temp_files.hpp"
#include <iostream>
#include <filesystem>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdlib>
#include <cstdint>

namespace fs = std::filesystem;

namespace dictate {

std::string make_token() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    std::ostringstream out;
    out << std::hex << std::setfill('0') << std::setw(16) << dist(gen)
        << std::setw(16) << dist(gen);
    return out.str();
}

std::string temp_directory() {
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir && *tmpdir) return tmpdir;
    return "/tmp";
}

std::string make_temp_path(const std::string& dir, const std::string& prefix, const std::string& suffix) {
    return (fs::path(dir) / (prefix + make_token() + suffix)).string();
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::exists(path, ec);
}

void remove_file(const std::string& path, const char* tag) {
    if (path.empty()) return;

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[" << tag << "] Failed to remove " << path << ": " << ec.message() << std::endl;
    }
}

} // namespace dictate
