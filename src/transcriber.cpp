#include "transcriber.hpp"
#include "temp_files.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <cstdlib>

#include <unistd.h>

namespace fs = std::filesystem;

namespace dictate {

namespace {

bool starts_with(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

bool regular_file_exists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

InstallResourceLocator::InstallResourceLocator(std::string override_path)
    : override_path_(std::move(override_path)) {
}

std::string InstallResourceLocator::executable_directory() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return "";
    return exe.parent_path().string();
}

std::vector<std::string> InstallResourceLocator::search_directories() const {
    std::vector<std::string> dirs;
    std::string exe_dir = executable_directory();
    if (!exe_dir.empty()) {
        fs::path base(exe_dir);
        dirs.push_back(base.string());
        dirs.push_back((base / "whisper").string());
        dirs.push_back((base / ".." / "share" / "dictate").lexically_normal().string());
        dirs.push_back((base / ".." / "share" / "dictate" / "whisper").lexically_normal().string());
    }

    const char* path_env = std::getenv("PATH");
    if (path_env) {
        std::stringstream ss(path_env);
        std::string entry;
        while (std::getline(ss, entry, ':')) {
            if (!entry.empty()) dirs.push_back(entry);
        }
    }
    return dirs;
}

void InstallResourceLocator::set_override_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    override_path_ = path;
}

std::string InstallResourceLocator::override_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return override_path_;
}

std::string InstallResourceLocator::locate(const std::string& name) {
    std::string configured = override_path();
    if (!configured.empty()) {
        if (regular_file_exists(configured)) return configured;
        std::cerr << "[transcription] Configured " << name << " not found at " << configured << std::endl;
        return "";
    }

    for (const auto& dir : search_directories()) {
        fs::path candidate = fs::path(dir) / name;
        if (regular_file_exists(candidate)) return candidate.string();
    }
    return "";
}

std::string TranscriptParser::parse(const std::string& output) {
    std::istringstream stream(output);
    std::string line;
    std::string joined;

    while (std::getline(stream, line)) {
        std::string cleaned = trim(line);
        if (cleaned.empty()) continue;
        if (starts_with(cleaned, "[")) continue;
        if (starts_with(cleaned, "whisper_")) continue;
        if (starts_with(cleaned, "main")) continue;

        if (!joined.empty()) joined += ' ';
        joined += cleaned;
    }
    return trim(joined);
}

WhisperCliTranscriber::WhisperCliTranscriber(ProcessRunner& runner, ResourceLocator& locator)
    : runner_(runner)
    , locator_(locator)
    , temp_dir_(temp_directory()) {
}

bool WhisperCliTranscriber::ensure_executable(const std::string& path) {
    if (access(path.c_str(), X_OK) == 0) return true;

    try {
        fs::permissions(path,
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[transcription] Failed to mark whisper-cli executable: " << e.what() << std::endl;
        return false;
    }
    return true;
}

TranscriptionResult WhisperCliTranscriber::transcribe(const std::string& audio_path, const std::string& model_path) {
    TranscriptionResult result;

    std::string binary = locator_.locate(BINARY_NAME);
    if (binary.empty()) {
        result.error = ErrorKind::MissingWhisperBinary;
        return result;
    }
    if (!regular_file_exists(model_path)) {
        result.error = ErrorKind::MissingModel;
        return result;
    }
    ensure_executable(binary);

    std::string output_base = make_temp_path(temp_dir_, "dictate_out_", "");
    std::string output_text = output_base + ".txt";

    std::vector<std::string> arguments = {
        "-m", model_path,
        "-f", audio_path,
        "-otxt",
        "-of", output_base,
    };

    std::cout << "[transcription] Running " << binary << " on " << audio_path << std::endl;
    ProcessResult process = runner_.run(binary, arguments);

    if (!process.launched || process.exit_status != 0) {
        result.error = ErrorKind::ProcessFailed;
        result.diagnostic = process.output.empty() ? process.error : process.output;
        if (result.diagnostic.empty()) result.diagnostic = "whisper-cli failed";
        std::cerr << "[transcription] whisper-cli exited with " << process.exit_status << std::endl;
        remove_file(output_text, "transcription");
        return result;
    }

    std::string text;
    {
        std::ifstream file(output_text);
        if (file.is_open()) {
            std::stringstream contents;
            contents << file.rdbuf();
            text = trim(contents.str());
        }
    }
    remove_file(output_text, "transcription");

    if (text.empty()) {
        text = TranscriptParser::parse(process.output);
    }
    if (text.empty()) {
        result.error = ErrorKind::EmptyResult;
        return result;
    }

    result.success = true;
    result.text = text;
    return result;
}

} // namespace dictate
