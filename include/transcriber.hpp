#pragma once

#include "errors.hpp"
#include "process_runner.hpp"

#include <string>
#include <vector>
#include <mutex>

namespace dictate {

struct TranscriptionResult {
    bool success = false;
    std::string text;
    ErrorKind error = ErrorKind::None;
    std::string diagnostic;     // captured engine output on ProcessFailed
};

// Speech-to-text engine. One request, one result, no retries.
class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;

    virtual TranscriptionResult transcribe(const std::string& audio_path, const std::string& model_path) = 0;
};

// Finds files shipped alongside the application
class ResourceLocator {
public:
    virtual ~ResourceLocator() = default;

    // Absolute path of an existing file, or "" if it cannot be found
    virtual std::string locate(const std::string& name) = 0;
};

// Search order: explicit override, <exe dir>, <exe dir>/whisper,
// <exe dir>/../share/dictate, <exe dir>/../share/dictate/whisper, then $PATH
class InstallResourceLocator : public ResourceLocator {
public:
    explicit InstallResourceLocator(std::string override_path = "");

    std::string locate(const std::string& name) override;

    // Takes effect for the next lookup; safe to call while a lookup runs
    void set_override_path(const std::string& path);
    std::string override_path() const;

    std::vector<std::string> search_directories() const;

    // Directory holding the running executable
    static std::string executable_directory();

private:
    mutable std::mutex mutex_;
    std::string override_path_;
};

// Cleans up whisper-cli console output when no transcript file was written
class TranscriptParser {
public:
    // Drops blank lines and lines starting with "[", "whisper_" or "main",
    // joins the rest with single spaces.
    static std::string parse(const std::string& output);
};

// Runs the whisper-cli executable:
//   <bin> -m <model> -f <audio> -otxt -of <tmp>/dictate_out_<token>
class WhisperCliTranscriber : public TranscriptionEngine {
public:
    static constexpr const char* BINARY_NAME = "whisper-cli";

    WhisperCliTranscriber(ProcessRunner& runner, ResourceLocator& locator);

    TranscriptionResult transcribe(const std::string& audio_path, const std::string& model_path) override;

    void set_temp_directory(const std::string& dir) { temp_dir_ = dir; }

    // Adds execute permission for owner, group and others if missing
    static bool ensure_executable(const std::string& path);

private:
    ProcessRunner& runner_;
    ResourceLocator& locator_;
    std::string temp_dir_;
};

std::string trim(const std::string& text);

} // namespace dictate
