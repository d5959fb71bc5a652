#pragma once

#include "hotkey.hpp"
#include "audio_device.hpp"

#include <string>
#include <cstdint>

namespace dictate {

// How a transcript is delivered to the focused window
enum class PasteMode {
    CtrlV,          // clipboard + Ctrl+V
    ShiftInsert,    // clipboard + Shift+Insert (terminals)
    Type            // synthesize each character
};

const char* paste_mode_name(PasteMode mode);

// Accepts the names above plus "cmdV" as an alias for Ctrl+V
bool parse_paste_mode(const std::string& text, PasteMode& out);

// ~/.dictate
std::string default_data_dir();

// ~/.dictate/models/ggml-base.en.bin
std::string default_model_path();

// ~/.dictate/settings.conf
std::string default_settings_path();

struct Config {
    HotkeyBindings hotkeys;

    // Audio input
    std::string input_device_uid = SYSTEM_DEFAULT_DEVICE;
    int input_channel = 0;          // 0 = loudest channel, else 1-based

    // Whisper
    std::string model_path = default_model_path();
    std::string whisper_path;       // empty = search next to the executable

    // Behavior
    PasteMode paste_mode = PasteMode::CtrlV;
    bool auto_copy = false;         // put each transcript on the clipboard
    bool auto_paste = false;        // paste as soon as the transcript arrives
    bool restore_clipboard = false; // put the previous clipboard text back after pasting
    int restore_delay_ms = 300;
    bool show_transcript = true;    // print transcripts to the console
};

} // namespace dictate
