#include "status_reporter.hpp"
#include <iostream>

// No tray on Linux; status goes to the console

namespace dictate {

const char* app_state_name(AppState state) {
    switch (state) {
        case AppState::Idle: return "Ready";
        case AppState::Recording: return "Recording...";
        case AppState::Transcribing: return "Transcribing...";
    }
    return "";
}

void ConsoleStatusReporter::update_state(AppState state) {
    std::cout << "[dictate] " << app_state_name(state) << std::endl;
}

void ConsoleStatusReporter::show_message(const std::string& message) {
    std::cout << "[dictate] " << message << std::endl;
}

void ConsoleStatusReporter::show_paste_ready() {
    if (paste_ready_) return;
    paste_ready_ = true;
    std::cout << "[dictate] Transcript ready to paste" << std::endl;
}

void ConsoleStatusReporter::clear_paste_ready() {
    paste_ready_ = false;
}

void ConsoleStatusReporter::show_transcript(const std::string& text) {
    std::cout << "\n>>> " << text << "\n" << std::endl;
}

void ConsoleStatusReporter::show_permissions(bool microphone, bool input, bool paste) {
    std::cout << "[permissions] Required access:" << std::endl;
    std::cout << "  [" << (microphone ? "x" : " ") << "] Microphone (a capture device via PulseAudio/ALSA)" << std::endl;
    std::cout << "  [" << (input ? "x" : " ") << "] Input monitoring (read access to /dev/input, 'input' group)" << std::endl;
    std::cout << "  [" << (paste ? "x" : " ") << "] Paste (X11 display with the XTest extension)" << std::endl;
}

} // namespace dictate
