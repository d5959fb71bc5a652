#include "config.hpp"
#include <cstdlib>

namespace dictate {

const char* paste_mode_name(PasteMode mode) {
    switch (mode) {
        case PasteMode::CtrlV: return "ctrlV";
        case PasteMode::ShiftInsert: return "shiftInsert";
        case PasteMode::Type: return "type";
    }
    return "ctrlV";
}

bool parse_paste_mode(const std::string& text, PasteMode& out) {
    if (text == "ctrlV" || text == "cmdV") {
        out = PasteMode::CtrlV;
    } else if (text == "shiftInsert") {
        out = PasteMode::ShiftInsert;
    } else if (text == "type") {
        out = PasteMode::Type;
    } else {
        return false;
    }
    return true;
}

std::string default_data_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return ".dictate";
    return std::string(home) + "/.dictate";
}

std::string default_model_path() {
    return default_data_dir() + "/models/ggml-base.en.bin";
}

std::string default_settings_path() {
    return default_data_dir() + "/settings.conf";
}

} // namespace dictate
