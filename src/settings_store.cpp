#include "settings_store.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <cerrno>
#include <cstdlib>

namespace dictate {

namespace {

std::string trim_spaces(const std::string& text) {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

bool parse_bool(const std::string& text, bool& out) {
    if (text == "true" || text == "1" || text == "yes") {
        out = true;
    } else if (text == "false" || text == "0" || text == "no") {
        out = false;
    } else {
        return false;
    }
    return true;
}

bool parse_int(const std::string& text, int& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < 0 || value > 1000000) return false;
    out = static_cast<int>(value);
    return true;
}

const char* bool_text(bool value) {
    return value ? "true" : "false";
}

} // namespace

SettingsStore::SettingsStore(std::string path)
    : path_(std::move(path)) {
}

bool SettingsStore::apply(Config& config, const std::string& key, const std::string& value) {
    if (key == "toggle_hotkey") return decode_hotkey(value, config.hotkeys.toggle);
    if (key == "hold_hotkey") return decode_hotkey(value, config.hotkeys.hold);
    if (key == "paste_hotkey") return decode_hotkey(value, config.hotkeys.paste);
    if (key == "screenshot_hotkey") return decode_hotkey(value, config.hotkeys.screenshot);

    if (key == "input_device") {
        config.input_device_uid = value.empty() ? SYSTEM_DEFAULT_DEVICE : value;
        return true;
    }
    if (key == "input_channel") return parse_int(value, config.input_channel);
    if (key == "model_path") {
        if (value.empty()) return false;
        config.model_path = value;
        return true;
    }
    if (key == "whisper_path") {
        config.whisper_path = value;
        return true;
    }
    if (key == "paste_mode") return parse_paste_mode(value, config.paste_mode);
    if (key == "auto_copy") return parse_bool(value, config.auto_copy);
    if (key == "auto_paste") return parse_bool(value, config.auto_paste);
    if (key == "restore_clipboard") return parse_bool(value, config.restore_clipboard);
    if (key == "restore_delay_ms") return parse_int(value, config.restore_delay_ms);
    if (key == "show_transcript") return parse_bool(value, config.show_transcript);
    return false;
}

bool SettingsStore::load(Config& config) const {
    if (path_.empty()) return true;

    std::ifstream file(path_);
    if (!file.is_open()) {
        // No settings yet, defaults apply
        return true;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = trim_spaces(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "[dictate] " << path_ << ":" << line_number << ": expected key = value" << std::endl;
            continue;
        }

        std::string key = trim_spaces(line.substr(0, eq));
        std::string value = trim_spaces(line.substr(eq + 1));
        if (!apply(config, key, value)) {
            std::cerr << "[dictate] " << path_ << ":" << line_number
                      << ": ignoring " << key << " = '" << value << "'" << std::endl;
        }
    }
    return true;
}

bool SettingsStore::reload(Config& config, const Overrides& overrides) const {
    Config fresh;
    load(fresh);

    for (const auto& entry : overrides) {
        if (!apply(fresh, entry.first, entry.second)) {
            std::cerr << "[dictate] Invalid value for " << entry.first << ": '" << entry.second << "'" << std::endl;
            return false;
        }
    }
    config = fresh;
    return true;
}

bool SettingsStore::save(const Config& config) const {
    std::filesystem::path path(path_);
    if (path.has_parent_path()) {
        try {
            std::filesystem::create_directories(path.parent_path());
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "[dictate] Failed to create settings directory: " << e.what() << std::endl;
            return false;
        }
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "[dictate] Failed to write settings: " << path_ << std::endl;
        return false;
    }

    file << "# dictate settings\n"
         << "# Hotkeys: key_code,modifiers,uses_fn,fn_only\n"
         << "#   key_code  evdev code (57 = Space, 47 = V)\n"
         << "#   modifiers 1 = Ctrl, 2 = Alt, 4 = Shift, 8 = Super\n\n";

    file << "toggle_hotkey = " << encode_hotkey(config.hotkeys.toggle) << "\n"
         << "hold_hotkey = " << encode_hotkey(config.hotkeys.hold) << "\n"
         << "paste_hotkey = " << encode_hotkey(config.hotkeys.paste) << "\n"
         << "screenshot_hotkey = " << encode_hotkey(config.hotkeys.screenshot) << "\n\n";

    file << "input_device = " << config.input_device_uid << "\n"
         << "input_channel = " << config.input_channel << "\n\n";

    file << "model_path = " << config.model_path << "\n"
         << "whisper_path = " << config.whisper_path << "\n\n";

    file << "paste_mode = " << paste_mode_name(config.paste_mode) << "\n"
         << "auto_copy = " << bool_text(config.auto_copy) << "\n"
         << "auto_paste = " << bool_text(config.auto_paste) << "\n"
         << "restore_clipboard = " << bool_text(config.restore_clipboard) << "\n"
         << "restore_delay_ms = " << config.restore_delay_ms << "\n"
         << "show_transcript = " << bool_text(config.show_transcript) << "\n";

    if (!file) {
        std::cerr << "[dictate] Failed to write settings: " << path_ << std::endl;
        return false;
    }
    return true;
}

} // namespace dictate
