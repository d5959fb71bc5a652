#include "hotkey.hpp"
#include <linux/input-event-codes.h>
#include <sstream>
#include <vector>
#include <unordered_map>
#include <cstdlib>
#include <cerrno>

namespace dictate {

const char* action_name(ActionKind kind) {
    switch (kind) {
        case ActionKind::Toggle: return "toggle";
        case ActionKind::Hold: return "hold";
        case ActionKind::Paste: return "paste";
        case ActionKind::Screenshot: return "screenshot";
    }
    return "unknown";
}

const Hotkey& HotkeyBindings::get(ActionKind kind) const {
    switch (kind) {
        case ActionKind::Toggle: return toggle;
        case ActionKind::Hold: return hold;
        case ActionKind::Paste: return paste;
        case ActionKind::Screenshot: return screenshot;
    }
    return toggle;
}

Hotkey& HotkeyBindings::get(ActionKind kind) {
    const auto& self = *this;
    return const_cast<Hotkey&>(self.get(kind));
}

uint32_t Hotkey::expected_flags() const {
    uint32_t flags = modifier_mask & (MOD_CONTROL | MOD_ALT | MOD_SHIFT | MOD_META);
    if (uses_function_modifier) flags |= MOD_FUNCTION;
    return flags;
}

Hotkey Hotkey::default_toggle() {
    return Hotkey{KEY_SPACE, MOD_CONTROL | MOD_ALT, false, false};
}

Hotkey Hotkey::default_paste() {
    return Hotkey{KEY_V, MOD_CONTROL | MOD_ALT, false, false};
}

Hotkey Hotkey::default_hold() {
    return Hotkey{KEY_R, MOD_CONTROL | MOD_ALT, false, false};
}

Hotkey Hotkey::default_screenshot() {
    return Hotkey{KEY_S, MOD_CONTROL | MOD_ALT, false, false};
}

Hotkey Hotkey::fn_only() {
    return Hotkey{0, 0, false, true};
}

bool matches(const Hotkey& hotkey, uint32_t key_code, uint32_t flags) {
    if (hotkey.function_only) return false;
    if (key_code != hotkey.key_code) return false;
    return (flags & TRACKED_MODIFIERS) == (hotkey.expected_flags() & TRACKED_MODIFIERS);
}

std::string key_name(uint32_t key_code) {
    static const std::unordered_map<uint32_t, const char*> names = {
        {KEY_A, "A"}, {KEY_B, "B"}, {KEY_C, "C"}, {KEY_D, "D"}, {KEY_E, "E"},
        {KEY_F, "F"}, {KEY_G, "G"}, {KEY_H, "H"}, {KEY_I, "I"}, {KEY_J, "J"},
        {KEY_K, "K"}, {KEY_L, "L"}, {KEY_M, "M"}, {KEY_N, "N"}, {KEY_O, "O"},
        {KEY_P, "P"}, {KEY_Q, "Q"}, {KEY_R, "R"}, {KEY_S, "S"}, {KEY_T, "T"},
        {KEY_U, "U"}, {KEY_V, "V"}, {KEY_W, "W"}, {KEY_X, "X"}, {KEY_Y, "Y"},
        {KEY_Z, "Z"},
        {KEY_0, "0"}, {KEY_1, "1"}, {KEY_2, "2"}, {KEY_3, "3"}, {KEY_4, "4"},
        {KEY_5, "5"}, {KEY_6, "6"}, {KEY_7, "7"}, {KEY_8, "8"}, {KEY_9, "9"},
        {KEY_SPACE, "Space"},
        {KEY_ENTER, "Return"},
        {KEY_TAB, "Tab"},
        {KEY_ESC, "Esc"},
    };

    auto it = names.find(key_code);
    if (it != names.end()) return it->second;
    return "Key" + std::to_string(key_code);
}

std::string display_string(const Hotkey& hotkey) {
    if (hotkey.function_only) {
        return "Fn";
    }

    std::vector<std::string> parts;
    if (hotkey.uses_function_modifier) parts.push_back("Fn");
    if (hotkey.modifier_mask & MOD_CONTROL) parts.push_back("Ctrl");
    if (hotkey.modifier_mask & MOD_ALT) parts.push_back("Opt");
    if (hotkey.modifier_mask & MOD_SHIFT) parts.push_back("Shift");
    if (hotkey.modifier_mask & MOD_META) parts.push_back("Cmd");
    parts.push_back(key_name(hotkey.key_code));

    std::string label;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) label += "+";
        label += parts[i];
    }
    return label;
}

std::string encode_hotkey(const Hotkey& hotkey) {
    std::ostringstream out;
    out << hotkey.key_code << ","
        << hotkey.modifier_mask << ","
        << (hotkey.uses_function_modifier ? 1 : 0) << ","
        << (hotkey.function_only ? 1 : 0);
    return out.str();
}

static bool parse_u32(const std::string& field, uint32_t& value) {
    size_t start = field.find_first_not_of(" \t");
    if (start == std::string::npos) return false;
    size_t end = field.find_last_not_of(" \t");
    std::string trimmed = field.substr(start, end - start + 1);

    char* stop = nullptr;
    errno = 0;
    unsigned long parsed = std::strtoul(trimmed.c_str(), &stop, 10);
    if (errno != 0 || stop == trimmed.c_str() || *stop != '\0') return false;
    if (trimmed[0] == '-' || parsed > 0xFFFFFFFFul) return false;
    value = static_cast<uint32_t>(parsed);
    return true;
}

bool decode_hotkey(const std::string& text, Hotkey& out) {
    std::vector<std::string> fields;
    std::istringstream stream(text);
    std::string field;
    while (std::getline(stream, field, ',')) {
        fields.push_back(field);
    }

    // key_code and modifiers are required; the Fn flags were added later
    if (fields.size() < 2 || fields.size() > 4) return false;

    uint32_t values[4] = {0, 0, 0, 0};
    for (size_t i = 0; i < fields.size(); ++i) {
        if (!parse_u32(fields[i], values[i])) return false;
    }
    if (values[2] > 1 || values[3] > 1) return false;

    Hotkey decoded;
    decoded.key_code = values[0];
    decoded.modifier_mask = values[1];
    decoded.uses_function_modifier = values[2] == 1;
    decoded.function_only = values[3] == 1;
    if (decoded.function_only) {
        // Fn alone carries no key or other modifiers
        decoded = Hotkey::fn_only();
    }
    out = decoded;
    return true;
}

} // namespace dictate
