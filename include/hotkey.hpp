#pragma once

#include <string>
#include <cstdint>

namespace dictate {

// Modifier bits as reported by the keyboard tap
enum ModifierFlag : uint32_t {
    MOD_CONTROL  = 1u << 0,
    MOD_ALT      = 1u << 1,
    MOD_SHIFT    = 1u << 2,
    MOD_META     = 1u << 3,
    MOD_FUNCTION = 1u << 4,
};

// Modifiers that take part in matching; anything else is ignored
constexpr uint32_t TRACKED_MODIFIERS = MOD_CONTROL | MOD_ALT | MOD_SHIFT | MOD_META | MOD_FUNCTION;

enum class ActionKind {
    Toggle,
    Hold,
    Paste,
    Screenshot
};

const char* action_name(ActionKind kind);

struct Hotkey {
    uint32_t key_code = 0;          // evdev key code
    uint32_t modifier_mask = 0;     // MOD_CONTROL | MOD_ALT | MOD_SHIFT | MOD_META
    bool uses_function_modifier = false;
    bool function_only = false;     // Fn held alone; key_code is ignored

    // Flags the hotkey expects to see, Fn included
    uint32_t expected_flags() const;

    bool requires_event_tap() const { return uses_function_modifier || function_only; }

    bool operator==(const Hotkey& other) const {
        return key_code == other.key_code &&
               modifier_mask == other.modifier_mask &&
               uses_function_modifier == other.uses_function_modifier &&
               function_only == other.function_only;
    }
    bool operator!=(const Hotkey& other) const { return !(*this == other); }

    static Hotkey default_toggle();
    static Hotkey default_paste();
    static Hotkey default_hold();
    static Hotkey default_screenshot();
    static Hotkey fn_only();
};

// One hotkey per action
struct HotkeyBindings {
    Hotkey toggle = Hotkey::default_toggle();
    Hotkey hold = Hotkey::default_hold();
    Hotkey paste = Hotkey::default_paste();
    Hotkey screenshot = Hotkey::default_screenshot();

    const Hotkey& get(ActionKind kind) const;
    Hotkey& get(ActionKind kind);

    bool operator==(const HotkeyBindings& other) const {
        return toggle == other.toggle && hold == other.hold &&
               paste == other.paste && screenshot == other.screenshot;
    }
};

// Keycode + modifier match. Fn-only hotkeys never match here; they are
// detected from modifier transitions by HotkeyManager.
bool matches(const Hotkey& hotkey, uint32_t key_code, uint32_t flags);

// Canonical label: Fn, Ctrl, Opt, Shift, Cmd, then the key
std::string display_string(const Hotkey& hotkey);

std::string key_name(uint32_t key_code);

// Persisted form: "key_code,modifiers,uses_fn,fn_only"
std::string encode_hotkey(const Hotkey& hotkey);

// Accepts older two-field entries; missing flags default to false.
// Returns false on malformed input and leaves `out` untouched.
bool decode_hotkey(const std::string& text, Hotkey& out);

} // namespace dictate
