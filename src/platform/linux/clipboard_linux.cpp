#include "clipboard.hpp"
#include <iostream>
#include <cstdlib>
#include <cstring>
#include <array>
#include <memory>
#include <thread>
#include <chrono>

#include <X11/Xlib.h>
#include <X11/Xatom.h>
#include <X11/XKBlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace dictate {

namespace {

constexpr std::chrono::milliseconds TYPE_INTERVAL{20};

using DisplayPtr = std::unique_ptr<Display, decltype(&XCloseDisplay)>;

DisplayPtr open_display() {
    return DisplayPtr(XOpenDisplay(nullptr), XCloseDisplay);
}

// Helper to run a command and get output
std::string exec_command(const char* cmd) {
    std::array<char, 128> buffer;
    std::string result;
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd, "r"), pclose);
    if (!pipe) return "";
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }
    return result;
}

bool write_command(const char* cmd, const std::string& text) {
    FILE* pipe = popen(cmd, "w");
    if (!pipe) return false;
    fwrite(text.c_str(), 1, text.length(), pipe);
    return pclose(pipe) == 0;
}

void tap_key(Display* display, KeyCode key, KeyCode modifier) {
    if (modifier) XTestFakeKeyEvent(display, modifier, True, 0);
    XTestFakeKeyEvent(display, key, True, 0);
    XTestFakeKeyEvent(display, key, False, 0);
    if (modifier) XTestFakeKeyEvent(display, modifier, False, 0);
    XFlush(display);
}

// Printable ASCII maps straight onto Latin-1 keysyms
KeySym keysym_for(char c) {
    if (c == '\n') return XK_Return;
    if (c == '\t') return XK_Tab;
    if (c >= 0x20 && c <= 0x7e) return static_cast<KeySym>(c);
    return XK_question;
}

} // namespace

bool Clipboard::set_text(const std::string& text) {
    if (write_command("xclip -selection clipboard 2>/dev/null", text)) return true;
    if (write_command("xsel --clipboard --input 2>/dev/null", text)) return true;

    std::cerr << "[paste] Failed to set clipboard. Install xclip or xsel." << std::endl;
    return false;
}

std::string Clipboard::get_text() {
    std::string result = exec_command("xclip -selection clipboard -o 2>/dev/null");
    if (!result.empty()) return result;

    return exec_command("xsel --clipboard --output 2>/dev/null");
}

bool Clipboard::can_synthesize_input() {
    DisplayPtr display = open_display();
    if (!display) return false;

    int event_base, error_base, major, minor;
    return XTestQueryExtension(display.get(), &event_base, &error_base, &major, &minor) == True;
}

bool Clipboard::send_paste_keystroke(PasteMode mode) {
    DisplayPtr display = open_display();
    if (!display) {
        std::cerr << "[paste] Failed to open X display" << std::endl;
        return false;
    }

    KeyCode modifier = 0;
    KeyCode key = 0;
    if (mode == PasteMode::ShiftInsert) {
        modifier = XKeysymToKeycode(display.get(), XK_Shift_L);
        key = XKeysymToKeycode(display.get(), XK_Insert);
    } else {
        modifier = XKeysymToKeycode(display.get(), XK_Control_L);
        key = XKeysymToKeycode(display.get(), XK_v);
    }

    if (modifier == 0 || key == 0) {
        std::cerr << "[paste] Failed to get keycodes" << std::endl;
        return false;
    }

    tap_key(display.get(), key, modifier);
    return true;
}

bool Clipboard::type_text(const std::string& text) {
    DisplayPtr display = open_display();
    if (!display) {
        std::cerr << "[paste] Failed to open X display" << std::endl;
        return false;
    }

    KeyCode shift = XKeysymToKeycode(display.get(), XK_Shift_L);

    for (size_t i = 0; i < text.size(); ++i) {
        auto byte = static_cast<unsigned char>(text[i]);
        // One placeholder per UTF-8 sequence; continuation bytes are skipped
        if ((byte & 0xC0) == 0x80) continue;

        KeySym sym = keysym_for(byte < 0x80 ? static_cast<char>(byte) : '?');
        KeyCode key = XKeysymToKeycode(display.get(), sym);
        if (key == 0) continue;

        // Characters on the shifted level of their key need Shift held
        bool needs_shift = XkbKeycodeToKeysym(display.get(), key, 0, 0) != sym &&
                           XkbKeycodeToKeysym(display.get(), key, 0, 1) == sym;
        tap_key(display.get(), key, needs_shift ? shift : 0);
        std::this_thread::sleep_for(TYPE_INTERVAL);
    }
    return true;
}

PasteManager::PasteManager(Dispatcher& dispatcher)
    : dispatcher_(dispatcher) {
}

bool PasteManager::copy_to_clipboard(const std::string& text) {
    return Clipboard::set_text(text);
}

bool PasteManager::paste(const std::string& text, const Config& config) {
    std::string previous;
    if (config.restore_clipboard) {
        previous = Clipboard::get_text();
    }

    if (!copy_to_clipboard(text)) return false;

    bool ok = config.paste_mode == PasteMode::Type
        ? Clipboard::type_text(text)
        : Clipboard::send_paste_keystroke(config.paste_mode);
    std::cout << "[paste] Paste action executed (" << paste_mode_name(config.paste_mode) << ")" << std::endl;

    if (config.restore_clipboard && !previous.empty()) {
        dispatcher_.post_after(std::chrono::milliseconds(config.restore_delay_ms), [previous, text]() {
            // Leave it alone if the user copied something else meanwhile
            if (Clipboard::get_text() != text) return;
            if (!Clipboard::set_text(previous)) {
                std::cerr << "[paste] Failed to restore clipboard" << std::endl;
            }
        });
    }
    return ok;
}

} // namespace dictate
