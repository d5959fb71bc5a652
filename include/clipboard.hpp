#pragma once

#include "config.hpp"
#include "dispatcher.hpp"
#include <string>

namespace dictate {

class Clipboard {
public:
    // Set text to clipboard
    static bool set_text(const std::string& text);

    // Get text from clipboard
    static std::string get_text();

    // Simulates Ctrl+V or Shift+Insert in the focused window
    static bool send_paste_keystroke(PasteMode mode);

    // Synthesizes one keystroke per character
    static bool type_text(const std::string& text);

    // X display reachable and XTest available
    static bool can_synthesize_input();
};

// Where transcripts go
class PasteTarget {
public:
    virtual ~PasteTarget() = default;

    virtual bool copy_to_clipboard(const std::string& text) = 0;
    virtual bool paste(const std::string& text, const Config& config) = 0;
};

// Delivers transcripts to the focused window
class PasteManager : public PasteTarget {
public:
    explicit PasteManager(Dispatcher& dispatcher);

    bool copy_to_clipboard(const std::string& text) override;

    // Copies, then pastes with `mode`. With restore_clipboard the previous
    // text is put back after the delay, unless something else replaced the
    // clipboard in the meantime. Restore is best-effort.
    bool paste(const std::string& text, const Config& config) override;

private:
    Dispatcher& dispatcher_;
};

} // namespace dictate
