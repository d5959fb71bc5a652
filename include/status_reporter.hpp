#pragma once

#include <string>

namespace dictate {

enum class AppState {
    Idle,
    Recording,
    Transcribing
};

const char* app_state_name(AppState state);

// User-visible status surface. All calls arrive on the main dispatcher.
class StatusReporter {
public:
    virtual ~StatusReporter() = default;

    virtual void update_state(AppState state) = 0;
    virtual void show_message(const std::string& message) = 0;
    virtual void show_paste_ready() = 0;
    virtual void clear_paste_ready() = 0;
    virtual void show_transcript(const std::string& text) = 0;

    // What to grant for capture, hotkeys and paste
    virtual void show_permissions(bool microphone, bool input, bool paste) = 0;
};

// Prints status lines to the terminal
class ConsoleStatusReporter : public StatusReporter {
public:
    void update_state(AppState state) override;
    void show_message(const std::string& message) override;
    void show_paste_ready() override;
    void clear_paste_ready() override;
    void show_transcript(const std::string& text) override;
    void show_permissions(bool microphone, bool input, bool paste) override;

private:
    bool paste_ready_ = false;
};

} // namespace dictate
