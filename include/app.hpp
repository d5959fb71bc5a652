#pragma once

#include "config.hpp"
#include "audio_capture.hpp"
#include "audio_converter.hpp"
#include "transcriber.hpp"
#include "transcription_manager.hpp"
#include "hotkey_manager.hpp"
#include "clipboard.hpp"
#include "permissions.hpp"
#include "status_reporter.hpp"
#include "dispatcher.hpp"

#include <memory>
#include <set>
#include <string>

namespace dictate {

enum class RecordingMode {
    None,
    Toggle,
    Hold
};

// Collaborators the App drives but does not own
struct AppServices {
    AudioBackend& audio;
    KeyboardTap& keyboard;
    Permissions& permissions;
    TranscriptionEngine& engine;
    PasteTarget& paste;
    StatusReporter& status;
    Dispatcher& dispatcher;
};

// Wires hotkeys to capture, transcription and paste. Every method runs
// on the dispatcher's context.
class App : public HotkeyListener {
public:
    App(const Config& config, AppServices services);
    ~App() override;

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Installs the hotkey listener; returns false if it is Disabled
    bool start();
    void stop();

    // start(), then drive `loop` until it quits
    int run(MainDispatcher& loop);

    // Re-checks permissions and reinstalls the keyboard tap if it dropped
    void recheck_permissions();

    void toggle_dictation();
    void retry_transcription();
    void paste_last_transcript();
    void copy_last_transcript();
    void clear_transcript();

    void update_config(const Config& config);

    // HotkeyListener
    void on_toggle() override;
    void on_hold_start() override;
    void on_hold_end() override;
    void on_paste() override;
    void on_screenshot() override;
    void on_keystroke(uint32_t key_code, uint32_t flags) override;

    AppState state() const { return state_; }
    RecordingMode recording_mode() const { return mode_; }
    bool is_paste_ready() const { return paste_ready_; }
    const std::string& last_transcript() const { return last_transcript_; }
    const std::string& last_audio_path() const { return last_audio_path_; }
    const Config& config() const { return config_; }
    HotkeyManager& hotkeys() { return *hotkeys_; }

    // Blocks until queued transcriptions have finished on the worker
    void wait_for_background();

private:
    void start_recording(RecordingMode mode);
    void stop_recording_and_transcribe();
    void transcribe(const std::string& audio_path);
    void on_transcription_complete(const std::string& audio_path, const TranscriptionResult& result);

    void set_state(AppState state);
    void set_paste_ready(bool ready);
    void remember_audio(const std::string& path);
    void discard_audio(const std::string& path);

    Config config_;
    AppServices services_;

    AppState state_ = AppState::Idle;
    RecordingMode mode_ = RecordingMode::None;
    bool paste_ready_ = false;
    std::string last_transcript_;
    std::string last_audio_path_;
    // Captures queued for transcription; one entry per queued job
    std::multiset<std::string> pending_audio_;

    std::unique_ptr<HotkeyManager> hotkeys_;
    std::unique_ptr<AudioCapture> capture_;
    std::unique_ptr<AudioConverter> converter_;
    std::unique_ptr<TranscriptionManager> transcription_;

    // Expires with the App so late completions are dropped
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);

    // Declared last: joined first, before the components its tasks use
    TaskQueue queue_;
};

} // namespace dictate
