#include "app.hpp"
#include "temp_files.hpp"
#include <iostream>
#include <linux/input-event-codes.h>

namespace dictate {

App::App(const Config& config, AppServices services)
    : config_(config)
    , services_(services) {
    hotkeys_ = std::make_unique<HotkeyManager>(services_.keyboard, services_.dispatcher);
    hotkeys_->set_hotkeys(config_.hotkeys);
    hotkeys_->set_listener(this);

    capture_ = std::make_unique<AudioCapture>(services_.audio, services_.permissions);
    converter_ = std::make_unique<AudioConverter>();
    transcription_ = std::make_unique<TranscriptionManager>(*converter_, services_.engine, queue_);
}

App::~App() {
    stop();
    queue_.wait_idle();
    // Completions still posted to the dispatcher are dropped
    std::set<std::string> orphaned(pending_audio_.begin(), pending_audio_.end());
    pending_audio_.clear();
    for (const auto& path : orphaned) {
        discard_audio(path);
    }
    remember_audio("");
}

bool App::start() {
    bool mic = services_.permissions.microphone_authorized();
    bool input = services_.permissions.input_access_granted();
    bool paste = services_.permissions.paste_access_granted();
    std::cout << "[permissions] Permission status - mic: " << mic << ", input: " << input
              << ", paste: " << paste << std::endl;

    if (!input) {
        services_.status.show_message("Input monitoring permission required. Hotkeys are disabled until access is granted.");
        services_.status.show_permissions(mic, input, paste);
    }

    if (!hotkeys_->start()) {
        std::cerr << "[hotkeys] Keyboard listener unavailable" << std::endl;
        return false;
    }
    return true;
}

void App::stop() {
    if (hotkeys_) {
        hotkeys_->set_listener(nullptr);
        hotkeys_->stop();
    }

    if (capture_ && capture_->is_recording()) {
        CaptureResult result = capture_->stop();
        remove_file(result.path, "audio");
        mode_ = RecordingMode::None;
        set_state(AppState::Idle);
    }
}

int App::run(MainDispatcher& loop) {
    start();

    std::cout << "\n=== dictate ready ===" << std::endl;
    std::cout << "Toggle dictation: " << display_string(config_.hotkeys.toggle) << std::endl;
    std::cout << "Hold to talk:     " << display_string(config_.hotkeys.hold) << std::endl;
    std::cout << "Paste transcript: " << display_string(config_.hotkeys.paste) << std::endl;
    std::cout << "Press Ctrl+C to quit.\n" << std::endl;

    loop.run();

    stop();
    wait_for_background();
    return 0;
}

void App::recheck_permissions() {
    bool mic = services_.permissions.microphone_authorized();
    bool input = services_.permissions.input_access_granted();
    bool paste = services_.permissions.paste_access_granted();
    services_.status.show_permissions(mic, input, paste);

    if (input) {
        hotkeys_->restart_if_needed();
    }
}

void App::update_config(const Config& config) {
    config_ = config;
    hotkeys_->set_hotkeys(config_.hotkeys);
}

void App::toggle_dictation() {
    if (capture_->is_recording()) {
        stop_recording_and_transcribe();
    } else {
        start_recording(RecordingMode::Toggle);
    }
}

void App::start_recording(RecordingMode mode) {
    if (!services_.permissions.microphone_authorized()) {
        std::cerr << "[audio] Microphone permission missing" << std::endl;
        services_.status.show_permissions(false,
                                          services_.permissions.input_access_granted(),
                                          services_.permissions.paste_access_granted());
        return;
    }

    set_paste_ready(false);
    mode_ = mode;

    CaptureStatus status = capture_->start(config_.input_device_uid, config_.input_channel);
    if (!status.success) {
        std::cerr << "[audio] Failed to start recording: " << error_name(status.error);
        if (!status.detail.empty()) std::cerr << " (" << status.detail << ")";
        std::cerr << std::endl;
        services_.status.show_message("Failed to start recording");
        mode_ = RecordingMode::None;
        return;
    }

    std::cout << "[audio] Recording started" << (mode == RecordingMode::Hold ? " (hold)" : "") << std::endl;
    set_state(AppState::Recording);
}

void App::stop_recording_and_transcribe() {
    CaptureResult result = capture_->stop();
    mode_ = RecordingMode::None;

    if (!result.success) {
        std::cerr << "[audio] Failed to stop recording: " << error_name(result.error) << std::endl;
        services_.status.show_message("Failed to stop recording");
        set_state(AppState::Idle);
        return;
    }

    std::cout << "[audio] Recording stopped" << std::endl;
    transcribe(result.path);
}

void App::transcribe(const std::string& audio_path) {
    if (!services_.permissions.microphone_authorized()) {
        services_.status.show_permissions(false,
                                          services_.permissions.input_access_granted(),
                                          services_.permissions.paste_access_granted());
        discard_audio(audio_path);
        set_state(pending_audio_.empty() ? AppState::Idle : AppState::Transcribing);
        return;
    }

    set_paste_ready(false);
    pending_audio_.insert(audio_path);
    remember_audio(audio_path);
    set_state(AppState::Transcribing);
    std::cout << "[transcription] Transcription started" << std::endl;

    std::weak_ptr<int> alive = lifetime_;
    Dispatcher& dispatcher = services_.dispatcher;
    transcription_->transcribe_async(audio_path, config_.model_path,
        [this, alive, audio_path, &dispatcher](const TranscriptionResult& result) {
            dispatcher.post([this, alive, audio_path, result]() {
                if (alive.expired()) return;
                on_transcription_complete(audio_path, result);
            });
        });
}

void App::on_transcription_complete(const std::string& audio_path, const TranscriptionResult& result) {
    auto pending = pending_audio_.find(audio_path);
    if (pending != pending_audio_.end()) {
        pending_audio_.erase(pending);
    }
    discard_audio(audio_path);

    if (capture_->is_recording()) {
        set_state(AppState::Recording);
    } else {
        set_state(pending_audio_.empty() ? AppState::Idle : AppState::Transcribing);
    }

    if (!result.success) {
        std::cerr << "[transcription] Transcription failed: " << error_name(result.error) << std::endl;
        services_.status.show_message(describe_error(result.error));
        return;
    }

    last_transcript_ = result.text;
    std::cout << "[transcription] Transcription completed" << std::endl;

    if (config_.auto_copy) {
        if (services_.paste.copy_to_clipboard(result.text)) {
            std::cout << "[paste] Copied transcript to clipboard" << std::endl;
        }
    }

    if (!trim(result.text).empty()) {
        set_paste_ready(true);
    }

    if (config_.show_transcript) {
        services_.status.show_transcript(result.text);
    }

    if (config_.auto_paste) {
        paste_last_transcript();
    }
}

void App::retry_transcription() {
    if (last_audio_path_.empty() || !file_exists(last_audio_path_)) {
        services_.status.show_message("No audio to retry");
        return;
    }
    transcribe(last_audio_path_);
}

void App::paste_last_transcript() {
    if (trim(last_transcript_).empty()) {
        services_.status.show_message("No transcript");
        return;
    }
    if (!services_.permissions.paste_access_granted()) {
        services_.status.show_permissions(services_.permissions.microphone_authorized(),
                                          services_.permissions.input_access_granted(),
                                          false);
        return;
    }

    if (!services_.paste.paste(last_transcript_, config_)) {
        services_.status.show_message("Paste failed");
    }
    set_paste_ready(false);
}

void App::copy_last_transcript() {
    if (last_transcript_.empty()) return;
    services_.paste.copy_to_clipboard(last_transcript_);
}

void App::clear_transcript() {
    last_transcript_.clear();
    remember_audio("");
    set_paste_ready(false);
}

void App::on_toggle() {
    toggle_dictation();
}

void App::on_hold_start() {
    if (capture_->is_recording()) return;
    start_recording(RecordingMode::Hold);
}

void App::on_hold_end() {
    // Only ends sessions that a hold started
    if (!capture_->is_recording() || mode_ != RecordingMode::Hold) return;
    stop_recording_and_transcribe();
}

void App::on_paste() {
    paste_last_transcript();
}

void App::on_screenshot() {
    services_.status.show_message("Screenshots are not supported on this platform");
}

void App::on_keystroke(uint32_t key_code, uint32_t flags) {
    if (!paste_ready_) return;
    if (key_code != KEY_V) return;
    if (flags & (MOD_CONTROL | MOD_META)) {
        set_paste_ready(false);
    }
}

void App::wait_for_background() {
    queue_.wait_idle();
}

void App::set_state(AppState state) {
    if (state_ == state) return;
    state_ = state;
    services_.status.update_state(state);
}

void App::set_paste_ready(bool ready) {
    paste_ready_ = ready;
    if (ready) {
        services_.status.show_paste_ready();
    } else {
        services_.status.clear_paste_ready();
    }
}

void App::remember_audio(const std::string& path) {
    std::string previous = last_audio_path_;
    last_audio_path_ = path;
    // The previous capture is no longer retryable once replaced
    if (previous != path) {
        discard_audio(previous);
    }
}

// Removes a capture nothing refers to: not retryable and not queued
void App::discard_audio(const std::string& path) {
    if (path.empty() || path == last_audio_path_ || pending_audio_.count(path)) return;
    remove_file(path, "audio");
}

} // namespace dictate
