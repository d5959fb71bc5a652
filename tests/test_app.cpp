// End-to-end App behavior against fake devices, engine and paste target

#include "app.hpp"
#include "test_support.hpp"
#include <linux/input-event-codes.h>
#include <iostream>
#include <cassert>
#include <condition_variable>
#include <cstdlib>
#include <mutex>

using namespace dictate;
using dictate_test::ManualDispatcher;
using dictate_test::FakeKeyboardTap;
using dictate_test::ScratchDir;

namespace {

class FakePermissions : public Permissions {
public:
    bool microphone = true;
    bool input = true;
    bool paste = true;

    bool microphone_authorized() override { return microphone; }
    bool input_access_granted() override { return input; }
    bool paste_access_granted() override { return paste; }
};

class FakeStream : public InputStream {
public:
    bool start() override { return true; }
    bool stop() override { return true; }
};

class FakeAudio : public AudioBackend {
public:
    bool open_succeeds = true;
    FrameCallback callback;

    bool initialize() override { return true; }
    void shutdown() override {}

    std::vector<AudioDeviceInfo> input_devices() override {
        AudioDeviceInfo info;
        info.index = 0;
        info.name = "Fake Mic";
        info.uid = "fake:Fake Mic";
        info.input_channels = 1;
        info.built_in = true;
        return {info};
    }

    int default_input_device() override { return 0; }

    std::unique_ptr<InputStream> open_input(int, int, double, FrameCallback frame_callback,
                                            std::string& error) override {
        if (!open_succeeds) {
            error = "device busy";
            return nullptr;
        }
        callback = std::move(frame_callback);
        return std::make_unique<FakeStream>();
    }

    void speak(size_t frames) {
        std::vector<float> samples(frames, 0.3f);
        callback(samples.data(), samples.size(), 1);
    }
};

// Returns a scripted result; runs on the worker thread
class FakeEngine : public TranscriptionEngine {
public:
    TranscriptionResult next;
    int calls = 0;
    std::string last_model;

    FakeEngine() {
        next.success = true;
        next.text = "hello from the test";
    }

    TranscriptionResult transcribe(const std::string&, const std::string& model_path) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            released_.wait(lock, [this]() { return !held_; });
        }
        ++calls;
        last_model = model_path;
        return next;
    }

    // Blocks the worker inside transcribe() until release()
    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        released_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable released_;
    bool held_ = false;
};

class FakePaste : public PasteTarget {
public:
    std::vector<std::string> copied;
    std::vector<std::string> pasted;
    bool paste_succeeds = true;

    bool copy_to_clipboard(const std::string& text) override {
        copied.push_back(text);
        return true;
    }

    bool paste(const std::string& text, const Config&) override {
        pasted.push_back(text);
        return paste_succeeds;
    }
};

class FakeStatus : public StatusReporter {
public:
    std::vector<AppState> states;
    std::vector<std::string> messages;
    std::vector<std::string> transcripts;
    int permission_prompts = 0;
    bool paste_ready = false;

    void update_state(AppState state) override { states.push_back(state); }
    void show_message(const std::string& message) override { messages.push_back(message); }
    void show_paste_ready() override { paste_ready = true; }
    void clear_paste_ready() override { paste_ready = false; }
    void show_transcript(const std::string& text) override { transcripts.push_back(text); }
    void show_permissions(bool, bool, bool) override { ++permission_prompts; }
};

struct Harness {
    std::string saved_tmpdir;
    ScratchDir dir;
    ManualDispatcher dispatcher;
    FakeKeyboardTap tap;
    FakePermissions permissions;
    FakeAudio audio;
    FakeEngine engine;
    FakePaste paste;
    FakeStatus status;
    Config config;
    std::unique_ptr<App> app;

    explicit Harness(const std::string& name, Config base = Config())
        : saved_tmpdir(std::getenv("TMPDIR") ? std::getenv("TMPDIR") : "")
        , dir(name)
        , config(std::move(base)) {
        // Recordings land in the scratch directory
        setenv("TMPDIR", dir.path().c_str(), 1);
        config.model_path = dir.file("model.bin");

        AppServices services{audio, tap, permissions, engine, paste, status, dispatcher};
        app = std::make_unique<App>(config, services);
    }

    ~Harness() {
        app.reset();
        if (saved_tmpdir.empty()) {
            unsetenv("TMPDIR");
        } else {
            setenv("TMPDIR", saved_tmpdir.c_str(), 1);
        }
    }

    // One toggle session with some audio, run to completion
    void dictate() {
        app->toggle_dictation();
        assert(app->state() == AppState::Recording);
        audio.speak(4410);
        app->toggle_dictation();
        finish_background();
    }

    void finish_background() {
        app->wait_for_background();
        dispatcher.run_pending();
    }

    bool saw_message(const std::string& message) const {
        for (const auto& m : status.messages) {
            if (m == message) return true;
        }
        return false;
    }
};

} // namespace

void test_toggle_hotkey_flow() {
    std::cout << "Testing toggle hotkey flow..." << std::endl;

    Harness h("app_toggle");
    assert(h.app->start());
    assert(h.app->hotkeys().state() == TapState::Active);

    const uint32_t chord = MOD_CONTROL | MOD_ALT;
    h.tap.key_down(KEY_SPACE, chord);
    h.dispatcher.run_pending();
    assert(h.app->state() == AppState::Recording);
    assert(h.app->recording_mode() == RecordingMode::Toggle);
    h.tap.key_up(KEY_SPACE, chord);

    h.audio.speak(4410);

    h.tap.key_down(KEY_SPACE, chord);
    h.dispatcher.run_pending();
    assert(h.app->state() == AppState::Transcribing);
    h.tap.key_up(KEY_SPACE, chord);

    h.finish_background();
    assert(h.app->state() == AppState::Idle);
    assert(h.engine.calls == 1);
    assert(h.engine.last_model == h.config.model_path);
    assert(h.app->last_transcript() == "hello from the test");
    assert(h.app->is_paste_ready());
    assert(h.status.paste_ready);
    assert(h.status.transcripts.size() == 1);

    // States seen: Recording, Transcribing, Idle
    assert(h.status.states.size() == 3);
    assert(h.status.states[0] == AppState::Recording);
    assert(h.status.states[1] == AppState::Transcribing);
    assert(h.status.states[2] == AppState::Idle);

    // Recording kept for retry, converted copy removed
    assert(h.dir.count_with_prefix("dictate_recording_") == 1);
    assert(h.dir.count_with_prefix("dictate_resampled_") == 0);

    // User pastes manually with Ctrl+V
    h.tap.key_down(KEY_V, MOD_CONTROL);
    h.dispatcher.run_pending();
    assert(!h.app->is_paste_ready());
    assert(!h.status.paste_ready);
    assert(h.paste.pasted.empty());

    std::cout << "  PASS: Record, transcribe, paste-ready, cleared by Ctrl+V" << std::endl;
}

void test_paste_hotkey() {
    std::cout << "Testing paste hotkey..." << std::endl;

    Harness h("app_paste");
    assert(h.app->start());

    // Nothing to paste yet
    h.app->on_paste();
    assert(h.saw_message("No transcript"));
    assert(h.paste.pasted.empty());

    h.dictate();
    assert(h.app->is_paste_ready());

    h.tap.key_down(KEY_V, MOD_CONTROL | MOD_ALT);
    h.dispatcher.run_pending();
    assert(h.paste.pasted.size() == 1);
    assert(h.paste.pasted[0] == "hello from the test");
    assert(!h.app->is_paste_ready());

    // Permission missing: prompt instead of pasting
    h.permissions.paste = false;
    int prompts = h.status.permission_prompts;
    h.app->paste_last_transcript();
    assert(h.paste.pasted.size() == 1);
    assert(h.status.permission_prompts == prompts + 1);

    // Failed paste is reported
    h.permissions.paste = true;
    h.paste.paste_succeeds = false;
    h.app->paste_last_transcript();
    assert(h.saw_message("Paste failed"));

    std::cout << "  PASS: Paste delivered and gated" << std::endl;
}

void test_hold_to_talk() {
    std::cout << "Testing hold to talk..." << std::endl;

    Harness h("app_hold");
    assert(h.app->start());

    h.app->on_hold_start();
    assert(h.app->recording_mode() == RecordingMode::Hold);
    h.audio.speak(4410);
    h.app->on_hold_end();
    assert(h.app->state() == AppState::Transcribing);
    h.finish_background();
    assert(h.app->state() == AppState::Idle);
    assert(h.engine.calls == 1);

    // Hold release does not end a toggle session
    h.app->toggle_dictation();
    h.app->on_hold_end();
    assert(h.app->state() == AppState::Recording);
    assert(h.app->recording_mode() == RecordingMode::Toggle);

    // Hold press during a toggle session changes nothing
    h.app->on_hold_start();
    assert(h.app->recording_mode() == RecordingMode::Toggle);

    h.audio.speak(100);
    h.app->toggle_dictation();
    h.finish_background();
    assert(h.engine.calls == 2);

    std::cout << "  PASS: Hold end only stops hold sessions" << std::endl;
}

void test_microphone_denied() {
    std::cout << "Testing microphone permission denied..." << std::endl;

    Harness h("app_denied");
    h.permissions.microphone = false;

    h.app->toggle_dictation();
    assert(h.app->state() == AppState::Idle);
    assert(h.app->recording_mode() == RecordingMode::None);
    assert(h.status.permission_prompts == 1);
    assert(h.dir.count_with_prefix("dictate_recording_") == 0);

    std::cout << "  PASS: No capture without permission" << std::endl;
}

void test_device_failure() {
    std::cout << "Testing device open failure..." << std::endl;

    Harness h("app_device");
    h.audio.open_succeeds = false;

    h.app->toggle_dictation();
    assert(h.app->state() == AppState::Idle);
    assert(h.saw_message("Failed to start recording"));
    assert(h.dir.count_with_prefix("dictate_recording_") == 0);

    std::cout << "  PASS: Reported, nothing left behind" << std::endl;
}

void test_transcription_failure() {
    std::cout << "Testing transcription failure..." << std::endl;

    Harness h("app_failure");
    h.engine.next = TranscriptionResult();
    h.engine.next.error = ErrorKind::ProcessFailed;
    h.engine.next.diagnostic = "segfault";

    h.dictate();
    assert(h.app->state() == AppState::Idle);
    assert(h.saw_message("Whisper process failed"));
    assert(!h.app->is_paste_ready());
    assert(h.app->last_transcript().empty());

    // Empty recordings never reach the engine
    h.app->toggle_dictation();
    h.app->toggle_dictation();
    h.finish_background();
    assert(h.engine.calls == 1);
    assert(h.saw_message("No transcript produced"));

    std::cout << "  PASS: Error shown, state back to Idle" << std::endl;
}

void test_blank_transcript() {
    std::cout << "Testing blank transcript..." << std::endl;

    Harness h("app_blank");
    h.engine.next.text = "   ";

    h.dictate();
    assert(h.app->state() == AppState::Idle);
    assert(!h.app->is_paste_ready());

    std::cout << "  PASS: Whitespace is not paste-ready" << std::endl;
}

void test_retry_and_clear() {
    std::cout << "Testing retry and clear..." << std::endl;

    Harness h("app_retry");

    h.app->retry_transcription();
    assert(h.saw_message("No audio to retry"));

    h.dictate();
    std::string audio = h.app->last_audio_path();
    assert(!audio.empty());

    h.engine.next.text = "second attempt";
    h.app->retry_transcription();
    h.finish_background();
    assert(h.engine.calls == 2);
    assert(h.app->last_transcript() == "second attempt");
    assert(h.app->last_audio_path() == audio);

    // A new recording replaces the old one on disk
    h.dictate();
    assert(h.app->last_audio_path() != audio);
    assert(h.dir.count_with_prefix("dictate_recording_") == 1);

    h.app->clear_transcript();
    assert(h.app->last_transcript().empty());
    assert(h.app->last_audio_path().empty());
    assert(!h.app->is_paste_ready());
    assert(h.dir.count_with_prefix("dictate_recording_") == 0);

    std::cout << "  PASS: Retry reuses the recording" << std::endl;
}

void test_back_to_back_sessions() {
    std::cout << "Testing sessions queued behind a busy engine..." << std::endl;

    Harness h("app_queued");
    h.engine.hold();

    for (int session = 0; session < 3; ++session) {
        h.app->toggle_dictation();
        assert(h.app->state() == AppState::Recording);
        h.audio.speak(4410);
        h.app->toggle_dictation();
        assert(h.app->state() == AppState::Transcribing);
    }
    // Queued captures stay on disk until their job runs
    assert(h.dir.count_with_prefix("dictate_recording_") == 3);

    h.engine.release();
    h.app->wait_for_background();
    assert(h.engine.calls == 3);

    h.dispatcher.run_pending();
    assert(!h.saw_message("Audio conversion failed"));
    assert(h.status.messages.empty());
    assert(h.app->state() == AppState::Idle);
    assert(h.app->last_transcript() == "hello from the test");
    assert(h.dir.count_with_prefix("dictate_recording_") == 1);

    std::cout << "  PASS: Every queued recording transcribed" << std::endl;
}

void test_auto_copy_and_paste() {
    std::cout << "Testing auto copy and paste..." << std::endl;

    Config config;
    config.auto_copy = true;
    config.auto_paste = true;
    Harness h("app_auto", config);

    h.dictate();
    assert(h.paste.copied.size() == 1);
    assert(h.paste.copied[0] == "hello from the test");
    assert(h.paste.pasted.size() == 1);
    assert(!h.app->is_paste_ready());

    h.app->copy_last_transcript();
    assert(h.paste.copied.size() == 2);

    std::cout << "  PASS: Transcript copied and pasted on arrival" << std::endl;
}

void test_screenshot_and_permissions() {
    std::cout << "Testing screenshot and permission recheck..." << std::endl;

    Harness h("app_misc");
    h.tap.trusted = false;
    h.permissions.input = false;
    assert(!h.app->start());
    assert(h.app->hotkeys().state() == TapState::Disabled);
    assert(h.status.permission_prompts == 1);

    // Access granted later
    h.tap.trusted = true;
    h.permissions.input = true;
    h.app->recheck_permissions();
    assert(h.app->hotkeys().state() == TapState::Active);

    h.app->on_screenshot();
    assert(h.saw_message("Screenshots are not supported on this platform"));

    std::cout << "  PASS: Listener reinstalled once allowed" << std::endl;
}

void test_stop_discards_recording() {
    std::cout << "Testing stop while recording..." << std::endl;

    Harness h("app_stop");
    h.app->toggle_dictation();
    h.audio.speak(100);
    h.app->stop();
    assert(h.app->state() == AppState::Idle);
    assert(h.engine.calls == 0);
    assert(h.dir.count_with_prefix("dictate_recording_") == 0);

    std::cout << "  PASS: Unfinished recording removed" << std::endl;
}

int main() {
    std::cout << "\n=== App Test Suite ===" << std::endl << std::endl;

    test_toggle_hotkey_flow();
    test_paste_hotkey();
    test_hold_to_talk();
    test_microphone_denied();
    test_device_failure();
    test_transcription_failure();
    test_blank_transcript();
    test_retry_and_clear();
    test_back_to_back_sessions();
    test_auto_copy_and_paste();
    test_screenshot_and_permissions();
    test_stop_discards_recording();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
