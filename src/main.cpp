#include "app.hpp"
#include "config.hpp"
#include "settings_store.hpp"
#include <iostream>
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <csignal>
#include <cstring>
#include <cstdlib>

#include <poll.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_quit(false);
std::atomic<bool> g_toggle(false);
std::atomic<bool> g_reload(false);

static_assert(std::atomic<bool>::is_always_lock_free,
              "std::atomic<bool> must be lock-free for signal handler safety");

constexpr std::chrono::milliseconds POLL_INTERVAL{100};

void signal_handler(int /*signum*/) {
    g_quit = true;
}

void sigusr1_handler(int /*signum*/) {
    g_toggle = true;
}

void sighup_handler(int /*signum*/) {
    g_reload = true;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -m, --model PATH      Whisper model (default: ~/.dictate/models/ggml-base.en.bin)\n"
              << "  -w, --whisper PATH    whisper-cli executable (default: search next to dictate, then PATH)\n"
              << "  -d, --device UID      Input device UID from --list-devices, or 'system'\n"
              << "  -c, --channel N       Input channel, 1-based; 0 picks the loudest (default: 0)\n"
              << "  --paste-mode MODE     ctrlV, shiftInsert or type (default: ctrlV)\n"
              << "  --auto-paste          Paste each transcript as soon as it is ready\n"
              << "  --no-paste            Never paste automatically\n"
              << "  --list-devices        Print input devices and exit\n"
              << "  --settings PATH       Settings file (default: ~/.dictate/settings.conf)\n"
              << "  --save-settings       Write the effective settings to the settings file\n"
              << "  -h, --help            Show this help\n"
              << "\nConsole commands (type and press Enter):\n"
              << "  t  toggle dictation     p  paste last transcript\n"
              << "  c  copy last transcript r  retry last recording\n"
              << "  x  clear transcript     s  permission status\n"
              << "  q  quit\n"
              << "\nSignals:\n"
              << "  SIGUSR1  toggle dictation\n"
              << "  SIGHUP   reload settings and re-check permissions\n"
              << "\nFirst run:\n"
              << "  Download a model: curl -L -o ~/.dictate/models/ggml-base.en.bin \\\n"
              << "    https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.en.bin\n"
              << "  Hotkeys need read access to /dev/input: sudo usermod -aG input $USER\n"
              << std::endl;
}

int list_devices() {
    auto backend = dictate::create_portaudio_backend();
    if (!backend->initialize()) {
        std::cerr << "Failed to initialize audio" << std::endl;
        return 1;
    }

    int default_device = backend->default_input_device();
    auto devices = backend->input_devices();
    if (devices.empty()) {
        std::cout << "No input devices found" << std::endl;
        return 0;
    }

    std::cout << "Input devices:" << std::endl;
    for (const auto& device : devices) {
        std::cout << "  " << (device.index == default_device ? "* " : "  ") << device.name << "\n"
                  << "      uid: " << device.uid << "\n"
                  << "      channels: " << device.input_channels
                  << ", rate: " << device.default_sample_rate
                  << (device.built_in ? ", built-in" : "") << std::endl;
    }
    return 0;
}

// Console commands arrive on stdin; read whatever is there without blocking
void poll_console(dictate::App& app, std::string& pending) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    if (poll(&pfd, 1, 0) <= 0 || !(pfd.revents & (POLLIN | POLLHUP))) return;

    char buffer[256];
    ssize_t n = read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n <= 0) return;
    pending.append(buffer, static_cast<size_t>(n));

    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
        std::string command = dictate::trim(pending.substr(0, newline));
        pending.erase(0, newline + 1);

        if (command == "t") app.toggle_dictation();
        else if (command == "p") app.paste_last_transcript();
        else if (command == "c") app.copy_last_transcript();
        else if (command == "r") app.retry_transcription();
        else if (command == "x") app.clear_transcript();
        else if (command == "s") app.recheck_permissions();
        else if (command == "q") g_quit = true;
        else if (!command.empty()) std::cout << "Unknown command: " << command << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string settings_path = dictate::default_settings_path();
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--settings") == 0 && i + 1 < argc) {
            settings_path = argv[i + 1];
        }
    }

    dictate::SettingsStore settings(settings_path);
    dictate::SettingsStore::Overrides overrides;
    bool save_settings = false;

    // Command-line flags are kept as settings so they also win after a reload
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if (strcmp(argv[i], "--list-devices") == 0) {
            return list_devices();
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model") == 0) && i + 1 < argc) {
            overrides.emplace_back("model_path", argv[++i]);
        }
        else if ((strcmp(argv[i], "-w") == 0 || strcmp(argv[i], "--whisper") == 0) && i + 1 < argc) {
            overrides.emplace_back("whisper_path", argv[++i]);
        }
        else if ((strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--device") == 0) && i + 1 < argc) {
            overrides.emplace_back("input_device", argv[++i]);
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--channel") == 0) && i + 1 < argc) {
            overrides.emplace_back("input_channel", argv[++i]);
        }
        else if (strcmp(argv[i], "--paste-mode") == 0 && i + 1 < argc) {
            overrides.emplace_back("paste_mode", argv[++i]);
        }
        else if (strcmp(argv[i], "--auto-paste") == 0) {
            overrides.emplace_back("auto_paste", "true");
        }
        else if (strcmp(argv[i], "--no-paste") == 0) {
            overrides.emplace_back("auto_paste", "false");
        }
        else if (strcmp(argv[i], "--settings") == 0 && i + 1 < argc) {
            ++i;  // handled above
        }
        else if (strcmp(argv[i], "--save-settings") == 0) {
            save_settings = true;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    dictate::Config config;
    if (!settings.reload(config, overrides)) {
        print_usage(argv[0]);
        return 1;
    }

    if (save_settings) {
        if (!settings.save(config)) return 1;
        std::cout << "Settings written to " << settings.path() << std::endl;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGUSR1, sigusr1_handler);
    signal(SIGHUP, sighup_handler);

    dictate::MainDispatcher dispatcher;

    auto audio = dictate::create_portaudio_backend();
    auto keyboard = dictate::create_keyboard_tap();
    dictate::SystemPermissions permissions(*audio, *keyboard);
    dictate::SystemProcessRunner runner;
    dictate::InstallResourceLocator locator(config.whisper_path);
    dictate::WhisperCliTranscriber engine(runner, locator);
    dictate::PasteManager paste(dispatcher);
    dictate::ConsoleStatusReporter status;

    dictate::App app(config, dictate::AppServices{
        *audio, *keyboard, permissions, engine, paste, status, dispatcher,
    });

    // Signal flags and console input are serviced on the main loop
    std::string console_pending;
    std::function<void()> poll_events;
    poll_events = [&]() {
        if (g_quit.exchange(false)) {
            std::cout << "\nShutting down..." << std::endl;
            dispatcher.quit();
            return;
        }
        if (g_toggle.exchange(false)) {
            app.toggle_dictation();
        }
        if (g_reload.exchange(false)) {
            dictate::Config reloaded;
            if (settings.reload(reloaded, overrides)) {
                locator.set_override_path(reloaded.whisper_path);
                app.update_config(reloaded);
                std::cout << "[dictate] Settings reloaded from " << settings.path() << std::endl;
            }
            app.recheck_permissions();
        }
        poll_console(app, console_pending);
        dispatcher.post_after(POLL_INTERVAL, poll_events);
    };
    dispatcher.post_after(POLL_INTERVAL, poll_events);

    int result = app.run(dispatcher);
    audio->shutdown();
    return result;
}
