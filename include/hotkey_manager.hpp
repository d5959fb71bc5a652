#pragma once

#include "hotkey.hpp"
#include "keyboard_tap.hpp"
#include "dispatcher.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <vector>
#include <chrono>
#include <cstdint>

namespace dictate {

// Receives hotkey actions on the dispatcher's context
class HotkeyListener {
public:
    virtual ~HotkeyListener() = default;

    virtual void on_toggle() = 0;
    virtual void on_hold_start() = 0;
    virtual void on_hold_end() = 0;
    virtual void on_paste() = 0;
    virtual void on_screenshot() = 0;

    // Every real key-down, used to clear the paste-ready indicator
    virtual void on_keystroke(uint32_t key_code, uint32_t flags) = 0;
};

enum class TapState {
    Inactive,
    Active,
    Disabled    // tap could not be installed; waits for restart_if_needed()
};

class HotkeyManager {
public:
    // Settle window separating an intentional Fn tap from Fn chords
    static constexpr std::chrono::milliseconds FN_ONLY_DEBOUNCE{200};

    HotkeyManager(KeyboardTap& tap, Dispatcher& dispatcher);
    ~HotkeyManager();

    HotkeyManager(const HotkeyManager&) = delete;
    HotkeyManager& operator=(const HotkeyManager&) = delete;

    void set_listener(HotkeyListener* listener);

    // Replace all bindings at once
    void set_hotkeys(const HotkeyBindings& bindings);
    void set_hotkey(ActionKind kind, const Hotkey& hotkey);
    HotkeyBindings hotkeys() const;

    // Install the keyboard tap. On failure the manager is Disabled and
    // stays so until restart_if_needed() is called.
    bool start();
    void stop();
    bool restart_if_needed();

    TapState state() const;
    bool is_pressed(ActionKind kind) const;
    bool has_pending_fn_commit() const;

    // Event entry point, called on the tap thread
    void handle_event(const KeyboardEvent& event);

private:
    using Notification = std::function<void(HotkeyListener&)>;

    void handle_key(uint32_t key_code, bool down, uint32_t flags, std::vector<Notification>& out);
    void handle_flags(uint32_t flags, std::vector<Notification>& out);

    void press(ActionKind kind, std::vector<Notification>& out);
    void release(ActionKind kind, std::vector<Notification>& out);

    void schedule_fn_commit();
    void cancel_fn_commit();
    void commit_fn_only(uint64_t generation);
    bool any_function_only() const;

    Notification make_notification(ActionKind kind, bool start) const;
    void deliver(std::vector<Notification>& notifications);

    KeyboardTap& tap_;
    Dispatcher& dispatcher_;
    HotkeyListener* listener_ = nullptr;

    mutable std::mutex mutex_;
    HotkeyBindings bindings_;
    std::set<ActionKind> pressed_;
    TapState state_ = TapState::Inactive;

    bool fn_only_active_ = false;
    bool fn_commit_pending_ = false;
    uint64_t fn_generation_ = 0;

    // Expires with the manager so late timers become no-ops
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

} // namespace dictate
