#include "hotkey_manager.hpp"
#include <iostream>

namespace dictate {

namespace {

constexpr ActionKind MATCH_ORDER[] = {
    ActionKind::Hold,
    ActionKind::Toggle,
    ActionKind::Paste,
    ActionKind::Screenshot,
};

bool fn_only_eligible(uint32_t flags) {
    bool fn_pressed = (flags & MOD_FUNCTION) != 0;
    bool other_modifiers = (flags & (MOD_CONTROL | MOD_ALT | MOD_SHIFT | MOD_META)) != 0;
    return fn_pressed && !other_modifiers;
}

} // namespace

HotkeyManager::HotkeyManager(KeyboardTap& tap, Dispatcher& dispatcher)
    : tap_(tap)
    , dispatcher_(dispatcher) {
}

HotkeyManager::~HotkeyManager() {
    stop();
}

void HotkeyManager::set_listener(HotkeyListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = listener;
}

void HotkeyManager::set_hotkeys(const HotkeyBindings& bindings) {
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (ActionKind kind : MATCH_ORDER) {
            if (bindings_.get(kind) != bindings.get(kind) && pressed_.count(kind)) {
                // The old binding will never see its key-up
                release(kind, notifications);
            }
        }
        bindings_ = bindings;
        cancel_fn_commit();
        fn_only_active_ = false;
    }
    deliver(notifications);
}

void HotkeyManager::set_hotkey(ActionKind kind, const Hotkey& hotkey) {
    HotkeyBindings updated = hotkeys();
    updated.get(kind) = hotkey;
    set_hotkeys(updated);
}

HotkeyBindings HotkeyManager::hotkeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_;
}

TapState HotkeyManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool HotkeyManager::is_pressed(ActionKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pressed_.count(kind) > 0;
}

bool HotkeyManager::has_pending_fn_commit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fn_commit_pending_;
}

bool HotkeyManager::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == TapState::Active) return true;
    }

    if (!tap_.is_trusted()) {
        std::cerr << "[hotkeys] Input monitoring not permitted. Add your user to the 'input' group "
                  << "and restart the session." << std::endl;
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = TapState::Disabled;
        return false;
    }

    bool installed = tap_.install([this](const KeyboardEvent& event) {
        handle_event(event);
    });

    std::lock_guard<std::mutex> lock(mutex_);
    if (!installed) {
        std::cerr << "[hotkeys] Failed to create keyboard tap" << std::endl;
        state_ = TapState::Disabled;
        return false;
    }

    state_ = TapState::Active;
    std::cout << "[hotkeys] Hotkey monitoring enabled (" << tap_.device_name() << ")" << std::endl;
    return true;
}

void HotkeyManager::stop() {
    if (tap_.is_installed()) {
        tap_.uninstall();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cancel_fn_commit();
    fn_only_active_ = false;
    pressed_.clear();
    if (state_ == TapState::Active) {
        state_ = TapState::Inactive;
    }
}

bool HotkeyManager::restart_if_needed() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == TapState::Active) {
            if (tap_.is_installed()) return true;
            std::cerr << "[hotkeys] Keyboard tap was lost, reinstalling" << std::endl;
            state_ = TapState::Inactive;
            pressed_.clear();
            cancel_fn_commit();
            fn_only_active_ = false;
        }
    }
    return start();
}

void HotkeyManager::handle_event(const KeyboardEvent& event) {
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (event.type) {
            case KeyboardEvent::Type::FlagsChanged:
                handle_flags(event.flags, notifications);
                break;
            case KeyboardEvent::Type::KeyDown:
                handle_key(event.key_code, true, event.flags, notifications);
                break;
            case KeyboardEvent::Type::KeyUp:
                handle_key(event.key_code, false, event.flags, notifications);
                break;
        }
    }
    deliver(notifications);
}

void HotkeyManager::handle_key(uint32_t key_code, bool down, uint32_t flags,
                               std::vector<Notification>& out) {
    if (down) {
        // A real key always outranks a pending Fn-only gesture
        cancel_fn_commit();

        out.push_back([key_code, flags](HotkeyListener& listener) {
            listener.on_keystroke(key_code, flags);
        });
    }

    for (ActionKind kind : MATCH_ORDER) {
        const Hotkey& hotkey = bindings_.get(kind);
        if (down) {
            if (!matches(hotkey, key_code, flags)) continue;
            press(kind, out);
            return;
        }

        // Modifiers are often let go before the key itself, so a held
        // action is released by its key code alone
        if (!hotkey.function_only && hotkey.key_code == key_code && pressed_.count(kind)) {
            release(kind, out);
            return;
        }
    }
}

void HotkeyManager::handle_flags(uint32_t flags, std::vector<Notification>& out) {
    bool eligible = fn_only_eligible(flags);
    if (eligible == fn_only_active_) return;
    fn_only_active_ = eligible;

    if (!any_function_only()) return;

    if (eligible) {
        schedule_fn_commit();
        return;
    }

    cancel_fn_commit();
    for (ActionKind kind : MATCH_ORDER) {
        if (bindings_.get(kind).function_only) {
            release(kind, out);
        }
    }
}

void HotkeyManager::press(ActionKind kind, std::vector<Notification>& out) {
    // Autorepeat delivers repeated key-downs; only the first one counts
    if (pressed_.count(kind)) return;
    pressed_.insert(kind);
    out.push_back(make_notification(kind, true));
}

void HotkeyManager::release(ActionKind kind, std::vector<Notification>& out) {
    if (!pressed_.erase(kind)) return;
    if (kind == ActionKind::Hold) {
        out.push_back(make_notification(kind, false));
    }
}

void HotkeyManager::schedule_fn_commit() {
    cancel_fn_commit();
    uint64_t generation = fn_generation_;
    fn_commit_pending_ = true;

    std::weak_ptr<int> alive = lifetime_;
    dispatcher_.post_after(FN_ONLY_DEBOUNCE, [this, alive, generation]() {
        if (alive.expired()) return;
        commit_fn_only(generation);
    });
}

void HotkeyManager::cancel_fn_commit() {
    // Bumping the generation invalidates any timer already in flight
    ++fn_generation_;
    fn_commit_pending_ = false;
}

void HotkeyManager::commit_fn_only(uint64_t generation) {
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != fn_generation_ || !fn_commit_pending_) return;
        fn_commit_pending_ = false;
        if (!fn_only_active_) return;

        for (ActionKind kind : MATCH_ORDER) {
            if (bindings_.get(kind).function_only) {
                press(kind, notifications);
            }
        }
    }
    deliver(notifications);
}

bool HotkeyManager::any_function_only() const {
    for (ActionKind kind : MATCH_ORDER) {
        if (bindings_.get(kind).function_only) return true;
    }
    return false;
}

HotkeyManager::Notification HotkeyManager::make_notification(ActionKind kind, bool start) const {
    switch (kind) {
        case ActionKind::Hold:
            if (start) return [](HotkeyListener& listener) { listener.on_hold_start(); };
            return [](HotkeyListener& listener) { listener.on_hold_end(); };
        case ActionKind::Toggle:
            return [](HotkeyListener& listener) { listener.on_toggle(); };
        case ActionKind::Paste:
            return [](HotkeyListener& listener) { listener.on_paste(); };
        case ActionKind::Screenshot:
            return [](HotkeyListener& listener) { listener.on_screenshot(); };
    }
    return [](HotkeyListener&) {};
}

void HotkeyManager::deliver(std::vector<Notification>& notifications) {
    std::weak_ptr<int> alive = lifetime_;
    for (auto& notification : notifications) {
        // The listener is looked up when the task runs so a detached
        // listener never hears about events queued before it left
        dispatcher_.post([this, alive, notification]() {
            if (alive.expired()) return;
            HotkeyListener* listener = nullptr;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                listener = listener_;
            }
            if (listener) notification(*listener);
        });
    }
    notifications.clear();
}

} // namespace dictate
