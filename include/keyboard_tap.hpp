#pragma once

#include <functional>
#include <memory>
#include <string>
#include <cstdint>

namespace dictate {

struct KeyboardEvent {
    enum class Type {
        KeyDown,        // includes autorepeat
        KeyUp,
        FlagsChanged    // a modifier key went up or down
    };

    Type type = Type::KeyDown;
    uint32_t key_code = 0;
    uint32_t flags = 0;     // ModifierFlag bits held after this event
};

// Global low-level keyboard event source. Events are delivered in arrival
// order on a thread owned by the tap.
class KeyboardTap {
public:
    using EventHandler = std::function<void(const KeyboardEvent&)>;

    virtual ~KeyboardTap() = default;

    // Whether the process may observe global input at all
    virtual bool is_trusted() const = 0;

    // Begin delivering events to `handler`. Returns false if the tap
    // could not be created.
    virtual bool install(EventHandler handler) = 0;
    virtual void uninstall() = 0;
    virtual bool is_installed() const = 0;

    // Human-readable name of the device being observed
    virtual std::string device_name() const = 0;
};

// Platform-specific implementation (platform/linux/hotkey_linux.cpp)
std::unique_ptr<KeyboardTap> create_keyboard_tap();

} // namespace dictate
