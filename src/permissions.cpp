#include "permissions.hpp"
#include "audio_device.hpp"
#include "keyboard_tap.hpp"
#include "clipboard.hpp"

namespace dictate {

SystemPermissions::SystemPermissions(AudioBackend& backend, KeyboardTap& tap)
    : backend_(backend)
    , tap_(tap) {
}

bool SystemPermissions::microphone_authorized() {
    // There is no consent prompt on Linux: access means the sound server
    // answered and exposed at least one capture device.
    if (!backend_.initialize()) return false;
    return !backend_.input_devices().empty();
}

bool SystemPermissions::input_access_granted() {
    return tap_.is_trusted();
}

bool SystemPermissions::paste_access_granted() {
    return Clipboard::can_synthesize_input();
}

} // namespace dictate
