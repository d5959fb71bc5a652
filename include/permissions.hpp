#pragma once

namespace dictate {

class AudioBackend;
class KeyboardTap;

// Gates capture, hotkeys and paste. Checks are never bypassed.
class Permissions {
public:
    virtual ~Permissions() = default;

    virtual bool microphone_authorized() = 0;

    // Read access to a keyboard event device
    virtual bool input_access_granted() = 0;

    // An X display with the XTest extension to synthesize keystrokes
    virtual bool paste_access_granted() = 0;
};

class SystemPermissions : public Permissions {
public:
    SystemPermissions(AudioBackend& backend, KeyboardTap& tap);

    bool microphone_authorized() override;
    bool input_access_granted() override;
    bool paste_access_granted() override;

private:
    AudioBackend& backend_;
    KeyboardTap& tap_;
};

} // namespace dictate
