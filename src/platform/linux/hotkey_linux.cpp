#include "keyboard_tap.hpp"
#include "hotkey.hpp"
#include <iostream>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <filesystem>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <linux/input.h>
#include <sys/select.h>
#include <libevdev/libevdev.h>

namespace dictate {

namespace {

constexpr const char* INPUT_DIR = "/dev/input";

uint32_t modifier_for_key(unsigned int code) {
    switch (code) {
        case KEY_LEFTCTRL:
        case KEY_RIGHTCTRL:
            return MOD_CONTROL;
        case KEY_LEFTALT:
        case KEY_RIGHTALT:
            return MOD_ALT;
        case KEY_LEFTSHIFT:
        case KEY_RIGHTSHIFT:
            return MOD_SHIFT;
        case KEY_LEFTMETA:
        case KEY_RIGHTMETA:
            return MOD_META;
        case KEY_FN:
            return MOD_FUNCTION;
        default:
            return 0;
    }
}

std::vector<std::string> event_device_paths() {
    std::vector<std::string> paths;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(INPUT_DIR, ec)) {
        std::string name = entry.path().filename().string();
        if (name.rfind("event", 0) == 0) {
            paths.push_back(entry.path().string());
        }
    }
    if (ec) {
        std::cerr << "[hotkeys] Cannot list " << INPUT_DIR << ": " << ec.message() << std::endl;
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

struct EvdevDevice {
    int fd = -1;
    struct libevdev* dev = nullptr;
    std::string path;
    std::string name;
};

class EvdevKeyboardTap : public KeyboardTap {
public:
    ~EvdevKeyboardTap() override {
        uninstall();
    }

    bool is_trusted() const override {
        for (const auto& path : event_device_paths()) {
            if (access(path.c_str(), R_OK) == 0) return true;
        }
        return false;
    }

    bool install(EventHandler handler) override {
        if (running_.load()) return true;
        if (listener_thread_.joinable()) {
            // Previous loop ended on its own after losing every device
            listener_thread_.join();
            close_keyboards();
        }

        open_keyboards();
        if (devices_.empty()) {
            std::cerr << "[hotkeys] No readable keyboard device under " << INPUT_DIR << std::endl;
            return false;
        }

        handler_ = std::move(handler);
        held_.clear();
        running_.store(true);

        listener_thread_ = std::thread([this]() {
            run_loop();
        });
        return true;
    }

    void uninstall() override {
        if (running_.load()) {
            running_.store(false);
        }
        if (listener_thread_.joinable()) {
            listener_thread_.join();
        }
        close_keyboards();
    }

    bool is_installed() const override {
        return running_.load();
    }

    std::string device_name() const override {
        std::lock_guard<std::mutex> lock(names_mutex_);
        return names_;
    }

private:
    void open_keyboards() {
        for (const auto& path : event_device_paths()) {
            int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
            if (fd < 0) continue;

            struct libevdev* dev = nullptr;
            int rc = libevdev_new_from_fd(fd, &dev);
            if (rc < 0) {
                close(fd);
                continue;
            }

            // Only devices that look like a real keyboard
            if (libevdev_has_event_type(dev, EV_KEY) &&
                libevdev_has_event_code(dev, EV_KEY, KEY_A) &&
                libevdev_has_event_code(dev, EV_KEY, KEY_SPACE)) {
                EvdevDevice device;
                device.fd = fd;
                device.dev = dev;
                device.path = path;
                const char* name = libevdev_get_name(dev);
                device.name = name ? name : path;
                std::cout << "[hotkeys] Using keyboard: " << device.name << " (" << path << ")" << std::endl;
                devices_.push_back(device);
            } else {
                libevdev_free(dev);
                close(fd);
            }
        }

        std::lock_guard<std::mutex> lock(names_mutex_);
        names_.clear();
        for (const auto& device : devices_) {
            if (!names_.empty()) names_ += ", ";
            names_ += device.name;
        }
    }

    void close_keyboards() {
        for (auto& device : devices_) {
            if (device.dev) libevdev_free(device.dev);
            if (device.fd >= 0) close(device.fd);
        }
        devices_.clear();
    }

    uint32_t current_flags() const {
        uint32_t flags = 0;
        for (unsigned int code : held_) {
            flags |= modifier_for_key(code);
        }
        return flags;
    }

    void dispatch(const struct input_event& ev) {
        if (ev.type != EV_KEY) return;

        uint32_t modifier = modifier_for_key(ev.code);
        if (modifier != 0) {
            if (ev.value == 2) return;  // modifier autorepeat carries no change
            if (ev.value == 1) {
                if (std::find(held_.begin(), held_.end(), ev.code) == held_.end()) {
                    held_.push_back(ev.code);
                }
            } else {
                held_.erase(std::remove(held_.begin(), held_.end(), ev.code), held_.end());
            }

            KeyboardEvent event;
            event.type = KeyboardEvent::Type::FlagsChanged;
            event.key_code = ev.code;
            event.flags = current_flags();
            handler_(event);
            return;
        }

        KeyboardEvent event;
        event.type = ev.value == 0 ? KeyboardEvent::Type::KeyUp : KeyboardEvent::Type::KeyDown;
        event.key_code = ev.code;
        event.flags = current_flags();
        handler_(event);
    }

    // Returns false when the device is gone
    bool drain(EvdevDevice& device) {
        struct input_event ev;
        int rc;
        do {
            rc = libevdev_next_event(device.dev, LIBEVDEV_READ_FLAG_NORMAL, &ev);
            if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                // Dropped events: replay the kernel's resync so held keys stay correct
                while (rc == LIBEVDEV_READ_STATUS_SYNC) {
                    dispatch(ev);
                    rc = libevdev_next_event(device.dev, LIBEVDEV_READ_FLAG_SYNC, &ev);
                }
            } else if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
                dispatch(ev);
            }
        } while (rc == LIBEVDEV_READ_STATUS_SUCCESS || rc == LIBEVDEV_READ_STATUS_SYNC);

        if (rc == -ENODEV) {
            std::cerr << "[hotkeys] Keyboard disconnected: " << device.name << std::endl;
            return false;
        }
        if (rc != -EAGAIN) {
            std::cerr << "[hotkeys] Failed to read " << device.path << ": " << std::strerror(-rc) << std::endl;
        }
        return true;
    }

    void run_loop() {
        while (running_.load()) {
            if (devices_.empty()) {
                std::cerr << "[hotkeys] No keyboard left; hotkeys are inactive" << std::endl;
                running_.store(false);
                return;
            }

            fd_set fds;
            FD_ZERO(&fds);
            int max_fd = -1;
            for (const auto& device : devices_) {
                FD_SET(device.fd, &fds);
                max_fd = std::max(max_fd, device.fd);
            }

            struct timeval tv;
            tv.tv_sec = 0;
            tv.tv_usec = 100000; // 100ms timeout

            int ret = select(max_fd + 1, &fds, nullptr, nullptr, &tv);
            if (ret <= 0) continue;

            for (auto it = devices_.begin(); it != devices_.end();) {
                if (FD_ISSET(it->fd, &fds) && !drain(*it)) {
                    libevdev_free(it->dev);
                    close(it->fd);
                    it = devices_.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }

    EventHandler handler_;
    std::vector<EvdevDevice> devices_;
    std::vector<unsigned int> held_;

    mutable std::mutex names_mutex_;
    std::string names_;

    std::atomic<bool> running_{false};
    std::thread listener_thread_;
};

} // namespace

std::unique_ptr<KeyboardTap> create_keyboard_tap() {
    return std::make_unique<EvdevKeyboardTap>();
}

} // namespace dictate
