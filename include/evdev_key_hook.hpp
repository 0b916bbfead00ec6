#pragma once

#include "key_hook.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Forward declare libevdev types
struct libevdev;

namespace voxkey {

struct KeyboardDevice {
    std::string path;
    std::string name;
};

// by-id / by-path link names such as "usb-Logitech_USB_Keyboard-event-kbd"
bool is_keyboard_link_name(const std::string& filename);

// Keyboard-like evdev nodes (by-id, by-path, then event*)
std::vector<KeyboardDevice> list_keyboard_devices(std::string* error_message = nullptr);

// Evdev key codes a key name stands for, e.g. "ctrl" -> left and right ctrl.
// Empty if the name is unknown.
std::vector<unsigned int> key_codes_for_name(const std::string& key);

// KeyHook backed by a single evdev keyboard device (needs read access
// to /dev/input, usually via the "input" group)
class EvdevKeyHook : public KeyHook {
public:
    EvdevKeyHook();
    ~EvdevKeyHook() override;

    EvdevKeyHook(const EvdevKeyHook&) = delete;
    EvdevKeyHook& operator=(const EvdevKeyHook&) = delete;

    // Open the device; an empty path auto-detects the first keyboard
    bool initialize(const std::string& device_path = "");
    void shutdown();

    // Start/stop the listener thread
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    const std::string& device_path() const { return device_path_; }

    bool add_hotkey(const std::string& hotkey, Callback on_press) override;
    bool on_release_key(const std::string& key, Callback on_release) override;
    bool unhook_all() override;
    bool is_pressed(const std::string& key) const override;

    // Process one EV_KEY event (value 1 down, 0 up, 2 autorepeat) as if it
    // was read from the device. Handlers run on the calling thread.
    void dispatch_key_event(unsigned int code, int value);

private:
    struct Combination {
        // One entry per token; a token is down if any of its codes is
        std::vector<std::vector<unsigned int>> keys;
        Callback on_press;
    };

    struct ReleaseHandler {
        std::vector<unsigned int> codes;
        Callback on_release;
    };

    void run_loop();
    bool any_down(const std::vector<unsigned int>& codes) const;

    int keyboard_fd_ = -1;
    struct libevdev* dev_ = nullptr;
    std::string device_path_;

    std::atomic<bool> running_{false};
    std::thread listener_thread_;

    // Held for a whole dispatch, callbacks included; unhook_all() takes it
    // so it returns only once running handlers are done. Recursive so a
    // handler may unhook from inside its own dispatch.
    std::recursive_mutex dispatch_mutex_;

    // Guards key state and handlers; never held while callbacks run
    mutable std::mutex mutex_;
    std::vector<bool> key_down_;
    std::vector<Combination> combinations_;
    std::vector<ReleaseHandler> release_handlers_;
};

} // namespace voxkey
