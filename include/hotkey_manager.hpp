#pragma once

#include "config.hpp"
#include "key_hook.hpp"
#include "recording_state.hpp"
#include "scheduler.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voxkey {

// Binds the hold/toggle hotkeys to a KeyHook and drives the recording
// state machine from the key events it delivers.
class HotkeyManager {
public:
    using Callback = std::function<void()>;

    HotkeyManager(KeyHook& hook, Scheduler& scheduler,
                  std::chrono::milliseconds max_recording =
                      std::chrono::seconds(DEFAULT_MAX_RECORDING_SECONDS));
    ~HotkeyManager();

    HotkeyManager(const HotkeyManager&) = delete;
    HotkeyManager& operator=(const HotkeyManager&) = delete;

    // Either callback may be empty
    void set_callbacks(Callback on_activate, Callback on_deactivate);

    // Applies a partial update, re-registering hotkeys if running.
    // Returns true if the effective configuration changed.
    bool configure(const HotkeyUpdate& update);

    // Start/stop listening
    void start();
    void stop();

    void force_deactivate();

    bool is_running() const { return running_.load(); }
    bool is_recording() const { return state_.is_recording(); }

    // "hold", "toggle" or nullopt
    std::optional<std::string> active_mode() const;

    HotkeyConfig config() const;

private:
    void register_hotkeys();
    void unregister_hotkeys();
    void register_hold_hotkey(const std::string& hotkey, uint64_t generation);
    void register_toggle_hotkey(const std::string& hotkey, uint64_t generation);

    void check_hold_release(const std::vector<std::string>& keys, uint64_t generation);
    bool all_keys_pressed(const std::vector<std::string>& keys) const;

    // False once a newer registration cycle (or stop) has happened
    bool is_current(uint64_t generation) const;

    KeyHook& hook_;
    RecordingStateMachine state_;

    // Serializes start/stop/configure; never taken from hook callbacks
    mutable std::mutex mutex_;
    HotkeyConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> generation_{0};
};

} // namespace voxkey
