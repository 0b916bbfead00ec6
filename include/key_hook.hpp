#pragma once

#include <functional>
#include <string>

namespace voxkey {

// Global keyboard hook capability.
// Callbacks are delivered on the hook's own thread. Key names follow the
// hotkey token format ("ctrl", "win", "left windows", "r", "f5", ...).
// Registration methods return false (or throw) when the hook rejects them.
class KeyHook {
public:
    using Callback = std::function<void()>;

    virtual ~KeyHook() = default;

    // Fires when every key of the combination is down
    virtual bool add_hotkey(const std::string& hotkey, Callback on_press) = 0;

    // Fires whenever the given key goes up
    virtual bool on_release_key(const std::string& key, Callback on_release) = 0;

    // Removes every hotkey and release handler. Waits for callbacks that
    // are already running, so none of them is still executing on return.
    // A callback must not block on a lock held by the unhook_all() caller.
    virtual bool unhook_all() = 0;

    virtual bool is_pressed(const std::string& key) const = 0;
};

} // namespace voxkey
