#pragma once

#include <optional>
#include <string>

namespace voxkey {

// Active hotkey configuration. Hotkeys are stored in canonical form.
struct HotkeyConfig {
    std::string hold_hotkey = "ctrl+win";
    bool hold_enabled = true;
    std::string toggle_hotkey = "ctrl+shift+win";
    bool toggle_enabled = false;

    bool operator==(const HotkeyConfig& other) const {
        return hold_hotkey == other.hold_hotkey && hold_enabled == other.hold_enabled &&
               toggle_hotkey == other.toggle_hotkey && toggle_enabled == other.toggle_enabled;
    }
    bool operator!=(const HotkeyConfig& other) const { return !(*this == other); }
};

// Partial update for HotkeyManager::configure(); unset fields are kept
struct HotkeyUpdate {
    std::optional<std::string> hold_hotkey;
    std::optional<bool> hold_enabled;
    std::optional<std::string> toggle_hotkey;
    std::optional<bool> toggle_enabled;
};

struct Config {
    HotkeyConfig hotkeys;

    // Keyboard evdev node; empty means auto-detect
    std::string device_path;

    // Safety cap on any single recording
    int max_recording_seconds = 60;

    bool list_devices = false;
};

} // namespace voxkey
