#include "hotkey_manager.hpp"
#include "hotkey_spec.hpp"
#include <iostream>
#include <exception>
#include <utility>

namespace voxkey {

HotkeyManager::HotkeyManager(KeyHook& hook, Scheduler& scheduler,
                             std::chrono::milliseconds max_recording)
    : hook_(hook)
    , state_(scheduler, max_recording) {
}

HotkeyManager::~HotkeyManager() {
    stop();
}

void HotkeyManager::set_callbacks(Callback on_activate, Callback on_deactivate) {
    state_.set_callbacks(std::move(on_activate), std::move(on_deactivate));
}

bool HotkeyManager::configure(const HotkeyUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Normalize hotkeys before storing to keep a consistent format
    HotkeyConfig next = config_;
    if (update.hold_hotkey) next.hold_hotkey = normalize_hotkey(*update.hold_hotkey);
    if (update.hold_enabled) next.hold_enabled = *update.hold_enabled;
    if (update.toggle_hotkey) next.toggle_hotkey = normalize_hotkey(*update.toggle_hotkey);
    if (update.toggle_enabled) next.toggle_enabled = *update.toggle_enabled;

    bool needs_restart = next != config_;
    if (!needs_restart) return false;

    if (running_.load()) {
        std::cout << "Hotkey configuration changed, re-registering hotkeys" << std::endl;
        // Tear down fully, swap, rebuild. The reset also drops any live
        // safety timer from the old configuration.
        unregister_hotkeys();
        state_.reset();
        config_ = next;
        register_hotkeys();
    } else {
        config_ = next;
    }
    return true;
}

void HotkeyManager::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load()) return;

    running_.store(true);
    register_hotkeys();
}

void HotkeyManager::stop() {
    std::lock_guard<std::mutex> lock(mutex_);

    running_.store(false);
    unregister_hotkeys();
    state_.reset();
}

void HotkeyManager::force_deactivate() {
    state_.force_deactivate();
}

std::optional<std::string> HotkeyManager::active_mode() const {
    RecordingMode mode = state_.mode();
    if (mode == RecordingMode::None) return std::nullopt;
    return std::string(recording_mode_name(mode));
}

HotkeyConfig HotkeyManager::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void HotkeyManager::register_hotkeys() {
    uint64_t generation = ++generation_;

    if (config_.hold_enabled && !config_.hold_hotkey.empty()) {
        register_hold_hotkey(config_.hold_hotkey, generation);
    }
    if (config_.toggle_enabled && !config_.toggle_hotkey.empty()) {
        register_toggle_hotkey(config_.toggle_hotkey, generation);
    }
}

void HotkeyManager::unregister_hotkeys() {
    // Callbacks still in flight from the old registration become no-ops
    ++generation_;

    try {
        if (!hook_.unhook_all()) {
            std::cerr << "Failed to unregister hotkeys" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to unregister hotkeys: " << e.what() << std::endl;
    }
}

void HotkeyManager::register_hold_hotkey(const std::string& hotkey, uint64_t generation) {
    std::cout << "Registering hold hotkey: " << hotkey << std::endl;

    try {
        bool added = hook_.add_hotkey(hotkey, [this, generation]() {
            if (is_current(generation)) state_.hold_pressed();
        });
        if (!added) {
            std::cerr << "Failed to register hold hotkey: " << hotkey << std::endl;
            return;
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to register hold hotkey: " << hotkey << " (" << e.what() << ")" << std::endl;
        return;
    }

    // Monitor key releases to detect when the user lets go
    std::vector<std::string> keys = hotkey_release_keys(hotkey);
    auto on_release = [this, keys, generation]() {
        check_hold_release(keys, generation);
    };

    for (const auto& key : keys) {
        std::vector<std::string> names = {key};
        if (key == "win") {
            names.insert(names.end(), {"windows", "left windows", "right windows"});
        }

        for (const auto& name : names) {
            try {
                if (!hook_.on_release_key(name, on_release)) {
                    std::cerr << "Failed to register release handler for key: " << name << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "Failed to register release handler for key: " << name
                          << " (" << e.what() << ")" << std::endl;
            }
        }
    }

    std::cout << "Hold hotkey registered successfully: " << hotkey << std::endl;
}

void HotkeyManager::register_toggle_hotkey(const std::string& hotkey, uint64_t generation) {
    std::cout << "Registering toggle hotkey: " << hotkey << std::endl;

    try {
        bool added = hook_.add_hotkey(hotkey, [this, generation]() {
            if (is_current(generation)) state_.toggle_pressed();
        });
        if (!added) {
            std::cerr << "Failed to register toggle hotkey: " << hotkey << std::endl;
            return;
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to register toggle hotkey: " << hotkey << " (" << e.what() << ")" << std::endl;
        return;
    }

    std::cout << "Toggle hotkey registered successfully: " << hotkey << std::endl;
}

void HotkeyManager::check_hold_release(const std::vector<std::string>& keys, uint64_t generation) {
    if (!is_current(generation)) return;
    if (state_.mode() != RecordingMode::Hold) return;

    if (!all_keys_pressed(keys)) {
        state_.hold_released();
    }
}

bool HotkeyManager::all_keys_pressed(const std::vector<std::string>& keys) const {
    try {
        for (const auto& key : keys) {
            if (key == "win") {
                if (!(hook_.is_pressed("win") || hook_.is_pressed("windows"))) return false;
            } else if (!hook_.is_pressed(key)) {
                return false;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Key state query failed: " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool HotkeyManager::is_current(uint64_t generation) const {
    return running_.load() && generation_.load() == generation;
}

} // namespace voxkey
