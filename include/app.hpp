#pragma once

#include "config.hpp"
#include "evdev_key_hook.hpp"
#include "hotkey_manager.hpp"
#include "scheduler.hpp"

#include <memory>
#include <atomic>

namespace voxkey {

enum class AppState {
    Idle,
    Recording
};

class App {
public:
    App();
    ~App();

    // Initialize all components
    bool initialize(const Config& config);
    void shutdown();

    // Run the application (blocking)
    int run();

    // Stop the application
    void quit() { should_quit_.store(true); }

    // Get current state
    AppState state() const { return state_.load(); }

private:
    void on_activate();
    void on_deactivate();

    Config config_;
    std::unique_ptr<ThreadScheduler> scheduler_;
    std::unique_ptr<EvdevKeyHook> hook_;
    std::unique_ptr<HotkeyManager> hotkeys_;

    std::atomic<AppState> state_{AppState::Idle};
    std::atomic<bool> should_quit_{false};
};

// Console status line, e.g. "[voxkey] Recording (hold)..."
void print_status(AppState state, const char* mode = nullptr);

} // namespace voxkey
