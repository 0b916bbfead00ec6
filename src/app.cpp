#include "app.hpp"
#include <iostream>
#include <thread>
#include <chrono>

namespace voxkey {

App::App() = default;

App::~App() {
    shutdown();
}

bool App::initialize(const Config& config) {
    config_ = config;

    hook_ = std::make_unique<EvdevKeyHook>();
    if (!hook_->initialize(config_.device_path)) {
        std::cerr << "Failed to initialize keyboard hook" << std::endl;
        return false;
    }

    scheduler_ = std::make_unique<ThreadScheduler>();

    hotkeys_ = std::make_unique<HotkeyManager>(
        *hook_,
        *scheduler_,
        std::chrono::seconds(config_.max_recording_seconds)
    );

    HotkeyUpdate update;
    update.hold_hotkey = config_.hotkeys.hold_hotkey;
    update.hold_enabled = config_.hotkeys.hold_enabled;
    update.toggle_hotkey = config_.hotkeys.toggle_hotkey;
    update.toggle_enabled = config_.hotkeys.toggle_enabled;
    hotkeys_->configure(update);

    hotkeys_->set_callbacks([this]() { on_activate(); },
                            [this]() { on_deactivate(); });
    std::cout << "Hotkey manager initialized" << std::endl;

    state_.store(AppState::Idle);
    return true;
}

void App::shutdown() {
    should_quit_.store(true);

    // No more key events, then no more timers
    if (hook_) {
        hook_->stop();
    }
    if (hotkeys_) {
        hotkeys_->stop();
    }
    if (scheduler_) {
        scheduler_->stop();
    }
    // The manager holds a reference to the scheduler
    hotkeys_.reset();
    scheduler_.reset();

    if (hook_) {
        hook_->shutdown();
        hook_.reset();
    }
}

int App::run() {
    if (!hook_ || !hotkeys_) {
        std::cerr << "Application not initialized" << std::endl;
        return 1;
    }

    if (!hook_->start()) {
        std::cerr << "Failed to start hotkey listener" << std::endl;
        return 1;
    }
    hotkeys_->start();

    HotkeyConfig hotkeys = hotkeys_->config();
    std::cout << "\n=== voxkey Ready ===" << std::endl;
    if (hotkeys.hold_enabled) {
        std::cout << "Hold " << hotkeys.hold_hotkey << " to record, release to stop." << std::endl;
    }
    if (hotkeys.toggle_enabled) {
        std::cout << "Press " << hotkeys.toggle_hotkey << " to start or stop recording." << std::endl;
    }
    std::cout << "Recordings stop automatically after " << config_.max_recording_seconds
              << "s.\n" << std::endl;

    while (!should_quit_.load()) {
        if (!hook_->is_running()) {
            std::cerr << "Hotkey listener stopped unexpectedly" << std::endl;
            return 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    return 0;
}

void App::on_activate() {
    state_.store(AppState::Recording);
    auto mode = hotkeys_->active_mode();
    print_status(AppState::Recording, mode ? mode->c_str() : nullptr);
}

void App::on_deactivate() {
    state_.store(AppState::Idle);
    print_status(AppState::Idle);
}

void print_status(AppState state, const char* mode) {
    switch (state) {
        case AppState::Idle:
            std::cout << "[voxkey] Ready" << std::endl;
            break;
        case AppState::Recording:
            std::cout << "[voxkey] Recording";
            if (mode) std::cout << " (" << mode << ")";
            std::cout << "..." << std::endl;
            break;
    }
}

} // namespace voxkey
