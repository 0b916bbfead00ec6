#include "app.hpp"
#include "config.hpp"
#include "evdev_key_hook.hpp"
#include "hotkey_spec.hpp"
#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>

static voxkey::App* g_app = nullptr;

void signal_handler(int signum) {
    std::cout << "\nReceived signal " << signum << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  --hold KEYS         Hold-to-record hotkey (default: ctrl+win)\n"
              << "  --toggle KEYS       Press-to-toggle hotkey (default: ctrl+shift+win)\n"
              << "  --no-hold           Disable the hold hotkey\n"
              << "  --toggle-on         Enable the toggle hotkey\n"
              << "  -d, --device PATH   Keyboard evdev device (default: auto-detect)\n"
              << "  --max-seconds N     Stop any recording after N seconds (default: 60)\n"
              << "  --list-devices      List keyboard devices and exit\n"
              << "  --check KEYS        Validate a hotkey, print its canonical form and exit\n"
              << "  -h, --help          Show this help\n"
              << "\nHotkeys:\n"
              << "  Keys joined by '+', e.g. ctrl+win or ctrl+alt+r.\n"
              << "  Needs a modifier (ctrl, alt, shift, win) plus another key,\n"
              << "  or at least two modifiers. 'windows' and 'control' are accepted.\n"
              << "\nPermissions:\n"
              << "  Reading /dev/input needs root or membership in the input group.\n"
              << std::endl;
}

static int list_devices() {
    std::string error;
    auto devices = voxkey::list_keyboard_devices(&error);
    if (devices.empty()) {
        std::cerr << error << std::endl;
        return 1;
    }
    for (const auto& device : devices) {
        std::cout << device.path << "  " << device.name << std::endl;
    }
    return 0;
}

static int check_hotkey(const std::string& hotkey) {
    auto result = voxkey::validate_hotkey(hotkey);
    if (!result.valid) {
        std::cerr << "Invalid hotkey '" << hotkey << "': " << result.error << std::endl;
        return 1;
    }
    std::cout << voxkey::normalize_hotkey(hotkey) << std::endl;
    return 0;
}

static bool validate_config(const voxkey::HotkeyConfig& hotkeys) {
    bool ok = true;
    if (hotkeys.hold_enabled) {
        auto result = voxkey::validate_hotkey(hotkeys.hold_hotkey);
        if (!result.valid) {
            std::cerr << "Invalid hold hotkey '" << hotkeys.hold_hotkey << "': " << result.error << std::endl;
            ok = false;
        }
    }
    if (hotkeys.toggle_enabled) {
        auto result = voxkey::validate_hotkey(hotkeys.toggle_hotkey);
        if (!result.valid) {
            std::cerr << "Invalid toggle hotkey '" << hotkeys.toggle_hotkey << "': " << result.error << std::endl;
            ok = false;
        }
    }
    if (hotkeys.hold_enabled && hotkeys.toggle_enabled &&
        voxkey::hotkeys_conflict(hotkeys.hold_hotkey, hotkeys.toggle_hotkey)) {
        std::cerr << "Hold and toggle hotkeys are the same: "
                  << voxkey::normalize_hotkey(hotkeys.hold_hotkey) << std::endl;
        ok = false;
    }
    if (!hotkeys.hold_enabled && !hotkeys.toggle_enabled) {
        std::cerr << "Both hotkeys are disabled, nothing to listen for" << std::endl;
        ok = false;
    }
    return ok;
}

int main(int argc, char* argv[]) {
    voxkey::Config config;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if (strcmp(argv[i], "--hold") == 0 && i + 1 < argc) {
            config.hotkeys.hold_hotkey = argv[++i];
        }
        else if (strcmp(argv[i], "--toggle") == 0 && i + 1 < argc) {
            config.hotkeys.toggle_hotkey = argv[++i];
        }
        else if (strcmp(argv[i], "--no-hold") == 0) {
            config.hotkeys.hold_enabled = false;
        }
        else if (strcmp(argv[i], "--toggle-on") == 0) {
            config.hotkeys.toggle_enabled = true;
        }
        else if ((strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--device") == 0) && i + 1 < argc) {
            config.device_path = argv[++i];
        }
        else if (strcmp(argv[i], "--max-seconds") == 0 && i + 1 < argc) {
            config.max_recording_seconds = std::atoi(argv[++i]);
            if (config.max_recording_seconds <= 0) {
                std::cerr << "Invalid --max-seconds value: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if (strcmp(argv[i], "--list-devices") == 0) {
            config.list_devices = true;
        }
        else if (strcmp(argv[i], "--check") == 0 && i + 1 < argc) {
            return check_hotkey(argv[++i]);
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config.list_devices) {
        return list_devices();
    }

    config.hotkeys.hold_hotkey = voxkey::normalize_hotkey(config.hotkeys.hold_hotkey);
    config.hotkeys.toggle_hotkey = voxkey::normalize_hotkey(config.hotkeys.toggle_hotkey);
    if (!validate_config(config.hotkeys)) {
        return 1;
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    voxkey::App app;
    g_app = &app;

    std::cout << "voxkey - Recording hotkeys\n" << std::endl;
    std::cout << "Hold hotkey: " << config.hotkeys.hold_hotkey
              << (config.hotkeys.hold_enabled ? "" : " (disabled)") << std::endl;
    std::cout << "Toggle hotkey: " << config.hotkeys.toggle_hotkey
              << (config.hotkeys.toggle_enabled ? "" : " (disabled)") << std::endl;
    std::cout << "Max recording: " << config.max_recording_seconds << "s" << std::endl;
    std::cout << std::endl;

    if (!app.initialize(config)) {
        std::cerr << "Failed to initialize application" << std::endl;
        g_app = nullptr;
        return 1;
    }

    int result = app.run();

    g_app = nullptr;
    return result;
}
