#include "evdev_key_hook.hpp"
#include "hotkey_spec.hpp"
#include <iostream>
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <exception>
#include <filesystem>
#include <map>
#include <system_error>
#include <unordered_set>
#include <fcntl.h>
#include <unistd.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <libevdev/libevdev.h>

namespace voxkey {

namespace {

// Names that don't follow the KEY_<NAME> pattern
const std::map<std::string, std::vector<unsigned int>>& key_aliases() {
    static const std::map<std::string, std::vector<unsigned int>> aliases = {
        {"ctrl", {KEY_LEFTCTRL, KEY_RIGHTCTRL}},
        {"control", {KEY_LEFTCTRL, KEY_RIGHTCTRL}},
        {"left ctrl", {KEY_LEFTCTRL}},
        {"right ctrl", {KEY_RIGHTCTRL}},
        {"alt", {KEY_LEFTALT, KEY_RIGHTALT}},
        {"left alt", {KEY_LEFTALT}},
        {"right alt", {KEY_RIGHTALT}},
        {"alt gr", {KEY_RIGHTALT}},
        {"shift", {KEY_LEFTSHIFT, KEY_RIGHTSHIFT}},
        {"left shift", {KEY_LEFTSHIFT}},
        {"right shift", {KEY_RIGHTSHIFT}},
        {"win", {KEY_LEFTMETA, KEY_RIGHTMETA}},
        {"windows", {KEY_LEFTMETA, KEY_RIGHTMETA}},
        {"left windows", {KEY_LEFTMETA}},
        {"right windows", {KEY_RIGHTMETA}},
        {"esc", {KEY_ESC}},
        {"escape", {KEY_ESC}},
        {"return", {KEY_ENTER}},
        {"del", {KEY_DELETE}},
        {"ins", {KEY_INSERT}},
        {"pgup", {KEY_PAGEUP}},
        {"pgdn", {KEY_PAGEDOWN}},
        {"print screen", {KEY_SYSRQ}},
        {"-", {KEY_MINUS}},
        {"=", {KEY_EQUAL}},
        {",", {KEY_COMMA}},
        {".", {KEY_DOT}},
        {"/", {KEY_SLASH}},
        {";", {KEY_SEMICOLON}},
        {"'", {KEY_APOSTROPHE}},
        {"`", {KEY_GRAVE}},
        {"[", {KEY_LEFTBRACE}},
        {"]", {KEY_RIGHTBRACE}},
        {"\\", {KEY_BACKSLASH}},
    };
    return aliases;
}

constexpr size_t kBitsPerLong = sizeof(unsigned long) * 8;

constexpr size_t bits_to_longs(size_t bits) {
    return (bits + kBitsPerLong - 1) / kBitsPerLong;
}

template <size_t N>
bool test_bit(const std::array<unsigned long, N>& bits, int bit) {
    size_t index = static_cast<size_t>(bit) / kBitsPerLong;
    size_t offset = static_cast<size_t>(bit) % kBitsPerLong;
    if (index >= bits.size()) return false;
    return (bits[index] & (1UL << offset)) != 0;
}

bool is_keyboard_fd(int fd) {
    std::array<unsigned long, bits_to_longs(EV_MAX + 1)> ev_bits{};
    if (ioctl(fd, EVIOCGBIT(0, ev_bits.size() * sizeof(unsigned long)), ev_bits.data()) < 0) {
        return false;
    }
    if (!test_bit(ev_bits, EV_KEY)) return false;

    std::array<unsigned long, bits_to_longs(KEY_MAX + 1)> key_bits{};
    if (ioctl(fd, EVIOCGBIT(EV_KEY, key_bits.size() * sizeof(unsigned long)), key_bits.data()) < 0) {
        return false;
    }

    const int required_keys[] = {KEY_A, KEY_Z, KEY_SPACE, KEY_ENTER, KEY_LEFTSHIFT};
    for (int code : required_keys) {
        if (!test_bit(key_bits, code)) return false;
    }
    return true;
}

std::string read_device_name(int fd) {
    char buffer[256] = {0};
    if (ioctl(fd, EVIOCGNAME(sizeof(buffer)), buffer) < 0) return {};
    return std::string(buffer);
}

std::vector<std::string> collect_entries(const std::filesystem::path& dir, bool event_nodes) {
    std::vector<std::string> entries;
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec) || ec) return entries;

    std::filesystem::directory_iterator it(dir, ec);
    if (ec) return entries;

    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::string name = it->path().filename().string();
        bool match = event_nodes ? name.rfind("event", 0) == 0 : is_keyboard_link_name(name);
        if (match) entries.push_back(it->path().string());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

std::vector<std::string> candidate_paths() {
    std::vector<std::string> candidates;
    std::unordered_set<std::string> seen;

    for (const auto& list : {collect_entries("/dev/input/by-id", false),
                             collect_entries("/dev/input/by-path", false),
                             collect_entries("/dev/input", true)}) {
        for (const auto& path : list) {
            // Symlinks and their event node count once
            std::error_code ec;
            std::string resolved = std::filesystem::canonical(path, ec).string();
            if (ec) resolved = path;
            if (seen.insert(resolved).second) candidates.push_back(path);
        }
    }
    return candidates;
}

} // namespace

bool is_keyboard_link_name(const std::string& filename) {
    std::string lower = filename;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("kbd") != std::string::npos || lower.find("keyboard") != std::string::npos;
}

std::vector<KeyboardDevice> list_keyboard_devices(std::string* error_message) {
    std::vector<KeyboardDevice> devices;
    auto candidates = candidate_paths();
    bool permission_denied = false;
    std::string last_error;

    for (const auto& path : candidates) {
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) {
            if (errno == EACCES || errno == EPERM) permission_denied = true;
            last_error = path + ": " + std::system_category().message(errno);
            continue;
        }
        if (is_keyboard_fd(fd)) {
            devices.push_back({path, read_device_name(fd)});
        }
        close(fd);
    }

    if (devices.empty() && error_message) {
        if (permission_denied) {
            *error_message = "Permission denied while probing input devices. "
                             "Try running with sudo or add user to input group.";
        } else if (candidates.empty()) {
            *error_message = "No evdev devices found under /dev/input.";
        } else if (!last_error.empty()) {
            *error_message = "No keyboard-like device found. Last error: " + last_error;
        } else {
            *error_message = "No keyboard-like device found.";
        }
    }
    return devices;
}

std::vector<unsigned int> key_codes_for_name(const std::string& key) {
    const auto& aliases = key_aliases();
    auto it = aliases.find(key);
    if (it != aliases.end()) return it->second;

    // "page up" -> KEY_PAGEUP, "f5" -> KEY_F5, "r" -> KEY_R
    std::string name = "KEY_";
    for (unsigned char c : key) {
        if (c == ' ') continue;
        name.push_back(static_cast<char>(std::toupper(c)));
    }
    if (name.size() == 4) return {};

    int code = libevdev_event_code_from_name(EV_KEY, name.c_str());
    if (code < 0) return {};
    return {static_cast<unsigned int>(code)};
}

EvdevKeyHook::EvdevKeyHook()
    : key_down_(KEY_CNT, false) {
}

EvdevKeyHook::~EvdevKeyHook() {
    shutdown();
}

bool EvdevKeyHook::initialize(const std::string& device_path) {
    if (dev_) return true;

    std::string path = device_path;
    if (path.empty()) {
        std::string error;
        auto devices = list_keyboard_devices(&error);
        if (devices.empty()) {
            std::cerr << "Failed to find keyboard device: " << error << std::endl;
            return false;
        }
        path = devices.front().path;
    }

    int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        std::cerr << "Failed to open keyboard device " << path << ": "
                  << std::system_category().message(errno)
                  << ". Try running with sudo or add user to input group." << std::endl;
        return false;
    }

    int rc = libevdev_new_from_fd(fd, &dev_);
    if (rc < 0) {
        std::cerr << "Failed to init libevdev for " << path << ": "
                  << std::system_category().message(-rc) << std::endl;
        dev_ = nullptr;
        close(fd);
        return false;
    }

    if (!libevdev_has_event_type(dev_, EV_KEY) ||
        !libevdev_has_event_code(dev_, EV_KEY, KEY_A)) {
        std::cerr << "Device is not a keyboard: " << path << std::endl;
        libevdev_free(dev_);
        dev_ = nullptr;
        close(fd);
        return false;
    }

    keyboard_fd_ = fd;
    device_path_ = path;

    // Keys already held when we attach
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (unsigned int code = 0; code < KEY_CNT; ++code) {
            key_down_[code] = libevdev_get_event_value(dev_, EV_KEY, code) != 0;
        }
    }

    const char* name = libevdev_get_name(dev_);
    std::cout << "Using keyboard: " << path << (name ? " (" + std::string(name) + ")" : "") << std::endl;
    return true;
}

void EvdevKeyHook::shutdown() {
    stop();

    if (dev_) {
        libevdev_free(dev_);
        dev_ = nullptr;
    }
    if (keyboard_fd_ >= 0) {
        close(keyboard_fd_);
        keyboard_fd_ = -1;
    }
    device_path_.clear();
}

bool EvdevKeyHook::start() {
    if (running_.load()) return true;
    if (!dev_) {
        std::cerr << "Keyboard device not initialized" << std::endl;
        return false;
    }

    // A previous loop may have ended on its own (device removed)
    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }

    running_.store(true);
    listener_thread_ = std::thread([this]() {
        run_loop();
    });
    return true;
}

void EvdevKeyHook::stop() {
    running_.store(false);

    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
}

bool EvdevKeyHook::add_hotkey(const std::string& hotkey, Callback on_press) {
    Combination combination;
    for (const auto& key : hotkey_release_keys(hotkey)) {
        auto codes = key_codes_for_name(key);
        if (codes.empty()) {
            std::cerr << "Unknown key name: '" << key << "' in hotkey " << hotkey << std::endl;
            return false;
        }
        combination.keys.push_back(std::move(codes));
    }
    if (combination.keys.empty()) return false;

    combination.on_press = std::move(on_press);

    std::lock_guard<std::mutex> lock(mutex_);
    combinations_.push_back(std::move(combination));
    return true;
}

bool EvdevKeyHook::on_release_key(const std::string& key, Callback on_release) {
    auto codes = key_codes_for_name(key);
    if (codes.empty()) {
        std::cerr << "Unknown key name: '" << key << "'" << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    release_handlers_.push_back({std::move(codes), std::move(on_release)});
    return true;
}

bool EvdevKeyHook::unhook_all() {
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    combinations_.clear();
    release_handlers_.clear();
    return true;
}

bool EvdevKeyHook::is_pressed(const std::string& key) const {
    auto codes = key_codes_for_name(key);
    std::lock_guard<std::mutex> lock(mutex_);
    return any_down(codes);
}

bool EvdevKeyHook::any_down(const std::vector<unsigned int>& codes) const {
    for (unsigned int code : codes) {
        if (code < key_down_.size() && key_down_[code]) return true;
    }
    return false;
}

void EvdevKeyHook::dispatch_key_event(unsigned int code, int value) {
    if (code >= key_down_.size()) return;

    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);

    std::vector<Callback> to_fire;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (value == 1) {
            // Autorepeat (value 2) never re-triggers a combination
            if (key_down_[code]) return;
            key_down_[code] = true;

            for (const auto& combination : combinations_) {
                bool member = false;
                bool complete = true;
                for (const auto& key : combination.keys) {
                    if (std::find(key.begin(), key.end(), code) != key.end()) member = true;
                    if (!any_down(key)) complete = false;
                }
                if (member && complete) to_fire.push_back(combination.on_press);
            }
        } else if (value == 0) {
            // State first, so handlers see the key as up
            key_down_[code] = false;

            for (const auto& handler : release_handlers_) {
                if (std::find(handler.codes.begin(), handler.codes.end(), code) != handler.codes.end()) {
                    to_fire.push_back(handler.on_release);
                }
            }
        }
    }

    for (const auto& callback : to_fire) {
        try {
            if (callback) callback();
        } catch (const std::exception& e) {
            std::cerr << "Hotkey handler failed: " << e.what() << std::endl;
        }
    }
}

void EvdevKeyHook::run_loop() {
    struct input_event ev;
    unsigned int read_flag = LIBEVDEV_READ_FLAG_NORMAL;

    while (running_.load()) {
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(keyboard_fd_, &fds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 100000; // 100ms timeout

        int ret = select(keyboard_fd_ + 1, &fds, nullptr, nullptr, &tv);
        if (ret <= 0) continue;

        int rc;
        while (true) {
            rc = libevdev_next_event(dev_, read_flag, &ev);

            if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                if (read_flag == LIBEVDEV_READ_FLAG_NORMAL) {
                    // SYN_DROPPED: replay the state delta before continuing
                    read_flag = LIBEVDEV_READ_FLAG_SYNC;
                    continue;
                }
            } else if (rc == -EAGAIN && read_flag == LIBEVDEV_READ_FLAG_SYNC) {
                read_flag = LIBEVDEV_READ_FLAG_NORMAL;
                continue;
            } else if (rc != LIBEVDEV_READ_STATUS_SUCCESS) {
                break;
            }

            if (ev.type == EV_KEY) {
                dispatch_key_event(ev.code, ev.value);
            }
        }

        if (rc != -EAGAIN) {
            std::cerr << "Keyboard device read failed: " << std::system_category().message(-rc) << std::endl;
            running_.store(false);
        }
    }
}

} // namespace voxkey
