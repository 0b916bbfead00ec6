// Test doubles shared by the hotkey tests: a scripted KeyHook and a
// Scheduler driven by a manual clock.

#pragma once

#include "key_hook.hpp"
#include "scheduler.hpp"

#include <chrono>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace voxkey {
namespace testing {

class FakeKeyHook : public KeyHook {
public:
    struct Hotkey {
        std::string hotkey;
        Callback on_press;
    };

    struct Release {
        std::string key;
        Callback on_release;
    };

    bool add_hotkey(const std::string& hotkey, Callback on_press) override {
        add_hotkey_calls++;
        if (throw_on.count(hotkey)) throw std::runtime_error("hook rejected " + hotkey);
        if (reject.count(hotkey)) return false;
        hotkeys.push_back({hotkey, std::move(on_press)});
        return true;
    }

    bool on_release_key(const std::string& key, Callback on_release) override {
        releases.push_back({key, std::move(on_release)});
        return true;
    }

    bool unhook_all() override {
        unhook_calls++;
        hotkeys.clear();
        releases.clear();
        if (throw_on_unhook) throw std::runtime_error("unhook failed");
        return !fail_unhook;
    }

    bool is_pressed(const std::string& key) const override {
        return down.count(key) > 0;
    }

    // Press a key; fires every hotkey that becomes complete with it
    void press(const std::string& key) {
        if (!down.insert(key).second) return;

        std::vector<Callback> to_fire;
        for (const auto& entry : hotkeys) {
            auto keys = split(entry.hotkey);
            bool member = false;
            bool complete = true;
            for (const auto& k : keys) {
                if (k == key) member = true;
                if (!down.count(k)) complete = false;
            }
            if (member && complete) to_fire.push_back(entry.on_press);
        }
        for (auto& callback : to_fire) callback();
    }

    void press_all(const std::string& hotkey) {
        for (const auto& key : split(hotkey)) press(key);
    }

    // Release a key; fires its release handlers
    void release(const std::string& key) {
        down.erase(key);

        std::vector<Callback> to_fire;
        for (const auto& entry : releases) {
            if (entry.key == key) to_fire.push_back(entry.on_release);
        }
        for (auto& callback : to_fire) callback();
    }

    size_t release_count(const std::string& key) const {
        size_t count = 0;
        for (const auto& entry : releases) {
            if (entry.key == key) count++;
        }
        return count;
    }

    bool has_hotkey(const std::string& hotkey) const {
        for (const auto& entry : hotkeys) {
            if (entry.hotkey == hotkey) return true;
        }
        return false;
    }

    static std::vector<std::string> split(const std::string& hotkey) {
        std::vector<std::string> keys;
        std::stringstream stream(hotkey);
        std::string key;
        while (std::getline(stream, key, '+')) keys.push_back(key);
        return keys;
    }

    std::vector<Hotkey> hotkeys;
    std::vector<Release> releases;
    std::set<std::string> down;

    std::set<std::string> reject;
    std::set<std::string> throw_on;
    bool fail_unhook = false;
    bool throw_on_unhook = false;

    int add_hotkey_calls = 0;
    int unhook_calls = 0;
};

class ManualScheduler : public Scheduler {
public:
    TaskId schedule(std::chrono::milliseconds delay, Task task) override {
        TaskId id = next_id_++;
        tasks_[id] = {now_ + delay, std::move(task)};
        return id;
    }

    void cancel(TaskId id) override {
        cancel_calls++;
        tasks_.erase(id);
    }

    // Moves the clock forward, running every task that falls due
    void advance(std::chrono::milliseconds delta) {
        std::chrono::milliseconds target = now_ + delta;
        while (true) {
            auto due = tasks_.end();
            for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
                if (it->second.first <= target &&
                    (due == tasks_.end() || it->second.first < due->second.first)) {
                    due = it;
                }
            }
            if (due == tasks_.end()) break;

            now_ = due->second.first;
            Task task = std::move(due->second.second);
            tasks_.erase(due);
            task();
        }
        now_ = target;
    }

    size_t pending() const { return tasks_.size(); }

    int cancel_calls = 0;

private:
    std::chrono::milliseconds now_{0};
    TaskId next_id_ = 1;
    std::map<TaskId, std::pair<std::chrono::milliseconds, Task>> tasks_;
};

} // namespace testing
} // namespace voxkey
