#pragma once

#include "scheduler.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace voxkey {

enum class RecordingMode {
    None,
    Hold,
    Toggle
};

// "hold", "toggle" or "none"
const char* recording_mode_name(RecordingMode mode);

constexpr int DEFAULT_MAX_RECORDING_SECONDS = 60;

// Tracks which mode (if any) is recording and owns the safety timer.
//
// Transitions are compare-and-swap on a single mode value, so when the
// timer and a key event race to stop the same recording only one of them
// wins; the other is a no-op. on_activate/on_deactivate fire exactly once
// per edge. Safe to call from the hook thread and the scheduler thread.
class RecordingStateMachine {
public:
    using Callback = std::function<void()>;

    explicit RecordingStateMachine(
        Scheduler& scheduler,
        std::chrono::milliseconds max_duration = std::chrono::seconds(DEFAULT_MAX_RECORDING_SECONDS));
    ~RecordingStateMachine();

    RecordingStateMachine(const RecordingStateMachine&) = delete;
    RecordingStateMachine& operator=(const RecordingStateMachine&) = delete;

    void set_callbacks(Callback on_activate, Callback on_deactivate);

    // Idle -> Hold. Ignored while any mode is active.
    void hold_pressed();

    // Hold -> Idle. Called once the hold keys are no longer all down.
    void hold_released();

    // Idle -> Toggle, Toggle -> Idle. Ignored while holding.
    void toggle_pressed();

    // Stops whichever mode is active
    void force_deactivate();

    // Back to Idle without calling on_deactivate
    void reset();

    RecordingMode mode() const { return mode_.load(); }
    bool is_recording() const { return mode_.load() != RecordingMode::None; }

    std::chrono::milliseconds max_duration() const { return max_duration_; }

private:
    bool activate(RecordingMode mode, const char* message);
    bool deactivate(RecordingMode expected, const char* message);

    // Both need transition_mutex_ held
    void start_max_timer(uint64_t session);
    void cancel_max_timer();
    void on_max_timer(uint64_t session);

    void invoke(const Callback& callback, const char* name);

    Scheduler& scheduler_;
    std::chrono::milliseconds max_duration_;

    std::atomic<RecordingMode> mode_{RecordingMode::None};
    // Bumped on every activation; a timer only acts on its own session
    std::atomic<uint64_t> session_{0};

    // Held across a mode change and its timer schedule/cancel. Never held
    // while callbacks run.
    std::mutex transition_mutex_;
    Scheduler::TaskId timer_id_ = 0;

    std::mutex callback_mutex_;
    Callback on_activate_;
    Callback on_deactivate_;
};

} // namespace voxkey
