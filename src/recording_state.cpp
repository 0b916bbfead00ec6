#include "recording_state.hpp"
#include <iostream>
#include <exception>
#include <utility>

namespace voxkey {

const char* recording_mode_name(RecordingMode mode) {
    switch (mode) {
        case RecordingMode::Hold: return "hold";
        case RecordingMode::Toggle: return "toggle";
        case RecordingMode::None: return "none";
    }
    return "none";
}

RecordingStateMachine::RecordingStateMachine(Scheduler& scheduler,
                                             std::chrono::milliseconds max_duration)
    : scheduler_(scheduler)
    , max_duration_(max_duration) {
}

RecordingStateMachine::~RecordingStateMachine() {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    cancel_max_timer();
}

void RecordingStateMachine::set_callbacks(Callback on_activate, Callback on_deactivate) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_activate_ = std::move(on_activate);
    on_deactivate_ = std::move(on_deactivate);
}

void RecordingStateMachine::hold_pressed() {
    // No-op if already recording in some mode
    activate(RecordingMode::Hold, "Hold hotkey activated");
}

void RecordingStateMachine::hold_released() {
    deactivate(RecordingMode::Hold, "Hold hotkey deactivated");
}

void RecordingStateMachine::toggle_pressed() {
    if (mode_.load() == RecordingMode::Hold) return;

    if (!activate(RecordingMode::Toggle, "Toggle hotkey activated - recording started")) {
        deactivate(RecordingMode::Toggle, "Toggle hotkey deactivated - recording stopped");
    }
}

void RecordingStateMachine::force_deactivate() {
    RecordingMode current = mode_.load();
    if (current == RecordingMode::Hold) {
        hold_released();
    } else if (current == RecordingMode::Toggle) {
        deactivate(RecordingMode::Toggle, "Toggle hotkey deactivated - recording stopped");
    }
}

void RecordingStateMachine::reset() {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    cancel_max_timer();
    mode_.store(RecordingMode::None);
}

bool RecordingStateMachine::activate(RecordingMode mode, const char* message) {
    {
        std::lock_guard<std::mutex> lock(transition_mutex_);
        RecordingMode expected = RecordingMode::None;
        if (!mode_.compare_exchange_strong(expected, mode)) return false;

        uint64_t session = ++session_;
        start_max_timer(session);
    }

    std::cout << message << std::endl;

    Callback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_activate_;
    }
    invoke(callback, "activate");
    return true;
}

bool RecordingStateMachine::deactivate(RecordingMode expected, const char* message) {
    if (expected == RecordingMode::None) return false;
    {
        // The timer being cancelled is the one of the session just ended;
        // no activation can slip in between
        std::lock_guard<std::mutex> lock(transition_mutex_);
        if (!mode_.compare_exchange_strong(expected, RecordingMode::None)) return false;
        cancel_max_timer();
    }

    std::cout << message << std::endl;

    Callback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_deactivate_;
    }
    invoke(callback, "deactivate");
    return true;
}

void RecordingStateMachine::start_max_timer(uint64_t session) {
    if (timer_id_ != 0) {
        scheduler_.cancel(timer_id_);
    }
    timer_id_ = scheduler_.schedule(max_duration_, [this, session]() {
        on_max_timer(session);
    });
}

void RecordingStateMachine::cancel_max_timer() {
    if (timer_id_ != 0) {
        scheduler_.cancel(timer_id_);
        timer_id_ = 0;
    }
}

void RecordingStateMachine::on_max_timer(uint64_t session) {
    // Stale timer from an earlier recording
    if (session != session_.load()) return;

    RecordingMode current = mode_.load();
    if (current == RecordingMode::None) return;

    std::cout << "Max recording time reached ("
              << std::chrono::duration_cast<std::chrono::seconds>(max_duration_).count()
              << "s)" << std::endl;

    force_deactivate();
}

void RecordingStateMachine::invoke(const Callback& callback, const char* name) {
    if (!callback) return;
    try {
        callback();
    } catch (const std::exception& e) {
        std::cerr << "Recording " << name << " callback failed: " << e.what() << std::endl;
    }
}

} // namespace voxkey
