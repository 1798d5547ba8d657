#pragma once

#include "config.hpp"
#include "edge_channel.hpp"
#include "logger/logger.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>

enum class EdgeDisposition {
    Dispatched,
    Suppressed,
    UnconfiguredLine
};

// Turns raw press edges into at most one toggle per line per debounce window.
//
// Each line is Idle or Suppressed(until). An edge at T on an Idle line, or on a
// Suppressed line with T >= until, is accepted: the line becomes
// Suppressed(T + window) and a toggle for its station is dispatched with the
// default duration. Anything else is dropped.
class InputDebouncer {
public:
    using ToggleDispatch = std::function<void(int display_index, int duration_sec)>;

    InputDebouncer(
        const std::vector<ButtonConfig>& buttons,
        const ControlConfig& control,
        std::mutex& state_mutex,
        ToggleDispatch dispatch
    );

    EdgeDisposition on_edge(const EdgeEvent& edge);

    // Consumes edges until the channel is closed and drained
    void run(EdgeChannel& channel);

    int unconfigured_edges() const { return unconfigured_edges_; }

private:
    struct LineState {
        int station;
        bool suppressed;
        SteadyClock::time_point suppress_until;

        explicit LineState(int st) : station(st), suppressed(false) {}
    };

    std::map<int, LineState> lines_;
    std::chrono::milliseconds window_;
    int default_duration_sec_;
    std::mutex& mutex_;
    ToggleDispatch dispatch_;
    std::atomic<int> unconfigured_edges_;

    Logger logger_;
};
