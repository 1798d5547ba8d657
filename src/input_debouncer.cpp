#include "input_debouncer.hpp"
#include "control_error.hpp"

InputDebouncer::InputDebouncer(
    const std::vector<ButtonConfig>& buttons,
    const ControlConfig& control,
    std::mutex& state_mutex,
    ToggleDispatch dispatch
) : window_(control.debounce_ms), default_duration_sec_(control.default_duration_sec),
    mutex_(state_mutex), dispatch_(std::move(dispatch)), unconfigured_edges_(0),
    logger_("InputDebouncer") {

    for (const auto& button : buttons) {
        lines_.emplace(button.line, LineState(button.station));
    }
}

EdgeDisposition InputDebouncer::on_edge(const EdgeEvent& edge) {
    int station = -1;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = lines_.find(edge.line);
        if (it != lines_.end()) {
            LineState& state = it->second;

            if (state.suppressed && edge.at < state.suppress_until) {
                return EdgeDisposition::Suppressed;
            }

            state.suppressed = true;
            state.suppress_until = edge.at + window_;
            station = state.station;
        }
    }

    if (station < 0) {
        unconfigured_edges_++;
        logger_.error() << to_string(ControlError::UnconfiguredLine) << ": press on line " << edge.line
                        << " has no station mapping";
        return EdgeDisposition::UnconfiguredLine;
    }

    logger_.separator("Button Press - Station " + std::to_string(station));
    logger_.debug() << "Line " << edge.line << " -> station " << station;

    // Dispatch outside the lock, the toggle path takes it again
    dispatch_(station, default_duration_sec_);
    return EdgeDisposition::Dispatched;
}

void InputDebouncer::run(EdgeChannel& channel) {
    logger_.info() << "Listening for button presses on " << lines_.size() << " line(s), debounce "
                   << window_.count() << "ms, default duration " << default_duration_sec_ << "s";

    EdgeEvent edge;
    while (channel.pop(edge)) {
        on_edge(edge);
    }

    logger_.info() << "Edge channel closed";
}
