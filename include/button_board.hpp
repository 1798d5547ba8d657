#pragma once

#include "config.hpp"
#include "edge_channel.hpp"
#include "i_modbus_manager.hpp"
#include "logger/logger.hpp"
#include <atomic>
#include <map>
#include <vector>

// Scans the Modbus button board and reports a press edge each time an input
// goes from released (0) to pressed (1). The first successful read of an input
// only primes its state, so a button held at startup does not fire.
class ButtonBoard {
public:
    ButtonBoard(
        const std::vector<ButtonConfig>& buttons,
        IModbusManager& modbus,
        EdgeChannel& channel,
        TimeSource now = &SteadyClock::now
    );

    // Reads each slave once. Returns the number of press edges pushed.
    int scan();

    void run(std::atomic<bool>& running, std::chrono::milliseconds interval);

private:
    struct InputState {
        const ButtonConfig* button;
        bool last_state;
        bool primed;

        InputState(const ButtonConfig* btn)
            : button(btn), last_state(false), primed(false) {}
    };

    std::vector<InputState> input_states_;
    IModbusManager& modbus_;
    EdgeChannel& channel_;
    TimeSource now_;

    Logger logger_;

    void group_inputs_by_slave(std::map<int, std::vector<InputState*>>& groups);
};
