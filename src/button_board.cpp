#include "button_board.hpp"
#include <array>
#include <thread>

ButtonBoard::ButtonBoard(
    const std::vector<ButtonConfig>& buttons,
    IModbusManager& modbus,
    EdgeChannel& channel,
    TimeSource now
) : modbus_(modbus), channel_(channel), now_(std::move(now)), logger_("ButtonBoard") {

    for (const auto& button : buttons) {
        input_states_.emplace_back(&button);
    }
}

int ButtonBoard::scan() {
    std::map<int, std::vector<InputState*>> inputs_by_slave;
    group_inputs_by_slave(inputs_by_slave);

    std::array<uint8_t, 8> input_bits;
    int edges = 0;

    for (auto& [slave_id, slave_inputs] : inputs_by_slave) {
        // Read 8 inputs at once from this slave
        if (!modbus_.read_discrete_inputs(slave_id, 0, input_bits)) {
            continue;
        }

        const auto at = now_();

        for (auto* state : slave_inputs) {
            bool pressed = input_bits[state->button->address] != 0;

            if (state->primed && pressed && !state->last_state) {
                logger_.debug() << "Press on line " << state->button->line
                                << " (slave " << slave_id << " input " << state->button->address << ")";
                if (channel_.push(EdgeEvent{state->button->line, at})) {
                    edges++;
                }
            }

            state->last_state = pressed;
            state->primed = true;
        }
    }

    return edges;
}

void ButtonBoard::run(std::atomic<bool>& running, std::chrono::milliseconds interval) {
    logger_.info() << "Scanning " << input_states_.size() << " button(s) every " << interval.count() << "ms";

    while (running) {
        auto start_time = std::chrono::steady_clock::now();

        scan();

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (elapsed < interval) {
            std::this_thread::sleep_for(interval - elapsed);
        }
    }

    logger_.info() << "Button scan stopped";
}

void ButtonBoard::group_inputs_by_slave(std::map<int, std::vector<InputState*>>& groups) {
    for (auto& state : input_states_) {
        groups[state.button->slave_id].push_back(&state);
    }
}
