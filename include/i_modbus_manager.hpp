#pragma once

#include <array>
#include <cstdint>
#include <memory>

struct ModbusManagerStats;

// Discrete-input access to the button board, eight inputs per slave
class IModbusManager {
public:
    virtual ~IModbusManager() = default;

    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual bool read_discrete_inputs(int slave_id, int start_addr, std::array<uint8_t, 8>& dest) = 0;

    virtual std::unique_ptr<ModbusManagerStats> get_stats() const = 0;
    virtual void reset_stats() = 0;
};
