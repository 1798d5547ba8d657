#pragma once

#include <string>

enum class ControlError {
    InvalidStation,
    InvalidDuration,
    DeviceCommunicationFailed,
    UnconfiguredLine,
    RegistryUnavailable
};

inline std::string to_string(ControlError error) {
    switch (error) {
        case ControlError::InvalidStation:
            return "InvalidStation";
        case ControlError::InvalidDuration:
            return "InvalidDuration";
        case ControlError::DeviceCommunicationFailed:
            return "DeviceCommunicationFailed";
        case ControlError::UnconfiguredLine:
            return "UnconfiguredLine";
        case ControlError::RegistryUnavailable:
            return "RegistryUnavailable";
    }
    return "Unknown";
}
