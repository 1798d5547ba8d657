#pragma once

#include "config.hpp"
#include "http_transport.hpp"
#include "i_device_client.hpp"
#include "logger/logger.hpp"
#include <atomic>
#include <memory>
#include <optional>

struct DeviceClientStats {
    int request_success;
    int request_errors;

    DeviceClientStats();
    DeviceClientStats(int rs, int re);
};

// Lowercase hex MD5 of `text`, the credential format the device expects
std::string md5_hex(const std::string& text);

// Name of an OpenSprinkler "result" code, e.g. 2 -> "Unauthorized"
std::string describe_result_code(int code);

class OpenSprinklerClient : public IDeviceClient {
public:
    OpenSprinklerClient(const OpenSprinklerConfig& config, std::unique_ptr<IHttpTransport> transport);

    OpenSprinklerClient(const OpenSprinklerClient&) = delete;
    OpenSprinklerClient& operator=(const OpenSprinklerClient&) = delete;

    std::vector<std::string> list_station_names() override;
    std::vector<bool> list_station_states() override;

    bool activate(int device_index, int duration_sec) override;
    bool deactivate(int device_index) override;

    nlohmann::json get_snapshot() override;

    std::unique_ptr<DeviceClientStats> get_stats() const override;
    void reset_stats() override;

private:
    std::unique_ptr<IHttpTransport> transport_;
    std::string password_hash_;

    std::atomic<int> request_success_;
    std::atomic<int> request_errors_;

    Logger logger_;

    std::optional<nlohmann::json> fetch_json(const std::string& endpoint, const std::string& params = "");
    bool send_command(const std::string& params);
};
