#include "device_client.hpp"

#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

DeviceClientStats::DeviceClientStats() : request_success(0), request_errors(0) {}

DeviceClientStats::DeviceClientStats(int rs, int re) : request_success(rs), request_errors(re) {}

std::string md5_hex(const std::string& text) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (EVP_Digest(text.data(), text.size(), digest, &length, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; i++) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string describe_result_code(int code) {
    switch (code) {
        case 1:  return "Success";
        case 2:  return "Unauthorized";
        case 3:  return "Mismatch";
        case 16: return "Data Missing";
        case 17: return "Out of Range";
        case 18: return "Data Format Error";
        case 19: return "RF Code Error";
        case 32: return "Page Not Found";
        case 48: return "Not Permitted";
        default: return "Unknown result " + std::to_string(code);
    }
}

namespace {

int result_code(const nlohmann::json& j, int fallback) {
    auto it = j.find("result");
    if (it == j.end() || !it->is_number_integer()) {
        return fallback;
    }
    return it->get<int>();
}

}

OpenSprinklerClient::OpenSprinklerClient(const OpenSprinklerConfig& config,
                                         std::unique_ptr<IHttpTransport> transport)
    : transport_(std::move(transport)),
      password_hash_(md5_hex(config.password)),
      request_success_(0),
      request_errors_(0),
      logger_("OpenSprinklerClient") {
    logger_.debug() << "Client created for " << config.host << ":" << config.port;
}

std::vector<std::string> OpenSprinklerClient::list_station_names() {
    std::vector<std::string> names;

    auto j = fetch_json("jn");
    if (!j) {
        return names;
    }

    auto it = j->find("snames");
    if (it == j->end() || !it->is_array()) {
        logger_.error() << "Station names response has no \"snames\" array";
        request_errors_++;
        return names;
    }

    // Keep positions aligned with device indices even for odd entries
    for (const auto& item : *it) {
        names.push_back(item.is_string() ? item.get<std::string>() : std::string());
    }

    request_success_++;
    return names;
}

std::vector<bool> OpenSprinklerClient::list_station_states() {
    std::vector<bool> states;

    auto j = fetch_json("js");
    if (!j) {
        return states;
    }

    auto it = j->find("sn");
    if (it == j->end() || !it->is_array()) {
        logger_.error() << "Station status response has no \"sn\" array";
        request_errors_++;
        return states;
    }

    for (const auto& item : *it) {
        if (item.is_boolean()) {
            states.push_back(item.get<bool>());
        } else if (item.is_number()) {
            states.push_back(item.get<int>() != 0);
        } else {
            states.push_back(false);
        }
    }

    request_success_++;
    return states;
}

bool OpenSprinklerClient::activate(int device_index, int duration_sec) {
    if (device_index < 0 || duration_sec <= 0) {
        logger_.error() << "Refusing activate: station " << device_index << " for " << duration_sec << "s";
        return false;
    }

    return send_command("&sid=" + std::to_string(device_index) + "&en=1&t=" + std::to_string(duration_sec));
}

bool OpenSprinklerClient::deactivate(int device_index) {
    if (device_index < 0) {
        logger_.error() << "Refusing deactivate: station " << device_index;
        return false;
    }

    return send_command("&sid=" + std::to_string(device_index) + "&en=0");
}

nlohmann::json OpenSprinklerClient::get_snapshot() {
    auto j = fetch_json("ja");
    if (!j) {
        return nlohmann::json::object();
    }

    request_success_++;
    return *j;
}

std::unique_ptr<DeviceClientStats> OpenSprinklerClient::get_stats() const {
    return std::make_unique<DeviceClientStats>(request_success_.load(), request_errors_.load());
}

void OpenSprinklerClient::reset_stats() {
    request_success_ = 0;
    request_errors_ = 0;
}

std::optional<nlohmann::json> OpenSprinklerClient::fetch_json(const std::string& endpoint,
                                                              const std::string& params) {
    auto response = transport_->get("/" + endpoint + "?pw=" + password_hash_ + params);
    if (!response) {
        request_errors_++;
        return std::nullopt;
    }

    if (!response->ok()) {
        logger_.error() << "/" << endpoint << " returned HTTP " << response->status;
        request_errors_++;
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(response->body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        logger_.error() << "/" << endpoint << " returned malformed JSON";
        request_errors_++;
        return std::nullopt;
    }

    // Read endpoints only carry "result" when the request was refused
    if (endpoint != "cm" && j.contains("result")) {
        logger_.error() << "/" << endpoint << " refused: " << describe_result_code(result_code(j, 0));
        request_errors_++;
        return std::nullopt;
    }

    return j;
}

bool OpenSprinklerClient::send_command(const std::string& params) {
    auto j = fetch_json("cm", params);
    if (!j) {
        return false;
    }

    // A JSON reply without a result code is accepted on the HTTP status alone
    const int result = result_code(*j, 1);
    if (result != 1) {
        logger_.error() << "Command" << params.substr(0, params.find("&t=")) << " rejected: "
                        << describe_result_code(result);
        request_errors_++;
        return false;
    }

    request_success_++;
    return true;
}
