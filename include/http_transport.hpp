#pragma once

#include "logger/logger.hpp"
#include <chrono>
#include <optional>
#include <string>

struct HttpResponse {
    int status;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    // Issues a GET for `target` (path plus query). Returns nullopt when no
    // response was received (resolve, connect, timeout or read failure).
    virtual std::optional<HttpResponse> get(const std::string& target) = 0;
};

// Plain HTTP/1.1 client on Boost.Beast; one connection per request.
class BeastHttpTransport : public IHttpTransport {
public:
    BeastHttpTransport(const std::string& host, int port, std::chrono::milliseconds timeout);

    std::optional<HttpResponse> get(const std::string& target) override;

private:
    std::string host_;
    int port_;
    std::chrono::milliseconds timeout_;

    Logger logger_;
};
