#include "http_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

BeastHttpTransport::BeastHttpTransport(const std::string& host, int port,
                                       std::chrono::milliseconds timeout)
    : host_(host), port_(port), timeout_(timeout), logger_("HttpTransport") {}

std::optional<HttpResponse> BeastHttpTransport::get(const std::string& target) {
    // Log the path only, the query carries the credential hash
    const std::string path = target.substr(0, target.find('?'));

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    auto const results = resolver.resolve(host_, std::to_string(port_), ec);
    if (ec) {
        logger_.warning() << "Cannot resolve " << host_ << ": " << ec.message();
        return std::nullopt;
    }

    // tcp_stream timeouts only apply to asynchronous operations, so every
    // step is started async and driven to completion on the local context
    auto finish = [&](const char* step) {
        ioc.run();
        ioc.restart();
        if (ec) {
            logger_.warning() << "HTTP " << step << " failed (" << host_ << ":" << port_
                              << path << "): " << ec.message();
            return false;
        }
        return true;
    };

    stream.expires_after(timeout_);
    stream.async_connect(results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    if (!finish("connect")) {
        return std::nullopt;
    }

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, port_ == 80 ? host_ : host_ + ":" + std::to_string(port_));
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);

    stream.expires_after(timeout_);
    http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    if (!finish("write")) {
        return std::nullopt;
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    stream.expires_after(timeout_);
    http::async_read(stream, buffer, res, [&ec](beast::error_code e, std::size_t) { ec = e; });
    if (!finish("read")) {
        return std::nullopt;
    }

    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    if (shutdown_ec && shutdown_ec != beast::errc::not_connected) {
        logger_.debug() << "Socket shutdown: " << shutdown_ec.message();
    }

    logger_.debug() << "GET " << path << " -> " << res.result_int();

    return HttpResponse{static_cast<int>(res.result_int()), res.body()};
}
