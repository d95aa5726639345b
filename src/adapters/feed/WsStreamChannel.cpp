#include "adapters/feed/WsStreamChannel.hpp"

#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "domain/Errors.h"
#include "infra/http/HttpClient.hpp"
#include "logging/Log.h"

namespace lmv::adapters::feed {

namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr auto kStopPoll = std::chrono::milliseconds(200);
constexpr auto kConnectTimeout = std::chrono::seconds(10);

domain::TransportError make_error(const std::string& host, const std::string& message) {
    return domain::TransportError("WsStreamChannel " + host + ": " + message);
}

}  // namespace

WsStreamChannel::WsStreamChannel(WsEndpoint endpoint)
    : endpoint_(std::move(endpoint)), sslCtx_(ssl::context::tls_client) {
    beast::error_code ec;
    sslCtx_.set_default_verify_paths(ec);
    if (ec) {
        LOG_WARN(logging::LogCategory::NET, "Default CA paths unavailable: %s", ec.message().c_str());
    }
    sslCtx_.set_verify_mode(ssl::verify_peer);
}

WsStreamChannel::~WsStreamChannel() {
    close();
}

std::string WsStreamChannel::buildPath(const std::string& pathTemplate,
                                       const std::string& venue,
                                       const std::string& symbol) {
    std::string path = pathTemplate.empty() ? std::string{"/"} : pathTemplate;
    const std::string values[] = {infra::http::url_encode(venue), infra::http::url_encode(symbol)};
    std::size_t searchFrom = 0;
    for (const auto& value : values) {
        const auto pos = path.find("%s", searchFrom);
        if (pos == std::string::npos) {
            break;
        }
        path.replace(pos, 2, value);
        searchFrom = pos + value.size();
    }
    if (path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    return path;
}

template <typename Cancel, typename Start>
beast::error_code WsStreamChannel::pump_(Cancel&& cancel, Start&& start) {
    bool done = false;
    beast::error_code result;
    ioc_.restart();
    start([&done, &result](beast::error_code ec, auto&&...) {
        result = ec;
        done = true;
    });

    bool cancelled = false;
    while (!done) {
        ioc_.run_one_for(kStopPoll);
        if (!done && !cancelled && closing_.load(std::memory_order_acquire)) {
            cancel();
            cancelled = true;
        }
        if (!done && ioc_.stopped()) {
            ioc_.restart();
        }
    }
    return result;
}

template <typename Ws, typename Start>
beast::error_code WsStreamChannel::drive_(Ws& ws, Start&& start) {
    return pump_([&ws]() { beast::get_lowest_layer(ws).cancel(); }, std::forward<Start>(start));
}

template <typename Ws>
void WsStreamChannel::handshake_(Ws& ws, const std::string& path) {
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "LiveMarketView/0.1");
    }));
    const std::string hostHeader = endpoint_.host + ":" + endpoint_.port;
    auto ec = drive_(ws, [&](auto handler) { ws.async_handshake(hostHeader, path, std::move(handler)); });
    if (ec) {
        throw make_error(endpoint_.host, "WebSocket handshake error: " + ec.message());
    }
}

void WsStreamChannel::open(const std::string& venue, const std::string& symbol) {
    if (closing_.load(std::memory_order_acquire)) {
        throw make_error(endpoint_.host, "channel closed");
    }

    net::ip::tcp::resolver resolver(ioc_);
    net::ip::tcp::resolver::results_type results;
    auto ec = pump_([&resolver]() { resolver.cancel(); }, [&](auto handler) {
        resolver.async_resolve(endpoint_.host,
                               endpoint_.port,
                               [&results, handler = std::move(handler)](beast::error_code resolveEc,
                                                                       net::ip::tcp::resolver::results_type found) mutable {
                                   results = std::move(found);
                                   handler(resolveEc);
                               });
    });
    if (closing_.load(std::memory_order_acquire)) {
        throw make_error(endpoint_.host, "channel closed");
    }
    if (ec) {
        throw make_error(endpoint_.host, "DNS resolution error: " + ec.message());
    }

    const std::string path = buildPath(endpoint_.pathTemplate, venue, symbol);

    if (!endpoint_.tls) {
        plain_ = std::make_unique<PlainWs>(ioc_);
        auto& lowest = beast::get_lowest_layer(*plain_);
        lowest.expires_after(kConnectTimeout);
        ec = drive_(*plain_, [&](auto handler) { lowest.async_connect(results, std::move(handler)); });
        if (ec) {
            throw make_error(endpoint_.host, "Connection error: " + ec.message());
        }
        lowest.expires_never();
        handshake_(*plain_, path);
    }
    else {
        secure_ = std::make_unique<SecureWs>(ioc_, sslCtx_);
        if (!SSL_set_tlsext_host_name(secure_->next_layer().native_handle(), endpoint_.host.c_str())) {
            throw make_error(endpoint_.host, "Failed to set SNI hostname");
        }
        auto& lowest = beast::get_lowest_layer(*secure_);
        lowest.expires_after(kConnectTimeout);
        ec = drive_(*secure_, [&](auto handler) { lowest.async_connect(results, std::move(handler)); });
        if (ec) {
            throw make_error(endpoint_.host, "Connection error: " + ec.message());
        }
        lowest.expires_after(kConnectTimeout);
        ec = drive_(*secure_, [&](auto handler) {
            secure_->next_layer().async_handshake(ssl::stream_base::client, std::move(handler));
        });
        if (ec) {
            throw make_error(endpoint_.host, "TLS handshake error: " + ec.message());
        }
        lowest.expires_never();
        handshake_(*secure_, path);
    }
    LOG_DEBUG(logging::LogCategory::NET, "WebSocket connected to %s%s", endpoint_.host.c_str(), path.c_str());
}

template <typename Ws>
std::optional<std::string> WsStreamChannel::readFrom_(Ws& ws) {
    beast::flat_buffer buffer;
    auto ec = drive_(ws, [&](auto handler) { ws.async_read(buffer, std::move(handler)); });
    if (closing_.load(std::memory_order_acquire)) {
        return std::nullopt;
    }
    if (ec == websocket::error::closed) {
        throw make_error(endpoint_.host, "closed by peer");
    }
    if (ec) {
        throw make_error(endpoint_.host, "Read error: " + ec.message());
    }
    return beast::buffers_to_string(buffer.data());
}

std::optional<std::string> WsStreamChannel::read() {
    if (closing_.load(std::memory_order_acquire)) {
        return std::nullopt;
    }
    if (plain_) {
        return readFrom_(*plain_);
    }
    if (secure_) {
        return readFrom_(*secure_);
    }
    throw make_error(endpoint_.host, "read before open");
}

void WsStreamChannel::close() noexcept {
    closing_.store(true, std::memory_order_release);
}

}  // namespace lmv::adapters::feed
