#include "infra/http/HttpClient.hpp"

#include <chrono>
#include <sstream>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include "domain/Errors.h"
#include "logging/Log.h"

namespace lmv::infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;

using Response = bhttp::response<bhttp::string_body>;

domain::TransportError makeError(const Endpoint& endpoint, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTP request to " << (endpoint.tls ? "https://" : "http://") << endpoint.host << ':' << endpoint.port
        << target << " failed: " << message;
    return domain::TransportError(oss.str());
}

bhttp::request<bhttp::string_body> buildRequest(const Endpoint& endpoint,
                                                Method method,
                                                const std::string& target,
                                                const std::string& body) {
    bhttp::request<bhttp::string_body> req{method == Method::Post ? bhttp::verb::post : bhttp::verb::get, target, 11};
    req.set(bhttp::field::host, endpoint.host);
    req.set(bhttp::field::user_agent, "LiveMarketView/0.1");
    req.set(bhttp::field::accept, "application/json");
    req.set(bhttp::field::connection, "close");
    if (method == Method::Post) {
        req.set(bhttp::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();
    }
    return req;
}

template <typename Stream>
Response exchange(Stream& stream,
                  beast::tcp_stream& lowestLayer,
                  const bhttp::request<bhttp::string_body>& req,
                  const Endpoint& endpoint,
                  const std::string& target,
                  int timeoutSec) {
    beast::error_code ec;
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    bhttp::write(stream, req, ec);
    if (ec) {
        throw makeError(endpoint, target, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    Response response;
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    bhttp::read(stream, buffer, response, ec);
    if (ec) {
        throw makeError(endpoint, target, "Read error: " + ec.message());
    }
    return response;
}

Response performRequest(const Endpoint& endpoint,
                        Method method,
                        const std::string& target,
                        const std::string& body,
                        int timeoutSec) {
    if (timeoutSec <= 0) {
        throw makeError(endpoint, target, "timeout must be positive");
    }

    net::io_context ioc;
    net::ip::tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto const results = resolver.resolve(endpoint.host, endpoint.port, ec);
    if (ec) {
        throw makeError(endpoint, target, "DNS resolution error: " + ec.message());
    }

    const auto req = buildRequest(endpoint, method, target, body);

    if (!endpoint.tls) {
        beast::tcp_stream stream(ioc);
        stream.expires_after(std::chrono::seconds(timeoutSec));
        stream.connect(results, ec);
        if (ec) {
            throw makeError(endpoint, target, "Connection error: " + ec.message());
        }
        auto response = exchange(stream, stream, req, endpoint, target, timeoutSec);
        stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
        return response;
    }

    ssl::context sslContext(ssl::context::tls_client);
    sslContext.set_default_verify_paths(ec);
    sslContext.set_verify_mode(ssl::verify_peer);
    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << endpoint.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(endpoint, target, oss.str());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(endpoint, target, "Connection error: " + ec.message());
    }

    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(endpoint, target, "TLS handshake error: " + ec.message());
    }

    auto response = exchange(stream, lowestLayer, req, endpoint, target, timeoutSec);

    stream.shutdown(ec);
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        LOG_DEBUG(logging::LogCategory::NET, "TLS shutdown with %s: %s", endpoint.host.c_str(), ec.message().c_str());
    }
    return response;
}

bool isRedirect(unsigned status) {
    return status == 301U || status == 302U || status == 307U || status == 308U;
}

}  // namespace

JsonResponse request_json(const Endpoint& endpoint,
                          Method method,
                          const std::string& target,
                          const std::string& body,
                          int timeout_sec) {
    if (endpoint.host.empty()) {
        throw domain::TransportError("HTTP request requires a non-empty host");
    }

    std::string currentTarget = target.empty() ? std::string{"/"} : target;
    if (currentTarget.front() != '/') {
        currentTarget.insert(currentTarget.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(endpoint, method, currentTarget, body, timeout_sec);
        const auto status = static_cast<unsigned>(response.result_int());
        if (isRedirect(status)) {
            const std::string location{response.base()[bhttp::field::location]};
            if (location.empty() || location.front() != '/') {
                throw makeError(endpoint, currentTarget, "Unsupported redirect to '" + location + "'");
            }
            currentTarget = location;
            continue;
        }

        JsonResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.final_target = currentTarget;
        return result;
    }

    throw makeError(endpoint, currentTarget, "Too many redirects");
}

std::string get_json(const Endpoint& endpoint, const std::string& target, int timeout_sec) {
    auto response = request_json(endpoint, Method::Get, target, {}, timeout_sec);
    if (response.status >= 400U) {
        throw makeError(endpoint, response.final_target, "HTTP status " + std::to_string(response.status) + " received");
    }
    return std::move(response.body);
}

std::string post_json(const Endpoint& endpoint, const std::string& target, const std::string& body, int timeout_sec) {
    auto response = request_json(endpoint, Method::Post, target, body, timeout_sec);
    if (response.status >= 400U) {
        throw makeError(endpoint, response.final_target, "HTTP status " + std::to_string(response.status) + " received");
    }
    return std::move(response.body);
}

std::string url_encode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
            c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        }
        else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

}  // namespace lmv::infra::http
