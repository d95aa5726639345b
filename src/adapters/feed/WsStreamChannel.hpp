#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "adapters/feed/IStreamChannel.hpp"

namespace lmv::adapters::feed {

struct WsEndpoint {
    std::string host;
    std::string port{"443"};
    bool tls{true};
    // Two %s placeholders, venue then symbol.
    std::string pathTemplate{"/market-data/stream?venue=%s&symbol=%s"};
};

/**
 * WebSocket channel driven from the calling thread. Operations are issued
 * asynchronously and the private io_context is pumped in short slices so a
 * close() from another thread takes effect within one slice.
 */
class WsStreamChannel : public IStreamChannel {
public:
    explicit WsStreamChannel(WsEndpoint endpoint);
    ~WsStreamChannel() override;

    void open(const std::string& venue, const std::string& symbol) override;
    std::optional<std::string> read() override;
    void close() noexcept override;

    static std::string buildPath(const std::string& pathTemplate, const std::string& venue, const std::string& symbol);

private:
    using PlainWs = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using SecureWs = boost::beast::websocket::stream<boost::asio::ssl::stream<boost::beast::tcp_stream>>;

    // Runs one async operation to completion; `cancel` aborts it once close()
    // is requested.
    template <typename Cancel, typename Start>
    boost::beast::error_code pump_(Cancel&& cancel, Start&& start);
    template <typename Ws, typename Start>
    boost::beast::error_code drive_(Ws& ws, Start&& start);
    template <typename Ws>
    void handshake_(Ws& ws, const std::string& path);
    template <typename Ws>
    std::optional<std::string> readFrom_(Ws& ws);

    WsEndpoint endpoint_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context sslCtx_;
    std::unique_ptr<PlainWs> plain_;
    std::unique_ptr<SecureWs> secure_;
    std::atomic<bool> closing_{false};
};

}  // namespace lmv::adapters::feed
