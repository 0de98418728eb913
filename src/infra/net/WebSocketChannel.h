#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "infra/net/Channel.h"
#include "infra/net/Url.h"

namespace infra::net {

class WebSocketSession;

// Beast websocket on the caller's io_context; wss:// selects TLS. Does not reconnect.
class WebSocketChannel : public Channel {
public:
    struct Options {
        std::string authToken;
        std::chrono::milliseconds connectTimeout{30000};
    };

    WebSocketChannel(boost::asio::io_context& ioc,
                     boost::asio::ssl::context& sslCtx,
                     std::string url,
                     Options options);
    ~WebSocketChannel() override;

    void open(ChannelCallbacks callbacks) override;
    void close() override;
    bool isOpen() const override;

    const std::string& url() const noexcept { return url_; }

private:
    boost::asio::io_context& ioc_;
    boost::asio::ssl::context& sslCtx_;
    std::string url_;
    Options options_;
    std::shared_ptr<WebSocketSession> session_;
};

class WebSocketChannelFactory : public ChannelFactory {
public:
    WebSocketChannelFactory(boost::asio::io_context& ioc, WebSocketChannel::Options options);

    std::unique_ptr<Channel> create(const std::string& url) override;

private:
    boost::asio::io_context& ioc_;
    boost::asio::ssl::context sslCtx_;
    WebSocketChannel::Options options_;
};

}  // namespace infra::net
