#include "infra/net/WebSocketChannel.h"

#include <type_traits>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>

#include "logging/Log.h"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace infra::net {

class WebSocketSession {
public:
    virtual ~WebSocketSession() = default;

    virtual void start(ChannelCallbacks callbacks) = 0;
    virtual void stop() = 0;
    virtual bool isOpen() const = 0;
};

namespace {

template <bool Tls>
class WsSession final : public WebSocketSession, public std::enable_shared_from_this<WsSession<Tls>> {
public:
    using Layer = std::conditional_t<Tls, beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;
    using Stream = websocket::stream<Layer>;

    WsSession(asio::io_context& ioc, ssl::context& sslCtx, Url url, WebSocketChannel::Options options)
        : resolver_(ioc), ws_(makeStream(ioc, sslCtx)), url_(std::move(url)), options_(std::move(options)) {}

    void start(ChannelCallbacks callbacks) override {
        if (running_) {
            return;
        }
        callbacks_ = std::move(callbacks);
        running_ = true;
        LOG_DEBUG(logging::LogCategory::NET, "WS resolving %s:%s", url_.host.c_str(), url_.port.c_str());
        resolver_.async_resolve(url_.host, url_.port,
                                beast::bind_front_handler(&WsSession::onResolve, this->shared_from_this()));
    }

    void stop() override {
        if (!running_) {
            return;
        }
        running_ = false;
        callbacks_ = ChannelCallbacks{};
        resolver_.cancel();
        if (open_) {
            open_ = false;
            ws_->async_close(websocket::close_code::normal, [self = this->shared_from_this()](beast::error_code ec) {
                if (ec && ec != asio::error::operation_aborted) {
                    LOG_DEBUG(logging::LogCategory::NET, "WS close warning: %s", ec.message().c_str());
                }
            });
            return;
        }
        beast::get_lowest_layer(*ws_).close();
    }

    bool isOpen() const override { return open_; }

private:
    static std::unique_ptr<Stream> makeStream(asio::io_context& ioc, ssl::context& sslCtx) {
        if constexpr (Tls) {
            return std::make_unique<Stream>(ioc, sslCtx);
        }
        else {
            (void)sslCtx;
            return std::make_unique<Stream>(ioc);
        }
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (!running_) {
            return;
        }
        if (ec) {
            handleFailure("resolve", ec);
            return;
        }
        auto& lowest = beast::get_lowest_layer(*ws_);
        lowest.expires_after(options_.connectTimeout);
        lowest.async_connect(results, beast::bind_front_handler(&WsSession::onConnect, this->shared_from_this()));
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (!running_) {
            return;
        }
        if (ec) {
            handleFailure("connect", ec);
            return;
        }
        if constexpr (Tls) {
            if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), url_.host.c_str())) {
                beast::error_code sniEc{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
                handleFailure("sni", sniEc);
                return;
            }
            ws_->next_layer().async_handshake(ssl::stream_base::client,
                                              beast::bind_front_handler(&WsSession::onSslHandshake, this->shared_from_this()));
        }
        else {
            startHandshake();
        }
    }

    void onSslHandshake(beast::error_code ec) {
        if (!running_) {
            return;
        }
        if (ec) {
            handleFailure("ssl_handshake", ec);
            return;
        }
        startHandshake();
    }

    void startHandshake() {
        beast::get_lowest_layer(*ws_).expires_never();
        ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        std::string token = options_.authToken;
        ws_->set_option(websocket::stream_base::decorator([token](websocket::request_type& req) {
            req.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " fxsync");
            if (!token.empty()) {
                req.set(http::field::authorization, "Bearer " + token);
            }
        }));
        ws_->async_handshake(hostHeader(url_), url_.target,
                             beast::bind_front_handler(&WsSession::onHandshake, this->shared_from_this()));
    }

    void onHandshake(beast::error_code ec) {
        if (!running_) {
            return;
        }
        if (ec) {
            handleFailure("handshake", ec);
            return;
        }
        open_ = true;
        LOG_INFO(logging::LogCategory::NET, "WS connected %s%s", url_.host.c_str(), url_.target.c_str());
        // The callback may close the channel, which clears callbacks_.
        auto onOpen = callbacks_.onOpen;
        if (onOpen) {
            onOpen();
        }
        doRead();
    }

    void doRead() {
        if (!running_) {
            return;
        }
        ws_->async_read(buffer_, beast::bind_front_handler(&WsSession::onRead, this->shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t bytes) {
        boost::ignore_unused(bytes);
        if (!running_) {
            return;
        }
        if (ec) {
            handleFailure(ec == websocket::error::closed ? "remote_close" : "read", ec);
            return;
        }

        std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        auto onMessage = callbacks_.onMessage;
        if (onMessage) {
            onMessage(std::move(message));
        }
        doRead();
    }

    void handleFailure(const char* stage, beast::error_code ec) {
        if (!running_) {
            return;
        }
        running_ = false;
        open_ = false;
        LOG_WARN(logging::LogCategory::NET, "WS error during %s: %s", stage, ec.message().c_str());
        auto onClose = std::move(callbacks_.onClose);
        callbacks_ = ChannelCallbacks{};
        beast::error_code ignored;
        beast::get_lowest_layer(*ws_).socket().close(ignored);
        if (onClose) {
            onClose(std::string(stage) + ": " + ec.message());
        }
    }

    tcp::resolver resolver_;
    std::unique_ptr<Stream> ws_;
    beast::flat_buffer buffer_;
    Url url_;
    WebSocketChannel::Options options_;
    ChannelCallbacks callbacks_;
    bool running_{false};
    bool open_{false};
};

}  // namespace

WebSocketChannel::WebSocketChannel(asio::io_context& ioc, ssl::context& sslCtx, std::string url, Options options)
    : ioc_(ioc), sslCtx_(sslCtx), url_(std::move(url)), options_(std::move(options)) {}

WebSocketChannel::~WebSocketChannel() {
    close();
}

void WebSocketChannel::open(ChannelCallbacks callbacks) {
    if (session_) {
        LOG_WARN(logging::LogCategory::NET, "WS channel already opened: %s", url_.c_str());
        return;
    }

    auto parsed = parseUrl(url_);
    if (!parsed) {
        LOG_ERROR(logging::LogCategory::NET, "Invalid websocket url: %s", url_.c_str());
        auto onClose = std::move(callbacks.onClose);
        std::string reason = "invalid url: " + url_;
        asio::post(ioc_, [onClose = std::move(onClose), reason = std::move(reason)]() {
            if (onClose) {
                onClose(reason);
            }
        });
        return;
    }

    if (parsed->tls) {
        session_ = std::make_shared<WsSession<true>>(ioc_, sslCtx_, std::move(*parsed), options_);
    }
    else {
        session_ = std::make_shared<WsSession<false>>(ioc_, sslCtx_, std::move(*parsed), options_);
    }
    session_->start(std::move(callbacks));
}

void WebSocketChannel::close() {
    if (session_) {
        session_->stop();
    }
}

bool WebSocketChannel::isOpen() const {
    return session_ && session_->isOpen();
}

WebSocketChannelFactory::WebSocketChannelFactory(asio::io_context& ioc, WebSocketChannel::Options options)
    : ioc_(ioc), sslCtx_(ssl::context::tlsv12_client), options_(std::move(options)) {
    sslCtx_.set_default_verify_paths();
    sslCtx_.set_verify_mode(ssl::verify_peer);
}

std::unique_ptr<Channel> WebSocketChannelFactory::create(const std::string& url) {
    return std::make_unique<WebSocketChannel>(ioc_, sslCtx_, url, options_);
}

}  // namespace infra::net
