#include "infra/net/BeastHttpClient.h"

#include <memory>
#include <type_traits>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>

#include "infra/net/Url.h"
#include "logging/Log.h"

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace infra::net {

namespace {

template <bool Tls>
class HttpSession : public std::enable_shared_from_this<HttpSession<Tls>> {
public:
    using Stream = std::conditional_t<Tls, beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;

    HttpSession(asio::io_context& ioc,
                ssl::context& sslCtx,
                Url url,
                http::request<http::string_body> req,
                std::chrono::milliseconds timeout,
                HttpClient::Handler handler)
        : resolver_(ioc),
          deadline_(ioc),
          stream_(makeStream(ioc, sslCtx)),
          url_(std::move(url)),
          req_(std::move(req)),
          timeout_(timeout),
          handler_(std::move(handler)) {}

    // One deadline covers resolve, connect, handshake, write and read.
    void run() {
        deadline_.expires_after(timeout_);
        deadline_.async_wait(beast::bind_front_handler(&HttpSession::onDeadline, this->shared_from_this()));
        resolver_.async_resolve(url_.host, url_.port,
                                beast::bind_front_handler(&HttpSession::onResolve, this->shared_from_this()));
    }

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

    void onDeadline(beast::error_code ec) {
        if (ec == asio::error::operation_aborted || !handler_) {
            return;
        }
        timedOut_ = true;
        resolver_.cancel();
        beast::get_lowest_layer(*stream_).cancel();
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            fail("resolve", ec);
            return;
        }
        auto& lowest = beast::get_lowest_layer(*stream_);
        lowest.async_connect(results, beast::bind_front_handler(&HttpSession::onConnect, this->shared_from_this()));
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            fail("connect", ec);
            return;
        }
        if constexpr (Tls) {
            if (!SSL_set_tlsext_host_name(stream_->native_handle(), url_.host.c_str())) {
                beast::error_code sniEc{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
                fail("sni", sniEc);
                return;
            }
            stream_->async_handshake(ssl::stream_base::client,
                                     beast::bind_front_handler(&HttpSession::onHandshake, this->shared_from_this()));
        }
        else {
            write();
        }
    }

    void onHandshake(beast::error_code ec) {
        if (ec) {
            fail("ssl_handshake", ec);
            return;
        }
        write();
    }

    void write() {
        http::async_write(*stream_, req_, beast::bind_front_handler(&HttpSession::onWrite, this->shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            fail("write", ec);
            return;
        }
        http::async_read(*stream_, buffer_, res_, beast::bind_front_handler(&HttpSession::onRead, this->shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            fail("read", ec);
            return;
        }

        HttpResponse response;
        response.status = static_cast<int>(res_.result_int());
        response.body = std::move(res_.body());
        if (response.status < 200 || response.status >= 300) {
            LOG_WARN(logging::LogCategory::NET,
                     "HTTP %s%s status=%d",
                     url_.host.c_str(),
                     url_.target.c_str(),
                     response.status);
        }
        shutdown();
        complete(std::move(response));
    }

    void shutdown() {
        beast::error_code ignored;
        beast::get_lowest_layer(*stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
        beast::get_lowest_layer(*stream_).close();
    }

    void fail(const char* stage, beast::error_code ec) {
        if (timedOut_) {
            ec = beast::error::timeout;
        }
        LOG_WARN(logging::LogCategory::NET,
                 "HTTP error during %s for %s%s: %s",
                 stage,
                 url_.host.c_str(),
                 url_.target.c_str(),
                 ec.message().c_str());
        HttpResponse response;
        response.error = std::string(stage) + ": " + ec.message();
        complete(std::move(response));
    }

    void complete(HttpResponse response) {
        deadline_.cancel();
        auto handler = std::move(handler_);
        handler_ = nullptr;
        if (handler) {
            handler(std::move(response));
        }
    }

    tcp::resolver resolver_;
    asio::steady_timer deadline_;
    std::unique_ptr<Stream> stream_;
    Url url_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    beast::flat_buffer buffer_;
    std::chrono::milliseconds timeout_;
    HttpClient::Handler handler_;
    bool timedOut_{false};
};

}  // namespace

BeastHttpClient::BeastHttpClient(asio::io_context& ioc, Options options)
    : ioc_(ioc), sslCtx_(ssl::context::tlsv12_client), options_(std::move(options)) {
    sslCtx_.set_default_verify_paths();
    sslCtx_.set_verify_mode(ssl::verify_peer);
}

void BeastHttpClient::request(HttpMethod method, const std::string& url, std::string body, Handler handler) {
    auto parsed = parseUrl(url);
    if (!parsed || parsed->scheme == "ws" || parsed->scheme == "wss") {
        LOG_ERROR(logging::LogCategory::NET, "Invalid http url: %s", url.c_str());
        HttpResponse response;
        response.error = "invalid url: " + url;
        asio::post(ioc_, [handler = std::move(handler), response = std::move(response)]() mutable {
            if (handler) {
                handler(std::move(response));
            }
        });
        return;
    }

    http::request<http::string_body> req{method == HttpMethod::Post ? http::verb::post : http::verb::get, parsed->target, 11};
    req.set(http::field::host, hostHeader(*parsed));
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::accept, "application/json");
    if (!options_.authToken.empty()) {
        req.set(http::field::authorization, "Bearer " + options_.authToken);
    }
    if (method == HttpMethod::Post) {
        req.set(http::field::content_type, "application/json");
        req.body() = body.empty() ? std::string{"{}"} : std::move(body);
        req.prepare_payload();
    }

    LOG_DEBUG(logging::LogCategory::NET, "HTTP %s %s", method == HttpMethod::Post ? "POST" : "GET", url.c_str());
    if (parsed->tls) {
        std::make_shared<HttpSession<true>>(ioc_, sslCtx_, std::move(*parsed), std::move(req), options_.timeout, std::move(handler))
            ->run();
    }
    else {
        std::make_shared<HttpSession<false>>(ioc_, sslCtx_, std::move(*parsed), std::move(req), options_.timeout, std::move(handler))
            ->run();
    }
}

}  // namespace infra::net
