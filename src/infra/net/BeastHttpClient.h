#pragma once

#include <chrono>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "infra/net/HttpClient.h"

namespace infra::net {

// Async HTTP/1.1 over Beast; one connection per request, https:// selects TLS.
class BeastHttpClient : public HttpClient {
public:
    struct Options {
        std::string authToken;
        std::chrono::milliseconds timeout{30000};
    };

    BeastHttpClient(boost::asio::io_context& ioc, Options options);

    void request(HttpMethod method, const std::string& url, std::string body, Handler handler) override;

private:
    boost::asio::io_context& ioc_;
    boost::asio::ssl::context sslCtx_;
    Options options_;
};

}  // namespace infra::net
