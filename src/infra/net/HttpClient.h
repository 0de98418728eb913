#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace infra::net {

enum class HttpMethod { Get, Post };

struct HttpResponse {
    int status{0};
    std::string body;
    // Transport-level failure (resolve, connect, timeout, TLS).
    std::optional<std::string> error{};

    bool ok() const noexcept { return !error && status >= 200 && status < 300; }
};

class HttpClient {
public:
    using Handler = std::function<void(HttpResponse)>;

    virtual ~HttpClient() = default;

    // The handler runs exactly once on the event loop.
    virtual void request(HttpMethod method, const std::string& url, std::string body, Handler handler) = 0;

    void get(const std::string& url, Handler handler) { request(HttpMethod::Get, url, std::string{}, std::move(handler)); }
    void post(const std::string& url, std::string body, Handler handler) {
        request(HttpMethod::Post, url, std::move(body), std::move(handler));
    }
};

}  // namespace infra::net
