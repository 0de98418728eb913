#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace infra::net {

struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target{"/"};
    bool tls{false};
};

// ws, wss, http and https only; the port defaults from the scheme.
std::optional<Url> parseUrl(std::string_view text);

// Value for the Host header: the port is kept unless it is the scheme's default.
std::string hostHeader(const Url& url);

// Joins a base URL ("ws://host:8000/prefix") and a path ("/ws/dashboard").
std::string joinUrl(std::string_view base, std::string_view path);

}  // namespace infra::net
