#include "infra/net/Url.h"

#include <algorithm>
#include <cctype>

namespace infra::net {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}  // namespace

std::optional<Url> parseUrl(std::string_view text) {
    const auto schemeEnd = text.find("://");
    if (schemeEnd == std::string_view::npos || schemeEnd == 0) {
        return std::nullopt;
    }

    Url url;
    url.scheme = toLowerCopy(std::string(text.substr(0, schemeEnd)));
    if (url.scheme == "ws" || url.scheme == "http") {
        url.tls = false;
        url.port = "80";
    }
    else if (url.scheme == "wss" || url.scheme == "https") {
        url.tls = true;
        url.port = "443";
    }
    else {
        return std::nullopt;
    }

    std::string_view rest = text.substr(schemeEnd + 3);
    const auto pathStart = rest.find('/');
    std::string_view authority = rest.substr(0, pathStart);
    if (pathStart != std::string_view::npos) {
        url.target = std::string(rest.substr(pathStart));
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
        const auto port = authority.substr(colon + 1);
        if (port.empty() || !std::all_of(port.begin(), port.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
            return std::nullopt;
        }
        url.port = std::string(port);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    url.host = std::string(authority);
    return url;
}

std::string hostHeader(const Url& url) {
    const char* defaultPort = url.tls ? "443" : "80";
    if (url.port.empty() || url.port == defaultPort) {
        return url.host;
    }
    return url.host + ":" + url.port;
}

std::string joinUrl(std::string_view base, std::string_view path) {
    std::string result(base);
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    if (!path.empty() && path.front() != '/') {
        result.push_back('/');
    }
    result.append(path);
    return result;
}

}  // namespace infra::net
