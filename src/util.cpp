#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace yourapi {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target.front() == '?') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (parts.port.empty()) {
            throw std::invalid_argument("Invalid URL (empty port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string normalizeBaseUrl(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

bool isRetryableStatus(unsigned int status) {
    switch (status) {
        case 429:
        case 500:
        case 502:
        case 503:
        case 504:
            return true;
        default:
            return false;
    }
}

std::chrono::seconds computeBackoff(unsigned int attempt,
                                    std::optional<std::int64_t> retryAfterSeconds)
{
    if (retryAfterSeconds) {
        return std::chrono::seconds(*retryAfterSeconds);
    }

    // Exponential: 2^attempt seconds, clamped to 8.
    const std::int64_t backoff = attempt >= 3 ? 8 : (std::int64_t{1} << attempt);
    return std::chrono::seconds(backoff);
}

std::optional<std::int64_t> parseRetryAfter(const std::string& value) {
    if (value.empty()) return std::nullopt;

    std::int64_t seconds = 0;
    for (char c : value) {
        if (c < '0' || c > '9') return std::nullopt;
        const int digit = c - '0';
        if (seconds > (std::numeric_limits<std::int64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        seconds = seconds * 10 + digit;
    }
    return seconds;
}

std::string appendCursor(const std::string& path, const std::string& cursor) {
    const char separator = path.find('?') != std::string::npos ? '&' : '?';
    return path + separator + "cursor=" + cursor;
}

std::string urlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(u);
        }
    }
    return escaped.str();
}

std::string appendQuery(const std::string& path, const QueryParams& params) {
    std::string result = path;
    char separator = path.find('?') != std::string::npos ? '&' : '?';
    for (const auto& param : params) {
        result += separator;
        result += urlEncode(param.first) + "=" + urlEncode(param.second);
        separator = '&';
    }
    return result;
}

bool isValidHeaderName(const std::string& name) {
    if (name.empty()) return false;

    static const char* const kTokenSymbols = "!#$%&'*+-.^_`|~";
    return std::all_of(name.begin(), name.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return (u >= '0' && u <= '9') || (u >= 'a' && u <= 'z') ||
               (u >= 'A' && u <= 'Z') ||
               (u != 0 && std::strchr(kTokenSymbols, c) != nullptr);
    });
}

bool isValidHeaderValue(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return u == '\t' || (u >= 0x20 && u < 0x7f);
    });
}

} // namespace yourapi
