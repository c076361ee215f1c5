#pragma once

#include <chrono>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace yourapi {

/// Settings consumed once when a Client is constructed.
///
/// Only baseUrl is required. Unset optionals fall back to the defaults in
/// version.hpp. When both bearerToken and apiKey are set, only the bearer
/// token is sent.
struct ClientOptions {
    std::string                        baseUrl;
    std::optional<std::string>         apiKey;
    std::optional<std::string>         bearerToken;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<unsigned int>        maxRetries;
    std::optional<std::string>         userAgent;
    std::map<std::string, std::string> customHeaders;
    bool                               debug     = false;
    std::ostream*                      logStream = nullptr;  // nullptr = std::cerr

    ClientOptions() = default;
    explicit ClientOptions(std::string url) : baseUrl(std::move(url)) {}

    ClientOptions& withApiKey(std::string key) {
        apiKey = std::move(key);
        return *this;
    }

    ClientOptions& withBearerToken(std::string token) {
        bearerToken = std::move(token);
        return *this;
    }

    ClientOptions& withTimeout(std::chrono::milliseconds value) {
        timeout = value;
        return *this;
    }

    ClientOptions& withMaxRetries(unsigned int value) {
        maxRetries = value;
        return *this;
    }

    ClientOptions& withUserAgent(std::string value) {
        userAgent = std::move(value);
        return *this;
    }

    ClientOptions& withHeader(std::string name, std::string value) {
        customHeaders[std::move(name)] = std::move(value);
        return *this;
    }

    ClientOptions& withDebug(bool value) {
        debug = value;
        return *this;
    }

    /// The Client keeps a pointer to @p os, so the stream must outlive every
    /// Client built from these options.
    ClientOptions& withLogStream(std::ostream& os) {
        logStream = &os;
        return *this;
    }
};

} // namespace yourapi
