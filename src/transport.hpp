#pragma once

#include "cancellation.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace yourapi {

enum class HttpMethod { Get, Post, Put, Patch, Delete };

/// "GET", "POST", ...
const char* toString(HttpMethod method);

/// Ordered header list with case-insensitive names.
class HeaderMap {
public:
    using Entry          = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    /// Insert, or replace the value of an existing header in place.
    void set(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    bool contains(const std::string& name) const;

    bool        empty() const { return mEntries.empty(); }
    std::size_t size()  const { return mEntries.size(); }

    const_iterator begin() const { return mEntries.begin(); }
    const_iterator end()   const { return mEntries.end(); }

private:
    std::vector<Entry> mEntries;
};

struct HttpRequest {
    HttpMethod                 method = HttpMethod::Get;
    std::string                url;
    HeaderMap                  headers;
    std::optional<std::string> body;
    std::chrono::milliseconds  timeout{0};
    const CancellationToken*   cancel = nullptr;  // abandons the exchange when cancelled
};

struct HttpResponse {
    unsigned int status = 0;
    HeaderMap    headers;
    std::string  body;
};

/// Raised by a transport when no response could be obtained
/// (resolve, connect, TLS, I/O or timeout failure).
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Executes one HTTP exchange. Implementations must be safe to call from
/// several threads at once, and must give up promptly with TransportError
/// once request.cancel is cancelled.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// @throws TransportError when the exchange fails before a response.
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

} // namespace yourapi
