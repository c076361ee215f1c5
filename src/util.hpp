#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace yourapi {

/// Ordered query parameters; names may repeat.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path + query (e.g. "/v1/items?limit=10")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Strip every trailing '/' from a base URL.
std::string normalizeBaseUrl(std::string url);

/// 429, 500, 502, 503 and 504.
bool isRetryableStatus(unsigned int status);

/// Delay before the attempt after @p attempt (0-based index of the attempt
/// that just failed). A server hint is used verbatim; otherwise
/// min(2^attempt, 8) seconds.
std::chrono::seconds computeBackoff(unsigned int attempt,
                                    std::optional<std::int64_t> retryAfterSeconds = std::nullopt);

/// Parse a Retry-After header given as integer seconds. The HTTP-date form
/// and anything else that is not a plain non-negative integer yields nullopt.
std::optional<std::int64_t> parseRetryAfter(const std::string& value);

/// Append "cursor=<c>" to @p path using '&' when it already has a query,
/// '?' otherwise. The cursor is inserted as-is.
std::string appendCursor(const std::string& path, const std::string& cursor);

/// Percent-encode everything except RFC 3986 unreserved characters.
std::string urlEncode(const std::string& value);

/// Append encoded @p params to @p path, joining with '&' when the path
/// already has a query and '?' otherwise. No params leaves the path as is.
std::string appendQuery(const std::string& path, const QueryParams& params);

/// RFC 7230 token: non-empty, tchar only.
bool isValidHeaderName(const std::string& name);

/// HTAB, SP and visible ASCII only.
bool isValidHeaderValue(const std::string& value);

} // namespace yourapi
