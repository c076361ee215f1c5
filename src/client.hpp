#pragma once

#include "api_error.hpp"
#include "cancellation.hpp"
#include "client_options.hpp"
#include "transport.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace yourapi {

/// Blocks the calling thread for a backoff delay. Injectable for tests.
using Sleeper = std::function<void(std::chrono::seconds)>;

/// Long-lived API client. Immutable after construction and safe to share
/// between threads; concurrent calls are independent.
///
/// Every call returns the decoded JSON body, std::nullopt for 204, or throws
/// APIError. Transient failures (429, 500, 502, 503, 504 and transport
/// errors) are retried up to maxRetries times with exponential backoff.
class Client {
public:
    /// @param options    Configuration, consumed here.
    /// @param transport  HTTP executor; a BeastTransport when null.
    /// @param sleeper    Backoff wait; std::this_thread::sleep_for when empty.
    /// @throws std::invalid_argument on an unusable base URL, a non-positive
    ///         timeout, or a header that is not valid HTTP.
    explicit Client(const ClientOptions& options,
                    std::shared_ptr<HttpTransport> transport = nullptr,
                    Sleeper sleeper = nullptr);

    /// Run one request through the retry pipeline.
    /// @param body          Sent as JSON unless null.
    /// @param extraHeaders  Applied over the default headers for this call.
    /// @param cancel        Abandons the call (code CANCELLED) when cancelled,
    ///                      including an exchange already in flight.
    std::optional<nlohmann::json> doRequest(HttpMethod method,
                                            const std::string& path,
                                            const nlohmann::json& body = nullptr,
                                            const HeaderMap* extraHeaders = nullptr,
                                            const CancellationToken* cancel = nullptr) const;

    std::optional<nlohmann::json> get(const std::string& path,
                                      const CancellationToken* cancel = nullptr) const;

    /// GET with @p params appended to the query string (URL-encoded).
    std::optional<nlohmann::json> get(const std::string& path,
                                      const QueryParams& params,
                                      const CancellationToken* cancel = nullptr) const;

    /// A present @p idempotencyKey is sent as the Idempotency-Key header.
    std::optional<nlohmann::json> post(const std::string& path,
                                       const nlohmann::json& body,
                                       const std::optional<std::string>& idempotencyKey = std::nullopt,
                                       const CancellationToken* cancel = nullptr) const;

    std::optional<nlohmann::json> patch(const std::string& path,
                                        const nlohmann::json& body,
                                        const CancellationToken* cancel = nullptr) const;
    std::optional<nlohmann::json> put(const std::string& path,
                                      const nlohmann::json& body,
                                      const CancellationToken* cancel = nullptr) const;
    std::optional<nlohmann::json> del(const std::string& path,
                                      const CancellationToken* cancel = nullptr) const;

    /// GET and decode the body into T. std::nullopt on 204.
    /// @throws APIError with code PARSE_ERROR when the body does not fit T.
    template <typename T>
    std::optional<T> getAs(const std::string& path,
                           const CancellationToken* cancel = nullptr) const {
        auto body = get(path, cancel);
        if (!body) return std::nullopt;
        try {
            return body->get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw APIError(std::string("Failed to decode response: ") + e.what(),
                           std::nullopt, errc::kParseError);
        }
    }

    const std::string&        baseUrl()        const { return mBaseUrl; }
    const HeaderMap&          defaultHeaders() const { return mDefaultHeaders; }
    std::chrono::milliseconds timeout()        const { return mTimeout; }
    unsigned int              maxRetries()     const { return mMaxRetries; }
    bool                      debug()          const { return mDebug; }
    std::ostream&             logStream()      const { return *mLog; }

private:
    std::string                    mBaseUrl;
    HeaderMap                      mDefaultHeaders;
    std::chrono::milliseconds      mTimeout;
    unsigned int                   mMaxRetries;
    bool                           mDebug;
    std::ostream*                  mLog;
    std::shared_ptr<HttpTransport> mTransport;
    Sleeper                        mSleeper;

    HttpRequest buildRequest(HttpMethod method,
                             const std::string& url,
                             const std::optional<std::string>& body,
                             const HeaderMap* extraHeaders,
                             const CancellationToken* cancel) const;

    void waitBeforeRetry(std::chrono::seconds delay,
                         const CancellationToken* cancel) const;

    void logDebug(const std::string& message) const;
};

/// Build the APIError for a non-2xx response that will not be retried.
/// Body fields message/code/details/requestId are used when the body is JSON;
/// the x-request-id header is the fallback request id.
APIError parseErrorResponse(const HttpResponse& response);

} // namespace yourapi
