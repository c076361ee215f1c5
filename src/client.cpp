#include "client.hpp"
#include "beast_transport.hpp"
#include "util.hpp"
#include "version.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace yourapi {

namespace {

void setValidatedHeader(HeaderMap& headers,
                        const std::string& name,
                        const std::string& value)
{
    if (!isValidHeaderName(name)) {
        throw std::invalid_argument("Invalid header name: '" + name + "'");
    }
    if (!isValidHeaderValue(value)) {
        throw std::invalid_argument("Invalid value for header '" + name + "'");
    }
    headers.set(name, value);
}

void throwIfCancelled(const CancellationToken* cancel) {
    if (cancel && cancel->isCancelled()) {
        throw APIError("Request cancelled", std::nullopt, errc::kCancelled);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Client::Client(const ClientOptions& options,
               std::shared_ptr<HttpTransport> transport,
               Sleeper sleeper)
    : mBaseUrl(normalizeBaseUrl(options.baseUrl))
    , mTimeout(options.timeout.value_or(kDefaultTimeout))
    , mMaxRetries(options.maxRetries.value_or(kDefaultMaxRetries))
    , mDebug(options.debug)
    , mLog(options.logStream ? options.logStream : &std::cerr)
    , mTransport(std::move(transport))
    , mSleeper(std::move(sleeper))
{
    if (mBaseUrl.empty()) {
        throw std::invalid_argument("Client requires a base URL");
    }
    parseUrl(mBaseUrl);

    if (mTimeout.count() <= 0) {
        throw std::invalid_argument("Client timeout must be positive");
    }

    // Later entries win on collision.
    setValidatedHeader(mDefaultHeaders, "User-Agent",
                       options.userAgent.value_or(defaultUserAgent()));
    setValidatedHeader(mDefaultHeaders, "X-SDK-Language", kSdkLanguage);
    setValidatedHeader(mDefaultHeaders, "X-SDK-Version", kSdkVersion);

    if (options.bearerToken) {
        setValidatedHeader(mDefaultHeaders, "Authorization",
                           "Bearer " + *options.bearerToken);
    } else if (options.apiKey) {
        setValidatedHeader(mDefaultHeaders, "X-API-Key", *options.apiKey);
    }

    for (const auto& header : options.customHeaders) {
        setValidatedHeader(mDefaultHeaders, header.first, header.second);
    }

    if (!mTransport) {
        mTransport = std::make_shared<BeastTransport>();
    }
    if (!mSleeper) {
        mSleeper = [](std::chrono::seconds delay) {
            std::this_thread::sleep_for(delay);
        };
    }
}

// ---------------------------------------------------------------------------
// Request pipeline
// ---------------------------------------------------------------------------

std::optional<nlohmann::json>
Client::doRequest(HttpMethod method,
                  const std::string& path,
                  const nlohmann::json& body,
                  const HeaderMap* extraHeaders,
                  const CancellationToken* cancel) const
{
    const std::string url = mBaseUrl + path;

    std::optional<std::string> payload;
    if (!body.is_null()) {
        payload = body.dump();
    }
    const HttpRequest request = buildRequest(method, url, payload, extraHeaders, cancel);

    for (unsigned int attempt = 0; attempt <= mMaxRetries; ++attempt) {
        throwIfCancelled(cancel);

        if (mDebug) {
            logDebug(std::string(toString(method)) + " " + url + " (attempt " +
                     std::to_string(attempt + 1) + "/" +
                     std::to_string(mMaxRetries + 1) + ")");
        }

        HttpResponse response;
        try {
            response = mTransport->send(request);
        } catch (const TransportError& e) {
            throwIfCancelled(cancel);

            if (attempt < mMaxRetries) {
                const auto backoff = computeBackoff(attempt);
                if (mDebug) {
                    logDebug("Request error, retrying after " +
                             std::to_string(backoff.count()) + "s: " + e.what());
                }
                waitBeforeRetry(backoff, cancel);
                continue;
            }
            throw APIError(std::string("Request failed: ") + e.what(),
                           std::nullopt, errc::kRequestError);
        }

        // A response that arrives after cancellation is discarded.
        throwIfCancelled(cancel);

        const unsigned int status = response.status;
        if (mDebug) {
            logDebug("Response: " + std::to_string(status));
        }

        if (status >= 200 && status < 300) {
            if (status == 204) {
                return std::nullopt;
            }
            try {
                return nlohmann::json::parse(response.body);
            } catch (const nlohmann::json::parse_error& e) {
                throw APIError(std::string("Failed to parse response: ") + e.what(),
                               status, errc::kParseError);
            }
        }

        if (isRetryableStatus(status) && attempt < mMaxRetries) {
            std::optional<std::int64_t> retryAfter;
            if (auto header = response.headers.get("Retry-After")) {
                retryAfter = parseRetryAfter(*header);
            }

            const auto backoff = computeBackoff(attempt, retryAfter);
            if (mDebug) {
                logDebug("Retrying after " + std::to_string(backoff.count()) + "s");
            }
            waitBeforeRetry(backoff, cancel);
            continue;
        }

        throw parseErrorResponse(response);
    }

    // Unreachable: the final attempt always returns or throws above.
    throw APIError("Max retries exceeded", std::nullopt, errc::kMaxRetriesExceeded);
}

HttpRequest Client::buildRequest(HttpMethod method,
                                 const std::string& url,
                                 const std::optional<std::string>& body,
                                 const HeaderMap* extraHeaders,
                                 const CancellationToken* cancel) const
{
    HttpRequest request;
    request.method  = method;
    request.url     = url;
    request.headers = mDefaultHeaders;
    request.body    = body;
    request.timeout = mTimeout;
    request.cancel  = cancel;

    if (body && !request.headers.contains("Content-Type")) {
        request.headers.set("Content-Type", "application/json");
    }

    if (extraHeaders) {
        for (const auto& header : *extraHeaders) {
            if (!isValidHeaderName(header.first) || !isValidHeaderValue(header.second)) {
                throw APIError("Invalid request header '" + header.first + "'",
                               std::nullopt, errc::kRequestError);
            }
            request.headers.set(header.first, header.second);
        }
    }
    return request;
}

void Client::waitBeforeRetry(std::chrono::seconds delay,
                             const CancellationToken* cancel) const
{
    if (cancel) {
        if (!cancel->waitFor(delay)) {
            throw APIError("Request cancelled", std::nullopt, errc::kCancelled);
        }
        return;
    }
    mSleeper(delay);
}

void Client::logDebug(const std::string& message) const {
    *mLog << "[YourAPI] " << message << "\n";
}

// ---------------------------------------------------------------------------
// Method shortcuts
// ---------------------------------------------------------------------------

std::optional<nlohmann::json>
Client::get(const std::string& path, const CancellationToken* cancel) const {
    return doRequest(HttpMethod::Get, path, nullptr, nullptr, cancel);
}

std::optional<nlohmann::json>
Client::get(const std::string& path,
            const QueryParams& params,
            const CancellationToken* cancel) const
{
    return doRequest(HttpMethod::Get, appendQuery(path, params), nullptr, nullptr, cancel);
}

std::optional<nlohmann::json>
Client::post(const std::string& path,
             const nlohmann::json& body,
             const std::optional<std::string>& idempotencyKey,
             const CancellationToken* cancel) const
{
    if (!idempotencyKey) {
        return doRequest(HttpMethod::Post, path, body, nullptr, cancel);
    }
    HeaderMap headers;
    headers.set("Idempotency-Key", *idempotencyKey);
    return doRequest(HttpMethod::Post, path, body, &headers, cancel);
}

std::optional<nlohmann::json>
Client::patch(const std::string& path,
              const nlohmann::json& body,
              const CancellationToken* cancel) const
{
    return doRequest(HttpMethod::Patch, path, body, nullptr, cancel);
}

std::optional<nlohmann::json>
Client::put(const std::string& path,
            const nlohmann::json& body,
            const CancellationToken* cancel) const
{
    return doRequest(HttpMethod::Put, path, body, nullptr, cancel);
}

std::optional<nlohmann::json>
Client::del(const std::string& path, const CancellationToken* cancel) const {
    return doRequest(HttpMethod::Delete, path, nullptr, nullptr, cancel);
}

// ---------------------------------------------------------------------------
// Error bodies
// ---------------------------------------------------------------------------

APIError parseErrorResponse(const HttpResponse& response) {
    const unsigned int status = response.status;
    const auto headerRequestId = response.headers.get("x-request-id");

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error&) {
        return APIError("Request failed with status " + std::to_string(status),
                        status, std::nullopt, std::nullopt, headerRequestId);
    }

    std::string                   message = "Request failed";
    std::optional<std::string>    code;
    std::optional<nlohmann::json> details;
    std::optional<std::string>    requestId = headerRequestId;

    if (body.is_object()) {
        auto it = body.find("message");
        if (it != body.end() && it->is_string()) {
            message = it->get<std::string>();
        }
        it = body.find("code");
        if (it != body.end() && it->is_string()) {
            code = it->get<std::string>();
        }
        it = body.find("details");
        if (it != body.end()) {
            details = *it;
        }
        it = body.find("requestId");
        if (it != body.end() && it->is_string()) {
            requestId = it->get<std::string>();
        }
    }

    return APIError(message, status, code, details, requestId);
}

} // namespace yourapi
