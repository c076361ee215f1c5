#include "beast_transport.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#ifdef YOURAPI_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <stdexcept>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace yourapi {

namespace {

http::verb toVerb(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return http::verb::get;
        case HttpMethod::Post:   return http::verb::post;
        case HttpMethod::Put:    return http::verb::put;
        case HttpMethod::Patch:  return http::verb::patch;
        case HttpMethod::Delete: return http::verb::delete_;
    }
    return http::verb::get;
}

std::string hostHeader(const UrlParts& parts) {
    const bool defaultPort = (parts.scheme == "http" && parts.port == "80") ||
                             (parts.scheme == "https" && parts.port == "443");
    return defaultPort ? parts.host : parts.host + ":" + parts.port;
}

http::request<http::string_body>
buildRequest(const HttpRequest& request, const UrlParts& parts) {
    http::request<http::string_body> req{toVerb(request.method), parts.target, 11};
    req.set(http::field::host, hostHeader(parts));
    if (!request.headers.contains("Accept")) {
        req.set(http::field::accept, "application/json");
    }
    for (const auto& header : request.headers) {
        req.set(header.first, header.second);
    }
    if (request.body) {
        req.body() = *request.body;
    }
    req.prepare_payload();
    return req;
}

HttpResponse toResponse(http::response<http::string_body>& res) {
    HttpResponse response;
    response.status = res.result_int();
    for (const auto& field : res.base()) {
        response.headers.set(std::string(field.name_string()),
                             std::string(field.value()));
    }
    response.body = std::move(res.body());
    return response;
}

// tcp_stream deadlines only apply to asynchronous operations, so every step
// is started asynchronously and the io_context is run until it completes.
// A cancelled token stops the io_context; the pending step is dropped with it.
void await(net::io_context& ioc,
           const beast::error_code& ec,
           const CancellationToken* cancel)
{
    ioc.run();
    ioc.restart();
    if (cancel && cancel->isCancelled()) {
        throw TransportError("Request cancelled");
    }
    if (ec) {
        throw beast::system_error{ec};
    }
}

/// Resolve under the same deadline as the other steps; tcp::resolver has no
/// expiry of its own.
tcp::resolver::results_type resolve(net::io_context& ioc,
                                    const UrlParts& parts,
                                    std::chrono::milliseconds timeout,
                                    const CancellationToken* cancel)
{
    tcp::resolver     resolver(ioc);
    net::steady_timer deadline(ioc);
    beast::error_code ec;
    bool timedOut = false;
    tcp::resolver::results_type results;

    deadline.expires_after(timeout);
    deadline.async_wait([&](beast::error_code e) {
        if (!e) {
            timedOut = true;
            resolver.cancel();
        }
    });
    resolver.async_resolve(parts.host, parts.port,
        [&](beast::error_code e, tcp::resolver::results_type r) {
            ec = timedOut ? beast::error_code(beast::error::timeout) : e;
            results = std::move(r);
            deadline.cancel();
        });
    await(ioc, ec, cancel);
    return results;
}

void connect(net::io_context& ioc,
             beast::tcp_stream& stream,
             const tcp::resolver::results_type& results,
             std::chrono::milliseconds timeout,
             const CancellationToken* cancel)
{
    beast::error_code ec;
    stream.expires_after(timeout);
    stream.async_connect(results,
                         [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    await(ioc, ec, cancel);
}

/// Write the request and read the response on an already-connected stream.
template <typename Stream>
HttpResponse exchange(net::io_context& ioc,
                      Stream& stream,
                      http::request<http::string_body>& req,
                      std::chrono::milliseconds timeout,
                      const CancellationToken* cancel)
{
    beast::error_code ec;

    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_write(stream, req,
                      [&ec](beast::error_code e, std::size_t) { ec = e; });
    await(ioc, ec, cancel);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_read(stream, buffer, res,
                     [&ec](beast::error_code e, std::size_t) { ec = e; });
    await(ioc, ec, cancel);

    return toResponse(res);
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::send(const HttpRequest& request) {
    UrlParts parts;
    try {
        parts = parseUrl(request.url);
    } catch (const std::invalid_argument& e) {
        throw TransportError(e.what());
    }

    try {
        return parts.scheme == "https" ? doHttpsRequest(request, parts)
                                       : doHttpRequest(request, parts);
    } catch (const beast::system_error& e) {
        if (e.code() == beast::error::timeout) {
            throw TransportError("Request timed out: " + request.url);
        }
        throw TransportError(e.what());
    }
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpRequest(const HttpRequest& request,
                                           const UrlParts& parts)
{
    net::io_context ioc;
    CancellationToken::Subscription onCancel(request.cancel, [&ioc] { ioc.stop(); });
    beast::tcp_stream stream(ioc);

    auto const results = resolve(ioc, parts, request.timeout, request.cancel);
    connect(ioc, stream, results, request.timeout, request.cancel);

    auto req = buildRequest(request, parts);
    auto response = exchange(ioc, stream, req, request.timeout, request.cancel);

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpsRequest(const HttpRequest& request,
                                            const UrlParts& parts)
{
#ifdef YOURAPI_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    CancellationToken::Subscription onCancel(request.cancel, [&ioc] { ioc.stop(); });
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
        throw TransportError("Failed to set SNI hostname");
    }

    auto const results = resolve(ioc, parts, request.timeout, request.cancel);
    connect(ioc, beast::get_lowest_layer(stream), results, request.timeout, request.cancel);

    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_after(request.timeout);
    stream.async_handshake(ssl::stream_base::client,
                           [&ec](beast::error_code e) { ec = e; });
    await(ioc, ec, request.cancel);

    auto req = buildRequest(request, parts);
    auto response = exchange(ioc, stream, req, request.timeout, request.cancel);

    // Peers often close without close_notify; the response is already read.
    beast::get_lowest_layer(stream).expires_after(request.timeout);
    stream.async_shutdown([](beast::error_code) {});
    ioc.run();

    return response;
#else
    (void)request;
    (void)parts;
    throw TransportError("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace yourapi
