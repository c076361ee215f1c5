#pragma once

#include "transport.hpp"
#include "util.hpp"

namespace yourapi {

/// Default HttpTransport built on Boost.Beast.
/// Opens one connection per exchange; the request timeout bounds resolve,
/// connect, handshake, write and read, and a cancelled request.cancel stops
/// whichever step is running. HTTPS needs the library built with OpenSSL.
class BeastTransport : public HttpTransport {
public:
    HttpResponse send(const HttpRequest& request) override;

private:
    HttpResponse doHttpRequest(const HttpRequest& request, const UrlParts& parts);
    HttpResponse doHttpsRequest(const HttpRequest& request, const UrlParts& parts);
};

} // namespace yourapi
