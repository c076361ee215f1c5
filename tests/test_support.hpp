/// @file test_support.hpp
/// Scripted transport and recording sleeper shared by the unit tests.

#pragma once

#include "client.hpp"
#include "transport.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace yourapi::fakes {

/// Replays a fixed sequence of responses / transport failures and records
/// every request it was asked to send.
class ScriptedTransport : public HttpTransport {
public:
    ScriptedTransport& respond(unsigned int status,
                               const std::string& body = "",
                               const HeaderMap& headers = {}) {
        HttpResponse r;
        r.status  = status;
        r.body    = body;
        r.headers = headers;
        mScript.push_back(Step{r, ""});
        return *this;
    }

    ScriptedTransport& respondWithRetryAfter(unsigned int status,
                                             const std::string& retryAfter) {
        HeaderMap headers;
        headers.set("Retry-After", retryAfter);
        return respond(status, "", headers);
    }

    ScriptedTransport& fail(const std::string& what) {
        mScript.push_back(Step{std::nullopt, what});
        return *this;
    }

    HttpResponse send(const HttpRequest& request) override {
        mSent.push_back(request);
        if (onSend) onSend(request);

        if (mNext >= mScript.size()) {
            throw std::logic_error("ScriptedTransport: script exhausted");
        }
        const Step& step = mScript[mNext++];
        if (!step.response) {
            throw TransportError(step.error);
        }
        return *step.response;
    }

    const std::vector<HttpRequest>& sent() const { return mSent; }

    std::function<void(const HttpRequest&)> onSend;

private:
    struct Step {
        std::optional<HttpResponse> response;
        std::string                 error;
    };

    std::vector<Step>        mScript;
    std::vector<HttpRequest> mSent;
    std::size_t              mNext = 0;
};

/// Records backoff delays instead of sleeping.
struct RecordingSleeper {
    std::vector<std::chrono::seconds> delays;

    Sleeper sleeper() {
        return [this](std::chrono::seconds d) { delays.push_back(d); };
    }
};

} // namespace yourapi::fakes
