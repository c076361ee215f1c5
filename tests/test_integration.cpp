/// @file test_integration.cpp
/// Integration tests: drive the real BeastTransport against a small
/// Boost.Beast server running in-process on 127.0.0.1.
///
/// Each test installs a handler that sees the parsed request and returns the
/// response to send. Backoff waits go through a recording sleeper, so retry
/// tests do not sleep.

#include "client.hpp"
#include "pagination.hpp"
#include "test_support.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

using namespace yourapi;
using namespace yourapi::fakes;
using json = nlohmann::json;

namespace {

using ServerRequest  = http::request<http::string_body>;
using ServerResponse = http::response<http::string_body>;

ServerResponse jsonResponse(http::status status, const std::string& body) {
    ServerResponse res{status, 11};
    res.set(http::field::content_type, "application/json");
    res.body() = body;
    return res;
}

/// One-request-per-connection HTTP server on an ephemeral loopback port.
class LocalServer {
public:
    using Handler = std::function<ServerResponse(const ServerRequest&)>;

    explicit LocalServer(Handler handler)
        : mAcceptor(mIoc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
        , mHandler(std::move(handler))
    {
        doAccept();
        mThread = std::thread([this] { mIoc.run(); });
    }

    ~LocalServer() {
        net::post(mIoc, [this] {
            beast::error_code ec;
            mAcceptor.close(ec);
        });
        mIoc.stop();
        mThread.join();
    }

    std::string baseUrl() const {
        return "http://127.0.0.1:" + std::to_string(mAcceptor.local_endpoint().port());
    }

    std::vector<ServerRequest> requests() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mRequests;
    }

private:
    net::io_context            mIoc;
    tcp::acceptor              mAcceptor;
    Handler                    mHandler;
    std::thread                mThread;
    mutable std::mutex         mMutex;
    std::vector<ServerRequest> mRequests;

    void doAccept() {
        mAcceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
            if (ec) return;
            handle(std::move(socket));
            doAccept();
        });
    }

    void handle(tcp::socket socket) {
        beast::error_code  ec;
        beast::flat_buffer buffer;
        ServerRequest      req;
        http::read(socket, buffer, req, ec);
        if (ec) return;

        {
            std::lock_guard<std::mutex> lock(mMutex);
            mRequests.push_back(req);
        }

        ServerResponse res = mHandler(req);
        res.keep_alive(false);
        res.prepare_payload();
        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
    }
};

} // namespace

class IntegrationTest : public ::testing::Test {
protected:
    RecordingSleeper sleeps;

    Client makeClient(const std::string& baseUrl,
                      ClientOptions options = ClientOptions()) {
        options.baseUrl = baseUrl + "/v1/";
        if (!options.timeout) {
            options.timeout = std::chrono::milliseconds(2000);
        }
        return Client(options, nullptr, sleeps.sleeper());
    }
};

// ============================================================================
// Headers and bodies on the wire
// ============================================================================

TEST_F(IntegrationTest, DefaultHeadersReachTheServer) {
    LocalServer server([](const ServerRequest&) {
        return jsonResponse(http::status::ok, R"({"pong":true})");
    });

    auto client = makeClient(server.baseUrl(),
                             ClientOptions().withApiKey("key-1").withHeader("X-Tenant", "acme"));
    auto body = client.get("/ping");

    ASSERT_TRUE(body.has_value());
    EXPECT_EQ((*body)["pong"], true);

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    const auto& req = requests[0];
    EXPECT_EQ(req.method(), http::verb::get);
    EXPECT_EQ(std::string(req.target()), "/v1/ping");
    EXPECT_EQ(std::string(req[http::field::user_agent]), "yourapi-cpp-sdk/0.1.0");
    EXPECT_EQ(std::string(req["X-SDK-Language"]), "cpp");
    EXPECT_EQ(std::string(req["X-SDK-Version"]), "0.1.0");
    EXPECT_EQ(std::string(req["X-API-Key"]), "key-1");
    EXPECT_EQ(std::string(req["X-Tenant"]), "acme");
    EXPECT_EQ(std::string(req[http::field::accept]), "application/json");
    EXPECT_EQ(req.count(http::field::authorization), 0u);
}

TEST_F(IntegrationTest, BearerTokenSuppressesApiKey) {
    LocalServer server([](const ServerRequest&) {
        return jsonResponse(http::status::ok, "{}");
    });

    auto client = makeClient(server.baseUrl(),
                             ClientOptions().withApiKey("key-1").withBearerToken("tok-1"));
    client.get("/me");

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(std::string(requests[0][http::field::authorization]), "Bearer tok-1");
    EXPECT_EQ(requests[0].count("X-API-Key"), 0u);
}

TEST_F(IntegrationTest, PostSendsJsonBodyAndIdempotencyKey) {
    LocalServer server([](const ServerRequest& req) {
        auto echoed = json::parse(req.body());
        echoed["created"] = true;
        return jsonResponse(http::status::created, echoed.dump());
    });

    auto client = makeClient(server.baseUrl());
    auto body = client.post("/orders", {{"sku", "A-1"}, {"qty", 2}}, std::string("idem-9"));

    ASSERT_TRUE(body.has_value());
    EXPECT_EQ((*body)["sku"], "A-1");
    EXPECT_EQ((*body)["created"], true);

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method(), http::verb::post);
    EXPECT_EQ(std::string(requests[0][http::field::content_type]), "application/json");
    EXPECT_EQ(std::string(requests[0]["Idempotency-Key"]), "idem-9");
    EXPECT_EQ(json::parse(requests[0].body()), json({{"sku", "A-1"}, {"qty", 2}}));
}

TEST_F(IntegrationTest, PatchPutAndDeleteUseTheirVerbs) {
    LocalServer server([](const ServerRequest& req) {
        if (req.method() == http::verb::delete_) {
            ServerResponse res{http::status::no_content, 11};
            return res;
        }
        return jsonResponse(http::status::ok, "{}");
    });

    auto client = makeClient(server.baseUrl());
    client.patch("/orders/1", {{"qty", 3}});
    client.put("/orders/1", {{"sku", "B"}, {"qty", 1}});
    auto deleted = client.del("/orders/1");

    EXPECT_FALSE(deleted.has_value());

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].method(), http::verb::patch);
    EXPECT_EQ(requests[1].method(), http::verb::put);
    EXPECT_EQ(requests[2].method(), http::verb::delete_);
    EXPECT_TRUE(requests[2].body().empty());
}

// ============================================================================
// Error handling
// ============================================================================

TEST_F(IntegrationTest, ErrorBodyAndRequestIdHeaderAreParsed) {
    LocalServer server([](const ServerRequest&) {
        auto res = jsonResponse(http::status::forbidden,
                                R"({"message":"denied","code":"FORBIDDEN","details":{"scope":"admin"}})");
        res.set("x-request-id", "req-abc");
        return res;
    });

    auto client = makeClient(server.baseUrl());
    try {
        client.get("/admin");
        FAIL() << "Expected APIError";
    } catch (const APIError& e) {
        EXPECT_EQ(e.message(), "denied");
        EXPECT_EQ(e.status(), 403u);
        EXPECT_EQ(e.code(), "FORBIDDEN");
        EXPECT_EQ(e.requestId(), "req-abc");
        ASSERT_TRUE(e.details().has_value());
        EXPECT_EQ((*e.details())["scope"], "admin");
    }
    EXPECT_EQ(server.requests().size(), 1u);
}

TEST_F(IntegrationTest, RetriesUntilServerRecovers) {
    int calls = 0;
    LocalServer server([&calls](const ServerRequest&) {
        ++calls;
        if (calls == 1) {
            auto res = jsonResponse(http::status::too_many_requests, "{}");
            res.set(http::field::retry_after, "4");
            return res;
        }
        if (calls == 2) {
            return jsonResponse(http::status::service_unavailable, "{}");
        }
        return jsonResponse(http::status::ok, R"({"ready":true})");
    });

    auto client = makeClient(server.baseUrl(), ClientOptions().withMaxRetries(3));
    auto body = client.get("/status");

    ASSERT_TRUE(body.has_value());
    EXPECT_EQ((*body)["ready"], true);
    EXPECT_EQ(server.requests().size(), 3u);
    EXPECT_EQ(sleeps.delays,
              (std::vector<std::chrono::seconds>{std::chrono::seconds(4),
                                                 std::chrono::seconds(2)}));
}

TEST_F(IntegrationTest, SlowServerTimesOutAsRequestError) {
    LocalServer server([](const ServerRequest&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        return jsonResponse(http::status::ok, "{}");
    });

    auto client = makeClient(server.baseUrl(),
                             ClientOptions()
                                 .withTimeout(std::chrono::milliseconds(100))
                                 .withMaxRetries(0));
    try {
        client.get("/slow");
        FAIL() << "Expected APIError";
    } catch (const APIError& e) {
        EXPECT_EQ(e.code(), errc::kRequestError);
        EXPECT_FALSE(e.status().has_value());
    }
}

TEST_F(IntegrationTest, HostNamesAreResolved) {
    LocalServer server([](const ServerRequest&) {
        return jsonResponse(http::status::ok, R"({"pong":true})");
    });

    // Same port, reached through "localhost" instead of the literal address.
    std::string url = server.baseUrl();
    url.replace(url.find("127.0.0.1"), 9, "localhost");

    auto client = makeClient(url);
    auto result = client.get("/ping");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)["pong"], true);
}

TEST_F(IntegrationTest, UnreachableHostIsRetriedThenRequestError) {
    std::string deadBaseUrl;
    {
        // Grab a free port, then release it so nothing is listening.
        net::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        deadBaseUrl = "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port());
    }

    auto client = makeClient(deadBaseUrl, ClientOptions().withMaxRetries(2));
    try {
        client.get("/anything");
        FAIL() << "Expected APIError";
    } catch (const APIError& e) {
        EXPECT_EQ(e.code(), errc::kRequestError);
    }
    EXPECT_EQ(sleeps.delays.size(), 2u);
}

// ============================================================================
// Pagination
// ============================================================================

TEST_F(IntegrationTest, PaginatesAcrossServerPages) {
    LocalServer server([](const ServerRequest& req) {
        const std::string target(req.target());
        if (target == "/v1/items?limit=2") {
            return jsonResponse(http::status::ok,
                                R"({"items":[{"n":1},{"n":2}],"nextCursor":"p2","hasMore":true})");
        }
        if (target == "/v1/items?limit=2&cursor=p2") {
            return jsonResponse(http::status::ok,
                                R"({"items":[{"n":3},{"n":4}],"nextCursor":"p3","hasMore":true})");
        }
        if (target == "/v1/items?limit=2&cursor=p3") {
            return jsonResponse(http::status::ok,
                                R"({"items":[{"n":5}],"nextCursor":null,"hasMore":false})");
        }
        return jsonResponse(http::status::not_found, R"({"message":"unexpected target"})");
    });

    auto client = makeClient(server.baseUrl());
    CursorPaginator paginator(client);
    auto items = paginator.fetchAll("/items?limit=2");

    ASSERT_EQ(items.size(), 5u);
    for (std::size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(items[i]["n"], static_cast<int>(i + 1));
    }
    EXPECT_EQ(paginator.getStats().totalPages, 3u);
    EXPECT_EQ(server.requests().size(), 3u);
}

TEST_F(IntegrationTest, PaginatesByPageNumber) {
    LocalServer server([](const ServerRequest& req) {
        const std::string target(req.target());
        if (target == "/v1/orders?status=open&perPage=2&page=1") {
            return jsonResponse(http::status::ok,
                                R"({"items":[1,2],"page":1,"perPage":2,"totalPages":2,"totalItems":3})");
        }
        if (target == "/v1/orders?status=open&perPage=2&page=2") {
            return jsonResponse(http::status::ok,
                                R"({"items":[3],"page":2,"perPage":2,"totalPages":2,"totalItems":3})");
        }
        return jsonResponse(http::status::not_found, R"({"message":"unexpected target"})");
    });

    auto client = makeClient(server.baseUrl());
    PagePaginator paginator(client);
    auto items = paginator.fetchAll<int>("/orders", {{"status", "open"}, {"perPage", "2"}});

    EXPECT_EQ(items, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(paginator.getStats().totalPages, 2u);
    EXPECT_EQ(server.requests().size(), 2u);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(IntegrationTest, CancelAbandonsExchangeInFlight) {
    LocalServer server([](const ServerRequest&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        return jsonResponse(http::status::ok, "{}");
    });

    auto client = makeClient(server.baseUrl(),
                             ClientOptions()
                                 .withTimeout(std::chrono::milliseconds(5000))
                                 .withMaxRetries(0));

    CancellationToken token;
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    try {
        client.get("/hang", &token);
        ADD_FAILURE() << "Expected APIError";
    } catch (const APIError& e) {
        EXPECT_EQ(e.code(), errc::kCancelled);
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_TRUE(sleeps.delays.empty());
}

TEST_F(IntegrationTest, CancelStopsEveryShortcut) {
    LocalServer server([](const ServerRequest&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        return jsonResponse(http::status::ok, "{}");
    });

    auto client = makeClient(server.baseUrl(),
                             ClientOptions().withTimeout(std::chrono::milliseconds(5000)));

    const std::vector<std::function<void(const CancellationToken*)>> calls = {
        [&](const CancellationToken* t) { client.post("/a", json{{"k", 1}}, std::nullopt, t); },
        [&](const CancellationToken* t) { client.patch("/a", json{{"k", 1}}, t); },
        [&](const CancellationToken* t) { client.put("/a", json{{"k", 1}}, t); },
        [&](const CancellationToken* t) { client.del("/a", t); },
    };

    for (const auto& call : calls) {
        CancellationToken token;
        std::thread canceller([&token] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            token.cancel();
        });

        const auto start = std::chrono::steady_clock::now();
        try {
            call(&token);
            ADD_FAILURE() << "Expected APIError";
        } catch (const APIError& e) {
            EXPECT_EQ(e.code(), errc::kCancelled);
        }
        EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));
        canceller.join();
    }
}
