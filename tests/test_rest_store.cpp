//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_rest_store.cpp
// Purpose: GoogleTests for the REST store against an in-process HTTP responder, plus its failure modes
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcphost/RateLimiter.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/store/RestStore.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcphost;
using mcphost::errors::ErrorCategory;
using mcphost::errors::HostError;
using mcphost::store::RestStore;

namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

//==========================================================================================================
// CannedHttpServer
// Purpose: Answers each connection on 127.0.0.1 with the handler's response and keeps the requests.
//==========================================================================================================
class CannedHttpServer {
public:
    using Handler = std::function<http::response<http::string_body>(const http::request<http::string_body>&)>;

    explicit CannedHttpServer(Handler handler)
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)), handler_(std::move(handler)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this]() { run(); });
    }

    ~CannedHttpServer() {
        stopping_ = true;
        // Unblock accept()
        boost::system::error_code ec;
        net::io_context poke;
        tcp::socket s(poke);
        s.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
        s.close(ec);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string BaseUrl() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::vector<http::request<http::string_body>> Requests() {
        std::lock_guard<std::mutex> lk(mutex_);
        return requests_;
    }

private:
    void run() {
        while (!stopping_) {
            boost::system::error_code ec;
            tcp::socket sock(ioc_);
            acceptor_.accept(sock, ec);
            if (ec || stopping_) {
                return;
            }
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(sock, buffer, req, ec);
            if (ec) {
                continue;
            }
            {
                std::lock_guard<std::mutex> lk(mutex_);
                requests_.push_back(req);
            }
            auto res = handler_(req);
            res.version(req.version());
            res.keep_alive(false);
            res.prepare_payload();
            http::write(sock, res, ec);
            sock.shutdown(tcp::socket::shutdown_both, ec);
        }
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    Handler handler_;
    unsigned short port_{0};
    std::atomic<bool> stopping_{false};
    std::mutex mutex_;
    std::vector<http::request<http::string_body>> requests_;
    std::thread thread_;
};

http::response<http::string_body> jsonResponse(http::status status, const std::string& body) {
    http::response<http::string_body> res{status, 11};
    res.set(http::field::content_type, "application/json");
    res.body() = body;
    return res;
}

std::string header(const http::request<http::string_body>& req, const char* name) {
    auto it = req.find(name);
    if (it == req.end()) {
        return std::string();
    }
    const auto v = it->value();
    return std::string(v.data(), v.size());
}

std::string target(const http::request<http::string_body>& req) {
    const auto t = req.target();
    return std::string(t.data(), t.size());
}

RestStore::Options optionsFor(const std::string& url) {
    RestStore::Options o;
    o.baseUrl = url;
    o.apiKey = "anon-key";
    o.timeoutMs = 2000;
    return o;
}

} // namespace

TEST(ContentRange, ParsesTotal) {
    uint64_t total = 0;
    EXPECT_TRUE(store::ParseContentRangeTotal("0-0/42", total));
    EXPECT_EQ(total, 42u);
    EXPECT_TRUE(store::ParseContentRangeTotal("*/0", total));
    EXPECT_EQ(total, 0u);
    EXPECT_FALSE(store::ParseContentRangeTotal("0-0/*", total));
    EXPECT_FALSE(store::ParseContentRangeTotal("0-0", total));
    EXPECT_FALSE(store::ParseContentRangeTotal("0-0/", total));
    EXPECT_FALSE(store::ParseContentRangeTotal("0-0/12a", total));
}

TEST(FormatTimestamp, IsoUtcWithMilliseconds) {
    store::TimePoint tp{std::chrono::milliseconds(1700000000123LL)};
    EXPECT_EQ(store::FormatTimestamp(tp), "2023-11-14T22:13:20.123Z");
}

TEST(RestStore, RejectsUnusableUrl) {
    try {
        RestStore s(optionsFor(""));
        FAIL() << "expected ConfigurationError";
    } catch (const HostError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::ConfigurationError);
    }
    try {
        RestStore s(optionsFor("ftp://example.com"));
        FAIL() << "expected ConfigurationError";
    } catch (const HostError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::ConfigurationError);
    }
}

TEST(RestStore, FetchUserConfigsDecodesRowsAndSkipsBadOnes) {
    CannedHttpServer server([](const http::request<http::string_body>&) {
        return jsonResponse(http::status::ok, R"([
            {"id":"c1","user_id":"u1","name":"alpha","mcp_type":"stdio","command":"npx","args":["-y","pkg"],
             "env":{},"enabled":true,"metadata":{},"created_at":"2025-01-01T00:00:00Z"},
            {"id":"c2","user_id":"u1","name":"broken"},
            {"id":"c3","user_id":"u1","name":"gamma","command":"uvx","args":["tool"],"enabled":false}
        ])");
    });
    RestStore store(optionsFor(server.BaseUrl()));
    auto configs = store.FetchUserConfigs("u1");
    ASSERT_EQ(configs.size(), 2u);
    EXPECT_EQ(configs[0].id, "c1");
    EXPECT_EQ(configs[0].args.size(), 2u);
    EXPECT_EQ(configs[1].id, "c3");
    EXPECT_FALSE(configs[1].enabled);

    auto reqs = server.Requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method(), http::verb::get);
    const std::string t = target(reqs[0]);
    EXPECT_EQ(t.rfind("/rest/v1/mcp_configurations?", 0), 0u) << t;
    EXPECT_NE(t.find("user_id=eq.u1"), std::string::npos);
    EXPECT_NE(t.find("order=created_at.asc"), std::string::npos);
    EXPECT_EQ(header(reqs[0], "apikey"), "anon-key");
    EXPECT_EQ(header(reqs[0], "Authorization"), "Bearer anon-key");
}

TEST(RestStore, CountUsesExactCountHeader) {
    CannedHttpServer server([](const http::request<http::string_body>&) {
        auto res = jsonResponse(http::status::partial_content, "[]");
        res.set(http::field::content_range, "0-0/17");
        return res;
    });
    RestStore store(optionsFor(server.BaseUrl()));
    const uint64_t n = store.CountToolCallsSince("u1", "cfg 1", std::chrono::system_clock::now());
    EXPECT_EQ(n, 17u);

    auto reqs = server.Requests();
    ASSERT_EQ(reqs.size(), 1u);
    const std::string t = target(reqs[0]);
    EXPECT_NE(t.find("/rest/v1/mcp_tool_calls?"), std::string::npos);
    EXPECT_NE(t.find("mcp_config_id=eq.cfg%201"), std::string::npos) << t;
    EXPECT_NE(t.find("called_at=gte."), std::string::npos);
    EXPECT_EQ(header(reqs[0], "Prefer"), "count=exact");
}

TEST(RestStore, CountWithoutContentRangeIsUnavailable) {
    CannedHttpServer server([](const http::request<http::string_body>&) {
        return jsonResponse(http::status::ok, "[]");
    });
    RestStore store(optionsFor(server.BaseUrl()));
    try {
        store.CountToolCallsSince("u1", "c1", std::chrono::system_clock::now());
        FAIL() << "expected StoreUnavailable";
    } catch (const HostError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::StoreUnavailable);
    }
}

TEST(RestStore, AppendPostsRecord) {
    CannedHttpServer server([](const http::request<http::string_body>&) {
        return jsonResponse(http::status::created, "");
    });
    RestStore store(optionsFor(server.BaseUrl() + "/"));
    store::ToolCallRecord rec;
    rec.userId = "u1";
    rec.configId = "c1";
    rec.toolName = "echo";
    rec.success = false;
    rec.errorMessage = "MCP error -32603: boom";
    rec.executionTimeMs = 12;
    rec.calledAt = std::chrono::system_clock::now();
    ASSERT_NO_THROW(store.AppendToolCall(rec));

    auto reqs = server.Requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method(), http::verb::post);
    EXPECT_EQ(target(reqs[0]), "/rest/v1/mcp_tool_calls");
    EXPECT_EQ(header(reqs[0], "Prefer"), "return=minimal");
    JSONValue body = ParseJSON(reqs[0].body());
    EXPECT_EQ(std::get<std::string>(body.Find("mcp_config_id")->value), "c1");
    EXPECT_EQ(std::get<std::string>(body.Find("tool_name")->value), "echo");
    EXPECT_FALSE(std::get<bool>(body.Find("success")->value));
    EXPECT_EQ(std::get<int64_t>(body.Find("execution_time_ms")->value), 12);
}

TEST(RestStore, HttpErrorStatusIsUnavailable) {
    CannedHttpServer server([](const http::request<http::string_body>&) {
        return jsonResponse(http::status::internal_server_error, R"({"message":"db down"})");
    });
    RestStore store(optionsFor(server.BaseUrl()));
    try {
        store.FetchUserConfigs("u1");
        FAIL() << "expected StoreUnavailable";
    } catch (const HostError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::StoreUnavailable);
        EXPECT_NE(std::string(e.what()).find("500"), std::string::npos);
    }
}

TEST(RestStore, UnreachableEndpointIsUnavailable) {
    RestStore store(optionsFor("http://127.0.0.1:1"));
    try {
        store.FetchUserConfigs("u1");
        FAIL() << "expected StoreUnavailable";
    } catch (const HostError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::StoreUnavailable);
    }
}

TEST(RestStore, RateLimiterFailsOpenWhenStoreIsDown) {
    auto store = std::make_shared<RestStore>(optionsFor("http://127.0.0.1:1"));
    RateLimiter limiter(store, HostOptions{});
    RateLimitDecision d = limiter.CheckRateLimit("u1", "c1");
    EXPECT_TRUE(d.allowed);
    EXPECT_FALSE(d.remaining.has_value());
    EXPECT_NO_THROW(limiter.RecordToolCall("u1", "c1", "echo", true));
}

TEST(RestStore, BadCaFileFailsRequests) {
    RestStore::Options o = optionsFor("https://127.0.0.1:1");
    o.caFile = "/nonexistent/ca.pem";
    RestStore store(o);
    try {
        store.CountToolCallsSince("u1", "c1", std::chrono::system_clock::now());
        FAIL() << "expected StoreUnavailable";
    } catch (const HostError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::StoreUnavailable);
    }
}
