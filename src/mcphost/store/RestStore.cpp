//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcphost/store/RestStore.cpp
// Purpose: PostgREST-style store client using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

//==========================================================================================================
#include <utility>
#include <thread>
#include <sstream>
#include <vector>
#include <chrono>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/store/RestStore.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace mcphost {
namespace store {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

bool ParseContentRangeTotal(const std::string& header, uint64_t& total) {
    const std::size_t slash = header.rfind('/');
    if (slash == std::string::npos || slash + 1 >= header.size()) {
        return false;
    }
    const std::string tail = header.substr(slash + 1);
    if (tail == "*") {
        return false;
    }
    uint64_t v = 0;
    for (char c : tail) {
        if (c < '0' || c > '9') {
            return false;
        }
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    total = v;
    return true;
}

namespace {

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string urlEncode(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%';
            const char* hex = "0123456789ABCDEF";
            oss << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string verbName(http::verb verb) {
    const auto sv = http::to_string(verb);
    return std::string(sv.data(), sv.size());
}

std::string truncateBody(const std::string& body) {
    constexpr std::size_t kMax = 200;
    if (body.size() <= kMax) {
        return body;
    }
    return body.substr(0, kMax) + "...";
}

} // namespace

class RestStore::Impl {
public:
    RestStore::Options opts;

    // ------------------------------------------------------------------------------------------------------
    // URL parts (adequate for http(s)://host[:port][/prefix])
    // ------------------------------------------------------------------------------------------------------
    std::string scheme;
    std::string host;
    std::string port;
    std::string pathPrefix;

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx; // present when https
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    bool caInitOk{true};

    struct HttpResult {
        unsigned status{0};
        std::string body;
        std::string contentRange;
    };

    explicit Impl(const RestStore::Options& o) : opts(o) {
        if (opts.baseUrl.empty()) {
            throw errors::HostError(errors::ErrorCategory::ConfigurationError, "RestStore: base URL is empty");
        }
        parseUrl(opts.baseUrl);
        if (scheme != "http" && scheme != "https") {
            throw errors::HostError(errors::ErrorCategory::ConfigurationError,
                                    fmt::format("RestStore: unsupported URL scheme '{}'", scheme));
        }
        if (scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::ERR_clear_error();
            if (!opts.caFile.empty()) {
                try {
                    sslCtx->load_verify_file(opts.caFile);
                } catch (const boost::system::system_error& e) {
                    LOG_ERROR("RestStore: failed to load CA file {}: {}", opts.caFile, e.what());
                    caInitOk = false;
                }
            } else {
                try {
                    sslCtx->set_default_verify_paths();
                } catch (const boost::system::system_error& e) {
                    LOG_DEBUG("RestStore: set_default_verify_paths failed: {}", e.what());
                }
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }
        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() { ioc.run(); });
        LOG_DEBUG("RestStore: {}://{}:{}{} (timeout {} ms)", scheme, host, port, pathPrefix, opts.timeoutMs);
    }

    ~Impl() {
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    void parseUrl(const std::string& url) {
        std::size_t pos = 0;
        std::size_t schemeEnd = url.find("://");
        if (schemeEnd != std::string::npos) {
            scheme = url.substr(0, schemeEnd);
            pos = schemeEnd + 3;
        } else {
            scheme = std::string("http");
        }

        std::size_t slash = url.find('/', pos);
        std::string hostPort;
        if (slash == std::string::npos) {
            hostPort = url.substr(pos);
        } else {
            hostPort = url.substr(pos, slash - pos);
            pathPrefix = url.substr(slash);
        }
        while (!pathPrefix.empty() && pathPrefix.back() == '/') {
            pathPrefix.pop_back();
        }

        std::size_t colon = hostPort.find(':');
        if (colon == std::string::npos) {
            host = hostPort;
            port = (scheme == std::string("https")) ? std::string("443") : std::string("80");
        } else {
            host = hostPort.substr(0, colon);
            port = hostPort.substr(colon + 1);
        }
    }

    std::string target(const char* table, const std::string& query) const {
        return fmt::format("{}/rest/v1/{}?{}", pathPrefix, table, query);
    }

    void prepare(http::request<http::string_body>& req,
                 const std::vector<std::pair<std::string, std::string>>& headers) const {
        req.set(http::field::host, host);
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.set(http::field::user_agent, "mcphost");
        if (!opts.apiKey.empty()) {
            req.set("apikey", opts.apiKey);
            req.set(http::field::authorization, std::string("Bearer ") + opts.apiKey);
        }
        for (const auto& h : headers) {
            req.set(h.first, h.second);
        }
        if (!req.body().empty()) {
            req.set(http::field::content_type, "application/json");
        }
        req.prepare_payload();
    }

    static HttpResult toResult(http::response<http::string_body>& res) {
        HttpResult out;
        out.status = res.result_int();
        out.body = std::move(res.body());
        auto it = res.find(http::field::content_range);
        if (it != res.end()) {
            const auto v = it->value();
            out.contentRange = std::string(v.data(), v.size());
        }
        return out;
    }

    // Coroutine: one request on a fresh connection. Errors propagate as boost::system::system_error.
    net::awaitable<HttpResult> coRequest(http::verb verb, const std::string path, const std::string body,
                                         const std::vector<std::pair<std::string, std::string>> headers) {
        http::request<http::string_body> req{verb, path, 11};
        req.body() = body;
        prepare(req, headers);
        const auto timeout = ClampedMillis(opts.timeoutMs);

        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(host, port, net::use_awaitable);

        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        if (scheme == "https") {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
                LOG_WARN("RestStore: failed to set SNI hostname {}", host);
            }
            (void)::SSL_set1_host(stream.native_handle(), host.c_str());
            stream.next_layer().expires_after(timeout);
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            stream.next_layer().expires_after(timeout);
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec; stream.shutdown(ec);
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(timeout);
            co_await stream.async_connect(results, net::use_awaitable);
            stream.expires_after(timeout);
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec; stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        co_return toResult(res);
    }

    //==========================================================================================================
    // Runs one request on the io thread and waits for it.
    // Throws:
    //   errors::HostError (StoreUnavailable) on transport failure or a non-2xx status.
    //==========================================================================================================
    HttpResult request(http::verb verb, const std::string& path, const std::string& body,
                       const std::vector<std::pair<std::string, std::string>>& headers) {
        if (!caInitOk) {
            throw errors::HostError(errors::ErrorCategory::StoreUnavailable,
                                    "RestStore: CA initialization failed (bad caFile)");
        }
        LOG_DEBUG("RestStore: {} {}", verbName(verb), path);
        auto fut = net::co_spawn(ioc, coRequest(verb, path, body, headers), net::use_future);
        HttpResult result;
        try {
            result = fut.get();
        } catch (const std::exception& e) {
            throw errors::HostError(errors::ErrorCategory::StoreUnavailable,
                fmt::format("Store request {} {} failed: {}", verbName(verb), path, e.what()));
        }
        if (result.status < 200 || result.status >= 300) {
            throw errors::HostError(errors::ErrorCategory::StoreUnavailable,
                fmt::format("Store request {} {} returned HTTP {}: {}", verbName(verb), path,
                            result.status, truncateBody(result.body)));
        }
        return result;
    }
};

RestStore::RestStore(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

namespace {
RestStore::Options optionsFromHost(const HostOptions& options) {
    RestStore::Options o;
    o.baseUrl = options.storeUrl;
    o.apiKey = options.storeKey;
    o.caFile = options.storeCaFile;
    o.timeoutMs = options.storeTimeoutMs;
    return o;
}
} // namespace

RestStore::RestStore(const HostOptions& options)
    : pImpl(std::make_unique<Impl>(optionsFromHost(options))) {}

RestStore::~RestStore() = default;

std::vector<ServerConfig> RestStore::FetchUserConfigs(const std::string& userId) {
    FUNC_SCOPE();
    const std::string path = pImpl->target("mcp_configurations",
        fmt::format("select=*&user_id=eq.{}&order=created_at.asc", urlEncode(userId)));
    auto result = pImpl->request(http::verb::get, path, std::string(), {});

    JSONValue rows;
    try {
        rows = ParseJSON(result.body);
    } catch (const std::runtime_error& e) {
        throw errors::HostError(errors::ErrorCategory::StoreUnavailable,
                                fmt::format("Store returned malformed configuration list: {}", e.what()));
    }
    if (!rows.IsArray()) {
        throw errors::HostError(errors::ErrorCategory::StoreUnavailable,
                                "Store returned a non-array configuration list");
    }
    std::vector<ServerConfig> configs;
    for (const auto& row : std::get<JSONValue::Array>(rows.value)) {
        if (!row) {
            continue;
        }
        try {
            configs.push_back(ServerConfigFromJson(*row));
        } catch (const errors::HostError& e) {
            LOG_WARN("Skipping undecodable MCP configuration row for user {}: {}", userId, e.what());
        }
    }
    LOG_DEBUG("RestStore: {} configurations for user {}", configs.size(), userId);
    return configs;
}

void RestStore::AppendToolCall(const ToolCallRecord& record) {
    FUNC_SCOPE();
    const std::string path = fmt::format("{}/rest/v1/mcp_tool_calls", pImpl->pathPrefix);
    (void)pImpl->request(http::verb::post, path, SerializeJSON(ToolCallRecordToJson(record)),
                         {{"Prefer", "return=minimal"}});
}

uint64_t RestStore::CountToolCallsSince(const std::string& userId, const std::string& configId,
                                        TimePoint since) {
    FUNC_SCOPE();
    const std::string path = pImpl->target("mcp_tool_calls",
        fmt::format("select=id&user_id=eq.{}&mcp_config_id=eq.{}&called_at=gte.{}",
                    urlEncode(userId), urlEncode(configId), urlEncode(FormatTimestamp(since))));
    auto result = pImpl->request(http::verb::get, path, std::string(),
                                 {{"Prefer", "count=exact"}, {"Range", "0-0"}});
    uint64_t total = 0;
    if (!ParseContentRangeTotal(result.contentRange, total)) {
        throw errors::HostError(errors::ErrorCategory::StoreUnavailable,
            fmt::format("Store count response has no usable Content-Range (got '{}')", result.contentRange));
    }
    return total;
}

} // namespace store
} // namespace mcphost
