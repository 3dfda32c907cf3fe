//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/HTTPTransport.cpp
// Purpose: Streamable-HTTP gateway client using Boost.Beast coroutines (JSON and SSE replies, TLS 1.2+)
//==========================================================================================================

//==========================================================================================================
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <fmt/format.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcpgw/EventStreamFramer.h"
#include "mcpgw/HTTPTransport.hpp"
#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/errors/Errors.h"
#include "mcpgw/typed/Content.h"

namespace mcpgw {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr std::size_t kMaxEventSize = 16 * 1024 * 1024;
constexpr std::uint64_t kMaxJsonBody = 32 * 1024 * 1024;
constexpr int kMaxListPages = 100;

enum class TimeoutKind {
    Connect,
    Request,
    ToolExecution
};

//==========================================================================================================
// CallContext
// Purpose: Per-operation state shared between the exchange coroutine, its deadline timer and the caller's
//          stop callback. Flags are written from any thread; abort is installed and invoked on the I/O
//          thread only.
//==========================================================================================================
struct CallContext : std::enable_shared_from_this<CallContext> {
    std::uint64_t serial{0};
    std::string method;
    std::string toolName;
    TimeoutKind kind{TimeoutKind::Request};
    unsigned int timeoutMs{0};

    std::optional<int64_t> currentId;
    std::unique_ptr<JSONRPCResponse> reply;
    std::string sessionHeader;

    std::atomic<bool> cancelled{false};
    std::atomic<bool> timedOut{false};
    std::atomic<bool> closing{false};

    std::function<void()> abort;
    std::unique_ptr<net::steady_timer> timer;
    std::unique_ptr<std::stop_callback<std::function<void()>>> stopCallback;

    bool aborted() const { return cancelled.load() || timedOut.load() || closing.load(); }

    void abortNow() {
        if (abort) {
            abort();
        }
    }
};

// Clears the abort hook when the stage that installed it unwinds
struct AbortHook {
    CallContext& ctx;
    ~AbortHook() { ctx.abort = nullptr; }
};

void checkAbort(const CallContext& ctx) {
    if (ctx.aborted()) {
        throw boost::system::system_error(net::error::operation_aborted);
    }
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

template <typename Fields>
std::string headerValue(const Fields& fields, const char* name) {
    auto it = fields.find(name);
    if (it == fields.end()) return std::string();
    auto v = it->value();
    return std::string(v.data(), v.size());
}

std::optional<int64_t> numericId(const JSONRPCId& id) {
    if (std::holds_alternative<int64_t>(id)) {
        return std::get<int64_t>(id);
    }
    if (std::holds_alternative<std::string>(id)) {
        const auto& s = std::get<std::string>(id);
        if (!s.empty() && s.size() < 19 && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
            return static_cast<int64_t>(std::stoll(s));
        }
    }
    return std::nullopt;
}

std::string errorMessageOf(const JSONRPCResponse& resp) {
    auto e = errors::mcpErrorFromResponse(resp);
    if (e.has_value()) {
        return fmt::format("{} (code {})", e->message, e->code);
    }
    return SerializeJSON(resp.error.value_or(JSONValue{}));
}

//==========================================================================================================
// interpretCallReply
// Purpose: Maps a tools/call reply to a normalized output or a RemoteToolError.
//==========================================================================================================
ToolCallOutput interpretCallReply(const std::string& toolName, const JSONRPCResponse& resp) {
    if (resp.IsError()) {
        auto e = errors::mcpErrorFromResponse(resp);
        if (!e.has_value()) {
            throw errors::ProtocolError("Malformed error object in tools/call reply", SerializeJSON(*resp.error));
        }
        throw errors::RemoteToolError(toolName, e->code, e->message, e->data);
    }
    if (!resp.result.has_value() || !resp.result->isObject()) {
        throw errors::ProtocolError("tools/call reply lacks a result object",
                                    resp.result.has_value() ? SerializeJSON(*resp.result) : std::string());
    }
    ToolCallOutput out = typed::NormalizeCallToolResult(*resp.result);
    if (out.isError) {
        throw errors::RemoteToolError(toolName, std::nullopt, out.text);
    }
    return out;
}

} // namespace

class HTTPTransportClient::Impl {
public:
    config::GatewayConfig cfg;
    config::GatewayEndpoint ep;

    mutable std::mutex stateMutex;
    Session session;
    bool closed{false};
    std::atomic<bool> closeRequested{false};
    std::atomic<bool> terminateSent{false};

    std::atomic<int64_t> nextId{0};
    std::atomic<std::uint64_t> nextSerial{0};
    std::unordered_map<std::uint64_t, std::weak_ptr<CallContext>> active; // guarded by stateMutex

    std::mutex handlerMutex;
    ITransportClient::NotificationHandler notificationHandler;
    ITransportClient::ErrorHandler errorHandler;

    net::io_context ioc;
    std::thread ioThread;
    std::thread::id ioThreadId;
    std::unique_ptr<ssl::context> sslCtx; // present when https
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::string tlsInitError;

    explicit Impl(const config::GatewayConfig& c) : cfg(c), ep(config::ParseGatewayUrl(c.url)) {
        if (ep.secure()) {
            initTls();
        }
    }

    ~Impl() {
        if (!closeRequested.exchange(true)) {
            shutdown();
        }
        if (ioThread.joinable()) {
            if (std::this_thread::get_id() == ioThreadId) {
                LOG_WARN("HTTPTransportClient destroyed on its own I/O thread; detaching");
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }
    }

    void initTls() {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
        if (!cfg.tlsVerify) {
            LOG_WARN("TLS peer verification disabled for {}", ep.host);
            sslCtx->set_verify_mode(ssl::verify_none);
            return;
        }
        try {
            if (!cfg.caFile.empty()) {
                sslCtx->load_verify_file(cfg.caFile);
            }
            if (!cfg.caPath.empty()) {
                sslCtx->add_verify_path(cfg.caPath);
            }
            if (cfg.caFile.empty() && cfg.caPath.empty()) {
                sslCtx->set_default_verify_paths();
            }
        } catch (const boost::system::system_error& e) {
            tlsInitError = fmt::format("failed to load TLS trust store: {}", e.what());
            LOG_ERROR("HTTPS: {}", tlsInitError);
        }
        sslCtx->set_verify_mode(ssl::verify_peer);
    }

    void reportError(const std::string& msg) {
        ITransportClient::ErrorHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = errorHandler;
        }
        if (h) {
            h(msg);
        }
    }

    void setState(SessionState s) {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (session.state != SessionState::Closed) {
            session.state = s;
        }
    }

    SessionState state() const {
        std::lock_guard<std::mutex> lk(stateMutex);
        return session.state;
    }

    std::string sessionId() const {
        std::lock_guard<std::mutex> lk(stateMutex);
        return session.id;
    }

    void ensureStarted() {
        if (ioThread.joinable()) {
            return;
        }
        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("HTTP I/O loop terminated: {}", e.what());
                reportError(e.what());
            }
        });
        ioThreadId = ioThread.get_id();
    }

    //======================================================================================================
    // Context lifecycle
    //======================================================================================================
    std::shared_ptr<CallContext> makeContext(const std::string& method, TimeoutKind kind, unsigned int timeoutMs,
                                             const std::string& toolName = std::string()) {
        auto ctx = std::make_shared<CallContext>();
        ctx->serial = ++nextSerial;
        ctx->method = method;
        ctx->kind = kind;
        ctx->timeoutMs = timeoutMs;
        ctx->toolName = toolName;
        ctx->timer = std::make_unique<net::steady_timer>(ioc);
        return ctx;
    }

    void attachStopToken(const std::shared_ptr<CallContext>& ctx, std::stop_token st) {
        if (!st.stop_possible()) {
            return;
        }
        std::weak_ptr<CallContext> weak = ctx;
        ctx->stopCallback = std::make_unique<std::stop_callback<std::function<void()>>>(
            std::move(st), std::function<void()>([this, weak]() {
                auto c = weak.lock();
                if (!c) return;
                c->cancelled.store(true);
                net::post(ioc, [c]() { c->abortNow(); });
            }));
    }

    void armTimer(const std::shared_ptr<CallContext>& ctx) {
        if (ctx->timeoutMs == 0) {
            return;
        }
        std::weak_ptr<CallContext> weak = ctx;
        ctx->timer->expires_after(std::chrono::milliseconds(ctx->timeoutMs));
        ctx->timer->async_wait([weak](const boost::system::error_code& ec) {
            if (ec) return;
            auto c = weak.lock();
            if (!c) return;
            LOG_DEBUG("{} deadline of {} ms reached", c->method, c->timeoutMs);
            c->timedOut.store(true);
            c->abortNow();
        });
    }

    void finish(const std::shared_ptr<CallContext>& ctx) {
        ctx->timer->cancel();
        ctx->stopCallback.reset();
        ctx->abort = nullptr;
        std::lock_guard<std::mutex> lk(stateMutex);
        active.erase(ctx->serial);
    }

    std::exception_ptr timeoutFailure(const CallContext& ctx) const {
        switch (ctx.kind) {
            case TimeoutKind::Connect:
                return std::make_exception_ptr(errors::ConnectionError(
                    fmt::format("Connection to {} timed out after {} ms", ep.host, ctx.timeoutMs), false, true));
            case TimeoutKind::ToolExecution:
                return std::make_exception_ptr(errors::ToolTimeoutError(ctx.toolName, ctx.timeoutMs));
            case TimeoutKind::Request:
            default:
                return std::make_exception_ptr(errors::TimeoutError(ctx.method, ctx.timeoutMs));
        }
    }

    //======================================================================================================
    // translateFailure
    // Purpose: Maps a coroutine failure to the library taxonomy. The context flags decide first, since an
    //          aborted socket surfaces as a plain operation_aborted error.
    //======================================================================================================
    std::exception_ptr translateFailure(const CallContext& ctx, std::exception_ptr e) {
        if (ctx.closing.load()) {
            return std::make_exception_ptr(errors::ConnectionError("transport closed"));
        }
        if (ctx.cancelled.load()) {
            return std::make_exception_ptr(errors::OperationCancelled(ctx.method + " cancelled"));
        }
        if (ctx.timedOut.load()) {
            return timeoutFailure(ctx);
        }
        try {
            std::rethrow_exception(e);
        } catch (const errors::GatewayException&) {
            return e;
        } catch (const boost::system::system_error& se) {
            return std::make_exception_ptr(errors::ConnectionError(
                fmt::format("{} to {}:{} failed: {}", ctx.method, ep.host, ep.port, se.what())));
        } catch (const std::exception& ex) {
            return std::make_exception_ptr(errors::ConnectionError(fmt::format("{} failed: {}", ctx.method, ex.what())));
        }
    }

    // Connected sessions degrade on connection-class failures and recover on the next success
    void noteOutcome(std::exception_ptr failure) {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (!failure) {
            session.lastActivity = std::chrono::steady_clock::now();
            if (session.state == SessionState::Degraded) session.state = SessionState::Connected;
            return;
        }
        try {
            std::rethrow_exception(failure);
        } catch (const errors::ConnectionError& ce) {
            if (!ce.sessionExpired() && session.state == SessionState::Connected) {
                session.state = SessionState::Degraded;
            }
        } catch (const std::exception&) {
            // Other failures leave the session state unchanged
        }
    }

    bool registerContext(const std::shared_ptr<CallContext>& ctx, bool requireSession, std::exception_ptr& refusal) {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (closed || session.state == SessionState::Closed) {
            refusal = std::make_exception_ptr(errors::ConnectionError("transport closed"));
            return false;
        }
        if (requireSession && session.state != SessionState::Connected && session.state != SessionState::Degraded) {
            refusal = std::make_exception_ptr(errors::ConnectionError(
                fmt::format("{} requires a connected session (state {})", ctx->method, toString(session.state))));
            return false;
        }
        active[ctx->serial] = ctx;
        return true;
    }

    //======================================================================================================
    // launch
    // Purpose: Runs an operation coroutine on the I/O thread and bridges its outcome to a std::future.
    //======================================================================================================
    template <typename T>
    std::future<T> launch(std::shared_ptr<CallContext> ctx, std::stop_token st, bool requireSession,
                          net::awaitable<T> op) {
        std::promise<T> promise;
        auto fut = promise.get_future();
        if (st.stop_requested()) {
            promise.set_exception(std::make_exception_ptr(errors::OperationCancelled(ctx->method + " cancelled")));
            return fut;
        }
        std::exception_ptr refusal;
        if (!registerContext(ctx, requireSession, refusal)) {
            promise.set_exception(refusal);
            return fut;
        }
        attachStopToken(ctx, std::move(st));

        if constexpr (std::is_void_v<T>) {
            net::co_spawn(ioc, guarded(ctx, std::move(op)),
                [this, ctx, pr = std::move(promise)](std::exception_ptr e) mutable {
                    finish(ctx);
                    std::exception_ptr failure = e ? translateFailure(*ctx, e) : nullptr;
                    if (failure) {
                        pr.set_exception(failure);
                    } else {
                        pr.set_value();
                    }
                });
        } else {
            net::co_spawn(ioc, guarded(ctx, std::move(op)),
                [this, ctx, pr = std::move(promise)](std::exception_ptr e, T value) mutable {
                    finish(ctx);
                    std::exception_ptr failure = e ? translateFailure(*ctx, e) : nullptr;
                    noteOutcome(failure);
                    if (failure) {
                        try {
                            std::rethrow_exception(failure);
                        } catch (const std::exception& ex) {
                            LOG_DEBUG("{} failed: {}", ctx->method, ex.what());
                            reportError(ex.what());
                        }
                        pr.set_exception(failure);
                    } else {
                        pr.set_value(std::move(value));
                    }
                });
        }
        return fut;
    }

    template <typename T>
    net::awaitable<T> guarded(std::shared_ptr<CallContext> ctx, net::awaitable<T> op) {
        armTimer(ctx);
        co_return co_await std::move(op);
    }

    net::awaitable<void> guarded(std::shared_ptr<CallContext> ctx, net::awaitable<void> op) {
        armTimer(ctx);
        co_await std::move(op);
    }

    //======================================================================================================
    // Message routing
    //======================================================================================================
    void routeReply(CallContext& ctx, std::unique_ptr<JSONRPCResponse> resp) {
        std::optional<int64_t> id = numericId(resp->id);
        if (!id.has_value() && std::holds_alternative<std::nullptr_t>(resp->id) && resp->IsError()) {
            id = ctx.currentId; // gateway could not attribute the error to a request
        }
        if (id.has_value() && ctx.currentId == id) {
            if (!ctx.reply) ctx.reply = std::move(resp);
            return;
        }
        std::shared_ptr<CallContext> target;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            for (auto& kv : active) {
                auto c = kv.second.lock();
                if (c && id.has_value() && c->currentId == id) {
                    target = c;
                    break;
                }
            }
        }
        if (target) {
            LOG_DEBUG("Routing reply id={} from the {} stream to {}", *id, ctx.method, target->method);
            if (!target->reply) {
                target->reply = std::move(resp);
                // Wake the owner, which may be blocked reading its own stream
                target->abortNow();
            }
            return;
        }
        LOG_WARN("Dropping reply for unknown request id {}", IdToString(resp->id));
    }

    void dispatchMessage(CallContext& ctx, const JSONValue& v, const std::string& raw) {
        if (!v.isObject()) {
            throw errors::ProtocolError("Gateway frame is not a JSON object", raw);
        }
        auto method = GetStringMember(v, "method");
        if (method.has_value()) {
            if (FindMember(v, "id") != nullptr) {
                LOG_DEBUG("Ignoring server request '{}' on {} stream", *method, ctx.method);
                return;
            }
            std::optional<JSONValue> params;
            if (const JSONValue* p = FindMember(v, "params")) {
                params = *p;
            }
            ITransportClient::NotificationHandler h;
            {
                std::lock_guard<std::mutex> lk(handlerMutex);
                h = notificationHandler;
            }
            if (!h) {
                LOG_DEBUG("Notification '{}' dropped; no handler", *method);
                return;
            }
            try {
                h(std::make_unique<JSONRPCNotification>(*method, std::move(params)));
            } catch (const std::exception& e) {
                LOG_ERROR("Notification handler for '{}' threw: {}", *method, e.what());
            }
            return;
        }
        auto resp = std::make_unique<JSONRPCResponse>();
        if (!resp->FromValue(v)) {
            throw errors::ProtocolError("Gateway frame is neither a reply nor a notification", raw);
        }
        routeReply(ctx, std::move(resp));
    }

    void handleMessage(CallContext& ctx, const std::string& text) {
        JSONValue v;
        try {
            v = ParseJSON(text);
        } catch (const std::runtime_error& e) {
            throw errors::ProtocolError(fmt::format("Unparsable gateway frame: {}", e.what()), text);
        }
        if (v.isArray()) {
            for (const auto& item : std::get<JSONValue::Array>(v.value)) {
                dispatchMessage(ctx, item ? *item : JSONValue{}, text);
            }
            return;
        }
        dispatchMessage(ctx, v, text);
    }

    void drainEvents(CallContext& ctx, IEventStreamFramer& framer, bool finishing) {
        while (!ctx.reply || !finishing) {
            auto r = finishing ? framer.finish() : framer.tryDecode();
            if (r.status == IEventStreamFramer::DecodeStatus::EventTooLarge) {
                throw errors::ProtocolError(fmt::format("SSE event on {} stream exceeds {} bytes", ctx.method, kMaxEventSize));
            }
            if (r.status != IEventStreamFramer::DecodeStatus::Ok || !r.event.has_value()) {
                return;
            }
            if (!r.event->event.empty() && r.event->event != "message") {
                LOG_DEBUG("Ignoring SSE event type '{}'", r.event->event);
                continue;
            }
            handleMessage(ctx, r.event->data);
            if (ctx.reply && !finishing) {
                return;
            }
        }
    }

    //======================================================================================================
    // coHttp
    // Purpose: One HTTP exchange on an established stream: writes the request, maps the status, and
    //          consumes a JSON or SSE body, routing every message it carries.
    //======================================================================================================
    template <typename Stream>
    net::awaitable<void> coHttp(Stream& stream, std::shared_ptr<CallContext> ctx, http::verb verb, std::string body) {
        const std::string sid = sessionId();
        std::string negotiated;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            negotiated = session.protocolVersion;
        }

        http::request<http::string_body> req{verb, ep.path, 11};
        const bool defaultPort = (ep.secure() && ep.port == "443") || (!ep.secure() && ep.port == "80");
        req.set(http::field::host, defaultPort ? ep.host : ep.host + ":" + ep.port);
        req.set(http::field::user_agent, cfg.clientName + "/" + cfg.clientVersion);
        req.set(http::field::connection, "close");
        if (verb == http::verb::post) {
            req.set(http::field::content_type, "application/json");
            req.set(http::field::accept, "application/json, text/event-stream");
            req.body() = std::move(body);
        }
        if (!cfg.token.empty()) {
            req.set(http::field::authorization, "Bearer " + cfg.token);
        }
        if (!sid.empty()) {
            req.set(Headers::SessionId, sid);
        }
        if (!negotiated.empty()) {
            req.set(Headers::ProtocolVersion, negotiated);
        }
        req.prepare_payload();

        co_await http::async_write(stream, req, net::use_awaitable);
        checkAbort(*ctx);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(kMaxJsonBody);
        co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);
        checkAbort(*ctx);

        const auto& res = parser.get();
        const int status = static_cast<int>(res.result_int());
        LOG_DEBUG("{} {} -> HTTP {}", ctx->method, ep.path, status);
        ctx->sessionHeader = headerValue(res, Headers::SessionId);

        if (verb == http::verb::delete_) {
            if (status >= 300) {
                LOG_DEBUG("Session termination answered HTTP {}", status);
            }
            co_return;
        }

        if (status >= 400) {
            boost::system::error_code ec;
            if (!parser.is_done()) {
                co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
            }
            if (ec) {
                LOG_DEBUG("Reading HTTP {} body failed: {}", status, ec.message());
            }
            const std::string errBody = parser.get().body();
            if (status == 401 || status == 403) {
                throw errors::AuthError(fmt::format("Gateway rejected credentials for {} (HTTP {})", ctx->method, status),
                                        status, headerValue(parser.get(), "WWW-Authenticate"));
            }
            if (status == 404 && !sid.empty()) {
                markSessionExpired(sid);
                throw errors::ConnectionError(fmt::format("Gateway session {} expired (HTTP 404)", sid), true);
            }
            if (status >= 500) {
                throw errors::ConnectionError(fmt::format("Gateway error for {} (HTTP {})", ctx->method, status));
            }
            throw errors::ProtocolError(fmt::format("Gateway rejected {} (HTTP {})", ctx->method, status), errBody);
        }
        if (status < 200 || status >= 300) {
            throw errors::ProtocolError(fmt::format("Unexpected HTTP {} for {}", status, ctx->method));
        }
        if (!ctx->currentId.has_value()) {
            co_return; // notification: 202 Accepted carries nothing we need
        }

        const std::string contentType = lower(headerValue(res, "Content-Type"));
        if (contentType.rfind("text/event-stream", 0) == 0) {
            parser.body_limit(boost::none);
            auto framer = MakeEventStreamFramer(kMaxEventSize);
            while (!parser.is_done() && !ctx->reply) {
                co_await http::async_read_some(stream, buffer, parser, net::use_awaitable);
                checkAbort(*ctx);
                auto& chunk = parser.get().body();
                if (!chunk.empty()) {
                    framer->append(chunk);
                    chunk.clear();
                }
                drainEvents(*ctx, *framer, false);
            }
            if (!ctx->reply) {
                drainEvents(*ctx, *framer, true);
            }
        } else if (contentType.rfind("application/json", 0) == 0) {
            if (!parser.is_done()) {
                co_await http::async_read(stream, buffer, parser, net::use_awaitable);
                checkAbort(*ctx);
            }
            const std::string& text = parser.get().body();
            if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
                throw errors::ProtocolError(fmt::format("Gateway returned an empty body for {}", ctx->method));
            }
            handleMessage(*ctx, text);
        } else if (status == 202 || status == 204) {
            throw errors::ProtocolError(fmt::format("Gateway accepted {} without a reply (HTTP {})", ctx->method, status));
        } else {
            throw errors::ProtocolError(fmt::format("Unexpected content type '{}' for {}", contentType, ctx->method));
        }
    }

    //======================================================================================================
    // coExchange
    // Purpose: Resolves, connects (plus TLS handshake) and runs one HTTP exchange. Each stage installs an
    //          abort hook so timers, stop tokens and Disconnect can interrupt exactly this exchange.
    //======================================================================================================
    net::awaitable<void> coExchange(std::shared_ptr<CallContext> ctx, http::verb verb, std::string body) {
        checkAbort(*ctx);
        if (!tlsInitError.empty()) {
            throw errors::ConnectionError("HTTPS: " + tlsInitError);
        }
        auto ex = co_await net::this_coro::executor;
        tcp::resolver resolver(ex);
        AbortHook hook{*ctx};
        ctx->abort = [&resolver]() { resolver.cancel(); };
        auto results = co_await resolver.async_resolve(ep.host, ep.port, net::use_awaitable);
        checkAbort(*ctx);

        if (ep.secure()) {
            beast::ssl_stream<beast::tcp_stream> stream(ex, *sslCtx);
            ctx->abort = [&stream]() { beast::get_lowest_layer(stream).cancel(); };
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), ep.host.c_str())) {
                throw errors::ConnectionError("HTTPS: failed to set SNI hostname " + ep.host);
            }
            if (cfg.tlsVerify && ::SSL_set1_host(stream.native_handle(), ep.host.c_str()) != 1) {
                throw errors::ConnectionError("HTTPS: failed to enable hostname verification for " + ep.host);
            }
            co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            checkAbort(*ctx);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            checkAbort(*ctx);
            co_await coHttp(stream, ctx, verb, std::move(body));
            boost::system::error_code ec;
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_DEBUG("TLS shutdown: {}", ec.message());
            }
        } else {
            beast::tcp_stream stream(ex);
            ctx->abort = [&stream]() { stream.cancel(); };
            co_await stream.async_connect(results, net::use_awaitable);
            checkAbort(*ctx);
            co_await coHttp(stream, ctx, verb, std::move(body));
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
    }

    // One JSON-RPC request; the reply may arrive on this exchange's stream or be routed from another.
    net::awaitable<std::unique_ptr<JSONRPCResponse>> coRequest(std::shared_ptr<CallContext> ctx, std::string method,
                                                               std::optional<JSONValue> params) {
        const int64_t id = ++nextId;
        ctx->currentId = id;
        ctx->reply.reset();
        JSONRPCRequest request(JSONRPCId(id), method, std::move(params));
        std::exception_ptr failure;
        try {
            co_await coExchange(ctx, http::verb::post, request.Serialize());
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        // A reply routed from another stream interrupts this exchange; the reply stands
        if (failure && (!ctx->reply || ctx->aborted())) {
            std::rethrow_exception(failure);
        }
        if (!ctx->reply) {
            throw errors::ProtocolError(fmt::format("Response stream for {} (id {}) ended without a reply", method, id));
        }
        ctx->currentId.reset();
        co_return std::move(ctx->reply);
    }

    //======================================================================================================
    // Session operations
    //======================================================================================================
    void markSessionExpired(const std::string& sid) {
        LOG_WARN("Gateway session {} expired", sid);
        std::lock_guard<std::mutex> lk(stateMutex);
        if (session.id == sid) {
            session.id.clear();
            if (session.state != SessionState::Closed) {
                session.state = SessionState::Disconnected;
            }
        }
    }

    // Best-effort DELETE; at most one per transport instance.
    net::awaitable<void> coTerminateSession() {
        if (sessionId().empty() || terminateSent.exchange(true)) {
            co_return;
        }
        auto ctx = makeContext("DELETE session", TimeoutKind::Connect, cfg.connectTimeoutMs);
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            active[ctx->serial] = ctx;
        }
        armTimer(ctx);
        std::string failure;
        try {
            co_await coExchange(ctx, http::verb::delete_, std::string());
            LOG_DEBUG("Gateway session terminated");
        } catch (const std::exception& e) {
            failure = e.what();
        }
        finish(ctx);
        if (!failure.empty()) {
            LOG_DEBUG("Session termination failed: {}", failure);
        }
    }

    net::awaitable<void> coConnect(std::shared_ptr<CallContext> ctx) {
        std::exception_ptr failure;
        try {
            auto resp = co_await coRequest(ctx, Methods::Initialize,
                                           BuildInitializeParams(Implementation(cfg.clientName, cfg.clientVersion)));
            if (!ctx->sessionHeader.empty()) {
                std::lock_guard<std::mutex> lk(stateMutex);
                session.id = ctx->sessionHeader;
            }
            if (resp->IsError()) {
                throw errors::ProtocolError("Gateway rejected initialize: " + errorMessageOf(*resp));
            }
            if (!resp->result.has_value()) {
                throw errors::ProtocolError("initialize reply lacks a result", resp->Serialize());
            }
            InitializeResult init = ParseInitializeResult(*resp->result);
            if (ctx->sessionHeader.empty() && cfg.requireSessionId) {
                throw errors::ProtocolError(fmt::format("Gateway did not issue an {} header", Headers::SessionId));
            }
            {
                std::lock_guard<std::mutex> lk(stateMutex);
                session.protocolVersion = init.protocolVersion;
                session.serverInfo = init.serverInfo;
            }

            ctx->currentId.reset();
            JSONRPCNotification initialized(Methods::Initialized);
            co_await coExchange(ctx, http::verb::post, initialized.Serialize());

            std::lock_guard<std::mutex> lk(stateMutex);
            if (session.state == SessionState::Connecting) {
                session.state = SessionState::Connected;
                session.lastActivity = std::chrono::steady_clock::now();
            }
            LOG_INFO("Connected to gateway {} ({} {}), protocol {}, session {}", ep.host, init.serverInfo.name,
                     init.serverInfo.version, init.protocolVersion, session.id.empty() ? "<none>" : session.id);
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        if (failure) {
            setState(SessionState::Disconnected);
            if (!ctx->closing.load()) {
                co_await coTerminateSession();
            }
            {
                // A failed handshake leaves no session behind
                std::lock_guard<std::mutex> lk(stateMutex);
                session.id.clear();
                session.protocolVersion.clear();
                session.serverInfo = Implementation();
            }
            std::rethrow_exception(failure);
        }
    }

    net::awaitable<std::vector<ToolDescriptor>> coListTools(std::shared_ptr<CallContext> ctx) {
        std::vector<ToolDescriptor> tools;
        std::unordered_set<std::string> seen;
        std::optional<std::string> cursor;
        for (int page = 0; page < kMaxListPages; ++page) {
            auto resp = co_await coRequest(ctx, Methods::ListTools, BuildListToolsParams(cursor));
            if (resp->IsError()) {
                throw errors::ProtocolError("tools/list failed: " + errorMessageOf(*resp));
            }
            if (!resp->result.has_value()) {
                throw errors::ProtocolError("tools/list reply lacks a result", resp->Serialize());
            }
            ToolsListPage listed = ParseToolsListResult(*resp->result);
            for (auto& td : listed.tools) {
                if (!seen.insert(td.name).second) {
                    LOG_WARN("Duplicate tool '{}' in listing; keeping the first", td.name);
                    continue;
                }
                tools.push_back(std::move(td));
            }
            if (!listed.nextCursor.has_value()) {
                LOG_DEBUG("tools/list returned {} tool(s) in {} page(s)", tools.size(), page + 1);
                co_return tools;
            }
            if (cursor == listed.nextCursor) {
                throw errors::ProtocolError("tools/list repeated cursor " + *listed.nextCursor);
            }
            cursor = std::move(listed.nextCursor);
        }
        throw errors::ProtocolError(fmt::format("tools/list exceeded {} pages", kMaxListPages));
    }

    net::awaitable<ToolCallOutput> coCallTool(std::shared_ptr<CallContext> ctx, JSONValue arguments) {
        auto resp = co_await coRequest(ctx, Methods::CallTool, BuildCallToolParams(ctx->toolName, arguments));
        co_return interpretCallReply(ctx->toolName, *resp);
    }

    net::awaitable<void> coAbortAll() {
        std::vector<std::shared_ptr<CallContext>> victims;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            for (auto& kv : active) {
                if (auto c = kv.second.lock()) victims.push_back(std::move(c));
            }
        }
        for (auto& c : victims) {
            c->closing.store(true);
            c->abortNow();
        }
        co_return;
    }

    //======================================================================================================
    // shutdown
    // Purpose: Terminates the session, aborts in-flight exchanges and lets the I/O loop drain.
    //======================================================================================================
    void shutdown() {
        const bool onIoThread = ioThread.joinable() && std::this_thread::get_id() == ioThreadId;
        const std::string sid = sessionId();
        if (ioThread.joinable() && !sid.empty()) {
            if (onIoThread) {
                LOG_WARN("Disconnect called on the I/O thread; skipping session termination");
            } else {
                std::promise<void> done;
                auto fut = done.get_future();
                net::co_spawn(ioc, coTerminateSession(), [pr = std::move(done)](std::exception_ptr e) mutable {
                    if (e) {
                        pr.set_exception(e);
                    } else {
                        pr.set_value();
                    }
                });
                try {
                    fut.get();
                } catch (const std::exception& e) {
                    LOG_DEBUG("Session termination failed: {}", e.what());
                }
            }
        }
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            closed = true;
            session.state = SessionState::Closed;
            session.id.clear();
        }
        if (ioThread.joinable()) {
            net::co_spawn(ioc, coAbortAll(), [](std::exception_ptr e) {
                if (e) {
                    LOG_ERROR("Aborting in-flight exchanges failed");
                }
            });
            if (workGuard) {
                workGuard->reset();
                workGuard.reset();
            }
            if (!onIoThread) {
                ioThread.join();
            }
        }
        LOG_DEBUG("HTTP transport closed");
    }
};

HTTPTransportClient::HTTPTransportClient(const config::GatewayConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {}

HTTPTransportClient::~HTTPTransportClient() = default;

std::future<void> HTTPTransportClient::Connect() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(pImpl->stateMutex);
        const SessionState s = pImpl->session.state;
        if (s == SessionState::Connected || s == SessionState::Degraded) {
            std::promise<void> ready;
            ready.set_value();
            return ready.get_future();
        }
        if (pImpl->closed || s == SessionState::Closed) {
            std::promise<void> refused;
            refused.set_exception(std::make_exception_ptr(errors::ConnectionError("transport closed")));
            return refused.get_future();
        }
        if (s == SessionState::Connecting) {
            std::promise<void> busy;
            busy.set_exception(std::make_exception_ptr(errors::ConnectionError("Connect already in progress")));
            return busy.get_future();
        }
        pImpl->session.state = SessionState::Connecting;
    }
    pImpl->ensureStarted();
    auto ctx = pImpl->makeContext(Methods::Initialize, TimeoutKind::Connect, pImpl->cfg.connectTimeoutMs);
    LOG_DEBUG("Connecting to {}://{}:{}{}", pImpl->ep.scheme, pImpl->ep.host, pImpl->ep.port, pImpl->ep.path);
    return pImpl->launch<void>(ctx, std::stop_token{}, false, pImpl->coConnect(ctx));
}

std::future<void> HTTPTransportClient::Disconnect() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    if (!pImpl->closeRequested.exchange(true)) {
        pImpl->shutdown();
    }
    done.set_value();
    return fut;
}

bool HTTPTransportClient::IsConnected() const {
    const SessionState s = pImpl->state();
    return s == SessionState::Connected || s == SessionState::Degraded;
}

SessionState HTTPTransportClient::GetState() const {
    return pImpl->state();
}

Session HTTPTransportClient::GetSession() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->session;
}

std::future<std::unique_ptr<JSONRPCResponse>> HTTPTransportClient::SendRequest(
    const std::string& method, std::optional<JSONValue> params, unsigned int timeoutMs, std::stop_token stopToken) {
    FUNC_SCOPE();
    auto ctx = pImpl->makeContext(method, TimeoutKind::Request, timeoutMs);
    return pImpl->launch<std::unique_ptr<JSONRPCResponse>>(ctx, std::move(stopToken), true,
                                                           pImpl->coRequest(ctx, method, std::move(params)));
}

std::future<std::vector<ToolDescriptor>> HTTPTransportClient::ListTools(unsigned int timeoutMs, std::stop_token stopToken) {
    FUNC_SCOPE();
    auto ctx = pImpl->makeContext(Methods::ListTools, TimeoutKind::Request, timeoutMs);
    return pImpl->launch<std::vector<ToolDescriptor>>(ctx, std::move(stopToken), true, pImpl->coListTools(ctx));
}

std::future<ToolCallOutput> HTTPTransportClient::CallTool(const std::string& name, const JSONValue& arguments,
                                                          unsigned int timeoutMs, std::stop_token stopToken) {
    FUNC_SCOPE();
    auto ctx = pImpl->makeContext(Methods::CallTool, TimeoutKind::ToolExecution, timeoutMs, name);
    return pImpl->launch<ToolCallOutput>(ctx, std::move(stopToken), true, pImpl->coCallTool(ctx, arguments));
}

void HTTPTransportClient::SetNotificationHandler(NotificationHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

void HTTPTransportClient::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

//==========================================================================================================
// HTTPTransportClientFactory::CreateTransportClient
// Purpose: Builds an HTTP/HTTPS client for the configured gateway URL. Throws std::invalid_argument for an
//          unusable URL.
//==========================================================================================================
std::unique_ptr<ITransportClient> HTTPTransportClientFactory::CreateTransportClient(const config::GatewayConfig& config) {
    return std::make_unique<HTTPTransportClient>(config);
}

} // namespace mcpgw
