//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayServer.cpp
// Purpose: WebSocket gateway using Boost.Beast coroutines; one strand per connection, handlers on a
//          thread pool
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "logging/Logger.h"
#include "toolgate/ConnectionManager.h"
#include "toolgate/GatewayServer.h"
#include "toolgate/Session.h"
#include "toolgate/version.h"

namespace toolgate {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

std::string targetPath(beast::string_view target) {
    std::string path(target);
    auto q = path.find('?');
    if (q != std::string::npos) {
        path.resize(q);
    }
    return path;
}

std::string serverHeader() {
    return std::string(getServiceName()) + "/" + getVersionString();
}

//==========================================================================================================
// WebSocketConnection
// Purpose: Owns the Beast stream of one upgraded connection.
// Notes:
//   All stream access happens on the connection's strand. Send() may be called from any thread; it
//   queues the frame and keeps a single async_write outstanding.
//==========================================================================================================
class WebSocketConnection : public std::enable_shared_from_this<WebSocketConnection> {
public:
    using Stream = websocket::stream<beast::tcp_stream>;

    WebSocketConnection(Stream ws, std::string id) : ws_(std::move(ws)), id_(std::move(id)) {}

    Stream& ws() { return ws_; }
    const std::string& Id() const { return id_; }

    void Send(std::string frame) {
        net::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
            if (self->closed_) {
                return;
            }
            self->outbox_.push_back(std::move(frame));
            if (self->outbox_.size() == 1) {
                self->writeNext();
            }
        });
    }

    // Closes the socket on the connection's strand; the pending read then ends the session.
    std::future<void> Shutdown() {
        auto done = std::make_shared<std::promise<void>>();
        auto fut = done->get_future();
        net::post(ws_.get_executor(), [self = shared_from_this(), done]() {
            self->closed_ = true;
            boost::system::error_code ec;
            auto& socket = beast::get_lowest_layer(self->ws_).socket();
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
            done->set_value();
        });
        return fut;
    }

    // Reads frames until the peer closes or the transport fails. Never throws.
    net::awaitable<void> ReadLoop(Session& session) {
        beast::flat_buffer buffer;
        try {
            for (;;) {
                co_await ws_.async_read(buffer, net::use_awaitable);
                std::string text = beast::buffers_to_string(buffer.data());
                buffer.consume(buffer.size());
                session.OnFrame(text);
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                LOG_DEBUG("Connection {}: peer closed", id_);
            } else {
                LOG_DEBUG("Connection {}: read ended: {}", id_, e.what());
            }
        }
        closed_ = true;
        co_return;
    }

private:
    void writeNext() {
        ws_.text(true);
        ws_.async_write(net::buffer(outbox_.front()),
                        [self = shared_from_this()](beast::error_code ec, std::size_t) {
                            if (ec) {
                                LOG_DEBUG("Connection {}: write error: {}", self->id_, ec.message());
                                self->closed_ = true;
                                self->outbox_.clear();
                                return;
                            }
                            self->outbox_.pop_front();
                            if (!self->outbox_.empty() && !self->closed_) {
                                self->writeNext();
                            }
                        });
    }

    Stream ws_;
    const std::string id_;
    std::deque<std::string> outbox_;
    bool closed_{false};
};

} // namespace

class GatewayServer::Impl {
public:
    GatewayServer::Options opts;
    std::shared_ptr<const ActionRegistry> registry;
    std::atomic<bool> running{false};
    std::atomic<bool> stopped{false};
    std::atomic<uint16_t> boundPort{0};

    ConnectionManager connections;
    std::mutex liveMutex;
    std::unordered_map<std::string, std::weak_ptr<WebSocketConnection>> live;
    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;
    // Declared after ioc: destroyed (stopped and joined) first, so late results can still post writes.
    net::thread_pool workers;

    GatewayServer::ErrorHandler errorHandler;

    Impl(const GatewayServer::Options& o, std::shared_ptr<const ActionRegistry> r)
        : opts(o), registry(std::move(r)), workers(o.workerThreads) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    // Closes every upgraded socket and waits (bounded) for the strands to run the close.
    void shutdownConnections() {
        std::vector<std::shared_ptr<WebSocketConnection>> conns;
        {
            std::lock_guard<std::mutex> lock(liveMutex);
            for (auto& kv : live) {
                if (auto c = kv.second.lock()) {
                    conns.push_back(std::move(c));
                }
            }
        }
        std::vector<std::future<void>> pendingCloses;
        pendingCloses.reserve(conns.size());
        for (auto& c : conns) {
            pendingCloses.push_back(c->Shutdown());
        }
        for (auto& f : pendingCloses) {
            if (f.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
                LOG_WARN("Gateway: timed out closing a connection during shutdown");
            }
        }
        if (!conns.empty()) {
            LOG_INFO("Gateway closed {} connection(s)", conns.size());
        }
    }

    void setError(const std::string& msg) {
        LOG_WARN("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void bind() {
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.address, std::to_string(opts.port));
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::server, serverHeader());
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);

        const std::string path = targetPath(req.target());
        JSONValue::Object body;
        if (req.method() == http::verb::get && path == "/") {
            SetMember(body, "service", JSONValue(getServiceName()));
            SetMember(body, "message", JSONValue("toolgate WebSocket gateway"));
            SetMember(body, "version", JSONValue(getVersionString()));
            SetMember(body, "status", JSONValue("running"));
            SetMember(body, "websocket_path", JSONValue(opts.wsPath));
        } else if (req.method() == http::verb::get && path == "/health") {
            SetMember(body, "status", JSONValue("healthy"));
            SetMember(body, "connections", JSONValue(static_cast<int64_t>(connections.Count())));
        } else {
            res.result(http::status::not_found);
            SetMember(body, "error", JSONValue("Not found"));
        }
        res.body() = SerializeJSON(JSONValue(std::move(body)));
        res.prepare_payload();
        return res;
    }

    net::awaitable<void> runWebSocket(beast::tcp_stream stream, http::request<http::string_body> req) {
        stream.expires_never();
        auto conn = std::make_shared<WebSocketConnection>(WebSocketConnection::Stream(std::move(stream)),
                                                          connections.NextId());
        conn->ws().set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        conn->ws().set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) { res.set(http::field::server, serverHeader()); }));
        co_await conn->ws().async_accept(req, net::use_awaitable);

        std::weak_ptr<WebSocketConnection> weak = conn;
        auto session = std::make_shared<Session>(conn->Id(), registry, workers.get_executor(),
                                                 [weak](std::string frame) {
                                                     if (auto c = weak.lock()) {
                                                         c->Send(std::move(frame));
                                                     }
                                                 });
        {
            std::lock_guard<std::mutex> lock(liveMutex);
            live[conn->Id()] = conn;
        }
        connections.Add(session);
        session->Open();

        co_await conn->ReadLoop(*session);

        session->Close();
        connections.Remove(conn->Id());
        {
            std::lock_guard<std::mutex> lock(liveMutex);
            live.erase(conn->Id());
        }
        co_return;
    }

    net::awaitable<void> handleConnection(tcp::socket socket) {
        try {
            beast::tcp_stream stream(std::move(socket));
            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            stream.expires_after(std::chrono::seconds(30));
            co_await http::async_read(stream, buffer, req, net::use_awaitable);

            if (websocket::is_upgrade(req) && targetPath(req.target()) == opts.wsPath) {
                co_await runWebSocket(std::move(stream), std::move(req));
                co_return;
            }

            auto res = makeResponse(req);
            co_await http::async_write(stream, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                LOG_DEBUG("Gateway connection error suppressed during shutdown: {}", e.what());
            } else if (e.code() != http::error::end_of_stream) {
                setError(std::string("Gateway connection error: ") + e.what());
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("Gateway connection error suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("Gateway connection error: ") + e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        while (running.load()) {
            try {
                tcp::socket socket = co_await acceptor->async_accept(net::make_strand(ioc), net::use_awaitable);
                auto ex = socket.get_executor();
                net::co_spawn(ex, handleConnection(std::move(socket)), net::detached);
            } catch (const boost::system::system_error& e) {
                if (!running.load()) {
                    break;
                }
                setError(std::string("Gateway accept error: ") + e.what());
            }
        }
        co_return;
    }
};

GatewayServer::GatewayServer(const Options& opts, std::shared_ptr<const ActionRegistry> registry) {
    if (!registry) {
        throw std::invalid_argument("GatewayServer: registry is null");
    }
    if (!registry->IsSealed()) {
        throw std::invalid_argument("GatewayServer: registry must be sealed before serving");
    }
    if (opts.workerThreads == 0) {
        throw std::invalid_argument("GatewayServer: workerThreads must be > 0");
    }
    pImpl = std::make_unique<Impl>(opts, std::move(registry));
}

GatewayServer::~GatewayServer() = default;

std::future<void> GatewayServer::Start() {
    if (pImpl->stopped.load()) {
        throw std::logic_error("GatewayServer: cannot restart a stopped server");
    }
    if (pImpl->running.exchange(true)) {
        throw std::logic_error("GatewayServer: already started");
    }
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        pImpl->running.store(false);
        LOG_ERROR("Gateway failed to bind {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        throw;
    }
    LOG_INFO("Gateway listening on ws://{}:{}{} ({} workers)", pImpl->opts.address, pImpl->boundPort.load(),
             pImpl->opts.wsPath, pImpl->opts.workerThreads);

    std::promise<void> ready;
    auto fut = ready.get_future();
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        try {
            net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pr.set_value();
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("Gateway I/O thread error: ") + e.what());
        }
    });
    return fut;
}

std::future<void> GatewayServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    if (pImpl->stopped.exchange(true)) {
        done.set_value();
        return fut;
    }
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
    }
    pImpl->shutdownConnections();
    pImpl->connections.CloseAll();
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    pImpl->workers.stop();
    pImpl->workers.join();
    LOG_INFO("Gateway stopped");
    done.set_value();
    return fut;
}

bool GatewayServer::IsRunning() const {
    return pImpl->running.load();
}

uint16_t GatewayServer::GetBoundPort() const {
    return pImpl->boundPort.load();
}

std::size_t GatewayServer::ConnectionCount() const {
    return pImpl->connections.Count();
}

void GatewayServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace toolgate
