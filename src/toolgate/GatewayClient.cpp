//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayClient.cpp
// Purpose: Beast WebSocket client with request_id correlation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "logging/Logger.h"
#include "toolgate/GatewayClient.h"
#include "toolgate/errors/Errors.h"
#include "toolgate/version.h"

namespace toolgate {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

struct WsUrl {
    std::string host;
    std::string port;
    std::string target;
};

WsUrl parseWsUrl(const std::string& url) {
    static const std::string scheme = "ws://";
    if (url.rfind(scheme, 0) != 0) {
        throw std::invalid_argument("unsupported URL (expected ws://host:port/path): " + url);
    }
    std::string rest = url.substr(scheme.size());
    WsUrl out;
    auto slash = rest.find('/');
    std::string hostPort = slash == std::string::npos ? rest : rest.substr(0, slash);
    out.target = slash == std::string::npos ? "/" : rest.substr(slash);
    if (!hostPort.empty() && hostPort.front() == '[') {
        auto rb = hostPort.find(']');
        if (rb == std::string::npos) {
            throw std::invalid_argument("malformed IPv6 host in URL: " + url);
        }
        out.host = hostPort.substr(1, rb - 1);
        if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
            out.port = hostPort.substr(rb + 2);
        }
    } else {
        auto colon = hostPort.rfind(':');
        if (colon != std::string::npos) {
            out.host = hostPort.substr(0, colon);
            out.port = hostPort.substr(colon + 1);
        } else {
            out.host = hostPort;
        }
    }
    if (out.host.empty()) {
        throw std::invalid_argument("missing host in URL: " + url);
    }
    if (out.port.empty()) {
        out.port = "80";
    }
    return out;
}

} // namespace

class GatewayClient::Impl {
public:
    GatewayClient::Options opts;
    net::io_context ioc;
    websocket::stream<beast::tcp_stream> ws{ioc};
    std::thread ioThread;
    std::atomic<bool> connected{false};
    std::atomic<uint64_t> nextId{0};

    // Touched only on the I/O thread.
    std::deque<std::string> outbox;
    bool closing{false};

    std::mutex mutex;
    std::condition_variable unsolicitedCv;
    std::unordered_map<std::string, std::promise<ResponseEnvelope>> pending;
    std::deque<ResponseEnvelope> unsolicited;

    std::promise<void> readerDone;

    explicit Impl(const GatewayClient::Options& o) : opts(o) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    static std::string keyFor(const JSONValue& id) { return RequestIdKey(id); }

    void enqueue(std::string frame) {
        net::post(ioc, [this, frame = std::move(frame)]() mutable {
            if (closing) {
                return;
            }
            outbox.push_back(std::move(frame));
            if (outbox.size() == 1) {
                writeNext();
            }
        });
    }

    void writeNext() {
        ws.text(true);
        ws.async_write(net::buffer(outbox.front()), [this](beast::error_code ec, std::size_t) {
            if (ec) {
                LOG_DEBUG("GatewayClient write error: {}", ec.message());
                outbox.clear();
                return;
            }
            outbox.pop_front();
            if (!outbox.empty()) {
                writeNext();
            } else if (closing) {
                doClose();
            }
        });
    }

    void doClose() {
        ws.async_close(websocket::close_code::normal, [](beast::error_code ec) {
            if (ec) {
                LOG_DEBUG("GatewayClient close: {}", ec.message());
            }
        });
    }

    void onFrame(const std::string& text) {
        std::optional<ResponseEnvelope> parsed;
        try {
            parsed = ResponseEnvelope::Deserialize(text);
        } catch (const std::exception& e) {
            LOG_WARN("GatewayClient: ignoring malformed response: {}", e.what());
            return;
        }
        ResponseEnvelope response = std::move(*parsed);

        std::unique_lock<std::mutex> lock(mutex);
        if (!response.RequestId().IsNull()) {
            auto it = pending.find(keyFor(response.RequestId()));
            if (it != pending.end()) {
                it->second.set_value(std::move(response));
                pending.erase(it);
                return;
            }
        }
        unsolicited.push_back(std::move(response));
        lock.unlock();
        unsolicitedCv.notify_all();
    }

    void failPending(const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& kv : pending) {
            kv.second.set_exception(std::make_exception_ptr(std::runtime_error(reason)));
        }
        pending.clear();
    }

    net::awaitable<void> readLoop() {
        beast::flat_buffer buffer;
        try {
            for (;;) {
                co_await ws.async_read(buffer, net::use_awaitable);
                std::string text = beast::buffers_to_string(buffer.data());
                buffer.consume(buffer.size());
                onFrame(text);
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                LOG_DEBUG("GatewayClient: connection closed by peer");
            } else {
                LOG_DEBUG("GatewayClient: read ended: {}", e.what());
            }
        }
        connected.store(false);
        failPending("gateway connection closed");
        readerDone.set_value();
        co_return;
    }
};

GatewayClient::GatewayClient(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

GatewayClient::~GatewayClient() {
    Close();
}

void GatewayClient::Connect() {
    if (pImpl->connected.load() || pImpl->ioThread.joinable()) {
        throw std::logic_error("GatewayClient: already connected");
    }
    const WsUrl url = parseWsUrl(pImpl->opts.url);

    tcp::resolver resolver(pImpl->ioc);
    auto results = resolver.resolve(url.host, url.port);
    beast::get_lowest_layer(pImpl->ws).connect(results);
    pImpl->ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, std::string(getServiceName()) + "-client/" + getVersionString());
    }));
    pImpl->ws.handshake(url.host + ":" + url.port, url.target);
    pImpl->connected.store(true);
    LOG_DEBUG("GatewayClient connected to {}", pImpl->opts.url);

    net::co_spawn(pImpl->ioc, pImpl->readLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("GatewayClient I/O thread error: {}", e.what());
        }
    });
}

bool GatewayClient::IsConnected() const {
    return pImpl->connected.load();
}

std::future<ResponseEnvelope> GatewayClient::SendAsync(const std::string& action, const JSONValue& data,
                                                       std::optional<JSONValue> requestId) {
    if (!pImpl->connected.load()) {
        throw std::logic_error("GatewayClient: not connected");
    }
    RequestEnvelope request;
    request.action = action;
    request.data = data;
    request.hasRequestId = true;
    request.requestId = requestId ? std::move(*requestId)
                                  : JSONValue("req-" + std::to_string(++pImpl->nextId));

    std::future<ResponseEnvelope> fut;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        const std::string key = Impl::keyFor(request.requestId);
        if (pImpl->pending.count(key) != 0) {
            throw std::logic_error("GatewayClient: request_id already pending: " + SerializeJSON(request.requestId));
        }
        fut = pImpl->pending[key].get_future();
    }
    pImpl->enqueue(request.Serialize());
    return fut;
}

ResponseEnvelope GatewayClient::Send(const std::string& action, const JSONValue& data) {
    const std::string id = "req-" + std::to_string(++pImpl->nextId);
    auto fut = SendAsync(action, data, JSONValue(id));
    if (fut.wait_for(pImpl->opts.requestTimeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->pending.erase(Impl::keyFor(JSONValue(id)));
        throw errors::GatewayError(errors::ErrorCategory::Timeout,
                                   "no response for " + action + " (request_id " + id + ")");
    }
    return fut.get();
}

void GatewayClient::SendRaw(const std::string& frame) {
    if (!pImpl->connected.load()) {
        throw std::logic_error("GatewayClient: not connected");
    }
    pImpl->enqueue(frame);
}

std::optional<ResponseEnvelope> GatewayClient::NextUnsolicited(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    if (!pImpl->unsolicitedCv.wait_for(lock, timeout, [this] { return !pImpl->unsolicited.empty(); })) {
        return std::nullopt;
    }
    ResponseEnvelope r = std::move(pImpl->unsolicited.front());
    pImpl->unsolicited.pop_front();
    return r;
}

void GatewayClient::Close() {
    if (!pImpl->ioThread.joinable()) {
        return;
    }
    auto done = pImpl->readerDone.get_future();
    net::post(pImpl->ioc, [impl = pImpl.get()]() {
        if (impl->closing) {
            return;
        }
        impl->closing = true;
        if (impl->outbox.empty()) {
            impl->doClose();
        }
    });
    if (done.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
        LOG_DEBUG("GatewayClient: peer did not complete the close handshake");
    }
    pImpl->ioc.stop();
    pImpl->ioThread.join();
    pImpl->connected.store(false);
    pImpl->failPending("gateway client closed");
}

} // namespace toolgate
