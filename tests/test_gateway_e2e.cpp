//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_gateway_e2e.cpp
// Purpose: GatewayServer + GatewayClient over a real loopback WebSocket (correlation, errors, HTTP probes)
//==========================================================================================================

#include <utility>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "TempWorkspace.h"
#include "toolgate/GatewayClient.h"
#include "toolgate/GatewayServer.h"
#include "toolgate/StandardActions.h"

using namespace toolgate;
using toolgate_test::TempWorkspace;
using namespace std::chrono_literals;
namespace http = boost::beast::http;

namespace {

std::shared_ptr<const ActionRegistry> buildRegistry(const TempWorkspace& ws) {
    auto registry = std::make_shared<ActionRegistry>();
    ToolContext ctx;
    ctx.files = std::make_shared<tools::FileMutator>(ws.root());
    tools::CommandRunner::Options copts;
    copts.workspaceRoot = ws.root();
    ctx.commands = std::make_shared<tools::CommandRunner>(copts);
    ctx.collaborator = std::make_shared<OfflineCollaborator>();
    RegisterStandardActions(*registry, ctx);
    registry->Seal();
    return registry;
}

http::response<http::string_body> httpGet(uint16_t port, const std::string& target) {
    boost::asio::io_context io;
    boost::beast::tcp_stream stream(io);
    stream.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);
    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return res;
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

} // namespace

class GatewayE2ETest : public ::testing::Test {
protected:
    TempWorkspace ws;
    std::unique_ptr<GatewayServer> server;

    void SetUp() override {
        GatewayServer::Options opts;
        opts.port = 0;
        opts.workerThreads = 4;
        server = std::make_unique<GatewayServer>(opts, buildRegistry(ws));
        server->Start().get();
        ASSERT_TRUE(server->IsRunning());
        ASSERT_NE(server->GetBoundPort(), 0);
    }

    void TearDown() override {
        server->Stop().get();
    }

    std::unique_ptr<GatewayClient> connect() {
        GatewayClient::Options copts;
        copts.url = "ws://127.0.0.1:" + std::to_string(server->GetBoundPort()) + "/ws";
        copts.requestTimeout = 10000ms;
        auto client = std::make_unique<GatewayClient>(copts);
        client->Connect();
        return client;
    }
};

TEST_F(GatewayE2ETest, ReadFileRoundTrip) {
    ws.write("hello.txt", "hello gateway");
    auto client = connect();
    auto res = client->Send("read_file", ParseJSON("{\"file_path\":\"hello.txt\"}"));
    ASSERT_TRUE(res.IsSuccess()) << res.Error();
    EXPECT_EQ(res.Message(), "File read successfully");
    EXPECT_EQ(GetStringMember(JSONValue(res.Data()), "content"), std::string("hello gateway"));
    client->Close();
}

TEST_F(GatewayE2ETest, ConcurrentRequestsAreCorrelatedById) {
    ws.write("a.txt", "A");
    ws.write("b.txt", "B");
    auto client = connect();
    auto slow = client->SendAsync("execute_command", ParseJSON("{\"command\":\"sleep 1; echo slow\"}"),
                                  JSONValue("slow-1"));
    auto fa = client->SendAsync("read_file", ParseJSON("{\"file_path\":\"a.txt\"}"), JSONValue("a"));
    auto fb = client->SendAsync("read_file", ParseJSON("{\"file_path\":\"b.txt\"}"), JSONValue(int64_t{2}));

    ASSERT_EQ(fa.wait_for(5s), std::future_status::ready);
    ASSERT_EQ(fb.wait_for(5s), std::future_status::ready);
    // The fast reads must not wait behind the running command
    EXPECT_EQ(slow.wait_for(0ms), std::future_status::timeout);

    auto ra = fa.get();
    auto rb = fb.get();
    EXPECT_EQ(GetStringMember(JSONValue(ra.Data()), "content"), std::string("A"));
    EXPECT_EQ(std::get<std::string>(ra.RequestId().value), "a");
    EXPECT_EQ(GetStringMember(JSONValue(rb.Data()), "content"), std::string("B"));
    EXPECT_EQ(std::get<int64_t>(rb.RequestId().value), 2);

    ASSERT_EQ(slow.wait_for(10s), std::future_status::ready);
    auto rs = slow.get();
    ASSERT_TRUE(rs.IsSuccess());
    EXPECT_EQ(GetStringMember(JSONValue(rs.Data()), "stdout"), std::string("slow\n"));
    client->Close();
}

TEST_F(GatewayE2ETest, UnknownActionAndInvalidFrames) {
    auto client = connect();
    auto unknown = client->Send("format_disk", ParseJSON("{}"));
    EXPECT_FALSE(unknown.IsSuccess());
    EXPECT_EQ(unknown.Message(), "Unknown action");

    client->SendRaw("{definitely not json");
    auto invalid = client->NextUnsolicited(5000ms);
    ASSERT_TRUE(invalid.has_value());
    EXPECT_FALSE(invalid->IsSuccess());
    EXPECT_EQ(invalid->Message(), "Invalid JSON");
    EXPECT_TRUE(invalid->RequestId().IsNull());

    // The connection survives malformed frames
    ws.write("still.txt", "alive");
    auto ok = client->Send("read_file", ParseJSON("{\"file_path\":\"still.txt\"}"));
    EXPECT_TRUE(ok.IsSuccess());
    client->Close();
}

TEST_F(GatewayE2ETest, FailuresCarryCategoryPrefix) {
    auto client = connect();
    auto res = client->Send("read_file", ParseJSON("{\"file_path\":\"missing.txt\"}"));
    EXPECT_FALSE(res.IsSuccess());
    EXPECT_EQ(res.Message(), "Failed to read file");
    EXPECT_EQ(res.Error().rfind("NotFound:", 0), 0u);
    client->Close();
}

TEST_F(GatewayE2ETest, HttpProbes) {
    auto root = httpGet(server->GetBoundPort(), "/");
    EXPECT_EQ(root.result(), http::status::ok);
    auto rootJson = ParseJSON(root.body());
    EXPECT_EQ(GetStringMember(rootJson, "status"), std::string("running"));
    EXPECT_EQ(GetStringMember(rootJson, "websocket_path"), std::string("/ws"));

    auto health = httpGet(server->GetBoundPort(), "/health?verbose=1");
    EXPECT_EQ(health.result(), http::status::ok);
    auto healthJson = ParseJSON(health.body());
    EXPECT_EQ(GetStringMember(healthJson, "status"), std::string("healthy"));
    EXPECT_EQ(GetIntMember(healthJson, "connections"), 0);

    auto missing = httpGet(server->GetBoundPort(), "/nope");
    EXPECT_EQ(missing.result(), http::status::not_found);
}

TEST_F(GatewayE2ETest, ConnectionCountTracksClients) {
    auto a = connect();
    auto b = connect();
    EXPECT_TRUE(eventually([&] { return server->ConnectionCount() == 2; }));
    auto health = ParseJSON(httpGet(server->GetBoundPort(), "/health").body());
    EXPECT_EQ(GetIntMember(health, "connections"), 2);
    a->Close();
    EXPECT_TRUE(eventually([&] { return server->ConnectionCount() == 1; }));
    b->Close();
    EXPECT_TRUE(eventually([&] { return server->ConnectionCount() == 0; }));
}

TEST_F(GatewayE2ETest, ClientRejectsDuplicatePendingIds) {
    auto client = connect();
    auto first = client->SendAsync("execute_command", ParseJSON("{\"command\":\"sleep 0.5\"}"), JSONValue("same"));
    EXPECT_THROW(client->SendAsync("read_file", ParseJSON("{\"file_path\":\"x\"}"), JSONValue("same")),
                 std::logic_error);
    ASSERT_EQ(first.wait_for(10s), std::future_status::ready);
    EXPECT_TRUE(first.get().IsSuccess());
    client->Close();
}

TEST_F(GatewayE2ETest, StopFailsPendingClientRequests) {
    auto client = connect();
    auto pending = client->SendAsync("execute_command", ParseJSON("{\"command\":\"sleep 2\"}"));
    std::this_thread::sleep_for(200ms);
    server->Stop().get();
    EXPECT_FALSE(server->IsRunning());
    ASSERT_EQ(pending.wait_for(10s), std::future_status::ready);
    EXPECT_THROW(pending.get(), std::runtime_error);
    EXPECT_TRUE(eventually([&] { return !client->IsConnected(); }));
}

TEST(GatewayServer, RejectsUnsealedRegistry) {
    auto registry = std::make_shared<ActionRegistry>();
    EXPECT_THROW(GatewayServer(GatewayServer::Options{}, registry), std::invalid_argument);
    EXPECT_THROW(GatewayServer(GatewayServer::Options{}, nullptr), std::invalid_argument);
}

TEST(GatewayClient, RejectsNonWebSocketUrls) {
    GatewayClient::Options opts;
    opts.url = "http://127.0.0.1:1/ws";
    GatewayClient client(opts);
    EXPECT_THROW(client.Connect(), std::invalid_argument);
    EXPECT_FALSE(client.IsConnected());
    EXPECT_THROW(client.SendAsync("read_file", ParseJSON("{}")), std::logic_error);
}
