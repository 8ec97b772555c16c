//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_session.cpp
// Purpose: Session tests (request correlation, duplicate ids, malformed frames, close semantics)
//==========================================================================================================

#include <utility>
#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "toolgate/ActionRegistry.h"
#include "toolgate/Envelope.h"
#include "toolgate/Session.h"

using namespace toolgate;
using namespace std::chrono_literals;

namespace {

// Collects frames written by a session; safe to call from worker threads.
class FrameSink {
public:
    void operator()(std::string frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.push_back(ParseJSON(frame));
        cv_.notify_all();
    }

    bool waitFor(std::size_t count, std::chrono::milliseconds timeout = 5000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return frames_.size() >= count; });
    }

    std::vector<JSONValue> frames() {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<JSONValue> frames_;
};

// Handler that blocks until released, so requests can be held in flight.
struct Gate {
    std::promise<void> release;
    std::shared_future<void> released{release.get_future().share()};
    std::once_flag once;

    void open() {
        std::call_once(once, [this] { release.set_value(); });
    }
};

std::shared_ptr<const ActionRegistry> makeRegistry(const std::shared_ptr<Gate>& gate) {
    auto registry = std::make_shared<ActionRegistry>();
    registry->Register(Action::ReadFile, "echo", ActionSchema{}.Required("text", FieldType::String),
        [](const JSONValue& data) {
            ActionResult r;
            r.message = "Echoed";
            SetMember(r.data, "text", JSONValue(GetStringMember(data, "text").value_or("")));
            return r;
        });
    registry->Register(Action::ExecuteCommand, "blocks until released", ActionSchema{},
        [gate](const JSONValue&) {
            gate->released.wait();
            return ActionResult{"Released", {}};
        });
    registry->Seal();
    return registry;
}

class SessionTest : public ::testing::Test {
protected:
    boost::asio::thread_pool pool{4};
    std::shared_ptr<Gate> gate = std::make_shared<Gate>();
    std::shared_ptr<FrameSink> sink = std::make_shared<FrameSink>();
    std::shared_ptr<Session> session;

    void SetUp() override {
        auto s = sink;
        session = std::make_shared<Session>("conn-test", makeRegistry(gate), pool.get_executor(),
                                            [s](std::string frame) { (*s)(std::move(frame)); });
        session->Open();
    }

    void TearDown() override {
        gate->open();
        pool.join();
    }
};

} // namespace

TEST_F(SessionTest, StartsConnectingAndOpens) {
    auto s = std::make_shared<Session>("x", makeRegistry(gate), pool.get_executor(), nullptr);
    EXPECT_EQ(s->GetState(), SessionState::Connecting);
    s->OnFrame("{\"action\":\"read_file\",\"data\":{\"text\":\"a\"}}");
    EXPECT_EQ(s->InFlightCount(), 0u);  // dropped before Open
    s->Open();
    EXPECT_EQ(s->GetState(), SessionState::Open);
    EXPECT_STREQ(SessionStateName(s->GetState()), "open");
}

TEST_F(SessionTest, ResponseEchoesRequestId) {
    session->OnFrame("{\"action\":\"read_file\",\"data\":{\"text\":\"hi\"},\"request_id\":\"r-1\"}");
    ASSERT_TRUE(sink->waitFor(1));
    auto f = sink->frames()[0];
    EXPECT_EQ(GetBoolMember(f, "success"), true);
    EXPECT_EQ(GetStringMember(f, "request_id"), std::string("r-1"));
    const JSONValue* data = FindMember(f, "data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(GetStringMember(*data, "text"), std::string("hi"));
}

TEST_F(SessionTest, MissingRequestIdIsAnsweredWithNull) {
    session->OnFrame("{\"action\":\"read_file\",\"data\":{\"text\":\"a\"}}");
    session->OnFrame("{\"action\":\"read_file\",\"data\":{\"text\":\"b\"},\"request_id\":null}");
    ASSERT_TRUE(sink->waitFor(2));
    for (const auto& f : sink->frames()) {
        ASSERT_NE(FindMember(f, "request_id"), nullptr);
        EXPECT_TRUE(FindMember(f, "request_id")->IsNull());
        EXPECT_EQ(GetBoolMember(f, "success"), true);
    }
}

TEST_F(SessionTest, InvalidJsonGetsImmediateFailure) {
    session->OnFrame("this is not json");
    ASSERT_TRUE(sink->waitFor(1));
    auto f = sink->frames()[0];
    EXPECT_EQ(GetBoolMember(f, "success"), false);
    EXPECT_EQ(GetStringMember(f, "message"), std::string("Invalid JSON"));
    EXPECT_EQ(GetStringMember(f, "error")->rfind("ValidationError:", 0), 0u);
    EXPECT_EQ(session->GetState(), SessionState::Open);
}

TEST_F(SessionTest, InvalidRequestKeepsRecoveredId) {
    session->OnFrame("{\"data\":{},\"request_id\":42}");
    ASSERT_TRUE(sink->waitFor(1));
    auto f = sink->frames()[0];
    EXPECT_EQ(GetStringMember(f, "message"), std::string("Invalid request"));
    EXPECT_EQ(GetIntMember(f, "request_id"), 42);
}

TEST_F(SessionTest, UnknownActionIsAnsweredWithoutWorkers) {
    session->OnFrame("{\"action\":\"rm_rf\",\"request_id\":\"u\"}");
    ASSERT_TRUE(sink->waitFor(1));
    auto f = sink->frames()[0];
    EXPECT_EQ(GetBoolMember(f, "success"), false);
    EXPECT_EQ(GetStringMember(f, "message"), std::string("Unknown action"));
    EXPECT_EQ(GetStringMember(f, "request_id"), std::string("u"));
    EXPECT_EQ(session->InFlightCount(), 0u);
}

TEST_F(SessionTest, DuplicateInFlightRequestIdIsRejected) {
    session->OnFrame("{\"action\":\"execute_command\",\"request_id\":\"dup\"}");
    session->OnFrame("{\"action\":\"execute_command\",\"request_id\":\"dup\"}");
    ASSERT_TRUE(sink->waitFor(1));
    auto first = sink->frames()[0];
    EXPECT_EQ(GetStringMember(first, "message"), std::string("Duplicate request"));
    EXPECT_EQ(GetStringMember(first, "request_id"), std::string("dup"));
    EXPECT_EQ(session->InFlightCount(), 1u);

    gate->open();
    ASSERT_TRUE(sink->waitFor(2));
    EXPECT_EQ(GetStringMember(sink->frames()[1], "message"), std::string("Released"));

    // Once answered, the id may be reused.
    session->OnFrame("{\"action\":\"read_file\",\"data\":{\"text\":\"again\"},\"request_id\":\"dup\"}");
    ASSERT_TRUE(sink->waitFor(3));
    EXPECT_EQ(GetBoolMember(sink->frames()[2], "success"), true);
}

TEST_F(SessionTest, DistinctIdTypesDoNotCollide) {
    session->OnFrame("{\"action\":\"execute_command\",\"request_id\":1}");
    session->OnFrame("{\"action\":\"execute_command\",\"request_id\":\"1\"}");
    EXPECT_EQ(session->InFlightCount(), 2u);
    EXPECT_EQ(session->InFlightRequestKeys().size(), 2u);
}

TEST_F(SessionTest, StructuredRequestIdsAreEchoedAndComparedByValue) {
    session->OnFrame("{\"action\":\"execute_command\",\"request_id\":{\"job\":7,\"part\":\"a\"}}");
    session->OnFrame("{\"action\":\"execute_command\",\"request_id\":{\"part\":\"a\",\"job\":7}}");
    ASSERT_TRUE(sink->waitFor(1));
    auto dup = sink->frames()[0];
    EXPECT_EQ(GetStringMember(dup, "message"), std::string("Duplicate request"));
    const JSONValue* dupId = FindMember(dup, "request_id");
    ASSERT_NE(dupId, nullptr);
    EXPECT_EQ(GetIntMember(*dupId, "job"), 7);
    EXPECT_EQ(session->InFlightCount(), 1u);

    session->OnFrame("{\"action\":\"read_file\",\"data\":{\"text\":\"f\"},\"request_id\":2.5}");
    ASSERT_TRUE(sink->waitFor(2));
    auto echoed = sink->frames()[1];
    EXPECT_EQ(GetBoolMember(echoed, "success"), true);
    const JSONValue* id = FindMember(echoed, "request_id");
    ASSERT_NE(id, nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>(id->value), 2.5);
}

TEST_F(SessionTest, FastRequestsOvertakeSlowOnes) {
    session->OnFrame("{\"action\":\"execute_command\",\"request_id\":\"slow\"}");
    session->OnFrame("{\"action\":\"read_file\",\"data\":{\"text\":\"x\"},\"request_id\":\"fast\"}");
    ASSERT_TRUE(sink->waitFor(1));
    EXPECT_EQ(GetStringMember(sink->frames()[0], "request_id"), std::string("fast"));
    gate->open();
    ASSERT_TRUE(sink->waitFor(2));
    EXPECT_EQ(GetStringMember(sink->frames()[1], "request_id"), std::string("slow"));
}

TEST_F(SessionTest, CloseDiscardsLateResultsAndNotifiesOnce) {
    std::promise<std::string> closed;
    auto closedFuture = closed.get_future();
    int calls = 0;
    session->SetClosedHandler([&](const std::string& id) {
        ++calls;
        closed.set_value(id);
    });

    session->OnFrame("{\"action\":\"execute_command\",\"request_id\":\"late\"}");
    EXPECT_EQ(session->InFlightCount(), 1u);
    session->Close();
    EXPECT_EQ(session->GetState(), SessionState::Closing);
    session->Close();

    // Frames after close are ignored
    session->OnFrame("{\"action\":\"read_file\",\"data\":{\"text\":\"x\"}}");

    gate->open();
    ASSERT_EQ(closedFuture.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(closedFuture.get(), "conn-test");
    EXPECT_EQ(session->GetState(), SessionState::Closed);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sink->frames().empty());
}

TEST_F(SessionTest, CloseWithNothingInFlightIsImmediate) {
    bool notified = false;
    session->SetClosedHandler([&](const std::string&) { notified = true; });
    session->Close();
    EXPECT_EQ(session->GetState(), SessionState::Closed);
    EXPECT_TRUE(notified);
}
