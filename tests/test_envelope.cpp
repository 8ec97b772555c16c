//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_envelope.cpp
// Purpose: GoogleTests for request parsing and response envelope invariants
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <variant>

#include "toolgate/Envelope.h"

using namespace toolgate;

TEST(RequestEnvelope, ParsesFullRequest) {
    auto req = ParseRequestEnvelope("{\"action\":\"read_file\",\"data\":{\"file_path\":\"a.txt\"},\"request_id\":\"r1\"}");
    EXPECT_EQ(req.action, "read_file");
    EXPECT_EQ(GetStringMember(req.data, "file_path"), std::string("a.txt"));
    EXPECT_TRUE(req.hasRequestId);
    EXPECT_EQ(std::get<std::string>(req.requestId.value), "r1");
}

TEST(RequestEnvelope, MissingOrNullDataDefaultsToEmptyObject) {
    auto a = ParseRequestEnvelope("{\"action\":\"list_directory\"}");
    ASSERT_TRUE(a.data.IsObject());
    EXPECT_TRUE(std::get<JSONValue::Object>(a.data.value).empty());
    EXPECT_FALSE(a.hasRequestId);
    EXPECT_TRUE(a.requestId.IsNull());

    auto b = ParseRequestEnvelope("{\"action\":\"list_directory\",\"data\":null,\"request_id\":7}");
    ASSERT_TRUE(b.data.IsObject());
    EXPECT_EQ(std::get<int64_t>(b.requestId.value), 7);
}

TEST(RequestEnvelope, InvalidJsonIsReported) {
    try {
        ParseRequestEnvelope("{not json");
        FAIL() << "expected InvalidEnvelope";
    } catch (const InvalidEnvelope& e) {
        EXPECT_EQ(e.message(), "Invalid JSON");
        EXPECT_EQ(e.category(), errors::ErrorCategory::Validation);
        EXPECT_NE(std::string(e.what()).find("ValidationError: failed to parse message as JSON"), std::string::npos);
        EXPECT_TRUE(e.requestId().IsNull());
    }
}

TEST(RequestEnvelope, ShapeErrorsKeepRecoveredRequestId) {
    try {
        ParseRequestEnvelope("{\"data\":{},\"request_id\":\"abc\"}");
        FAIL() << "expected InvalidEnvelope";
    } catch (const InvalidEnvelope& e) {
        EXPECT_EQ(e.message(), "Invalid request");
        EXPECT_NE(std::string(e.what()).find("'action'"), std::string::npos);
        EXPECT_EQ(std::get<std::string>(e.requestId().value), "abc");
    }

    try {
        ParseRequestEnvelope("{\"action\":\"read_file\",\"data\":[1],\"request_id\":5}");
        FAIL() << "expected InvalidEnvelope";
    } catch (const InvalidEnvelope& e) {
        EXPECT_NE(std::string(e.what()).find("'data' must be an object"), std::string::npos);
        EXPECT_EQ(std::get<int64_t>(e.requestId().value), 5);
    }
}

TEST(RequestEnvelope, RejectsNonObjectsAndBadActions) {
    EXPECT_THROW(ParseRequestEnvelope("[1,2]"), InvalidEnvelope);
    EXPECT_THROW(ParseRequestEnvelope("{\"action\":5}"), InvalidEnvelope);
    EXPECT_THROW(ParseRequestEnvelope("{\"action\":\"\"}"), InvalidEnvelope);
}

TEST(RequestEnvelope, AnyJsonRequestIdIsKeptVerbatim) {
    auto obj = ParseRequestEnvelope("{\"action\":\"x\",\"request_id\":{\"a\":1,\"b\":[true,2.5]}}");
    ASSERT_TRUE(obj.hasRequestId);
    EXPECT_EQ(GetIntMember(obj.requestId, "a"), 1);
    const JSONValue* b = FindMember(obj.requestId, "b");
    ASSERT_NE(b, nullptr);
    ASSERT_TRUE(std::holds_alternative<JSONValue::Array>(b->value));
    EXPECT_EQ(std::get<JSONValue::Array>(b->value).size(), 2u);

    auto dbl = ParseRequestEnvelope("{\"action\":\"x\",\"request_id\":1.5}");
    EXPECT_DOUBLE_EQ(std::get<double>(dbl.requestId.value), 1.5);
    auto flag = ParseRequestEnvelope("{\"action\":\"x\",\"request_id\":false}");
    EXPECT_EQ(std::get<bool>(flag.requestId.value), false);

    auto resp = ResponseEnvelope::Success("ok", JSONValue::Object{}, dbl.requestId);
    auto json = ParseJSON(resp.Serialize());
    const JSONValue* echoed = FindMember(json, "request_id");
    ASSERT_NE(echoed, nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>(echoed->value), 1.5);
}

TEST(RequestEnvelope, RequestIdKeyComparesValues) {
    EXPECT_EQ(RequestIdKey(ParseJSON("{\"a\":1,\"b\":\"x\"}")), RequestIdKey(ParseJSON("{\"b\":\"x\",\"a\":1}")));
    EXPECT_NE(RequestIdKey(JSONValue(int64_t{1})), RequestIdKey(JSONValue("1")));
    EXPECT_NE(RequestIdKey(JSONValue(int64_t{1})), RequestIdKey(JSONValue(1.0)));
    EXPECT_NE(RequestIdKey(JSONValue(true)), RequestIdKey(JSONValue("true")));
    EXPECT_NE(RequestIdKey(ParseJSON("[1,2]")), RequestIdKey(ParseJSON("[2,1]")));
}

TEST(ResponseEnvelope, SuccessShape) {
    JSONValue::Object data;
    SetMember(data, "content", JSONValue("hello"));
    auto r = ResponseEnvelope::Success("File read successfully", data, JSONValue("id-1"));
    auto json = ParseJSON(r.Serialize());
    EXPECT_EQ(GetBoolMember(json, "success"), true);
    EXPECT_EQ(GetStringMember(json, "message"), std::string("File read successfully"));
    ASSERT_NE(FindMember(json, "error"), nullptr);
    EXPECT_TRUE(FindMember(json, "error")->IsNull());
    const JSONValue* d = FindMember(json, "data");
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(GetStringMember(*d, "content"), std::string("hello"));
    EXPECT_EQ(GetStringMember(json, "request_id"), std::string("id-1"));
}

TEST(ResponseEnvelope, FailureShape) {
    auto r = ResponseEnvelope::Failure("Failed to read file", "NotFound: file not found: /w/a");
    EXPECT_FALSE(r.IsSuccess());
    EXPECT_TRUE(r.Data().empty());
    auto json = ParseJSON(r.Serialize());
    EXPECT_EQ(GetBoolMember(json, "success"), false);
    ASSERT_NE(FindMember(json, "data"), nullptr);
    EXPECT_TRUE(FindMember(json, "data")->IsNull());
    EXPECT_EQ(GetStringMember(json, "error"), std::string("NotFound: file not found: /w/a"));
    ASSERT_NE(FindMember(json, "request_id"), nullptr);
    EXPECT_TRUE(FindMember(json, "request_id")->IsNull());
}

TEST(ResponseEnvelope, EmptyErrorIsNeverEmitted) {
    auto r = ResponseEnvelope::Failure("Oops", "");
    EXPECT_FALSE(r.Error().empty());
    EXPECT_EQ(r.Error().rfind("InternalError", 0), 0u);
}

TEST(ResponseEnvelope, FromErrorUsesCategoryPrefix) {
    errors::GatewayError err(errors::ErrorCategory::NotADirectory, "not a directory: /w/f");
    auto r = ResponseEnvelope::FromError("Failed to list directory", err, JSONValue(int64_t{3}));
    EXPECT_EQ(r.Error(), "NotADirectory: not a directory: /w/f");
    EXPECT_EQ(std::get<int64_t>(r.RequestId().value), 3);
}

TEST(ResponseEnvelope, DeserializeRestoresEnvelope) {
    JSONValue::Object data;
    SetMember(data, "n", JSONValue(int64_t{2}));
    auto original = ResponseEnvelope::Success("ok", data, JSONValue("q"));
    auto back = ResponseEnvelope::Deserialize(original.Serialize());
    EXPECT_TRUE(back.IsSuccess());
    EXPECT_EQ(back.Message(), "ok");
    EXPECT_EQ(GetIntMember(JSONValue(back.Data()), "n"), 2);
    EXPECT_EQ(std::get<std::string>(back.RequestId().value), "q");
}

TEST(ResponseEnvelope, DeserializeRejectsInconsistentShapes) {
    EXPECT_THROW(ResponseEnvelope::Deserialize("[]"), std::invalid_argument);
    EXPECT_THROW(ResponseEnvelope::Deserialize("{\"message\":\"x\"}"), std::invalid_argument);
    EXPECT_THROW(ResponseEnvelope::Deserialize("{\"success\":true,\"data\":null}"), std::invalid_argument);
    EXPECT_THROW(ResponseEnvelope::Deserialize("{oops"), JSONParseError);
}
