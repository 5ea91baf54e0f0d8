/**
 * @file test_json_codec.cpp
 * @brief Unit tests for the JSON helpers
 */

#include <gtest/gtest.h>
#include <airvol/core/json_codec.hpp>

#include "airvol/proto/wire.pb.h"

#include <locale>
#include <string>

using namespace airvol::core;

class JsonCodecTest : public ::testing::Test {
protected:
    google::protobuf::Struct parse(const std::string& text) {
        google::protobuf::Struct doc;
        EXPECT_TRUE(json::parseObject(text, doc)) << text;
        return doc;
    }
};

// =============================================================================
// Parsing
// =============================================================================

TEST_F(JsonCodecTest, ParsesObject) {
    auto doc = parse(R"({"service":"airvol","ws_port":81})");
    EXPECT_EQ(doc.fields_size(), 2);
}

TEST_F(JsonCodecTest, RejectsInvalidJson) {
    google::protobuf::Struct doc;
    std::string error;
    EXPECT_FALSE(json::parseObject("{not json", doc, &error));
    EXPECT_FALSE(error.empty());
}

TEST_F(JsonCodecTest, RejectsNonObject) {
    google::protobuf::Struct doc;
    EXPECT_FALSE(json::parseObject("[1,2,3]", doc));
    EXPECT_FALSE(json::parseObject("42", doc));
    EXPECT_FALSE(json::parseObject("", doc));
}

TEST_F(JsonCodecTest, IgnoresUnknownFields) {
    auto doc = parse(R"({"percent":10,"extra":{"nested":[1,2]}})");
    EXPECT_NE(json::firstField(doc, {"percent"}), nullptr);
}

// =============================================================================
// Field access
// =============================================================================

TEST_F(JsonCodecTest, FirstFieldHonorsOrder) {
    auto doc = parse(R"({"port":80,"wsPort":81})");
    const auto* field = json::firstField(doc, {"ws_port", "wsPort", "port"});
    ASSERT_NE(field, nullptr);
    EXPECT_EQ(json::asNumber(*field), 81.0);
}

TEST_F(JsonCodecTest, FirstFieldTreatsNullAsAbsent) {
    auto doc = parse(R"({"ws_port":null,"port":82})");
    const auto* field = json::firstField(doc, {"ws_port", "port"});
    ASSERT_NE(field, nullptr);
    EXPECT_EQ(json::asNumber(*field), 82.0);
}

TEST_F(JsonCodecTest, FirstFieldMissing) {
    auto doc = parse(R"({"a":1})");
    EXPECT_EQ(json::firstField(doc, {"b", "c"}), nullptr);
}

TEST_F(JsonCodecTest, AsNumberAcceptsNumbersAndNumericStrings) {
    auto doc = parse(R"({"a":37.6,"b":"37.6","c":" 12 ","d":"12abc","e":"","f":true})");
    EXPECT_EQ(json::asNumber(doc.fields().at("a")), 37.6);
    EXPECT_EQ(json::asNumber(doc.fields().at("b")), 37.6);
    EXPECT_EQ(json::asNumber(doc.fields().at("c")), 12.0);
    EXPECT_FALSE(json::asNumber(doc.fields().at("d")).has_value());
    EXPECT_FALSE(json::asNumber(doc.fields().at("e")).has_value());
    EXPECT_FALSE(json::asNumber(doc.fields().at("f")).has_value());
}

TEST_F(JsonCodecTest, AsNumberRejectsHexAndNonFinite) {
    auto doc = parse(R"({"a":"0x51","b":"0X51","c":"-0x1p3","d":"inf","e":"nan","f":"1e400"})");
    for (const char* key : {"a", "b", "c", "d", "e", "f"}) {
        EXPECT_FALSE(json::asNumber(doc.fields().at(key)).has_value()) << key;
    }
}

TEST_F(JsonCodecTest, AsNumberAcceptsSignsAndExponents) {
    auto doc = parse(R"({"a":"+40","b":"-2.5","c":"1e2","d":"0.5","e":"081"})");
    EXPECT_EQ(json::asNumber(doc.fields().at("a")), 40.0);
    EXPECT_EQ(json::asNumber(doc.fields().at("b")), -2.5);
    EXPECT_EQ(json::asNumber(doc.fields().at("c")), 100.0);
    EXPECT_EQ(json::asNumber(doc.fields().at("d")), 0.5);
    EXPECT_EQ(json::asNumber(doc.fields().at("e")), 81.0);
}

namespace {

struct CommaDecimal : std::numpunct<char> {
    char do_decimal_point() const override { return ','; }
};

}  // namespace

TEST_F(JsonCodecTest, AsNumberIgnoresGlobalLocale) {
    auto doc = parse(R"({"a":"37.6","b":"37,6"})");

    std::locale previous = std::locale::global(
        std::locale(std::locale::classic(), new CommaDecimal));
    auto dotted = json::asNumber(doc.fields().at("a"));
    auto comma = json::asNumber(doc.fields().at("b"));
    std::locale::global(previous);

    EXPECT_EQ(dotted, 37.6);
    EXPECT_FALSE(comma.has_value());
}

TEST_F(JsonCodecTest, AsStringOnlyForStrings) {
    auto doc = parse(R"({"a":"Studio","b":5})");
    EXPECT_EQ(json::asString(doc.fields().at("a")), std::string("Studio"));
    EXPECT_FALSE(json::asString(doc.fields().at("b")).has_value());
}

// =============================================================================
// Rendering
// =============================================================================

TEST_F(JsonCodecTest, RendersDiscoveryProbe) {
    airvol::wire::DiscoveryProbe probe;
    probe.set_type("discover");
    probe.set_service("airvol");

    std::string out;
    ASSERT_TRUE(json::render(probe, out));
    EXPECT_EQ(out, R"({"type":"discover","service":"airvol"})");
}

TEST_F(JsonCodecTest, RendersHeartbeat) {
    airvol::wire::Heartbeat heartbeat;
    heartbeat.set_hb(1);

    std::string out;
    ASSERT_TRUE(json::render(heartbeat, out));
    EXPECT_EQ(out, R"({"hb":1})");
}

TEST_F(JsonCodecTest, DescribeIsCompact) {
    auto doc = parse(R"({ "hb" : 1 })");
    EXPECT_EQ(json::describe(doc), R"({"hb":1})");
}
