/**
 * @file test_volume_gate.cpp
 * @brief Unit tests for VolumeGate and CommandVolumeSink
 *
 * Tests cover:
 * - Payload interpretation and key precedence
 * - Raw ADC rescaling
 * - Threshold gating
 * - Sink failures
 * - Command templating
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <airvol/core/volume_gate.hpp>
#include <airvol/core/event_history.hpp>

#include <cmath>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using namespace airvol::core;
using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

class MockVolumeSink : public VolumeSink {
public:
    MOCK_METHOD(bool, apply, (int percent, std::string& error), (override));
};

class VolumeGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<NiceMock<MockVolumeSink>>();
        ON_CALL(*sink_, apply(_, _)).WillByDefault(Return(true));
        history_ = std::make_shared<EventHistory>();
        gate_ = std::make_unique<VolumeGate>(sink_, 0.5, history_);
    }

    std::shared_ptr<NiceMock<MockVolumeSink>> sink_;
    std::shared_ptr<EventHistory> history_;
    std::unique_ptr<VolumeGate> gate_;
};

// =============================================================================
// interpret
// =============================================================================

TEST_F(VolumeGateTest, PercentStringIsRounded) {
    auto sample = VolumeGate::interpret(R"({"percent":"37.6"})");
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->percent, 38);
    EXPECT_DOUBLE_EQ(sample->exact, 37.6);
    EXPECT_EQ(sample->source_key, "percent");
}

TEST_F(VolumeGateTest, AliasesInPrecedenceOrder) {
    EXPECT_EQ(VolumeGate::interpret(R"({"pct":12})")->percent, 12);
    EXPECT_EQ(VolumeGate::interpret(R"({"volume_percent":"64"})")->percent, 64);

    auto sample = VolumeGate::interpret(R"({"raw":4095,"volume_percent":10,"pct":20,"percent":30})");
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->percent, 30);
    EXPECT_EQ(sample->source_key, "percent");

    sample = VolumeGate::interpret(R"({"raw":4095,"volume_percent":10})");
    EXPECT_EQ(sample->source_key, "volume_percent");
}

TEST_F(VolumeGateTest, UnusableKeyFallsThrough) {
    auto sample = VolumeGate::interpret(R"({"percent":"loud","pct":44})");
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->percent, 44);
    EXPECT_EQ(sample->source_key, "pct");
}

TEST_F(VolumeGateTest, RawIsRescaled) {
    EXPECT_EQ(VolumeGate::interpret(R"({"raw":2048})")->percent, 50);
    EXPECT_EQ(VolumeGate::interpret(R"({"raw":0})")->percent, 0);
    EXPECT_EQ(VolumeGate::interpret(R"({"raw":4095})")->percent, 100);
    EXPECT_EQ(VolumeGate::interpret(R"({"raw":"1024"})")->percent, 25);
}

TEST_F(VolumeGateTest, RawMatchesRoundedFormula) {
    for (int raw = 0; raw <= 4095; raw += 13) {
        auto sample = VolumeGate::interpret("{\"raw\":" + std::to_string(raw) + "}");
        ASSERT_TRUE(sample.has_value()) << raw;
        EXPECT_EQ(sample->percent, static_cast<int>(std::lround(raw * 100.0 / 4095.0))) << raw;
    }
}

TEST_F(VolumeGateTest, OutOfRangeIsClamped) {
    EXPECT_EQ(VolumeGate::interpret(R"({"percent":140})")->percent, 100);
    EXPECT_EQ(VolumeGate::interpret(R"({"percent":-3})")->percent, 0);
    EXPECT_EQ(VolumeGate::interpret(R"({"raw":9000})")->percent, 100);
}

TEST_F(VolumeGateTest, NothingUsable) {
    EXPECT_FALSE(VolumeGate::interpret(R"({"hb":1})").has_value());
    EXPECT_FALSE(VolumeGate::interpret(R"({"percent":null})").has_value());
    EXPECT_FALSE(VolumeGate::interpret(R"({"percent":true})").has_value());
    EXPECT_FALSE(VolumeGate::interpret("not json").has_value());
    EXPECT_FALSE(VolumeGate::interpret("42").has_value());
    EXPECT_FALSE(VolumeGate::interpret("").has_value());
}

// =============================================================================
// gate
// =============================================================================

TEST_F(VolumeGateTest, FirstValueAlwaysApplied) {
    EXPECT_CALL(*sink_, apply(38, _)).WillOnce(Return(true));

    EXPECT_EQ(gate_->process(R"({"percent":"37.6"})"), GateResult::CHANGED);
    EXPECT_EQ(gate_->lastApplied(), 38);
}

TEST_F(VolumeGateTest, SameValueIsGated) {
    EXPECT_CALL(*sink_, apply(50, _)).Times(1).WillOnce(Return(true));

    EXPECT_EQ(gate_->gate(50), GateResult::CHANGED);
    EXPECT_EQ(gate_->gate(50), GateResult::UNCHANGED);
}

TEST_F(VolumeGateTest, OnePointClearsDefaultThreshold) {
    EXPECT_CALL(*sink_, apply(_, _)).Times(2).WillRepeatedly(Return(true));

    gate_->gate(50);
    EXPECT_EQ(gate_->gate(51), GateResult::CHANGED);
}

TEST_F(VolumeGateTest, WiderThreshold) {
    gate_->gate(50);

    EXPECT_EQ(gate_->gate(52, 3.0), GateResult::UNCHANGED);
    EXPECT_EQ(gate_->gate(47, 3.0), GateResult::CHANGED);
    EXPECT_EQ(gate_->lastApplied(), 47);
}

TEST_F(VolumeGateTest, SinkSeesOnlyValuesClearingThreshold) {
    std::vector<int> applied;
    ON_CALL(*sink_, apply(_, _)).WillByDefault([&applied](int percent, std::string&) {
        applied.push_back(percent);
        return true;
    });

    for (int v : {10, 11, 11, 13, 12, 20}) {
        gate_->gate(v, 1.5);
    }

    ASSERT_EQ(applied.size(), 3u);
    EXPECT_EQ(applied[0], 10);
    EXPECT_EQ(applied[1], 13);
    EXPECT_EQ(applied[2], 20);
    for (size_t i = 1; i < applied.size(); ++i) {
        EXPECT_GE(std::abs(applied[i] - applied[i - 1]), 1.5);
    }
}

TEST_F(VolumeGateTest, SinkFailureStillRecordsValue) {
    EXPECT_CALL(*sink_, apply(70, _))
        .WillOnce(DoAll(SetArgReferee<1>(std::string("mixer busy")), Return(false)));

    EXPECT_EQ(gate_->gate(70), GateResult::CHANGED);
    EXPECT_EQ(gate_->lastApplied(), 70);
    EXPECT_EQ(gate_->gate(70), GateResult::UNCHANGED);

    auto entries = history_->entries();
    ASSERT_FALSE(entries.empty());
    EXPECT_NE(entries.back().message.find("mixer busy"), std::string::npos);
}

TEST_F(VolumeGateTest, SuccessIsReported) {
    gate_->gate(42);
    auto entries = history_->entries();
    ASSERT_FALSE(entries.empty());
    EXPECT_NE(entries.back().message.find("Volume 42%"), std::string::npos);
}

TEST_F(VolumeGateTest, ProcessIgnoresFramesWithoutVolume) {
    EXPECT_CALL(*sink_, apply(_, _)).Times(0);
    EXPECT_FALSE(gate_->process(R"({"hb":1})").has_value());
    EXPECT_FALSE(gate_->lastApplied().has_value());
}

// =============================================================================
// CommandVolumeSink
// =============================================================================

TEST_F(VolumeGateTest, CommandTemplate) {
    CommandVolumeSink sink;
    EXPECT_EQ(sink.commandFor(38), "amixer -q sset Master 38%");

    CommandVolumeSink custom("setvol {} && echo {}");
    EXPECT_EQ(custom.commandFor(5), "setvol 5 && echo 5");
}

TEST_F(VolumeGateTest, EmptyCommandIsDryRun) {
    CommandVolumeSink sink("");
    std::string error;
    EXPECT_TRUE(sink.apply(50, error));
    EXPECT_TRUE(error.empty());
}

TEST_F(VolumeGateTest, CommandExitStatus) {
    std::string error;
    EXPECT_TRUE(CommandVolumeSink("true {}").apply(10, error));

    EXPECT_FALSE(CommandVolumeSink("false {}").apply(10, error));
    EXPECT_NE(error.find("exited with status"), std::string::npos);
}
