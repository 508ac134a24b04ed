/**
 * @file test_serialization.cpp
 * @brief 분석 레코드 JSON 직렬화 테스트
 */

#include <gtest/gtest.h>

#include "affect_sdk/serialization.h"
#include "test_helpers.h"

namespace affect_sdk {
namespace testing {

using json = nlohmann::json;

// ============================================================
// 프레임 직렬화 테스트
// ============================================================

class FrameSerializationTest : public ::testing::Test {
protected:
    void SetUp() override {
        frame_.timestamp = 4.5;
        frame_.face_detected = true;
        frame_.emotion_analysis.dominant_emotion = Emotion::Stressed;
        frame_.emotion_analysis.confidence = 0.78f;
        frame_.emotion_analysis.probabilities = {
            {Emotion::Neutral, 0.6f},
            {Emotion::Sad, 0.4f}
        };

        MicroSignal jaw;
        jaw.detected = true;
        jaw.intensity = 0.8f;
        jaw.confidence = 0.75f;
        frame_.micro_expressions[SignalType::JawTension] = jaw;

        MicroSignal blink;
        blink.detected = true;
        blink.intensity = 0.9f;
        blink.confidence = 0.7f;
        blink.rate_per_minute = 45.0f;
        frame_.micro_expressions[SignalType::BlinkRate] = blink;

        frame_.composite_scores.stress_score = 0.72f;
        frame_.composite_scores.anxiety_score = 0.1f;
        frame_.composite_scores.engagement_score = 0.7f;
        frame_.composite_scores.overall_confidence = 0.78f;

        frame_.clinical_insights.primary_state = Emotion::Stressed;
        frame_.clinical_insights.stress_level = StressLevel::Elevated;
        frame_.clinical_insights.anxiety_indicators = {"elevated_blink_rate", "jaw_tension"};
    }

    FrameAnalysis frame_;
};

TEST_F(FrameSerializationTest, TopLevelFields) {
    const json j = toJson(frame_);

    EXPECT_DOUBLE_EQ(j.at("timestamp").get<double>(), 4.5);
    EXPECT_TRUE(j.at("face_detected").get<bool>());
    EXPECT_TRUE(j.contains("emotion_analysis"));
    EXPECT_TRUE(j.contains("micro_expressions"));
    EXPECT_TRUE(j.contains("composite_scores"));
    EXPECT_TRUE(j.contains("clinical_insights"));
    EXPECT_FALSE(j.contains("error"));
}

TEST_F(FrameSerializationTest, EmotionAnalysisGroup) {
    const json emotion = toJson(frame_).at("emotion_analysis");

    EXPECT_EQ(emotion.at("dominant_emotion").get<std::string>(), "stressed");
    EXPECT_NEAR(emotion.at("confidence").get<double>(), 0.78, 1e-6);

    const json& probs = emotion.at("emotion_probabilities");
    EXPECT_EQ(probs.size(), 2u);
    EXPECT_NEAR(probs.at("neutral").get<double>(), 0.6, 1e-6);
    EXPECT_NEAR(probs.at("sad").get<double>(), 0.4, 1e-6);
}

TEST_F(FrameSerializationTest, OnlyDetectedSignalsSerialized) {
    const json micro = toJson(frame_).at("micro_expressions");

    ASSERT_EQ(micro.size(), 2u);
    EXPECT_TRUE(micro.contains("jaw_tension"));
    EXPECT_TRUE(micro.contains("blink_rate"));
    EXPECT_FALSE(micro.contains("lip_press"));

    const json& jaw = micro.at("jaw_tension");
    EXPECT_TRUE(jaw.at("detected").get<bool>());
    EXPECT_NEAR(jaw.at("intensity").get<double>(), 0.8, 1e-6);
    EXPECT_FALSE(jaw.contains("rate_per_min"));

    EXPECT_NEAR(micro.at("blink_rate").at("rate_per_min").get<double>(), 45.0, 1e-6);
}

TEST_F(FrameSerializationTest, CompositeAndInsights) {
    const json j = toJson(frame_);

    const json& scores = j.at("composite_scores");
    EXPECT_NEAR(scores.at("stress_score").get<double>(), 0.72, 1e-6);
    EXPECT_NEAR(scores.at("anxiety_score").get<double>(), 0.1, 1e-6);
    EXPECT_NEAR(scores.at("engagement_score").get<double>(), 0.7, 1e-6);
    EXPECT_NEAR(scores.at("overall_confidence").get<double>(), 0.78, 1e-6);

    const json& insights = j.at("clinical_insights");
    EXPECT_EQ(insights.at("primary_state").get<std::string>(), "stressed");
    EXPECT_EQ(insights.at("stress_level").get<std::string>(), "elevated");
    EXPECT_EQ(insights.at("anxiety_indicators").size(), 2u);
    EXPECT_EQ(insights.at("anxiety_indicators")[0].get<std::string>(), "elevated_blink_rate");
    EXPECT_TRUE(insights.at("positive_indicators").empty());
}

TEST_F(FrameSerializationTest, NoFaceFrameShape) {
    FrameAnalysis no_face;
    no_face.timestamp = 2.0;

    const json j = toJson(no_face);
    EXPECT_EQ(j.size(), 3u);
    EXPECT_DOUBLE_EQ(j.at("timestamp").get<double>(), 2.0);
    EXPECT_FALSE(j.at("face_detected").get<bool>());
    EXPECT_EQ(j.at("error").get<std::string>(), "No face detected");
}

TEST_F(FrameSerializationTest, ClassifierFallbackHasEmptyProbabilities) {
    frame_.emotion_analysis.probabilities.clear();
    const json probs = toJson(frame_).at("emotion_analysis").at("emotion_probabilities");
    EXPECT_TRUE(probs.is_object());
    EXPECT_TRUE(probs.empty());
}

TEST_F(FrameSerializationTest, StringIsParseable) {
    const std::string compact = toJsonString(frame_);
    EXPECT_EQ(compact.find('\n'), std::string::npos);

    const json parsed = json::parse(compact);
    EXPECT_EQ(parsed.at("emotion_analysis").at("dominant_emotion").get<std::string>(), "stressed");

    const std::string pretty = toJsonString(frame_, 2);
    EXPECT_NE(pretty.find('\n'), std::string::npos);
}

// ============================================================
// 미세 신호 직렬화 테스트
// ============================================================

class SignalSerializationTest : public ::testing::Test {};

TEST_F(SignalSerializationTest, SmileCarriesType) {
    MicroSignal smile;
    smile.detected = true;
    smile.intensity = 0.4f;
    smile.confidence = 0.82f;
    smile.smile_type = SmileType::Social;

    const json j = toJson(SignalType::MicroSmile, smile);
    EXPECT_EQ(j.at("type").get<std::string>(), "social");
    EXPECT_FALSE(j.contains("rate_per_min"));
}

TEST_F(SignalSerializationTest, PlainSignalHasThreeFields) {
    MicroSignal brow;
    brow.detected = true;
    brow.intensity = 0.5f;
    brow.confidence = 0.75f;

    const json j = toJson(SignalType::EyebrowRaise, brow);
    EXPECT_EQ(j.size(), 3u);
    EXPECT_NEAR(j.at("confidence").get<double>(), 0.75, 1e-6);
}

// ============================================================
// 요약 / 상태 직렬화 테스트
// ============================================================

class SummarySerializationTest : public ::testing::Test {};

TEST_F(SummarySerializationTest, SummaryFields) {
    SessionSummary summary;
    summary.session_id = "S1";
    summary.started_at = "2026-01-31T09:15:02Z";
    summary.duration_seconds = 12.5;
    summary.total_frames_analyzed = 80;
    summary.frames_received = 88;
    summary.emotion_distribution = {{Emotion::Neutral, 0.75f}, {Emotion::Stressed, 0.25f}};
    summary.avg_stress_score = 0.3f;
    summary.avg_anxiety_score = 0.2f;
    summary.avg_engagement_score = 0.7f;
    summary.predominant_emotion = Emotion::Neutral;

    const json j = toJson(summary);
    EXPECT_EQ(j.at("session_id").get<std::string>(), "S1");
    EXPECT_EQ(j.at("started_at").get<std::string>(), "2026-01-31T09:15:02Z");
    EXPECT_DOUBLE_EQ(j.at("duration_seconds").get<double>(), 12.5);
    EXPECT_EQ(j.at("total_frames_analyzed").get<std::size_t>(), 80u);
    EXPECT_EQ(j.at("frames_received").get<std::size_t>(), 88u);
    EXPECT_NEAR(j.at("emotion_distribution").at("stressed").get<double>(), 0.25, 1e-6);
    EXPECT_NEAR(j.at("avg_stress_score").get<double>(), 0.3, 1e-6);
    EXPECT_NEAR(j.at("avg_anxiety_score").get<double>(), 0.2, 1e-6);
    EXPECT_NEAR(j.at("avg_engagement_score").get<double>(), 0.7, 1e-6);
    EXPECT_EQ(j.at("predominant_emotion").get<std::string>(), "neutral");

    EXPECT_EQ(json::parse(toJsonString(summary, 2)), j);
}

TEST_F(SummarySerializationTest, StatusFields) {
    PipelineStatus status;
    status.available = true;
    status.custom_backends = true;
    status.active_sessions = 2;
    status.stored_sessions = 3;
    status.target_fps = 7.0f;

    const json j = toJson(status);
    EXPECT_TRUE(j.at("available").get<bool>());
    EXPECT_TRUE(j.at("custom_backends").get<bool>());
    EXPECT_FALSE(j.at("models_present").get<bool>());
    EXPECT_EQ(j.at("active_sessions").get<std::size_t>(), 2u);
    EXPECT_EQ(j.at("stored_sessions").get<std::size_t>(), 3u);
    EXPECT_NEAR(j.at("target_fps").get<double>(), 7.0, 1e-6);
    EXPECT_TRUE(j.contains("opencv_enabled"));
    EXPECT_TRUE(j.contains("tflite_enabled"));
}

} // namespace testing
} // namespace affect_sdk
