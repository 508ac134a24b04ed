/**
 * @file test_fusion_engine.cpp
 * @brief FusionEngine 복합 점수, 감정 보정, 임상 참고 정보 테스트
 */

#include <gtest/gtest.h>
#include <algorithm>
#include "affect_sdk/fusion_engine.h"
#include "test_helpers.h"

namespace affect_sdk {
namespace testing {

namespace {

/// 모든 신호가 계산되었으나 검출되지 않은 묶음
MicroSignalSet makeQuietSignals() {
    MicroSignalSet signals;
    for (auto& reading : signals.readings) {
        MicroSignal signal;
        signal.confidence = 0.8f;
        reading = SignalReading::fromSignal(signal);
    }
    return signals;
}

void setSignal(MicroSignalSet& signals, SignalType type, bool detected,
               float intensity, float confidence, float rate_per_minute = 0.0f) {
    MicroSignal signal;
    signal.detected = detected;
    signal.intensity = intensity;
    signal.confidence = confidence;
    signal.rate_per_minute = rate_per_minute;
    if (type == SignalType::MicroSmile && detected) {
        signal.smile_type = SmileType::Social;
    }
    signals[type] = SignalReading::fromSignal(signal);
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // anonymous namespace

class FusionEngineTest : public ::testing::Test {
protected:
    FusionEngine engine_;
    MicroSignalSet signals_ = makeQuietSignals();
};

// ------------------------------------------------------------
// 복합 점수
// ------------------------------------------------------------

TEST_F(FusionEngineTest, StressFormula) {
    setSignal(signals_, SignalType::LipPress, true, 0.5f, 0.8f);
    setSignal(signals_, SignalType::JawTension, true, 0.5f, 0.75f);
    setSignal(signals_, SignalType::BlinkRate, false, 0.5f, 0.7f, 25.0f);

    // 0.3 * 0.5 + 0.3 * 0.5 + 0.4 * (25 / 50)
    EXPECT_NEAR(engine_.stressScore(signals_), 0.5f, 1e-5f);
}

TEST_F(FusionEngineTest, BlinkContributionSaturates) {
    setSignal(signals_, SignalType::BlinkRate, true, 1.0f, 0.7f, 210.0f);
    EXPECT_NEAR(engine_.stressScore(signals_), 0.4f, 1e-5f);
}

TEST_F(FusionEngineTest, BlinkTermFollowsSignalIntensity) {
    // 정규화는 분석기 몫: 원시 분당 횟수가 커도 강도만 반영
    setSignal(signals_, SignalType::BlinkRate, false, 0.25f, 0.7f, 200.0f);
    EXPECT_NEAR(engine_.stressScore(signals_), 0.1f, 1e-5f);
}

TEST_F(FusionEngineTest, AnxietyFormula) {
    setSignal(signals_, SignalType::EyeWidening, false, 0.5f, 0.88f);
    EXPECT_NEAR(engine_.anxietyScore(signals_), 0.2f, 1e-5f);

    setSignal(signals_, SignalType::EyeWidening, true, 1.0f, 0.88f);
    setSignal(signals_, SignalType::EyebrowRaise, true, 1.0f, 0.85f);
    setSignal(signals_, SignalType::LipPress, true, 1.0f, 0.8f);
    EXPECT_NEAR(engine_.anxietyScore(signals_), 1.0f, 1e-5f);
}

TEST_F(FusionEngineTest, UnavailableSignalsContributeZero) {
    SignalReading broken = SignalReading::unavailable();
    broken.signal.detected = true;
    broken.signal.intensity = 1.0f;
    broken.signal.rate_per_minute = 300.0f;
    for (auto& reading : signals_.readings) {
        reading = broken;
    }

    EXPECT_FLOAT_EQ(engine_.stressScore(signals_), 0.0f);
    EXPECT_FLOAT_EQ(engine_.anxietyScore(signals_), 0.0f);
    EXPECT_FLOAT_EQ(engine_.engagementScore(signals_), 0.7f);
}

TEST_F(FusionEngineTest, ScoresClampedToUnitRange) {
    // 범위를 벗어난 입력에도 [0, 1] 유지
    setSignal(signals_, SignalType::LipPress, true, 5.0f, 0.8f);
    setSignal(signals_, SignalType::JawTension, true, 5.0f, 0.75f);
    setSignal(signals_, SignalType::EyeWidening, true, 5.0f, 0.88f);
    EXPECT_LE(engine_.stressScore(signals_), 1.0f);
    EXPECT_LE(engine_.anxietyScore(signals_), 1.0f);

    setSignal(signals_, SignalType::LipPress, true, -5.0f, 0.8f);
    setSignal(signals_, SignalType::JawTension, true, -5.0f, 0.75f);
    setSignal(signals_, SignalType::EyeWidening, true, -5.0f, 0.88f);
    EXPECT_GE(engine_.stressScore(signals_), 0.0f);
    EXPECT_GE(engine_.anxietyScore(signals_), 0.0f);
}

TEST_F(FusionEngineTest, EngagementBoosts) {
    EXPECT_FLOAT_EQ(engine_.engagementScore(signals_), 0.7f);

    setSignal(signals_, SignalType::MicroSmile, true, 0.4f, 0.82f);
    EXPECT_NEAR(engine_.engagementScore(signals_), 0.85f, 1e-5f);

    setSignal(signals_, SignalType::EyebrowRaise, true, 1.0f, 0.85f);
    EXPECT_NEAR(engine_.engagementScore(signals_), 1.0f, 1e-5f);
}

TEST_F(FusionEngineTest, EngagementNeverExceedsOne) {
    FusionConfig config;
    config.engagement_baseline = 0.9f;
    FusionEngine engine(config);

    setSignal(signals_, SignalType::MicroSmile, true, 1.0f, 0.82f);
    setSignal(signals_, SignalType::EyebrowRaise, true, 1.0f, 0.85f);
    EXPECT_FLOAT_EQ(engine.engagementScore(signals_), 1.0f);
}

// ------------------------------------------------------------
// 감정 보정 규칙
// ------------------------------------------------------------

TEST_F(FusionEngineTest, NeutralWithHighStressBecomesStressed) {
    EXPECT_EQ(engine_.adjustEmotion(Emotion::Neutral, 0.75f, 0.1f), Emotion::Stressed);
}

TEST_F(FusionEngineTest, NeutralOrSadWithHighAnxietyBecomesAnxious) {
    EXPECT_EQ(engine_.adjustEmotion(Emotion::Neutral, 0.1f, 0.75f), Emotion::Anxious);
    EXPECT_EQ(engine_.adjustEmotion(Emotion::Sad, 0.1f, 0.75f), Emotion::Anxious);
}

TEST_F(FusionEngineTest, StressRuleAppliesFirst) {
    // neutral -> stressed 이후에는 불안 규칙 대상이 아님
    EXPECT_EQ(engine_.adjustEmotion(Emotion::Neutral, 0.9f, 0.9f), Emotion::Stressed);
    // sad 는 스트레스 규칙 대상이 아니므로 불안 규칙 적용
    EXPECT_EQ(engine_.adjustEmotion(Emotion::Sad, 0.9f, 0.9f), Emotion::Anxious);
}

TEST_F(FusionEngineTest, ThresholdsAreStrict) {
    EXPECT_EQ(engine_.adjustEmotion(Emotion::Neutral, 0.7f, 0.7f), Emotion::Neutral);
}

TEST_F(FusionEngineTest, OtherEmotionsAreTrusted) {
    EXPECT_EQ(engine_.adjustEmotion(Emotion::Happy, 0.95f, 0.95f), Emotion::Happy);
    EXPECT_EQ(engine_.adjustEmotion(Emotion::Angry, 0.95f, 0.95f), Emotion::Angry);
    EXPECT_EQ(engine_.adjustEmotion(Emotion::Fear, 0.95f, 0.95f), Emotion::Fear);
}

TEST_F(FusionEngineTest, ConfigurableOverrideThreshold) {
    FusionConfig config;
    config.stress_override_threshold = 0.5f;
    FusionEngine engine(config);
    EXPECT_EQ(engine.adjustEmotion(Emotion::Neutral, 0.6f, 0.0f), Emotion::Stressed);
}

// ------------------------------------------------------------
// 결합 신뢰도
// ------------------------------------------------------------

TEST_F(FusionEngineTest, CombinedConfidenceWithoutDetectedSignals) {
    // 0.6 * 0.9 + 0.4 * 0.5
    EXPECT_NEAR(engine_.combinedConfidence(0.9f, signals_), 0.74f, 1e-5f);
}

TEST_F(FusionEngineTest, CombinedConfidenceAveragesDetectedSignals) {
    setSignal(signals_, SignalType::LipPress, true, 0.3f, 0.8f);
    setSignal(signals_, SignalType::JawTension, true, 0.6f, 0.7f);

    // 0.6 * 0.9 + 0.4 * 0.75
    EXPECT_NEAR(engine_.combinedConfidence(0.9f, signals_), 0.84f, 1e-5f);
}

// ------------------------------------------------------------
// 프레임 퓨전
// ------------------------------------------------------------

TEST_F(FusionEngineTest, FuseWithClassifier) {
    setSignal(signals_, SignalType::JawTension, true, 0.8f, 0.75f);
    const ClassifierResult classified = makeClassifierOutput(Emotion::Happy, 0.8f);

    const FrameAnalysis analysis = engine_.fuse(classified, signals_, 3.5);

    EXPECT_TRUE(analysis.face_detected);
    EXPECT_DOUBLE_EQ(analysis.timestamp, 3.5);
    EXPECT_EQ(analysis.emotion_analysis.dominant_emotion, Emotion::Happy);
    EXPECT_EQ(analysis.emotion_analysis.probabilities.size(), EMOTION_CLASS_COUNT);
    EXPECT_NEAR(analysis.emotion_analysis.confidence, 0.6f * 0.8f + 0.4f * 0.75f, 1e-5f);
    EXPECT_FLOAT_EQ(analysis.composite_scores.overall_confidence,
                    analysis.emotion_analysis.confidence);
    EXPECT_NEAR(analysis.composite_scores.stress_score, 0.24f, 1e-5f);

    // 검출된 신호만 포함
    ASSERT_EQ(analysis.micro_expressions.size(), 1u);
    EXPECT_EQ(analysis.micro_expressions.count(SignalType::JawTension), 1u);
}

TEST_F(FusionEngineTest, FuseWithoutClassifierFallsBackToNeutral) {
    const FrameAnalysis analysis = engine_.fuse(std::nullopt, signals_, 0.0);

    EXPECT_EQ(analysis.emotion_analysis.dominant_emotion, Emotion::Neutral);
    EXPECT_TRUE(analysis.emotion_analysis.probabilities.empty());
    // 0.6 * 0.5 + 0.4 * 0.5
    EXPECT_NEAR(analysis.emotion_analysis.confidence, 0.5f, 1e-5f);
    EXPECT_TRUE(analysis.micro_expressions.empty());
}

TEST_F(FusionEngineTest, FuseAppliesAnxiousOverride) {
    setSignal(signals_, SignalType::EyeWidening, true, 1.0f, 0.88f);
    setSignal(signals_, SignalType::EyebrowRaise, true, 1.0f, 0.85f);
    setSignal(signals_, SignalType::LipPress, true, 0.5f, 0.8f);

    const FrameAnalysis analysis =
        engine_.fuse(makeClassifierOutput(Emotion::Sad, 0.6f), signals_, 1.0);

    EXPECT_NEAR(analysis.composite_scores.anxiety_score, 0.85f, 1e-5f);
    EXPECT_EQ(analysis.emotion_analysis.dominant_emotion, Emotion::Anxious);
    EXPECT_EQ(analysis.clinical_insights.primary_state, Emotion::Anxious);
}

TEST_F(FusionEngineTest, FuseIsDeterministic) {
    setSignal(signals_, SignalType::LipPress, true, 1.0f, 0.8f);
    setSignal(signals_, SignalType::JawTension, true, 1.0f, 0.75f);
    setSignal(signals_, SignalType::BlinkRate, true, 1.0f, 0.7f, 60.0f);
    const ClassifierResult classified = makeClassifierOutput(Emotion::Neutral, 0.7f);

    const FrameAnalysis first = engine_.fuse(classified, signals_, 2.0);
    const FrameAnalysis second = engine_.fuse(classified, signals_, 2.0);

    EXPECT_EQ(first.emotion_analysis.dominant_emotion, Emotion::Stressed);
    EXPECT_EQ(first.emotion_analysis.dominant_emotion, second.emotion_analysis.dominant_emotion);
    EXPECT_FLOAT_EQ(first.composite_scores.stress_score, second.composite_scores.stress_score);
    EXPECT_FLOAT_EQ(first.emotion_analysis.confidence, second.emotion_analysis.confidence);
}

// ------------------------------------------------------------
// 임상 참고 정보
// ------------------------------------------------------------

TEST_F(FusionEngineTest, StressLevelBands) {
    EXPECT_EQ(engine_.stressLevel(0.0f), StressLevel::Low);
    EXPECT_EQ(engine_.stressLevel(0.29f), StressLevel::Low);
    EXPECT_EQ(engine_.stressLevel(0.3f), StressLevel::Moderate);
    EXPECT_EQ(engine_.stressLevel(0.69f), StressLevel::Moderate);
    EXPECT_EQ(engine_.stressLevel(0.7f), StressLevel::Elevated);
    EXPECT_EQ(engine_.stressLevel(1.0f), StressLevel::Elevated);
}

TEST_F(FusionEngineTest, AnxietyIndicators) {
    setSignal(signals_, SignalType::LipPress, true, 0.5f, 0.8f);
    setSignal(signals_, SignalType::BlinkRate, true, 0.8f, 0.7f, 40.0f);
    setSignal(signals_, SignalType::JawTension, true, 0.5f, 0.75f);

    const ClinicalInsights insights =
        engine_.clinicalInsights(Emotion::Neutral, 0.5f, 0.7f, signals_);

    EXPECT_EQ(insights.stress_level, StressLevel::Moderate);
    ASSERT_EQ(insights.anxiety_indicators.size(), 3u);
    EXPECT_EQ(insights.anxiety_indicators[0], "lip_press");
    EXPECT_EQ(insights.anxiety_indicators[1], "elevated_blink_rate");
    EXPECT_EQ(insights.anxiety_indicators[2], "jaw_tension");
    EXPECT_TRUE(insights.positive_indicators.empty());
}

TEST_F(FusionEngineTest, PositiveIndicators) {
    setSignal(signals_, SignalType::MicroSmile, true, 0.4f, 0.82f);
    setSignal(signals_, SignalType::EyebrowRaise, true, 0.5f, 0.85f);

    const ClinicalInsights insights =
        engine_.clinicalInsights(Emotion::Happy, 0.0f, engine_.engagementScore(signals_), signals_);

    EXPECT_TRUE(contains(insights.positive_indicators, "micro_smile"));
    EXPECT_TRUE(contains(insights.positive_indicators, "eyebrow_raise_interest"));
    EXPECT_TRUE(contains(insights.positive_indicators, "high_engagement"));
    EXPECT_TRUE(insights.anxiety_indicators.empty());
    EXPECT_EQ(insights.primary_state, Emotion::Happy);
}

TEST_F(FusionEngineTest, BaselineEngagementIsNotHigh) {
    const ClinicalInsights insights =
        engine_.clinicalInsights(Emotion::Neutral, 0.0f, 0.7f, signals_);
    EXPECT_FALSE(contains(insights.positive_indicators, "high_engagement"));
    EXPECT_EQ(insights.stress_level, StressLevel::Low);
}

// ------------------------------------------------------------
// 설정 정규화
// ------------------------------------------------------------

TEST_F(FusionEngineTest, WeightsAreNormalized) {
    FusionConfig config;
    config.stress_lip_press_weight = 3.0f;
    config.stress_jaw_tension_weight = 3.0f;
    config.stress_blink_rate_weight = 4.0f;
    FusionEngine engine(config);

    EXPECT_NEAR(engine.config().stress_lip_press_weight, 0.3f, 1e-6f);
    EXPECT_NEAR(engine.config().stress_blink_rate_weight, 0.4f, 1e-6f);
}

TEST_F(FusionEngineTest, InvalidWeightsFallBackToDefaults) {
    FusionConfig config;
    config.anxiety_eye_widening_weight = -1.0f;
    config.stress_lip_press_weight = 0.0f;
    config.stress_jaw_tension_weight = 0.0f;
    config.stress_blink_rate_weight = 0.0f;
    FusionEngine engine(config);

    EXPECT_FLOAT_EQ(engine.config().anxiety_eye_widening_weight, 0.4f);
    EXPECT_FLOAT_EQ(engine.config().stress_lip_press_weight, 0.3f);
    EXPECT_FLOAT_EQ(engine.config().stress_blink_rate_weight, 0.4f);
}

} // namespace testing
} // namespace affect_sdk
