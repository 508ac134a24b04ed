/**
 * @file fusion_engine.cpp
 * @brief 퓨전 엔진 구현
 */

#include "affect_sdk/fusion_engine.h"

#include <algorithm>
#include <cmath>

namespace affect_sdk {

namespace {

float clampUnit(float value) {
    if (!std::isfinite(value)) {
        return 0.0f;
    }
    return std::clamp(value, 0.0f, 1.0f);
}

/**
 * @brief 가중치 세 개를 합 1.0 으로 정규화
 *
 * 음수 가중치가 있거나 합이 0 이하이면 기본값으로 대체.
 */
void normalizeWeights(float& a, float& b, float& c,
                      float default_a, float default_b, float default_c) {
    const float sum = a + b + c;
    if (!std::isfinite(sum) || sum <= 0.0f || a < 0.0f || b < 0.0f || c < 0.0f) {
        a = default_a;
        b = default_b;
        c = default_c;
        return;
    }
    a /= sum;
    b /= sum;
    c /= sum;
}

} // anonymous namespace

FusionEngine::FusionEngine(const FusionConfig& config)
    : config_(config) {
    const FusionConfig defaults{};

    normalizeWeights(config_.stress_lip_press_weight,
                     config_.stress_jaw_tension_weight,
                     config_.stress_blink_rate_weight,
                     defaults.stress_lip_press_weight,
                     defaults.stress_jaw_tension_weight,
                     defaults.stress_blink_rate_weight);

    normalizeWeights(config_.anxiety_eye_widening_weight,
                     config_.anxiety_eyebrow_raise_weight,
                     config_.anxiety_lip_press_weight,
                     defaults.anxiety_eye_widening_weight,
                     defaults.anxiety_eyebrow_raise_weight,
                     defaults.anxiety_lip_press_weight);

    config_.classifier_weight = clampUnit(config_.classifier_weight);
}

FrameAnalysis FusionEngine::fuse(const std::optional<ClassifierResult>& classifier,
                                 const MicroSignalSet& signals,
                                 double timestamp) const {
    FrameAnalysis analysis;
    analysis.timestamp = timestamp;
    analysis.face_detected = true;

    Emotion base_emotion = Emotion::Neutral;
    float base_confidence = config_.fallback_confidence;
    if (classifier) {
        base_emotion = classifier->dominant_emotion;
        base_confidence = clampUnit(classifier->confidence);
        analysis.emotion_analysis.probabilities = classifier->probabilities;
    }

    const float stress = stressScore(signals);
    const float anxiety = anxietyScore(signals);
    const float engagement = engagementScore(signals);
    const Emotion adjusted = adjustEmotion(base_emotion, stress, anxiety);
    const float confidence = combinedConfidence(base_confidence, signals);

    analysis.emotion_analysis.dominant_emotion = adjusted;
    analysis.emotion_analysis.confidence = confidence;

    for (std::size_t i = 0; i < SIGNAL_TYPE_COUNT; ++i) {
        const SignalType type = static_cast<SignalType>(i);
        const MicroSignal signal = signals.value(type);
        if (signal.detected) {
            analysis.micro_expressions[type] = signal;
        }
    }

    analysis.composite_scores.stress_score = stress;
    analysis.composite_scores.anxiety_score = anxiety;
    analysis.composite_scores.engagement_score = engagement;
    analysis.composite_scores.overall_confidence = confidence;

    analysis.clinical_insights = clinicalInsights(adjusted, stress, engagement, signals);
    return analysis;
}

float FusionEngine::stressScore(const MicroSignalSet& signals) const {
    const float lip = signals.value(SignalType::LipPress).intensity;
    const float jaw = signals.value(SignalType::JawTension).intensity;
    // 깜빡임 강도는 분석기에서 AnalyzerConfig::blink_rate_normalizer 로 정규화됨
    const float blink = clampUnit(signals.value(SignalType::BlinkRate).intensity);

    return clampUnit(lip * config_.stress_lip_press_weight +
                     jaw * config_.stress_jaw_tension_weight +
                     blink * config_.stress_blink_rate_weight);
}

float FusionEngine::anxietyScore(const MicroSignalSet& signals) const {
    const float widening = signals.value(SignalType::EyeWidening).intensity;
    const float brow = signals.value(SignalType::EyebrowRaise).intensity;
    const float lip = signals.value(SignalType::LipPress).intensity;

    return clampUnit(widening * config_.anxiety_eye_widening_weight +
                     brow * config_.anxiety_eyebrow_raise_weight +
                     lip * config_.anxiety_lip_press_weight);
}

float FusionEngine::engagementScore(const MicroSignalSet& signals) const {
    float engagement = config_.engagement_baseline;
    if (signals.value(SignalType::MicroSmile).detected) {
        engagement += config_.engagement_smile_boost;
    }
    if (signals.value(SignalType::EyebrowRaise).detected) {
        engagement += config_.engagement_eyebrow_boost;
    }
    return clampUnit(engagement);
}

Emotion FusionEngine::adjustEmotion(Emotion base, float stress, float anxiety) const {
    Emotion adjusted = base;

    if (stress > config_.stress_override_threshold && adjusted == Emotion::Neutral) {
        adjusted = Emotion::Stressed;
    }

    // 두 번째 규칙은 첫 번째 규칙의 결과를 기준으로 판정
    if (anxiety > config_.anxiety_override_threshold &&
        (adjusted == Emotion::Sad || adjusted == Emotion::Neutral)) {
        adjusted = Emotion::Anxious;
    }

    return adjusted;
}

float FusionEngine::combinedConfidence(float classifier_confidence,
                                       const MicroSignalSet& signals) const {
    float sum = 0.0f;
    int count = 0;
    for (const auto& reading : signals.readings) {
        const MicroSignal signal = reading.valueOrDefault();
        if (signal.detected) {
            sum += signal.confidence;
            ++count;
        }
    }

    const float micro_confidence = count > 0 ? sum / static_cast<float>(count)
                                             : config_.neutral_micro_confidence;

    return clampUnit(config_.classifier_weight * clampUnit(classifier_confidence) +
                     (1.0f - config_.classifier_weight) * micro_confidence);
}

StressLevel FusionEngine::stressLevel(float stress) const {
    if (stress < config_.stress_moderate_threshold) {
        return StressLevel::Low;
    }
    if (stress < config_.stress_elevated_threshold) {
        return StressLevel::Moderate;
    }
    return StressLevel::Elevated;
}

ClinicalInsights FusionEngine::clinicalInsights(Emotion state,
                                                float stress,
                                                float engagement,
                                                const MicroSignalSet& signals) const {
    ClinicalInsights insights;
    insights.primary_state = state;
    insights.stress_level = stressLevel(stress);

    if (signals.value(SignalType::LipPress).detected) {
        insights.anxiety_indicators.emplace_back("lip_press");
    }
    if (signals.value(SignalType::BlinkRate).detected) {
        insights.anxiety_indicators.emplace_back("elevated_blink_rate");
    }
    if (signals.value(SignalType::JawTension).detected) {
        insights.anxiety_indicators.emplace_back("jaw_tension");
    }

    if (signals.value(SignalType::MicroSmile).detected) {
        insights.positive_indicators.emplace_back("micro_smile");
    }
    if (signals.value(SignalType::EyebrowRaise).detected) {
        insights.positive_indicators.emplace_back("eyebrow_raise_interest");
    }
    if (engagement > config_.high_engagement_threshold) {
        insights.positive_indicators.emplace_back("high_engagement");
    }

    return insights;
}

} // namespace affect_sdk
