/**
 * @file emotion_classifier.cpp
 * @brief 분류기 출력 정규화 및 팩토리 구현
 */

#include "affect_sdk/emotion_classifier.h"
#include "affect_sdk/tflite_emotion_classifier.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace affect_sdk {

namespace {

using EmotionArray = std::array<float, EMOTION_CLASS_COUNT>;

EmotionArray uniformDistribution() {
    EmotionArray probs{};
    probs.fill(1.0f / static_cast<float>(EMOTION_CLASS_COUNT));
    return probs;
}

/**
 * @brief 모델 출력이 이미 확률 분포인지 판정
 * 모든 값이 [0,1] 범위이고 합이 1 근처
 */
bool looksLikeProbabilities(const EmotionArray& values) {
    float sum = 0.0f;
    for (const float value : values) {
        if (value < -0.001f || value > 1.001f) {
            return false;
        }
        sum += value;
    }
    return sum > 0.85f && sum < 1.15f;
}

} // anonymous namespace

EmotionArray normalizeEmotionOutput(const EmotionArray& model_output) {
    for (const float value : model_output) {
        if (!std::isfinite(value)) {
            return uniformDistribution();
        }
    }

    EmotionArray probs{};

    if (looksLikeProbabilities(model_output)) {
        float sum = 0.0f;
        for (std::size_t i = 0; i < EMOTION_CLASS_COUNT; ++i) {
            probs[i] = std::clamp(model_output[i], 0.0f, 1.0f);
            sum += probs[i];
        }

        if (sum > std::numeric_limits<float>::epsilon()) {
            for (float& value : probs) {
                value /= sum;
            }
            return probs;
        }
    }

    // softmax (최대값 차감으로 overflow 방지)
    const float max_logit = *std::max_element(model_output.begin(), model_output.end());

    float sum = 0.0f;
    for (std::size_t i = 0; i < EMOTION_CLASS_COUNT; ++i) {
        probs[i] = std::exp(model_output[i] - max_logit);
        sum += probs[i];
    }

    if (sum <= std::numeric_limits<float>::epsilon()) {
        return uniformDistribution();
    }

    for (float& value : probs) {
        value /= sum;
    }
    return probs;
}

ClassifierResult makeClassifierResult(const EmotionArray& probabilities) {
    ClassifierResult result;

    std::size_t best_index = 0;
    for (std::size_t i = 0; i < EMOTION_CLASS_COUNT; ++i) {
        result.probabilities[emotionFromClassIndex(i)] = probabilities[i];
        if (probabilities[i] > probabilities[best_index]) {
            best_index = i;
        }
    }

    result.dominant_emotion = emotionFromClassIndex(best_index);
    result.confidence = std::clamp(probabilities[best_index], 0.0f, 1.0f);
    return result;
}

namespace detail {

std::unique_ptr<EmotionClassifier> createEmotionClassifier(BackendType type) {
    switch (type) {
        case BackendType::TfLiteFer:
            return std::make_unique<TfLiteEmotionClassifier>();

        case BackendType::MediaPipe:
        case BackendType::Unknown:
        default:
            return nullptr;
    }
}

} // namespace detail
} // namespace affect_sdk
