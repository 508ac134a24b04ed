/**
 * @file test_emotion_classifier.cpp
 * @brief EmotionClassifier 인터페이스, 출력 정규화, TFLite 어댑터 테스트
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <numeric>
#include <type_traits>
#include "affect_sdk/emotion_classifier.h"
#include "affect_sdk/tflite_emotion_classifier.h"
#include "test_helpers.h"

namespace affect_sdk {
namespace testing {

using EmotionArray = std::array<float, EMOTION_CLASS_COUNT>;

namespace {

float sumOf(const EmotionArray& values) {
    return std::accumulate(values.begin(), values.end(), 0.0f);
}

} // anonymous namespace

// ============================================================
// 인터페이스 테스트
// ============================================================

class EmotionClassifierTest : public ::testing::Test {};

TEST_F(EmotionClassifierTest, IsAbstractClass) {
    EXPECT_TRUE(std::is_abstract<EmotionClassifier>::value);
    EXPECT_TRUE(std::has_virtual_destructor<EmotionClassifier>::value);
    EXPECT_FALSE(std::is_copy_constructible<EmotionClassifier>::value);
    EXPECT_FALSE(std::is_move_constructible<EmotionClassifier>::value);
}

TEST_F(EmotionClassifierTest, MockClassifierRequiresInitialization) {
    MockEmotionClassifier classifier(makeClassifierOutput(Emotion::Happy, 0.8f));
    auto frame = makeDummyFrame();

    EXPECT_FALSE(classifier.classify(frame.data(), 640, 480, FrameFormat::BGR).has_value());
    ASSERT_TRUE(classifier.initialize("mock://models"));

    auto result = classifier.classify(frame.data(), 640, 480, FrameFormat::BGR);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->dominant_emotion, Emotion::Happy);
}

// ============================================================
// 출력 정규화 테스트
// ============================================================

class NormalizeEmotionOutputTest : public ::testing::Test {};

TEST_F(NormalizeEmotionOutputTest, ProbabilitiesPassThrough) {
    const EmotionArray input = {0.05f, 0.05f, 0.1f, 0.5f, 0.1f, 0.1f, 0.1f};
    const EmotionArray probs = normalizeEmotionOutput(input);

    EXPECT_NEAR(sumOf(probs), 1.0f, 1e-5f);
    EXPECT_NEAR(probs[3], 0.5f, 1e-5f);
}

TEST_F(NormalizeEmotionOutputTest, NearlyNormalizedIsRescaled) {
    // 합 0.9 -> 재정규화
    const EmotionArray input = {0.0f, 0.0f, 0.0f, 0.45f, 0.0f, 0.0f, 0.45f};
    const EmotionArray probs = normalizeEmotionOutput(input);

    EXPECT_NEAR(sumOf(probs), 1.0f, 1e-5f);
    EXPECT_NEAR(probs[3], 0.5f, 1e-5f);
    EXPECT_NEAR(probs[6], 0.5f, 1e-5f);
}

TEST_F(NormalizeEmotionOutputTest, LogitsUseSoftmax) {
    const EmotionArray logits = {1.0f, -2.0f, 0.5f, 4.0f, 0.0f, 1.5f, 2.0f};
    const EmotionArray probs = normalizeEmotionOutput(logits);

    EXPECT_NEAR(sumOf(probs), 1.0f, 1e-5f);
    for (float p : probs) {
        EXPECT_GE(p, 0.0f);
        EXPECT_LE(p, 1.0f);
    }

    // 순서 보존
    EXPECT_GT(probs[3], probs[6]);
    EXPECT_GT(probs[6], probs[5]);
    EXPECT_GT(probs[0], probs[1]);

    // softmax 값 확인: exp(4) / sum(exp)
    float denom = 0.0f;
    for (float l : logits) denom += std::exp(l);
    EXPECT_NEAR(probs[3], std::exp(4.0f) / denom, 1e-5f);
}

TEST_F(NormalizeEmotionOutputTest, LargeLogitsDoNotOverflow) {
    const EmotionArray logits = {1000.0f, 999.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f};
    const EmotionArray probs = normalizeEmotionOutput(logits);

    EXPECT_NEAR(sumOf(probs), 1.0f, 1e-5f);
    EXPECT_TRUE(std::isfinite(probs[0]));
    EXPECT_GT(probs[0], probs[1]);
}

TEST_F(NormalizeEmotionOutputTest, NonFiniteGivesUniform) {
    EmotionArray input = {0.1f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f, 0.4f};
    input[2] = std::numeric_limits<float>::quiet_NaN();

    const EmotionArray probs = normalizeEmotionOutput(input);
    for (float p : probs) {
        EXPECT_NEAR(p, 1.0f / 7.0f, 1e-6f);
    }

    input[2] = std::numeric_limits<float>::infinity();
    EXPECT_NEAR(normalizeEmotionOutput(input)[6], 1.0f / 7.0f, 1e-6f);
}

TEST_F(NormalizeEmotionOutputTest, AllZeroGivesUniform) {
    // 모두 0 인 logit -> softmax 균등
    const EmotionArray probs = normalizeEmotionOutput(EmotionArray{});
    for (float p : probs) {
        EXPECT_NEAR(p, 1.0f / 7.0f, 1e-6f);
    }
}

// ============================================================
// ClassifierResult 구성 테스트
// ============================================================

class MakeClassifierResultTest : public ::testing::Test {};

TEST_F(MakeClassifierResultTest, ArgmaxIsDominant) {
    const EmotionArray probs = {0.05f, 0.05f, 0.6f, 0.1f, 0.1f, 0.05f, 0.05f};
    const ClassifierResult result = makeClassifierResult(probs);

    EXPECT_EQ(result.dominant_emotion, Emotion::Fear);
    EXPECT_FLOAT_EQ(result.confidence, 0.6f);
    EXPECT_EQ(result.probabilities.size(), EMOTION_CLASS_COUNT);
    EXPECT_FLOAT_EQ(result.probabilities.at(Emotion::Fear), 0.6f);
    EXPECT_EQ(result.probabilities.count(Emotion::Stressed), 0u);
}

TEST_F(MakeClassifierResultTest, TieResolvesToFirstIndex) {
    const EmotionArray probs = {0.0f, 0.0f, 0.0f, 0.5f, 0.0f, 0.0f, 0.5f};
    EXPECT_EQ(makeClassifierResult(probs).dominant_emotion, Emotion::Happy);
}

TEST_F(MakeClassifierResultTest, UniformPicksAngry) {
    EmotionArray probs{};
    probs.fill(1.0f / 7.0f);
    const ClassifierResult result = makeClassifierResult(probs);
    EXPECT_EQ(result.dominant_emotion, Emotion::Angry);
    EXPECT_NEAR(result.confidence, 1.0f / 7.0f, 1e-6f);
}

// ============================================================
// 팩토리 / TFLite 어댑터 테스트 (모델 없음)
// ============================================================

class TfLiteEmotionClassifierTest : public ::testing::Test {};

TEST_F(TfLiteEmotionClassifierTest, FactoryCreatesTfLite) {
    auto classifier = detail::createEmotionClassifier(BackendType::TfLiteFer);
    ASSERT_NE(classifier, nullptr);
    EXPECT_EQ(classifier->getBackendType(), BackendType::TfLiteFer);
    EXPECT_FALSE(classifier->isInitialized());

    EXPECT_EQ(detail::createEmotionClassifier(BackendType::MediaPipe), nullptr);
    EXPECT_EQ(detail::createEmotionClassifier(BackendType::Unknown), nullptr);
}

TEST_F(TfLiteEmotionClassifierTest, InitializeWithInvalidPath) {
    TfLiteEmotionClassifier classifier;
    EXPECT_FALSE(classifier.initialize("/nonexistent/path/to/models"));
    EXPECT_FALSE(classifier.initialize(""));
    EXPECT_FALSE(classifier.isInitialized());
}

TEST_F(TfLiteEmotionClassifierTest, ClassifyWithoutInitialization) {
    TfLiteEmotionClassifier classifier;
    auto frame = makeDummyFrame();
    EXPECT_FALSE(classifier.classify(frame.data(), 640, 480, FrameFormat::BGR).has_value());
    EXPECT_FALSE(classifier.classify(nullptr, 640, 480, FrameFormat::BGR).has_value());
}

TEST_F(TfLiteEmotionClassifierTest, SettersBeforeInitialize) {
    TfLiteEmotionClassifier classifier;
    classifier.setModelFiles("", "fer.tflite");
    classifier.setMinDetectionConfidence(-1.0f);
    classifier.setNumThreads(0);
    classifier.release();
    EXPECT_FALSE(classifier.isInitialized());
}

} // namespace testing
} // namespace affect_sdk
