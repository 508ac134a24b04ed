/**
 * @file test_landmark_extractor.cpp
 * @brief LandmarkExtractor 인터페이스, 랜드마크 그룹, MediaPipe 어댑터 테스트
 */

#include <gtest/gtest.h>
#include <memory>
#include <type_traits>
#include "affect_sdk/landmark_extractor.h"
#include "affect_sdk/mediapipe_landmark_extractor.h"
#include "test_helpers.h"

namespace affect_sdk {
namespace testing {

// ============================================================
// LandmarkExtractor 인터페이스 테스트
// ============================================================

class LandmarkExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// ------------------------------------------------------------
// 클래스 특성 테스트
// ------------------------------------------------------------

TEST_F(LandmarkExtractorTest, IsAbstractClass) {
    EXPECT_TRUE(std::is_abstract<LandmarkExtractor>::value);
}

TEST_F(LandmarkExtractorTest, HasVirtualDestructor) {
    // 가상 소멸자가 있어야 함 (다형성 삭제 지원)
    EXPECT_TRUE(std::has_virtual_destructor<LandmarkExtractor>::value);
}

TEST_F(LandmarkExtractorTest, IsNotCopyableOrMovable) {
    EXPECT_FALSE(std::is_copy_constructible<LandmarkExtractor>::value);
    EXPECT_FALSE(std::is_copy_assignable<LandmarkExtractor>::value);
    EXPECT_FALSE(std::is_move_constructible<LandmarkExtractor>::value);
    EXPECT_FALSE(std::is_move_assignable<LandmarkExtractor>::value);
}

// ------------------------------------------------------------
// Mock 추출기 동작 테스트
// ------------------------------------------------------------

TEST_F(LandmarkExtractorTest, MockReturnsScriptedFaces) {
    auto script = std::make_shared<FaceScript>();
    script->push(makeNeutralFace());
    script->push(std::nullopt);

    MockLandmarkExtractor extractor(script);
    ASSERT_TRUE(extractor.initialize("mock://models"));

    auto frame = makeDummyFrame();
    auto first = extractor.extract(frame.data(), 640, 480, FrameFormat::BGR);
    auto second = extractor.extract(frame.data(), 640, 480, FrameFormat::BGR);
    auto third = extractor.extract(frame.data(), 640, 480, FrameFormat::BGR);

    ASSERT_TRUE(first.has_value());
    EXPECT_FLOAT_EQ((*first)[152].y, 340.0f);
    EXPECT_FALSE(second.has_value());
    EXPECT_FALSE(third.has_value());  // 마지막 항목 반복
    EXPECT_EQ(script->extract_calls, 3);
}

TEST_F(LandmarkExtractorTest, MockWithoutInitializationReturnsNothing) {
    auto script = std::make_shared<FaceScript>();
    script->push(makeNeutralFace());

    MockLandmarkExtractor extractor(script);
    auto frame = makeDummyFrame();
    EXPECT_FALSE(extractor.extract(frame.data(), 640, 480, FrameFormat::BGR).has_value());
}

// ============================================================
// 랜드마크 그룹 테스트
// ============================================================

class LandmarkGroupTest : public ::testing::Test {};

TEST_F(LandmarkGroupTest, EyeGroupsMatchEarOrder) {
    const std::vector<int> left = landmarkGroup("left_eye");
    ASSERT_EQ(left.size(), 6u);
    for (std::size_t i = 0; i < left.size(); ++i) {
        EXPECT_EQ(left[i], landmark_index::LEFT_EYE[i]);
    }

    const std::vector<int> right = landmarkGroup("right_eye");
    ASSERT_EQ(right.size(), 6u);
    for (std::size_t i = 0; i < right.size(); ++i) {
        EXPECT_EQ(right[i], landmark_index::RIGHT_EYE[i]);
    }
}

TEST_F(LandmarkGroupTest, AllNamedGroupsExist) {
    for (const char* name : {"left_eye", "right_eye", "left_eyebrow", "right_eyebrow",
                             "lips_upper", "lips_lower", "jaw", "nose"}) {
        const std::vector<int> indices = landmarkGroup(name);
        EXPECT_FALSE(indices.empty()) << name;
        for (int index : indices) {
            EXPECT_GE(index, 0) << name;
            EXPECT_LT(index, FACE_LANDMARK_COUNT) << name;
        }
    }
}

TEST_F(LandmarkGroupTest, JawGroupContainsChin) {
    const std::vector<int> jaw = landmarkGroup("jaw");
    EXPECT_NE(std::find(jaw.begin(), jaw.end(), landmark_index::CHIN), jaw.end());
}

TEST_F(LandmarkGroupTest, UnknownGroupIsEmpty) {
    EXPECT_TRUE(landmarkGroup("iris").empty());
    EXPECT_TRUE(landmarkGroup("").empty());
    EXPECT_TRUE(landmarkGroupPoints(makeNeutralFace(), "ears").empty());
}

TEST_F(LandmarkGroupTest, GroupPointsFollowIndices) {
    const LandmarkSet face = makeNeutralFace();
    const std::vector<Landmark3D> eye = landmarkGroupPoints(face, "left_eye");

    ASSERT_EQ(eye.size(), 6u);
    EXPECT_FLOAT_EQ(eye[0].x, 264.0f);  // 33: 바깥
    EXPECT_FLOAT_EQ(eye[3].x, 296.0f);  // 133: 안쪽
}

// ============================================================
// 팩토리 테스트
// ============================================================

class LandmarkExtractorFactoryTest : public ::testing::Test {};

TEST_F(LandmarkExtractorFactoryTest, CreateMediaPipe) {
    auto extractor = detail::createLandmarkExtractor(BackendType::MediaPipe);
    ASSERT_NE(extractor, nullptr);
    EXPECT_EQ(extractor->getBackendType(), BackendType::MediaPipe);
    EXPECT_FALSE(extractor->isInitialized());
}

TEST_F(LandmarkExtractorFactoryTest, CreateByName) {
    EXPECT_NE(detail::createLandmarkExtractor("mediapipe"), nullptr);
    EXPECT_NE(detail::createLandmarkExtractor("MediaPipe"), nullptr);
    EXPECT_NE(detail::createLandmarkExtractor("face_mesh"), nullptr);
    EXPECT_EQ(detail::createLandmarkExtractor("dlib"), nullptr);
}

TEST_F(LandmarkExtractorFactoryTest, UnsupportedTypes) {
    EXPECT_EQ(detail::createLandmarkExtractor(BackendType::Unknown), nullptr);
    EXPECT_EQ(detail::createLandmarkExtractor(BackendType::TfLiteFer), nullptr);
}

// ============================================================
// MediaPipeLandmarkExtractor 테스트 (모델 없음)
// ============================================================

class MediaPipeLandmarkExtractorTest : public ::testing::Test {};

TEST_F(MediaPipeLandmarkExtractorTest, InheritsFromLandmarkExtractor) {
    EXPECT_TRUE((std::is_base_of<LandmarkExtractor, MediaPipeLandmarkExtractor>::value));
    EXPECT_FALSE(std::is_abstract<MediaPipeLandmarkExtractor>::value);
}

TEST_F(MediaPipeLandmarkExtractorTest, InitializeWithInvalidPath) {
    MediaPipeLandmarkExtractor extractor;
    EXPECT_FALSE(extractor.initialize("/nonexistent/path/to/models"));
    EXPECT_FALSE(extractor.isInitialized());
}

TEST_F(MediaPipeLandmarkExtractorTest, InitializeWithEmptyPath) {
    MediaPipeLandmarkExtractor extractor;
    EXPECT_FALSE(extractor.initialize(""));
    EXPECT_FALSE(extractor.isInitialized());
}

TEST_F(MediaPipeLandmarkExtractorTest, ExtractWithoutInitialization) {
    // 초기화 전 추출은 얼굴 없음과 동일
    MediaPipeLandmarkExtractor extractor;
    auto frame = makeDummyFrame();
    EXPECT_FALSE(extractor.extract(frame.data(), 640, 480, FrameFormat::BGR).has_value());
}

TEST_F(MediaPipeLandmarkExtractorTest, ExtractWithInvalidInput) {
    MediaPipeLandmarkExtractor extractor;
    EXPECT_FALSE(extractor.extract(nullptr, 640, 480, FrameFormat::BGR).has_value());

    auto frame = makeDummyFrame();
    EXPECT_FALSE(extractor.extract(frame.data(), 0, 480, FrameFormat::BGR).has_value());
    EXPECT_FALSE(extractor.extract(frame.data(), 640, -1, FrameFormat::BGR).has_value());
}

TEST_F(MediaPipeLandmarkExtractorTest, SettersBeforeInitialize) {
    // 설정 메서드는 초기화 여부와 무관하게 안전해야 함
    MediaPipeLandmarkExtractor extractor;
    extractor.setModelFiles("detector.tflite", "mesh.tflite");
    extractor.setMinDetectionConfidence(1.5f);
    extractor.setNumThreads(64);
    extractor.setTrackingEnabled(false);
    extractor.resetTracking();
    EXPECT_FALSE(extractor.isInitialized());
}

TEST_F(MediaPipeLandmarkExtractorTest, ReleaseWithoutInitialization) {
    MediaPipeLandmarkExtractor extractor;
    extractor.release();
    EXPECT_FALSE(extractor.isInitialized());
}

} // namespace testing
} // namespace affect_sdk
