/**
 * @file emotion_classifier.h
 * @brief 표정 분류기 추상 인터페이스
 */

#ifndef AFFECT_SDK_EMOTION_CLASSIFIER_H
#define AFFECT_SDK_EMOTION_CLASSIFIER_H

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "affect_sdk/types.h"
#include "affect_sdk/export.h"

namespace affect_sdk {

/**
 * @brief 표정 분류기 추상 인터페이스
 *
 * 분류기는 자체 얼굴 검출을 수행하므로 랜드마크 추출기와
 * 검출 결과가 일치하지 않을 수 있음.
 */
class AFFECT_SDK_EXPORT EmotionClassifier {
public:
    virtual ~EmotionClassifier() = default;

    /**
     * @brief 분류기 초기화
     * @param model_path 모델 파일 디렉토리 경로
     * @return 초기화 성공 여부
     */
    virtual bool initialize(const std::string& model_path) = 0;

    /**
     * @brief 프레임 표정 분류
     * @param frame_data 입력 이미지 데이터 포인터
     * @param width 이미지 너비
     * @param height 이미지 높이
     * @param format 픽셀 포맷
     * @return 분류 결과 (얼굴 미검출 또는 백엔드 실패 시 nullopt)
     */
    virtual std::optional<ClassifierResult> classify(const uint8_t* frame_data,
                                                     int width,
                                                     int height,
                                                     FrameFormat format) = 0;

    virtual void release() = 0;
    virtual bool isInitialized() const = 0;
    virtual BackendType getBackendType() const = 0;

    // 복사/이동 금지
    EmotionClassifier(const EmotionClassifier&) = delete;
    EmotionClassifier& operator=(const EmotionClassifier&) = delete;
    EmotionClassifier(EmotionClassifier&&) = delete;
    EmotionClassifier& operator=(EmotionClassifier&&) = delete;

protected:
    EmotionClassifier() = default;
};

/**
 * @brief 세션마다 새 분류기를 만드는 팩토리 (초기화 완료 상태로 반환)
 */
using EmotionClassifierFactory = std::function<std::unique_ptr<EmotionClassifier>()>;

/**
 * @brief 모델 원시 출력 -> 확률 분포
 *
 * 출력이 이미 확률처럼 보이면 (0~1, 합 0.85~1.15) 재정규화만 하고,
 * 아니면 logit 으로 간주하여 softmax 적용.
 *
 * @param model_output 분류기 어휘 순서의 원시 출력
 * @return 합이 1.0 인 확률 (NaN 포함 시 균등 분포)
 */
AFFECT_SDK_EXPORT std::array<float, EMOTION_CLASS_COUNT> normalizeEmotionOutput(
    const std::array<float, EMOTION_CLASS_COUNT>& model_output);

/**
 * @brief 확률 분포로 ClassifierResult 구성 (argmax 를 대표 감정으로)
 */
AFFECT_SDK_EXPORT ClassifierResult makeClassifierResult(
    const std::array<float, EMOTION_CLASS_COUNT>& probabilities);

namespace detail {

/**
 * @brief 분류기 생성 (내부용)
 * @param type 생성할 백엔드 종류
 * @return 미초기화 분류기 (지원하지 않는 종류면 nullptr)
 */
AFFECT_SDK_EXPORT std::unique_ptr<EmotionClassifier> createEmotionClassifier(BackendType type);

} // namespace detail

} // namespace affect_sdk

#endif // AFFECT_SDK_EMOTION_CLASSIFIER_H
