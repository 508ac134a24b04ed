/**
 * @file tflite_emotion_classifier.h
 * @brief TensorFlow Lite 기반 표정 분류기 선언
 */

#pragma once

#include "affect_sdk/emotion_classifier.h"
#include <memory>

namespace affect_sdk {

/**
 * @brief FER 계열 TFLite 표정 분류기
 *
 * 자체 BlazeFace 검출로 얼굴을 찾은 뒤 정사각형으로 크롭,
 * 그레이스케일 + 히스토그램 평활화 후 모델 입력 크기로 리사이즈.
 * 출력 순서: angry, disgust, fear, happy, sad, surprise, neutral
 *
 * @note 모델 파일 필요:
 *       - face_detection_short_range.tflite
 *       - emotion_classifier.tflite (입력 [1, H, W, 1] 또는 [1, H, W, 3])
 */
class AFFECT_SDK_EXPORT TfLiteEmotionClassifier : public EmotionClassifier {
public:
    TfLiteEmotionClassifier();
    ~TfLiteEmotionClassifier() override;

    TfLiteEmotionClassifier(const TfLiteEmotionClassifier&) = delete;
    TfLiteEmotionClassifier& operator=(const TfLiteEmotionClassifier&) = delete;
    TfLiteEmotionClassifier(TfLiteEmotionClassifier&&) = delete;
    TfLiteEmotionClassifier& operator=(TfLiteEmotionClassifier&&) = delete;

    bool initialize(const std::string& model_path) override;

    std::optional<ClassifierResult> classify(const uint8_t* frame_data,
                                             int width,
                                             int height,
                                             FrameFormat format) override;

    void release() override;
    bool isInitialized() const override;
    BackendType getBackendType() const override;

    /**
     * @brief 모델 파일 이름 지정 (initialize 전에 호출)
     */
    void setModelFiles(const std::string& face_detection_model,
                       const std::string& emotion_model);

    /**
     * @brief 얼굴 검출 최소 신뢰도 설정
     */
    void setMinDetectionConfidence(float confidence);

    /**
     * @brief TFLite 추론 스레드 수 설정 (1 ~ 16)
     */
    void setNumThreads(int num_threads);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace affect_sdk
