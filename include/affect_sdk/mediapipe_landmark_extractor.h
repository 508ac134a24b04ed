/**
 * @file mediapipe_landmark_extractor.h
 * @brief MediaPipe 기반 랜드마크 추출기 선언
 *
 * TensorFlow Lite를 사용하여 MediaPipe의 Face Detection 및
 * Face Mesh 모델을 실행하는 LandmarkExtractor 구현체
 */

#pragma once

#include "affect_sdk/landmark_extractor.h"
#include <memory>

namespace affect_sdk {

/**
 * @brief MediaPipe 기반 랜드마크 추출기
 *
 * BlazeFace 로 얼굴 영역을 찾고, 해당 영역을 크롭하여
 * Face Mesh 모델로 468개 랜드마크를 추출한 뒤 픽셀 좌표로 복원.
 *
 * @note TensorFlow Lite 런타임 필요
 * @note 모델 파일 필요:
 *       - face_detection_short_range.tflite
 *       - face_landmark.tflite
 * @note 스레드 안전하지 않음 - 세션마다 별도 인스턴스 사용
 */
class AFFECT_SDK_EXPORT MediaPipeLandmarkExtractor : public LandmarkExtractor {
public:
    MediaPipeLandmarkExtractor();
    ~MediaPipeLandmarkExtractor() override;

    // 복사/이동 금지 (Pimpl 사용)
    MediaPipeLandmarkExtractor(const MediaPipeLandmarkExtractor&) = delete;
    MediaPipeLandmarkExtractor& operator=(const MediaPipeLandmarkExtractor&) = delete;
    MediaPipeLandmarkExtractor(MediaPipeLandmarkExtractor&&) = delete;
    MediaPipeLandmarkExtractor& operator=(MediaPipeLandmarkExtractor&&) = delete;

    // ========================================
    // LandmarkExtractor 인터페이스 구현
    // ========================================

    /**
     * @brief 추출기 초기화
     * @param model_path 모델 파일들이 있는 디렉토리 경로
     * @return 초기화 성공 여부
     */
    bool initialize(const std::string& model_path) override;

    /**
     * @brief 랜드마크 추출 수행
     * @param frame_data 이미지 데이터 포인터
     * @param width 이미지 너비
     * @param height 이미지 높이
     * @param format 이미지 포맷
     * @return 468개 랜드마크 (픽셀 좌표), 얼굴 미검출 시 nullopt
     */
    std::optional<LandmarkSet> extract(const uint8_t* frame_data,
                                       int width,
                                       int height,
                                       FrameFormat format) override;

    void release() override;
    bool isInitialized() const override;
    BackendType getBackendType() const override;

    // ========================================
    // MediaPipe 전용 설정
    // ========================================

    /**
     * @brief 모델 파일 이름 지정 (initialize 전에 호출)
     * @param face_detection_model 얼굴 검출 모델 파일명
     * @param face_landmark_model Face Mesh 모델 파일명
     */
    void setModelFiles(const std::string& face_detection_model,
                       const std::string& face_landmark_model);

    /**
     * @brief 얼굴 검출 최소 신뢰도 설정
     * @param confidence 신뢰도 (0.0 ~ 1.0)
     */
    void setMinDetectionConfidence(float confidence);

    /**
     * @brief TFLite 추론에 사용할 스레드 수 설정
     *
     * 초기화 전에 호출해야 효과적임.
     * 기본값: 2
     *
     * @param num_threads 스레드 수 (1 ~ 16)
     */
    void setNumThreads(int num_threads);

    /**
     * @brief 추적 모드 활성화/비활성화
     *
     * 추적 모드 활성화 시 연속 프레임에서 Face Detection을 스킵하고
     * 이전 랜드마크의 외곽 영역을 재사용함.
     * 기본값: true
     *
     * @param enable 활성화 여부
     */
    void setTrackingEnabled(bool enable);

    /**
     * @brief 추적 캐시 초기화
     */
    void resetTracking();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace affect_sdk
