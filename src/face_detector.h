/**
 * @file face_detector.h
 * @brief 백엔드 공용 내부 유틸리티 (RGB 변환, TFLite 로드, BlazeFace 검출)
 *
 * MediaPipeLandmarkExtractor 와 TfLiteEmotionClassifier 가 공유.
 * 공개 헤더가 아니므로 OpenCV/TFLite 타입을 직접 노출함.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "affect_sdk/types.h"

#ifdef AFFECT_SDK_HAS_TFLITE
#include "tensorflow/lite/interpreter.h"
#include "tensorflow/lite/kernels/register.h"
#include "tensorflow/lite/model.h"
#endif

#ifdef AFFECT_SDK_HAS_OPENCV
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#endif

namespace affect_sdk {
namespace internal {

/**
 * @brief 모델 디렉토리와 필수 파일 존재 여부 검사
 * @param model_path 모델 디렉토리
 * @param model_files 디렉토리 내 필수 파일 이름 목록
 */
bool validateModelPath(const std::string& model_path,
                       const std::vector<std::string>& model_files);

/**
 * @brief 입력 프레임 크기/포인터 기본 검사
 */
bool isValidFrame(const uint8_t* frame_data, int width, int height);

#ifdef AFFECT_SDK_HAS_OPENCV

/**
 * @brief 입력 프레임을 RGB cv::Mat 으로 변환
 *
 * 입력 버퍼는 읽기 전용으로만 사용함. RGB 입력은 복사 없이 래핑.
 *
 * @param frame_data 입력 이미지 데이터
 * @param width 입력 너비
 * @param height 입력 높이 (NV21/NV12 는 Y 평면 높이)
 * @param format 입력 포맷
 * @param output_rgb 출력 RGB Mat (CV_8UC3)
 * @return 성공 여부
 */
bool convertToRgb(const uint8_t* frame_data, int width, int height,
                  FrameFormat format, cv::Mat& output_rgb);

/**
 * @brief 정규화 사각형을 픽셀 ROI 로 변환
 *
 * @param normalized 정규화 좌표 사각형 (0~1)
 * @param image_width 이미지 너비
 * @param image_height 이미지 높이
 * @param margin 각 변에 추가할 여백 비율
 * @param square 긴 변 기준 정사각형으로 확장 여부
 * @param clipped 실제 사용된 영역 (정규화 좌표, 출력)
 * @return 이미지 경계 안으로 잘린 ROI (비어 있을 수 있음)
 */
cv::Rect toPixelRoi(const Rect& normalized, int image_width, int image_height,
                    float margin, bool square, Rect& clipped);

#endif  // AFFECT_SDK_HAS_OPENCV

#ifdef AFFECT_SDK_HAS_TFLITE

/**
 * @brief TFLite 모델 로드 및 인터프리터 생성
 * @param model_file 모델 파일 경로
 * @param num_threads 추론 스레드 수
 * @param model 모델 포인터 (출력)
 * @param interpreter 인터프리터 포인터 (출력)
 * @return 성공 여부
 */
bool loadModel(const std::string& model_file,
               int num_threads,
               std::unique_ptr<tflite::FlatBufferModel>& model,
               std::unique_ptr<tflite::Interpreter>& interpreter);

/// logit -> 확률
float sigmoid(float x);

#endif  // AFFECT_SDK_HAS_TFLITE

#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)

/**
 * @brief BlazeFace short range 얼굴 검출기
 *
 * 입력 128x128 RGB, 앵커 16x16x2 + 8x8x6 = 896.
 * 가장 점수가 높은 한 얼굴만 반환.
 */
class BlazeFaceDetector {
public:
    static constexpr int INPUT_WIDTH = 128;
    static constexpr int INPUT_HEIGHT = 128;

    BlazeFaceDetector() = default;

    BlazeFaceDetector(const BlazeFaceDetector&) = delete;
    BlazeFaceDetector& operator=(const BlazeFaceDetector&) = delete;

    /**
     * @brief 모델 로드
     * @param model_file face_detection_short_range.tflite 경로
     * @param num_threads 추론 스레드 수
     */
    bool load(const std::string& model_file, int num_threads);

    void release();
    bool isLoaded() const { return interpreter_ != nullptr; }

    void setMinConfidence(float confidence) { min_confidence_ = confidence; }

    /**
     * @brief 얼굴 검출
     * @param rgb RGB 이미지
     * @param confidence 검출 신뢰도 (출력, nullptr 허용)
     * @return 얼굴 영역 (정규화 좌표), 미검출 시 nullopt
     */
    std::optional<Rect> detect(const cv::Mat& rgb, float* confidence = nullptr);

private:
    struct Anchor {
        float x_center;
        float y_center;
    };

    void generateAnchors();

    std::unique_ptr<tflite::FlatBufferModel> model_;
    std::unique_ptr<tflite::Interpreter> interpreter_;
    std::vector<Anchor> anchors_;
    float min_confidence_ = 0.5f;

    cv::Mat resized_buffer_;
    cv::Mat float_buffer_;
};

#endif  // AFFECT_SDK_HAS_TFLITE && AFFECT_SDK_HAS_OPENCV

} // namespace internal
} // namespace affect_sdk
