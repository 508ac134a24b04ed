/**
 * @file mediapipe_landmark_extractor.cpp
 * @brief MediaPipeLandmarkExtractor 구현 - TensorFlow Lite 통합
 *
 * BlazeFace 로 얼굴 영역을 찾고 Face Mesh 모델로 468개 랜드마크 추출.
 * 결과 좌표는 입력 프레임 픽셀 좌표.
 */

#include "affect_sdk/mediapipe_landmark_extractor.h"

#include <algorithm>  // std::clamp
#include <cstring>    // std::memcpy
#include <exception>
#include <filesystem>

#include "face_detector.h"
#include "logging.h"

namespace affect_sdk {

#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
namespace {
    // Face Landmark 모델: 192x192 RGB
    constexpr int FACE_LANDMARK_INPUT_WIDTH = 192;
    constexpr int FACE_LANDMARK_INPUT_HEIGHT = 192;

    // 크롭 여백 (각 변 비율)
    constexpr float FACE_CROP_MARGIN = 0.25f;
}
#endif

// ============================================================
// Pimpl 구현 클래스
// ============================================================
class MediaPipeLandmarkExtractor::Impl {
public:
    bool initialized = false;
    std::string model_path;

    std::string face_detection_file = "face_detection_short_range.tflite";
    std::string face_landmark_file = "face_landmark.tflite";

    float min_detection_confidence = 0.5f;
    int num_threads = 2;
    bool use_tracking = true;

#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
    internal::BlazeFaceDetector face_detector;

    std::unique_ptr<tflite::FlatBufferModel> face_landmark_model;
    std::unique_ptr<tflite::Interpreter> face_landmark_interpreter;

    // 이미지 처리용 버퍼 (OpenCV Mat 재사용)
    cv::Mat rgb_buffer;
    cv::Mat cropped_buffer;
    cv::Mat float_buffer;

    // 추적 캐시: 이전 프레임 랜드마크 외곽 영역 (정규화 좌표)
    bool has_prev_face = false;
    Rect prev_face_rect{};

    void resetTrackingCache() {
        has_prev_face = false;
        prev_face_rect = Rect{};
    }

    bool loadAllModels(const std::string& base_path) {
        std::filesystem::path base(base_path);

        if (!face_detector.load((base / face_detection_file).string(), num_threads)) {
            internal::logError("failed to load face detection model: %s",
                               face_detection_file.c_str());
            return false;
        }
        face_detector.setMinConfidence(min_detection_confidence);

        if (!internal::loadModel((base / face_landmark_file).string(), num_threads,
                                 face_landmark_model, face_landmark_interpreter)) {
            internal::logError("failed to load face landmark model: %s",
                               face_landmark_file.c_str());
            return false;
        }

        return true;
    }

    void releaseAllModels() {
        face_detector.release();
        face_landmark_interpreter.reset();
        face_landmark_model.reset();
        resetTrackingCache();
    }

    /**
     * @brief 얼굴 영역 크롭 + 192x192 float 입력 텐서 채우기
     * @param face_rect 얼굴 영역 (정규화)
     * @param crop_rect 실제 크롭 영역 (정규화, 출력)
     */
    bool prepareLandmarkInput(const Rect& face_rect, Rect& crop_rect) {
        cv::Rect roi = internal::toPixelRoi(face_rect, rgb_buffer.cols, rgb_buffer.rows,
                                            FACE_CROP_MARGIN, true, crop_rect);
        if (roi.width <= 1 || roi.height <= 1) {
            return false;
        }

        cv::resize(rgb_buffer(roi), cropped_buffer,
                   cv::Size(FACE_LANDMARK_INPUT_WIDTH, FACE_LANDMARK_INPUT_HEIGHT),
                   0, 0, cv::INTER_LINEAR);
        cropped_buffer.convertTo(float_buffer, CV_32FC3, 1.0 / 255.0);

        float* input_tensor = face_landmark_interpreter->typed_input_tensor<float>(0);
        if (!input_tensor) {
            return false;
        }

        const std::size_t row_floats = static_cast<std::size_t>(FACE_LANDMARK_INPUT_WIDTH) * 3;
        if (float_buffer.isContinuous()) {
            std::memcpy(input_tensor, float_buffer.ptr<float>(),
                        row_floats * FACE_LANDMARK_INPUT_HEIGHT * sizeof(float));
        } else {
            float* dst = input_tensor;
            for (int y = 0; y < FACE_LANDMARK_INPUT_HEIGHT; ++y) {
                std::memcpy(dst, float_buffer.ptr<float>(y), row_floats * sizeof(float));
                dst += row_floats;
            }
        }
        return true;
    }

    /**
     * @brief Face Mesh 실행 후 전체 프레임 픽셀 좌표로 복원
     *
     * Output 0: [1, 1, 1, 1404] 192x192 크롭 기준 픽셀 좌표 (x, y, z)
     * Output 1: [1, 1, 1, 1] 얼굴 존재 logit (모델에 따라 없을 수 있음)
     */
    std::optional<LandmarkSet> runFaceLandmark(const Rect& crop_rect, int width, int height) {
        if (face_landmark_interpreter->Invoke() != kTfLiteOk) {
            internal::logWarn("face landmark inference failed");
            return std::nullopt;
        }

        const TfLiteTensor* output = face_landmark_interpreter->tensor(
            face_landmark_interpreter->outputs()[0]);
        const float* output_data = face_landmark_interpreter->typed_output_tensor<float>(0);
        if (!output || !output_data ||
            output->bytes < static_cast<std::size_t>(FACE_LANDMARK_COUNT) * 3 * sizeof(float)) {
            return std::nullopt;
        }

        if (face_landmark_interpreter->outputs().size() >= 2) {
            const float* presence = face_landmark_interpreter->typed_output_tensor<float>(1);
            if (presence && internal::sigmoid(presence[0]) < min_detection_confidence) {
                return std::nullopt;
            }
        }

        LandmarkSet landmarks;
        for (int i = 0; i < FACE_LANDMARK_COUNT; ++i) {
            // 크롭 픽셀 -> 크롭 정규화 -> 프레임 정규화 -> 프레임 픽셀
            float local_x = output_data[i * 3 + 0] / static_cast<float>(FACE_LANDMARK_INPUT_WIDTH);
            float local_y = output_data[i * 3 + 1] / static_cast<float>(FACE_LANDMARK_INPUT_HEIGHT);

            landmarks[i].x = (crop_rect.x + local_x * crop_rect.width) * static_cast<float>(width);
            landmarks[i].y = (crop_rect.y + local_y * crop_rect.height) * static_cast<float>(height);
            landmarks[i].z = output_data[i * 3 + 2];
        }
        return landmarks;
    }

    /**
     * @brief 랜드마크 외곽 사각형 (정규화 좌표)
     */
    static Rect landmarkBounds(const LandmarkSet& landmarks, int width, int height) {
        float min_x = landmarks[0].x;
        float max_x = landmarks[0].x;
        float min_y = landmarks[0].y;
        float max_y = landmarks[0].y;
        for (const auto& point : landmarks.points) {
            min_x = std::min(min_x, point.x);
            max_x = std::max(max_x, point.x);
            min_y = std::min(min_y, point.y);
            max_y = std::max(max_y, point.y);
        }

        Rect bounds{};
        bounds.x = std::clamp(min_x / static_cast<float>(width), 0.0f, 1.0f);
        bounds.y = std::clamp(min_y / static_cast<float>(height), 0.0f, 1.0f);
        bounds.width = std::clamp((max_x - min_x) / static_cast<float>(width), 0.0f, 1.0f - bounds.x);
        bounds.height = std::clamp((max_y - min_y) / static_cast<float>(height), 0.0f, 1.0f - bounds.y);
        return bounds;
    }

    std::optional<LandmarkSet> extractFromRect(const Rect& face_rect, int width, int height) {
        Rect crop_rect{};
        if (!prepareLandmarkInput(face_rect, crop_rect)) {
            return std::nullopt;
        }
        return runFaceLandmark(crop_rect, width, height);
    }

    std::optional<LandmarkSet> extract(const uint8_t* frame_data, int width, int height,
                                       FrameFormat format) {
        if (!internal::convertToRgb(frame_data, width, height, format, rgb_buffer)) {
            resetTrackingCache();
            return std::nullopt;
        }

        std::optional<LandmarkSet> landmarks;

        // 추적 모드: 이전 프레임 영역으로 Face Detection 스킵
        if (use_tracking && has_prev_face) {
            landmarks = extractFromRect(prev_face_rect, width, height);
        }

        if (!landmarks) {
            std::optional<Rect> face_rect = face_detector.detect(rgb_buffer);
            if (!face_rect) {
                resetTrackingCache();
                return std::nullopt;
            }
            landmarks = extractFromRect(*face_rect, width, height);
        }

        if (!landmarks) {
            resetTrackingCache();
            return std::nullopt;
        }

        prev_face_rect = landmarkBounds(*landmarks, width, height);
        has_prev_face = prev_face_rect.width > 0.0f && prev_face_rect.height > 0.0f;
        return landmarks;
    }
#endif  // AFFECT_SDK_HAS_TFLITE && AFFECT_SDK_HAS_OPENCV
};

// ============================================================
// 생성자/소멸자
// ============================================================

MediaPipeLandmarkExtractor::MediaPipeLandmarkExtractor()
    : impl_(std::make_unique<Impl>()) {
}

MediaPipeLandmarkExtractor::~MediaPipeLandmarkExtractor() = default;

// ============================================================
// LandmarkExtractor 인터페이스 구현
// ============================================================

bool MediaPipeLandmarkExtractor::initialize(const std::string& model_path) {
    if (impl_->initialized) {
        return false;
    }

    if (!internal::validateModelPath(model_path,
                                     {impl_->face_detection_file, impl_->face_landmark_file})) {
        internal::logWarn("landmark models not found under '%s'", model_path.c_str());
        return false;
    }

#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
    if (!impl_->loadAllModels(model_path)) {
        impl_->releaseAllModels();
        return false;
    }

    impl_->model_path = model_path;
    impl_->initialized = true;
    return true;
#else
    internal::logWarn("MediaPipe landmark extractor requires OpenCV and TensorFlow Lite");
    return false;
#endif
}

std::optional<LandmarkSet> MediaPipeLandmarkExtractor::extract(const uint8_t* frame_data,
                                                               int width,
                                                               int height,
                                                               FrameFormat format) {
    if (!impl_->initialized || !internal::isValidFrame(frame_data, width, height)) {
        return std::nullopt;
    }

#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
    try {
        return impl_->extract(frame_data, width, height, format);
    } catch (const cv::Exception& e) {
        internal::logWarn("landmark extraction failed (OpenCV): %s", e.what());
    } catch (const std::exception& e) {
        internal::logWarn("landmark extraction failed: %s", e.what());
    }
    impl_->resetTrackingCache();
#else
    (void)format;
#endif
    return std::nullopt;
}

void MediaPipeLandmarkExtractor::release() {
#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
    impl_->releaseAllModels();
#endif
    impl_->initialized = false;
    impl_->model_path.clear();
}

bool MediaPipeLandmarkExtractor::isInitialized() const {
    return impl_->initialized;
}

BackendType MediaPipeLandmarkExtractor::getBackendType() const {
    return BackendType::MediaPipe;
}

// ============================================================
// MediaPipe 전용 설정
// ============================================================

void MediaPipeLandmarkExtractor::setModelFiles(const std::string& face_detection_model,
                                               const std::string& face_landmark_model) {
    if (!face_detection_model.empty()) {
        impl_->face_detection_file = face_detection_model;
    }
    if (!face_landmark_model.empty()) {
        impl_->face_landmark_file = face_landmark_model;
    }
}

void MediaPipeLandmarkExtractor::setMinDetectionConfidence(float confidence) {
    impl_->min_detection_confidence = std::clamp(confidence, 0.0f, 1.0f);
#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
    impl_->face_detector.setMinConfidence(impl_->min_detection_confidence);
#endif
}

void MediaPipeLandmarkExtractor::setNumThreads(int num_threads) {
    // 최소 1개 이상, 최대 16개
    impl_->num_threads = std::clamp(num_threads, 1, 16);
}

void MediaPipeLandmarkExtractor::setTrackingEnabled(bool enable) {
    impl_->use_tracking = enable;
    if (!enable) {
        resetTracking();
    }
}

void MediaPipeLandmarkExtractor::resetTracking() {
#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
    impl_->resetTrackingCache();
#endif
}

} // namespace affect_sdk
