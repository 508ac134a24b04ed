/**
 * @file tflite_emotion_classifier.cpp
 * @brief TfLiteEmotionClassifier 구현
 */

#include "affect_sdk/tflite_emotion_classifier.h"

#include <algorithm>
#include <exception>
#include <filesystem>

#include "face_detector.h"
#include "logging.h"

namespace affect_sdk {

#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
namespace {
    // 얼굴 크롭 여백 (각 변 비율)
    constexpr float FACE_CROP_MARGIN = 0.1f;
}
#endif

// ============================================================
// Pimpl 구현 클래스
// ============================================================
class TfLiteEmotionClassifier::Impl {
public:
    bool initialized = false;

    std::string face_detection_file = "face_detection_short_range.tflite";
    std::string emotion_file = "emotion_classifier.tflite";

    float min_detection_confidence = 0.5f;
    int num_threads = 2;

#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
    internal::BlazeFaceDetector face_detector;

    std::unique_ptr<tflite::FlatBufferModel> emotion_model;
    std::unique_ptr<tflite::Interpreter> emotion_interpreter;

    // 모델 입력 형태 [1, H, W, C]
    int input_width = 0;
    int input_height = 0;
    int input_channels = 0;
    TfLiteType input_type = kTfLiteNoType;

    cv::Mat rgb_buffer;
    cv::Mat gray_buffer;
    cv::Mat resized_buffer;

    bool loadAllModels(const std::string& base_path) {
        std::filesystem::path base(base_path);

        if (!face_detector.load((base / face_detection_file).string(), num_threads)) {
            internal::logError("failed to load face detection model: %s",
                               face_detection_file.c_str());
            return false;
        }
        face_detector.setMinConfidence(min_detection_confidence);

        if (!internal::loadModel((base / emotion_file).string(), num_threads,
                                 emotion_model, emotion_interpreter)) {
            internal::logError("failed to load emotion model: %s", emotion_file.c_str());
            return false;
        }

        const TfLiteTensor* input = emotion_interpreter->tensor(emotion_interpreter->inputs()[0]);
        if (!input || !input->dims || input->dims->size != 4) {
            internal::logError("emotion model input must be [1, H, W, C]");
            return false;
        }
        input_height = input->dims->data[1];
        input_width = input->dims->data[2];
        input_channels = input->dims->data[3];
        input_type = input->type;

        if (input_width <= 0 || input_height <= 0 ||
            (input_channels != 1 && input_channels != 3)) {
            internal::logError("unsupported emotion model input shape %dx%dx%d",
                               input_width, input_height, input_channels);
            return false;
        }
        if (input_type != kTfLiteFloat32 && input_type != kTfLiteUInt8) {
            internal::logError("unsupported emotion model input type %d",
                               static_cast<int>(input_type));
            return false;
        }

        const TfLiteTensor* output = emotion_interpreter->tensor(emotion_interpreter->outputs()[0]);
        if (!output || outputCount(*output) < EMOTION_CLASS_COUNT) {
            internal::logError("emotion model must output at least %zu classes",
                               EMOTION_CLASS_COUNT);
            return false;
        }

        return true;
    }

    void releaseAllModels() {
        face_detector.release();
        emotion_interpreter.reset();
        emotion_model.reset();
        input_width = input_height = input_channels = 0;
        input_type = kTfLiteNoType;
    }

    static std::size_t outputCount(const TfLiteTensor& tensor) {
        if (!tensor.dims || tensor.dims->size == 0) {
            return 0;
        }
        std::size_t count = 1;
        for (int d = 0; d < tensor.dims->size; ++d) {
            count *= static_cast<std::size_t>(std::max(tensor.dims->data[d], 0));
        }
        return count;
    }

    /**
     * @brief 그레이스케일 얼굴 이미지를 입력 텐서에 기록
     *
     * 3채널 입력 모델은 회색 값을 세 채널에 복제.
     */
    bool writeInput(const cv::Mat& face_gray) {
        if (input_type == kTfLiteFloat32) {
            float* dst = emotion_interpreter->typed_input_tensor<float>(0);
            if (!dst) return false;
            for (int y = 0; y < input_height; ++y) {
                const uint8_t* row = face_gray.ptr<uint8_t>(y);
                for (int x = 0; x < input_width; ++x) {
                    const float value = static_cast<float>(row[x]) / 255.0f;
                    for (int c = 0; c < input_channels; ++c) {
                        *dst++ = value;
                    }
                }
            }
        } else {
            uint8_t* dst = emotion_interpreter->typed_input_tensor<uint8_t>(0);
            if (!dst) return false;
            for (int y = 0; y < input_height; ++y) {
                const uint8_t* row = face_gray.ptr<uint8_t>(y);
                for (int x = 0; x < input_width; ++x) {
                    for (int c = 0; c < input_channels; ++c) {
                        *dst++ = row[x];
                    }
                }
            }
        }
        return true;
    }

    bool readOutput(std::array<float, EMOTION_CLASS_COUNT>& raw) {
        const TfLiteTensor* output = emotion_interpreter->tensor(emotion_interpreter->outputs()[0]);
        if (!output) return false;

        if (output->type == kTfLiteFloat32) {
            const float* data = emotion_interpreter->typed_output_tensor<float>(0);
            if (!data) return false;
            std::copy(data, data + EMOTION_CLASS_COUNT, raw.begin());
            return true;
        }
        if (output->type == kTfLiteUInt8) {
            const uint8_t* data = emotion_interpreter->typed_output_tensor<uint8_t>(0);
            if (!data) return false;
            const float scale = output->params.scale;
            const int zero_point = output->params.zero_point;
            for (std::size_t i = 0; i < EMOTION_CLASS_COUNT; ++i) {
                raw[i] = scale * static_cast<float>(static_cast<int>(data[i]) - zero_point);
            }
            return true;
        }
        return false;
    }

    std::optional<ClassifierResult> classify(const uint8_t* frame_data, int width, int height,
                                             FrameFormat format) {
        if (!internal::convertToRgb(frame_data, width, height, format, rgb_buffer)) {
            return std::nullopt;
        }

        std::optional<Rect> face_rect = face_detector.detect(rgb_buffer);
        if (!face_rect) {
            return std::nullopt;
        }

        Rect crop_rect{};
        cv::Rect roi = internal::toPixelRoi(*face_rect, rgb_buffer.cols, rgb_buffer.rows,
                                            FACE_CROP_MARGIN, true, crop_rect);
        if (roi.width <= 1 || roi.height <= 1) {
            return std::nullopt;
        }

        // 그레이스케일 + 히스토그램 평활화 + 모델 입력 크기
        cv::cvtColor(rgb_buffer(roi), gray_buffer, cv::COLOR_RGB2GRAY);
        cv::equalizeHist(gray_buffer, gray_buffer);
        cv::resize(gray_buffer, resized_buffer, cv::Size(input_width, input_height),
                   0, 0, cv::INTER_AREA);

        if (!writeInput(resized_buffer)) {
            return std::nullopt;
        }

        if (emotion_interpreter->Invoke() != kTfLiteOk) {
            internal::logWarn("emotion inference failed");
            return std::nullopt;
        }

        std::array<float, EMOTION_CLASS_COUNT> raw{};
        if (!readOutput(raw)) {
            return std::nullopt;
        }

        return makeClassifierResult(normalizeEmotionOutput(raw));
    }
#endif  // AFFECT_SDK_HAS_TFLITE && AFFECT_SDK_HAS_OPENCV
};

// ============================================================
// 생성자/소멸자
// ============================================================

TfLiteEmotionClassifier::TfLiteEmotionClassifier()
    : impl_(std::make_unique<Impl>()) {
}

TfLiteEmotionClassifier::~TfLiteEmotionClassifier() = default;

// ============================================================
// EmotionClassifier 인터페이스 구현
// ============================================================

bool TfLiteEmotionClassifier::initialize(const std::string& model_path) {
    if (impl_->initialized) {
        return false;
    }

    if (!internal::validateModelPath(model_path,
                                     {impl_->face_detection_file, impl_->emotion_file})) {
        internal::logWarn("emotion models not found under '%s'", model_path.c_str());
        return false;
    }

#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
    if (!impl_->loadAllModels(model_path)) {
        impl_->releaseAllModels();
        return false;
    }
    impl_->initialized = true;
    return true;
#else
    internal::logWarn("TFLite emotion classifier requires OpenCV and TensorFlow Lite");
    return false;
#endif
}

std::optional<ClassifierResult> TfLiteEmotionClassifier::classify(const uint8_t* frame_data,
                                                                  int width,
                                                                  int height,
                                                                  FrameFormat format) {
    if (!impl_->initialized || !internal::isValidFrame(frame_data, width, height)) {
        return std::nullopt;
    }

#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
    try {
        return impl_->classify(frame_data, width, height, format);
    } catch (const cv::Exception& e) {
        internal::logWarn("emotion classification failed (OpenCV): %s", e.what());
    } catch (const std::exception& e) {
        internal::logWarn("emotion classification failed: %s", e.what());
    }
#else
    (void)format;
#endif
    return std::nullopt;
}

void TfLiteEmotionClassifier::release() {
#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
    impl_->releaseAllModels();
#endif
    impl_->initialized = false;
}

bool TfLiteEmotionClassifier::isInitialized() const {
    return impl_->initialized;
}

BackendType TfLiteEmotionClassifier::getBackendType() const {
    return BackendType::TfLiteFer;
}

void TfLiteEmotionClassifier::setModelFiles(const std::string& face_detection_model,
                                            const std::string& emotion_model) {
    if (!face_detection_model.empty()) {
        impl_->face_detection_file = face_detection_model;
    }
    if (!emotion_model.empty()) {
        impl_->emotion_file = emotion_model;
    }
}

void TfLiteEmotionClassifier::setMinDetectionConfidence(float confidence) {
    impl_->min_detection_confidence = std::clamp(confidence, 0.0f, 1.0f);
#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)
    impl_->face_detector.setMinConfidence(impl_->min_detection_confidence);
#endif
}

void TfLiteEmotionClassifier::setNumThreads(int num_threads) {
    impl_->num_threads = std::clamp(num_threads, 1, 16);
}

} // namespace affect_sdk
