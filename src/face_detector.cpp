/**
 * @file face_detector.cpp
 * @brief 백엔드 공용 내부 유틸리티 구현
 */

#include "face_detector.h"

#include <algorithm>  // std::clamp
#include <cmath>      // std::exp
#include <cstring>    // std::memcpy
#include <filesystem>

namespace affect_sdk {
namespace internal {

bool validateModelPath(const std::string& model_path,
                       const std::vector<std::string>& model_files) {
    if (model_path.empty()) {
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(model_path, ec)) {
        return false;
    }

    for (const auto& model : model_files) {
        std::filesystem::path model_file = std::filesystem::path(model_path) / model;
        if (!std::filesystem::exists(model_file, ec)) {
            return false;
        }
    }

    return true;
}

bool isValidFrame(const uint8_t* frame_data, int width, int height) {
    return frame_data != nullptr && width > 0 && height > 0;
}

#ifdef AFFECT_SDK_HAS_OPENCV

namespace {

/**
 * @brief FrameFormat -> OpenCV RGB 변환 코드
 * @return -1 이면 변환 불필요, -2 이면 미지원
 */
int getColorConversionCode(FrameFormat format) {
    switch (format) {
        case FrameFormat::RGBA:      return cv::COLOR_RGBA2RGB;
        case FrameFormat::BGRA:      return cv::COLOR_BGRA2RGB;
        case FrameFormat::RGB:       return -1;
        case FrameFormat::BGR:       return cv::COLOR_BGR2RGB;
        case FrameFormat::NV21:      return cv::COLOR_YUV2RGB_NV21;
        case FrameFormat::NV12:      return cv::COLOR_YUV2RGB_NV12;
        case FrameFormat::Grayscale: return cv::COLOR_GRAY2RGB;
    }
    return -2;
}

} // anonymous namespace

bool convertToRgb(const uint8_t* frame_data, int width, int height,
                  FrameFormat format, cv::Mat& output_rgb) {
    if (!isValidFrame(frame_data, width, height)) {
        return false;
    }

    // 데이터 복사 없이 래핑 (읽기 전용으로만 사용)
    uint8_t* data = const_cast<uint8_t*>(frame_data);
    cv::Mat input_mat;

    switch (format) {
        case FrameFormat::RGBA:
        case FrameFormat::BGRA:
            input_mat = cv::Mat(height, width, CV_8UC4, data);
            break;
        case FrameFormat::RGB:
        case FrameFormat::BGR:
            input_mat = cv::Mat(height, width, CV_8UC3, data);
            break;
        case FrameFormat::NV21:
        case FrameFormat::NV12:
            // YUV 420 semi-planar: Y 평면 + 절반 높이 UV 평면
            input_mat = cv::Mat(height + height / 2, width, CV_8UC1, data);
            break;
        case FrameFormat::Grayscale:
            input_mat = cv::Mat(height, width, CV_8UC1, data);
            break;
        default:
            return false;
    }

    int conversion_code = getColorConversionCode(format);
    if (conversion_code == -1) {
        output_rgb = input_mat;
    } else if (conversion_code >= 0) {
        cv::cvtColor(input_mat, output_rgb, conversion_code);
    } else {
        return false;
    }

    return !output_rgb.empty();
}

cv::Rect toPixelRoi(const Rect& normalized, int image_width, int image_height,
                    float margin, bool square, Rect& clipped) {
    float min_x = normalized.x - normalized.width * margin;
    float min_y = normalized.y - normalized.height * margin;
    float max_x = normalized.x + normalized.width * (1.0f + margin);
    float max_y = normalized.y + normalized.height * (1.0f + margin);

    if (square) {
        // 픽셀 기준 긴 변에 맞춤
        float center_x = (min_x + max_x) / 2.0f;
        float center_y = (min_y + max_y) / 2.0f;
        float size_px = std::max((max_x - min_x) * image_width,
                                 (max_y - min_y) * image_height);
        float half_w = size_px / 2.0f / static_cast<float>(image_width);
        float half_h = size_px / 2.0f / static_cast<float>(image_height);
        min_x = center_x - half_w;
        max_x = center_x + half_w;
        min_y = center_y - half_h;
        max_y = center_y + half_h;
    }

    min_x = std::clamp(min_x, 0.0f, 1.0f);
    min_y = std::clamp(min_y, 0.0f, 1.0f);
    max_x = std::clamp(max_x, 0.0f, 1.0f);
    max_y = std::clamp(max_y, 0.0f, 1.0f);

    int px_min_x = std::clamp(static_cast<int>(min_x * image_width), 0, image_width - 1);
    int px_min_y = std::clamp(static_cast<int>(min_y * image_height), 0, image_height - 1);
    int px_max_x = std::clamp(static_cast<int>(max_x * image_width), px_min_x, image_width);
    int px_max_y = std::clamp(static_cast<int>(max_y * image_height), px_min_y, image_height);

    cv::Rect roi(px_min_x, px_min_y, px_max_x - px_min_x, px_max_y - px_min_y);

    // 실제 픽셀 ROI 기준으로 정규화 좌표 재계산 (좌표 복원 시 사용)
    clipped.x = static_cast<float>(roi.x) / static_cast<float>(image_width);
    clipped.y = static_cast<float>(roi.y) / static_cast<float>(image_height);
    clipped.width = static_cast<float>(roi.width) / static_cast<float>(image_width);
    clipped.height = static_cast<float>(roi.height) / static_cast<float>(image_height);

    return roi;
}

#endif  // AFFECT_SDK_HAS_OPENCV

#ifdef AFFECT_SDK_HAS_TFLITE

bool loadModel(const std::string& model_file,
               int num_threads,
               std::unique_ptr<tflite::FlatBufferModel>& model,
               std::unique_ptr<tflite::Interpreter>& interpreter) {
    model = tflite::FlatBufferModel::BuildFromFile(model_file.c_str());
    if (!model) {
        return false;
    }

    tflite::ops::builtin::BuiltinOpResolver resolver;
    tflite::InterpreterBuilder builder(*model, resolver);
    builder.SetNumThreads(num_threads);

    if (builder(&interpreter) != kTfLiteOk || !interpreter) {
        model.reset();
        return false;
    }

    if (interpreter->AllocateTensors() != kTfLiteOk) {
        interpreter.reset();
        model.reset();
        return false;
    }

    if (interpreter->inputs().empty() || interpreter->outputs().empty()) {
        interpreter.reset();
        model.reset();
        return false;
    }

    return true;
}

float sigmoid(float x) {
    return 1.0f / (1.0f + std::exp(-x));
}

#endif  // AFFECT_SDK_HAS_TFLITE

#if defined(AFFECT_SDK_HAS_TFLITE) && defined(AFFECT_SDK_HAS_OPENCV)

// ============================================================
// BlazeFaceDetector
// ============================================================

bool BlazeFaceDetector::load(const std::string& model_file, int num_threads) {
    release();
    if (!loadModel(model_file, num_threads, model_, interpreter_)) {
        return false;
    }
    generateAnchors();
    return true;
}

void BlazeFaceDetector::release() {
    interpreter_.reset();
    model_.reset();
    anchors_.clear();
}

/**
 * MediaPipe BlazeFace short range 앵커 구성:
 * - 16x16 feature map (stride 8), 셀당 2개
 * - 8x8 feature map (stride 16), 셀당 6개
 * 앵커 크기는 고정 (1.0) 이므로 중심만 보관
 */
void BlazeFaceDetector::generateAnchors() {
    anchors_.clear();

    struct AnchorOption {
        int feature_map_size;
        int num_anchors;
        float stride;
    };

    const AnchorOption options[] = {
        {16, 2, 8.0f},
        {8, 6, 16.0f}
    };

    const float input_size = static_cast<float>(INPUT_WIDTH);

    for (const auto& opt : options) {
        for (int y = 0; y < opt.feature_map_size; ++y) {
            for (int x = 0; x < opt.feature_map_size; ++x) {
                float x_center = (static_cast<float>(x) + 0.5f) * opt.stride / input_size;
                float y_center = (static_cast<float>(y) + 0.5f) * opt.stride / input_size;
                for (int n = 0; n < opt.num_anchors; ++n) {
                    anchors_.push_back(Anchor{x_center, y_center});
                }
            }
        }
    }
}

/**
 * BlazeFace 출력 구조:
 * - Output 0 (regressors): [1, num_anchors, 16]  xc, yc, w, h + 6 키포인트
 * - Output 1 (classificators): [1, num_anchors, 1]  logit
 */
std::optional<Rect> BlazeFaceDetector::detect(const cv::Mat& rgb, float* confidence) {
    if (!interpreter_ || rgb.empty()) {
        return std::nullopt;
    }

    // 전처리: 128x128 리사이즈 + [0, 1] 정규화
    cv::resize(rgb, resized_buffer_, cv::Size(INPUT_WIDTH, INPUT_HEIGHT),
               0, 0, cv::INTER_LINEAR);
    resized_buffer_.convertTo(float_buffer_, CV_32FC3, 1.0 / 255.0);

    float* input_tensor = interpreter_->typed_input_tensor<float>(0);
    if (!input_tensor) {
        return std::nullopt;
    }

    const std::size_t row_bytes = static_cast<std::size_t>(INPUT_WIDTH) * 3 * sizeof(float);
    if (float_buffer_.isContinuous()) {
        std::memcpy(input_tensor, float_buffer_.ptr<float>(), row_bytes * INPUT_HEIGHT);
    } else {
        float* dst = input_tensor;
        for (int y = 0; y < INPUT_HEIGHT; ++y) {
            std::memcpy(dst, float_buffer_.ptr<float>(y), row_bytes);
            dst += INPUT_WIDTH * 3;
        }
    }

    if (interpreter_->Invoke() != kTfLiteOk) {
        return std::nullopt;
    }

    const TfLiteTensor* boxes_tensor = interpreter_->tensor(interpreter_->outputs()[0]);
    const float* boxes_data = interpreter_->typed_output_tensor<float>(0);
    if (!boxes_tensor || !boxes_data || !boxes_tensor->dims) {
        return std::nullopt;
    }

    const int num_dims = boxes_tensor->dims->size;
    int num_anchors = 0;
    int box_stride = 16;
    if (num_dims == 3) {
        num_anchors = boxes_tensor->dims->data[1];
        box_stride = boxes_tensor->dims->data[2];
    } else if (num_dims == 2) {
        num_anchors = boxes_tensor->dims->data[0];
        box_stride = boxes_tensor->dims->data[1];
    }
    if (num_anchors <= 0 || box_stride < 4) {
        return std::nullopt;
    }

    const float* scores_data = nullptr;
    if (interpreter_->outputs().size() >= 2) {
        scores_data = interpreter_->typed_output_tensor<float>(1);
    }
    if (!scores_data) {
        return std::nullopt;
    }

    const int effective_anchors = std::min(num_anchors, static_cast<int>(anchors_.size()));

    float best_score = 0.0f;
    int best_idx = -1;
    for (int i = 0; i < effective_anchors; ++i) {
        float score = sigmoid(scores_data[i]);
        if (score > best_score && score >= min_confidence_) {
            best_score = score;
            best_idx = i;
        }
    }

    if (best_idx < 0) {
        return std::nullopt;
    }

    const Anchor& anchor = anchors_[static_cast<std::size_t>(best_idx)];
    const float* box = boxes_data + static_cast<std::size_t>(best_idx) * box_stride;

    // 오프셋은 입력 크기 기준 픽셀 단위
    const float input_size = static_cast<float>(INPUT_WIDTH);
    float cx = anchor.x_center + box[0] / input_size;
    float cy = anchor.y_center + box[1] / input_size;
    float w = box[2] / input_size;
    float h = box[3] / input_size;

    if (!(w > 0.0f) || !(h > 0.0f)) {
        return std::nullopt;
    }

    Rect face_rect{};
    face_rect.x = std::clamp(cx - w / 2.0f, 0.0f, 1.0f);
    face_rect.y = std::clamp(cy - h / 2.0f, 0.0f, 1.0f);
    face_rect.width = std::clamp(w, 0.0f, 1.0f - face_rect.x);
    face_rect.height = std::clamp(h, 0.0f, 1.0f - face_rect.y);

    if (face_rect.width <= 0.0f || face_rect.height <= 0.0f) {
        return std::nullopt;
    }

    if (confidence) {
        *confidence = best_score;
    }
    return face_rect;
}

#endif  // AFFECT_SDK_HAS_TFLITE && AFFECT_SDK_HAS_OPENCV

} // namespace internal
} // namespace affect_sdk
