/**
 * @file config.h
 * @brief 파이프라인 설정 구조체 및 설정 파일 로더
 *
 * 임계값과 가중치는 라벨 데이터로 재보정될 수 있도록 모두 설정값으로 노출.
 * 기본값은 운영 중인 서비스의 값과 동일.
 */

#ifndef AFFECT_SDK_CONFIG_H
#define AFFECT_SDK_CONFIG_H

#include <string>

#include "affect_sdk/export.h"

namespace affect_sdk {

/**
 * @brief 미세 신호 분석기 설정
 */
struct AnalyzerConfig {
    // 눈썹 올림: (눈썹-눈 거리) / 얼굴 높이
    float eyebrow_raise_threshold = 0.08f;  ///< 검출 임계값
    float eyebrow_raise_range = 0.04f;      ///< 임계값 초과분이 이 값이면 강도 1.0
    float eyebrow_raise_confidence = 0.85f;

    // 입술 압박: 입술 간격 / 입 너비
    float lip_press_threshold = 0.08f;
    float lip_press_confidence = 0.80f;

    // 깜빡임: EAR (eye aspect ratio)
    float blink_ear_threshold = 0.20f;      ///< 이 값 미만이면 깜빡임 프레임
    float blink_rate_elevated = 25.0f;      ///< 분당 깜빡임 검출 임계값 (정상 15~20)
    float blink_rate_normalizer = 50.0f;    ///< 강도 정규화 기준 (분당)
    float blink_confidence = 0.70f;

    // 눈 크게 뜨기: EAR
    float eye_widening_threshold = 0.35f;
    float eye_widening_baseline = 0.25f;    ///< 평상시 EAR
    float eye_widening_range = 0.15f;
    float eye_widening_confidence = 0.88f;

    // 턱 긴장: 턱 높이 / 턱 너비
    float jaw_tension_threshold = 0.65f;
    float jaw_tension_range = 0.15f;
    float jaw_tension_confidence = 0.75f;

    // 미소: 입꼬리 상승량 (픽셀)
    float micro_smile_lift_px = 2.0f;
    float micro_smile_full_lift_px = 10.0f; ///< 이 상승량에서 강도 1.0
    float micro_smile_confidence = 0.82f;
};

/**
 * @brief 퓨전 엔진 설정
 *
 * 각 가중치 묶음은 합이 1.0 이어야 함 (아니면 엔진이 정규화).
 */
struct FusionConfig {
    // 스트레스 = lip * w + jaw * w + blink_norm * w
    float stress_lip_press_weight = 0.3f;
    float stress_jaw_tension_weight = 0.3f;
    float stress_blink_rate_weight = 0.4f;

    // 불안 = eye_widening * w + eyebrow * w + lip * w
    float anxiety_eye_widening_weight = 0.4f;
    float anxiety_eyebrow_raise_weight = 0.3f;
    float anxiety_lip_press_weight = 0.3f;

    // 참여도
    float engagement_baseline = 0.7f;
    float engagement_smile_boost = 0.15f;
    float engagement_eyebrow_boost = 0.15f;
    float high_engagement_threshold = 0.8f;

    // 감정 보정 규칙
    float stress_override_threshold = 0.7f;
    float anxiety_override_threshold = 0.7f;

    // 결합 신뢰도
    float classifier_weight = 0.6f;         ///< 나머지는 미세 신호 가중치
    float neutral_micro_confidence = 0.5f;  ///< 검출된 신호가 없을 때
    float fallback_confidence = 0.5f;       ///< 분류기 실패 시 neutral 신뢰도

    // 스트레스 구간
    float stress_moderate_threshold = 0.3f;
    float stress_elevated_threshold = 0.7f;
};

/**
 * @brief 세션 파이프라인 설정 (시작 시 1회 주입)
 */
struct PipelineConfig {
    std::string model_path;     ///< 모델 디렉토리 경로

    std::string face_detection_model = "face_detection_short_range.tflite";
    std::string face_landmark_model = "face_landmark.tflite";
    std::string emotion_model = "emotion_classifier.tflite";

    float target_fps = 7.0f;        ///< 호출자 목표 주기 (깜빡임 외삽에도 사용)
    int num_threads = 2;            ///< 세션당 TFLite 추론 스레드 수
    float min_detection_confidence = 0.5f;
    bool enable_logging = true;     ///< stderr 로그 출력 여부

    AnalyzerConfig analyzer;
    FusionConfig fusion;
};

/**
 * @brief JSON 설정 파일 로드
 *
 * 파일에 존재하는 키만 덮어쓰며 알 수 없는 키는 무시함.
 * 예시:
 * @code
 * {
 *   "model_path": "models/",
 *   "target_fps": 7,
 *   "analyzer": { "blink_ear_threshold": 0.21 },
 *   "fusion": { "stress_override_threshold": 0.75 }
 * }
 * @endcode
 *
 * @param path 설정 파일 경로
 * @param config 입출력 설정 (실패 시 변경되지 않음)
 * @param error 실패 사유 (nullptr 허용)
 * @return 로드 성공 여부
 */
AFFECT_SDK_EXPORT bool loadPipelineConfig(const std::string& path,
                                          PipelineConfig& config,
                                          std::string* error = nullptr);

/**
 * @brief JSON 문자열에서 설정 로드
 * @see loadPipelineConfig
 */
AFFECT_SDK_EXPORT bool parsePipelineConfig(const std::string& json_text,
                                           PipelineConfig& config,
                                           std::string* error = nullptr);

/**
 * @brief 설정값 검증
 *
 * 음수 임계값, 0 이하 fps, 0 이하 범위값, 합이 0 인 가중치 묶음 등을 거부.
 *
 * @param config 검증할 설정
 * @param error 실패 사유 (nullptr 허용)
 * @return 유효 여부
 */
AFFECT_SDK_EXPORT bool validatePipelineConfig(const PipelineConfig& config,
                                              std::string* error = nullptr);

/// AnalyzerConfig 검증 (임계값/범위 양수, 신뢰도 [0,1])
AFFECT_SDK_EXPORT bool validateAnalyzerConfig(const AnalyzerConfig& config,
                                              std::string* error = nullptr);

/// FusionConfig 검증 (가중치 합 양수, 점수/임계값 [0,1])
AFFECT_SDK_EXPORT bool validateFusionConfig(const FusionConfig& config,
                                            std::string* error = nullptr);

} // namespace affect_sdk

#endif // AFFECT_SDK_CONFIG_H
