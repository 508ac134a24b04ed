/**
 * @file types.h
 * @brief AffectSDK 핵심 데이터 타입 정의
 *
 * 랜드마크, 미세 신호, 분류기 결과, 프레임 분석 레코드,
 * 세션 요약 등 파이프라인 전 단계에서 공유하는 데이터 구조체 정의.
 */

#ifndef AFFECT_SDK_TYPES_H
#define AFFECT_SDK_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "affect_sdk/export.h"

namespace affect_sdk {

// ============================================================
// 상수
// ============================================================

/// MediaPipe Face Mesh 랜드마크 개수
constexpr int FACE_LANDMARK_COUNT = 468;

/// 분류기 어휘 크기 (angry ~ neutral)
constexpr std::size_t EMOTION_CLASS_COUNT = 7;

/// 미세 신호 종류 개수
constexpr std::size_t SIGNAL_TYPE_COUNT = 6;

// ============================================================
// 열거형 정의
// ============================================================

/**
 * @brief 프레임 포맷 열거형
 * 입력 이미지의 픽셀 포맷
 */
enum class FrameFormat : int {
    RGBA = 0,       ///< 32비트 RGBA
    BGRA = 1,       ///< 32비트 BGRA
    RGB = 2,        ///< 24비트 RGB
    BGR = 3,        ///< 24비트 BGR
    NV21 = 4,       ///< Android 카메라 YUV 포맷
    NV12 = 5,       ///< iOS 카메라 YUV 포맷
    Grayscale = 6   ///< 8비트 그레이스케일
};

/**
 * @brief 에러 코드 열거형
 * SDK 작업 결과 상태
 */
enum class ErrorCode : int {
    // 성공
    Success = 0,

    // 100번대: 초기화 에러
    NotInitialized = 100,       ///< 백엔드 초기화되지 않음
    AlreadyInitialized = 101,   ///< 이미 초기화됨
    ModelLoadFailed = 102,      ///< 모델 로드 실패
    InvalidPath = 103,          ///< 잘못된 경로
    ConfigParseFailed = 104,    ///< 설정 파일 파싱 실패

    // 200번대: 파라미터 에러
    InvalidParameter = 200,         ///< 잘못된 파라미터
    NullPointer = 201,              ///< 널 포인터
    FrameFormatUnsupported = 202,   ///< 지원하지 않는 프레임 포맷

    // 300번대: 검출 에러
    DetectionFailed = 300,      ///< 검출 실패
    NoFaceDetected = 301,       ///< 얼굴 미검출

    // 500번대: 세션 API 오용
    SessionNotFound = 500,      ///< 시작되지 않은 세션
    SessionAlreadyActive = 501, ///< 추적 중인 세션에 대한 중복 시작
    SessionNotTracking = 502,   ///< 정지된 세션에 프레임 입력

    // 일반 에러
    Unknown = 999               ///< 알 수 없는 에러
};

/**
 * @brief 랜드마크/분류기 백엔드 종류
 */
enum class BackendType : int {
    Unknown = 0,    ///< 알 수 없음 (테스트용 Mock 포함)
    MediaPipe = 1,  ///< MediaPipe Face Detection + Face Mesh (TFLite)
    TfLiteFer = 2   ///< FER 계열 표정 분류 모델 (TFLite)
};

/**
 * @brief 감정 레이블
 *
 * Angry ~ Neutral 은 분류기 어휘 (모델 출력 순서와 동일).
 * Stressed, Anxious 는 퓨전 엔진의 보정 규칙으로만 생성됨.
 */
enum class Emotion : int {
    Angry = 0,
    Disgust = 1,
    Fear = 2,
    Happy = 3,
    Sad = 4,
    Surprise = 5,
    Neutral = 6,
    Stressed = 7,
    Anxious = 8
};

/**
 * @brief 미세 신호 종류
 */
enum class SignalType : int {
    EyebrowRaise = 0,
    LipPress = 1,
    BlinkRate = 2,
    EyeWidening = 3,
    JawTension = 4,
    MicroSmile = 5
};

/**
 * @brief 미소 분류
 * Duchenne 판정은 다중 프레임 눈가 추적이 없어 항상 Social 로 보고됨
 */
enum class SmileType : int {
    None = 0,
    Social = 1,
    Duchenne = 2
};

/**
 * @brief 미세 신호 계산 상태
 */
enum class SignalStatus : int {
    Ok = 0,          ///< 계산 성공 (강도가 0일 수도 있음)
    Unavailable = 1  ///< 기하 정보 부족/비정상으로 계산 불가
};

/**
 * @brief 스트레스 구간
 */
enum class StressLevel : int {
    Low = 0,
    Moderate = 1,
    Elevated = 2
};

/**
 * @brief 세션 상태 머신
 */
enum class SessionStatus : int {
    Uninitialized = 0,
    Tracking = 1,
    Stopped = 2
};

// ============================================================
// 기본 데이터 구조체
// ============================================================

/**
 * @brief 3D 랜드마크 좌표
 * x, y 는 픽셀 좌표, z 는 상대 깊이
 */
struct Landmark3D {
    float x;    ///< X 좌표 (픽셀)
    float y;    ///< Y 좌표 (픽셀)
    float z;    ///< 상대 깊이
};

/**
 * @brief 사각형 영역 (정규화 좌표)
 */
struct Rect {
    float x;        ///< 좌상단 X 좌표
    float y;        ///< 좌상단 Y 좌표
    float width;    ///< 너비
    float height;   ///< 높이
};

/**
 * @brief 얼굴 랜드마크 집합
 *
 * 항상 468개 전체가 채워진 상태로만 존재함.
 * 얼굴 미검출은 std::optional<LandmarkSet> 의 부재로 표현.
 */
struct LandmarkSet {
    std::array<Landmark3D, FACE_LANDMARK_COUNT> points{};

    const Landmark3D& operator[](int index) const { return points[static_cast<std::size_t>(index)]; }
    Landmark3D& operator[](int index) { return points[static_cast<std::size_t>(index)]; }
};

/**
 * @brief 단일 미세 신호
 */
struct MicroSignal {
    bool detected = false;          ///< 검출 여부
    float intensity = 0.0f;         ///< 강도 (0.0~1.0)
    float confidence = 0.0f;        ///< 신뢰도 (0.0~1.0)
    float rate_per_minute = 0.0f;   ///< 분당 횟수 (BlinkRate 전용)
    SmileType smile_type = SmileType::None; ///< 미소 분류 (MicroSmile 전용)
};

/**
 * @brief 미세 신호 계산 결과 (Ok | Unavailable)
 *
 * "계산 실패"와 "정상 계산 결과가 낮은 강도"를 구분하기 위한 태그 타입.
 */
struct SignalReading {
    SignalStatus status = SignalStatus::Unavailable;
    MicroSignal signal;

    bool ok() const noexcept { return status == SignalStatus::Ok; }

    /// Unavailable 이면 detected=false, intensity=0, confidence=0 으로 강등
    MicroSignal valueOrDefault() const noexcept { return ok() ? signal : MicroSignal{}; }

    static SignalReading fromSignal(const MicroSignal& value) {
        SignalReading reading;
        reading.status = SignalStatus::Ok;
        reading.signal = value;
        return reading;
    }

    static SignalReading unavailable() { return SignalReading{}; }
};

/**
 * @brief 프레임당 미세 신호 묶음 (SignalType 순서로 인덱싱)
 */
struct MicroSignalSet {
    std::array<SignalReading, SIGNAL_TYPE_COUNT> readings{};

    const SignalReading& operator[](SignalType type) const {
        return readings[static_cast<std::size_t>(type)];
    }
    SignalReading& operator[](SignalType type) {
        return readings[static_cast<std::size_t>(type)];
    }

    /// 강등된 값 조회 (Unavailable -> 기본값)
    MicroSignal value(SignalType type) const { return (*this)[type].valueOrDefault(); }
};

/**
 * @brief 표정 분류기 결과
 */
struct ClassifierResult {
    Emotion dominant_emotion = Emotion::Neutral;
    float confidence = 0.0f;
    std::map<Emotion, float> probabilities;  ///< 합계 약 1.0
};

/**
 * @brief 감정 분석 그룹 (보정된 대표 감정)
 */
struct EmotionAnalysis {
    Emotion dominant_emotion = Emotion::Neutral;
    float confidence = 0.0f;                    ///< 결합 신뢰도
    std::map<Emotion, float> probabilities;     ///< 분류기 확률 (실패 시 비어 있음)
};

/**
 * @brief 복합 점수 (모두 0.0~1.0)
 */
struct CompositeScores {
    float stress_score = 0.0f;
    float anxiety_score = 0.0f;
    float engagement_score = 0.0f;
    float overall_confidence = 0.0f;
};

/**
 * @brief 검토자용 임상 참고 정보 (진단 아님)
 */
struct ClinicalInsights {
    Emotion primary_state = Emotion::Neutral;
    StressLevel stress_level = StressLevel::Low;
    std::vector<std::string> anxiety_indicators;
    std::vector<std::string> positive_indicators;
};

/**
 * @brief 프레임 단위 퓨전 결과
 *
 * face_detected 가 false 이면 나머지 그룹은 기본값이며 직렬화되지 않음.
 */
struct FrameAnalysis {
    double timestamp = 0.0;         ///< 세션 기준 시각 (초)
    bool face_detected = false;
    EmotionAnalysis emotion_analysis;
    std::map<SignalType, MicroSignal> micro_expressions;  ///< 검출된 신호만
    CompositeScores composite_scores;
    ClinicalInsights clinical_insights;
};

/**
 * @brief 세션 요약 (요청 시 계산되는 읽기 전용 뷰)
 */
struct SessionSummary {
    std::string session_id;
    std::string started_at;                     ///< ISO-8601 UTC
    double duration_seconds = 0.0;
    std::size_t total_frames_analyzed = 0;      ///< 얼굴 검출 프레임 수
    std::size_t frames_received = 0;            ///< 미검출 포함 전체 프레임 수
    std::map<Emotion, float> emotion_distribution;
    float avg_stress_score = 0.0f;
    float avg_anxiety_score = 0.0f;
    float avg_engagement_score = 0.0f;
    Emotion predominant_emotion = Emotion::Neutral;
};

// ============================================================
// 문자열 변환
// ============================================================

/// 감정 레이블 문자열 ("angry", ..., "stressed", "anxious")
AFFECT_SDK_EXPORT const char* emotionToString(Emotion emotion);

/// 문자열 -> 감정 (대소문자 무시). 알 수 없으면 false
AFFECT_SDK_EXPORT bool emotionFromString(const std::string& name, Emotion& out);

/// 분류기 출력 인덱스 -> 감정 (범위 밖이면 Neutral)
AFFECT_SDK_EXPORT Emotion emotionFromClassIndex(std::size_t index);

/// 미세 신호 이름 ("eyebrow_raise", "lip_press", ...)
AFFECT_SDK_EXPORT const char* signalTypeToString(SignalType type);

/// 스트레스 구간 이름 ("low", "moderate", "elevated")
AFFECT_SDK_EXPORT const char* stressLevelToString(StressLevel level);

/// 미소 분류 이름 ("none", "social", "duchenne")
AFFECT_SDK_EXPORT const char* smileTypeToString(SmileType type);

/// 세션 상태 이름 ("uninitialized", "tracking", "stopped")
AFFECT_SDK_EXPORT const char* sessionStatusToString(SessionStatus status);

/// 에러 코드 설명 문자열
AFFECT_SDK_EXPORT const char* errorCodeToString(ErrorCode code);

} // namespace affect_sdk

#endif // AFFECT_SDK_TYPES_H
