/**
 * @file session_pipeline.h
 * @brief 세션 단위 감정 분석 파이프라인 선언
 *
 * 세션 ID 별로 독립된 상태(프레임 기록, 시간 이력, 백엔드 인스턴스)를 보관하는
 * 레지스트리. 전역 상태 없이 호출 측 서비스가 소유하여 주입함.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "affect_sdk/config.h"
#include "affect_sdk/emotion_classifier.h"
#include "affect_sdk/landmark_extractor.h"
#include "affect_sdk/export.h"
#include "affect_sdk/types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace affect_sdk {

/**
 * @brief 프레임 처리 결과
 */
struct AFFECT_SDK_EXPORT ProcessResult {
    bool success = false;               ///< 처리 성공 여부 (얼굴 미검출도 성공)
    FrameAnalysis analysis;             ///< 프레임 분석 레코드
    ErrorCode error_code = ErrorCode::Success; ///< 에러 코드
    float processing_time_ms = 0.0f;    ///< 총 처리 시간 (밀리초)
    float landmark_time_ms = 0.0f;      ///< 랜드마크 추출 시간 (밀리초)
    float classify_time_ms = 0.0f;      ///< 표정 분류 시간 (밀리초)
    float analysis_time_ms = 0.0f;      ///< 기하 분석 + 퓨전 시간 (밀리초)
};

/**
 * @brief 세션 요약 조회 결과
 *
 * success 이면서 summary 가 비어 있으면 얼굴 검출 프레임이 아직 없음.
 */
struct AFFECT_SDK_EXPORT SummaryResult {
    bool success = false;
    ErrorCode error_code = ErrorCode::Success;
    std::optional<SessionSummary> summary;
};

/**
 * @brief 파이프라인 상태 (진단용)
 */
struct AFFECT_SDK_EXPORT PipelineStatus {
    bool available = false;             ///< 기본 백엔드로 세션 시작 가능 여부
    bool opencv_enabled = false;        ///< OpenCV 백엔드 컴파일 여부
    bool tflite_enabled = false;        ///< TFLite 백엔드 컴파일 여부
    bool models_present = false;        ///< 모델 파일 존재 여부
    bool custom_backends = false;       ///< 팩토리가 주입되었는지 여부
    std::size_t active_sessions = 0;    ///< Tracking 상태 세션 수
    std::size_t stored_sessions = 0;    ///< Stopped 포함 보관 중인 세션 수
    float target_fps = 0.0f;
};

/**
 * @brief 세션 파이프라인
 *
 * 세션 상태 머신: Uninitialized -> Tracking -> Stopped
 *
 * - start(): 추적 중인 세션 ID 로 다시 시작하면 SessionAlreadyActive 로 거부.
 *   Stopped 상태의 세션은 새 상태로 교체됨.
 * - processFrame(): Tracking 상태에서만 허용. 랜드마크 -> 분류 -> 기하 분석 -> 퓨전.
 * - summarize(): Tracking/Stopped 에서 허용. 매번 새로 계산.
 * - stop(): Stopped 로 전환하고 최종 요약 반환. 상태는 discard() 까지 유지.
 *
 * @note Pimpl 패턴으로 구현 세부사항 은닉
 * @note 스레드 안전: 서로 다른 세션은 병렬 처리 가능하며,
 *       동일 세션의 호출은 세션별 뮤텍스로 직렬화됨
 *
 * 사용 예시:
 * @code
 * PipelineConfig config;
 * config.model_path = "models/";
 * SessionPipeline pipeline(config);
 *
 * pipeline.start("S1");
 * ProcessResult result = pipeline.processFrame("S1", frame_data, width, height,
 *                                              FrameFormat::BGR, 1.25);
 * if (result.success && result.analysis.face_detected) {
 *     // result.analysis.composite_scores.stress_score ...
 * }
 * SummaryResult final_summary = pipeline.stop("S1");
 * pipeline.discard("S1");
 * @endcode
 */
class AFFECT_SDK_EXPORT SessionPipeline {
public:
    explicit SessionPipeline(const PipelineConfig& config = PipelineConfig{});
    ~SessionPipeline();

    // 복사/이동 금지 (세션 레지스트리 소유)
    SessionPipeline(const SessionPipeline&) = delete;
    SessionPipeline& operator=(const SessionPipeline&) = delete;
    SessionPipeline(SessionPipeline&&) = delete;
    SessionPipeline& operator=(SessionPipeline&&) = delete;

    // ========================================
    // 백엔드 주입
    // ========================================

    /**
     * @brief 랜드마크 추출기 팩토리 교체
     *
     * 이후 시작되는 세션부터 적용. nullptr 이면 기본(MediaPipe) 팩토리 복원.
     */
    void setLandmarkExtractorFactory(LandmarkExtractorFactory factory);

    /**
     * @brief 표정 분류기 팩토리 교체
     *
     * 이후 시작되는 세션부터 적용. nullptr 이면 기본(TFLite) 팩토리 복원.
     */
    void setEmotionClassifierFactory(EmotionClassifierFactory factory);

    // ========================================
    // 세션 수명
    // ========================================

    /**
     * @brief 세션 추적 시작
     *
     * @param session_id 세션 식별자 (빈 문자열 불가)
     * @return Success, SessionAlreadyActive, InvalidParameter, ModelLoadFailed
     */
    ErrorCode start(const std::string& session_id);

    /**
     * @brief 세션 추적 정지
     *
     * @param session_id 세션 식별자
     * @return 최종 요약 (미존재 세션이면 SessionNotFound)
     */
    SummaryResult stop(const std::string& session_id);

    /**
     * @brief 세션 상태 폐기
     *
     * 추적 중인 세션도 폐기 가능 (진행 중인 프레임 처리 완료 후 폐기).
     *
     * @return Success 또는 SessionNotFound
     */
    ErrorCode discard(const std::string& session_id);

    /**
     * @brief 세션 상태 조회
     * @return 미존재 세션이면 Uninitialized
     */
    SessionStatus status(const std::string& session_id) const;

    // ========================================
    // 프레임 처리
    // ========================================

    /**
     * @brief 프레임 처리
     *
     * 얼굴 미검출은 success = true, analysis.face_detected = false.
     * 타임스탬프 역행은 허용되며 그대로 저장됨.
     *
     * @param session_id 세션 식별자
     * @param frame_data 프레임 데이터 (읽기 전용)
     * @param width 프레임 너비
     * @param height 프레임 높이
     * @param format 픽셀 포맷
     * @param timestamp 세션 기준 시각 (초)
     * @return 처리 결과
     */
    ProcessResult processFrame(const std::string& session_id,
                               const uint8_t* frame_data,
                               int width,
                               int height,
                               FrameFormat format,
                               double timestamp);

    /**
     * @brief 프레임 처리 (타임스탬프 자동)
     *
     * 시각 = 지금까지의 얼굴 검출 프레임 수 / target_fps
     */
    ProcessResult processFrame(const std::string& session_id,
                               const uint8_t* frame_data,
                               int width,
                               int height,
                               FrameFormat format);

    /**
     * @brief cv::Mat 프레임 처리
     *
     * BGR/BGRA/Grayscale Mat 지원. OpenCV 미포함 빌드에서는 FrameFormatUnsupported.
     */
    ProcessResult processFrame(const std::string& session_id,
                               const cv::Mat& frame,
                               double timestamp);

    /**
     * @brief 단일 프레임 일회성 분석
     *
     * 임시 세션 상태와 임시 백엔드로 분석하며 레지스트리에 남기지 않음.
     */
    ProcessResult analyzeOnce(const uint8_t* frame_data,
                              int width,
                              int height,
                              FrameFormat format);

    // ========================================
    // 조회
    // ========================================

    /**
     * @brief 세션 요약 계산
     *
     * 얼굴 검출 프레임이 없으면 success = true, summary = nullopt.
     */
    SummaryResult summarize(const std::string& session_id) const;

    /**
     * @brief 최근 얼굴 검출 프레임 (최대 10개, 오래된 순)
     * @return 미존재 세션이면 빈 벡터
     */
    std::vector<FrameAnalysis> recentFrames(const std::string& session_id) const;

    /**
     * @brief 세션의 전체 프레임 기록 복사본 (미검출 프레임 포함)
     */
    std::vector<FrameAnalysis> frames(const std::string& session_id) const;

    /// Tracking 상태 세션 수
    std::size_t activeSessionCount() const;

    /// 파이프라인 진단 정보
    PipelineStatus getStatus() const;

    const PipelineConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief 실시간 피드백 한 줄 포맷
 *
 * 예: "12.3s | HAPPY (0.81) | Stress: 0.12 | Anxiety: 0.05"
 * 얼굴 미검출 프레임: "12.3s | no face"
 */
AFFECT_SDK_EXPORT std::string formatLiveFeedback(const FrameAnalysis& analysis);

/**
 * @brief 프레임 기록에서 요약 계산
 *
 * 얼굴 검출 프레임만 집계. 기간은 마지막 검출 프레임의 시각.
 * 대표 감정 동률은 감정 열거 순서가 빠른 쪽.
 *
 * @return 검출 프레임이 없으면 nullopt
 */
AFFECT_SDK_EXPORT std::optional<SessionSummary> summarizeFrames(
    const std::vector<FrameAnalysis>& frames);

} // namespace affect_sdk
