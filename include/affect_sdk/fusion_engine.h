/**
 * @file fusion_engine.h
 * @brief 분류기 출력과 기하 미세 신호를 결합하는 퓨전 엔진 선언
 */

#pragma once

#include <optional>

#include "affect_sdk/config.h"
#include "affect_sdk/types.h"

namespace affect_sdk {

/**
 * @brief 퓨전 엔진
 *
 * 상태 없음. 동일한 입력에 대해 항상 동일한 결과 (보정 규칙 포함).
 *
 * 사용 예시:
 * @code
 * FusionEngine engine;
 * FrameAnalysis analysis = engine.fuse(classifier_result, signals, timestamp);
 * @endcode
 */
class AFFECT_SDK_EXPORT FusionEngine {
public:
    /**
     * @brief 생성자
     *
     * 합이 1.0 이 아닌 가중치 묶음은 정규화되고,
     * 합이 0 이하인 묶음은 기본값으로 대체됨.
     */
    explicit FusionEngine(const FusionConfig& config = FusionConfig{});

    /**
     * @brief 프레임 퓨전
     *
     * @param classifier 분류기 결과 (실패 시 nullopt -> neutral / 0.5)
     * @param signals 미세 신호 묶음
     * @param timestamp 프레임 시각 (초)
     * @return face_detected = true 인 분석 레코드
     */
    FrameAnalysis fuse(const std::optional<ClassifierResult>& classifier,
                       const MicroSignalSet& signals,
                       double timestamp) const;

    /// 0.3 lip + 0.3 jaw + 0.4 blink 강도 (분석기 정규화 값), [0,1] 클램프
    float stressScore(const MicroSignalSet& signals) const;

    /// 0.4 eye_widening + 0.3 eyebrow + 0.3 lip, [0,1] 클램프
    float anxietyScore(const MicroSignalSet& signals) const;

    /// 기본값 + 미소/눈썹 검출 가산, 최대 1.0
    float engagementScore(const MicroSignalSet& signals) const;

    /**
     * @brief 감정 보정 규칙
     *
     * stress > 임계값 && neutral -> stressed
     * anxiety > 임계값 && (sad || neutral) -> anxious
     * 분류기의 neutral 이 아닌 출력은 그대로 신뢰함.
     */
    Emotion adjustEmotion(Emotion base, float stress, float anxiety) const;

    /**
     * @brief 결합 신뢰도
     * classifier_weight * 분류기 + (1 - classifier_weight) * 검출 신호 평균 신뢰도
     */
    float combinedConfidence(float classifier_confidence,
                             const MicroSignalSet& signals) const;

    /// 스트레스 점수 구간화
    StressLevel stressLevel(float stress) const;

    /// 임상 참고 정보 생성
    ClinicalInsights clinicalInsights(Emotion state,
                                      float stress,
                                      float engagement,
                                      const MicroSignalSet& signals) const;

    const FusionConfig& config() const noexcept { return config_; }

private:
    FusionConfig config_;
};

} // namespace affect_sdk
