/**
 * @file micro_signal_analyzer.h
 * @brief 랜드마크 기하 기반 미세 표정 분석기 선언
 *
 * 모든 지표는 얼굴 기준 거리(얼굴 높이, 입 너비, 턱 너비, 눈 너비)로
 * 정규화된 비율이므로 카메라와의 거리 및 얼굴 크기에 불변.
 */

#pragma once

#include <array>
#include <cstddef>
#include <optional>

#include "affect_sdk/config.h"
#include "affect_sdk/ring_buffer.h"
#include "affect_sdk/types.h"

namespace affect_sdk {

/// 깜빡임 비율 계산 창 (프레임)
constexpr std::size_t BLINK_WINDOW_FRAMES = 30;

/// 최근 기하 샘플 이력 (프레임)
constexpr std::size_t GEOMETRY_HISTORY_FRAMES = 10;

/**
 * @brief 프레임 단위 원시 기하 측정값
 *
 * measures 는 SignalType 순서:
 * 눈썹 비율, 입술 간격 비율, EAR, EAR, 턱 비율, 입꼬리 상승량(px)
 */
struct GeometrySample {
    double timestamp = 0.0;
    std::array<float, SIGNAL_TYPE_COUNT> measures{};
    std::array<bool, SIGNAL_TYPE_COUNT> available{};
};

/**
 * @brief 세션 범위 시간 이력
 *
 * 세션 상태(SessionState)가 소유하며 단일 writer 로만 갱신됨.
 */
struct SignalHistory {
    RingBuffer<bool, BLINK_WINDOW_FRAMES> blink_window;
    RingBuffer<GeometrySample, GEOMETRY_HISTORY_FRAMES> recent_geometry;

    void clear() noexcept {
        blink_window.clear();
        recent_geometry.clear();
    }
};

/**
 * @brief 미세 신호 분석기
 *
 * 분석기 자체는 상태가 없으며 (설정만 보관) 시간 이력은 호출자가 전달.
 * 각 계산은 실패 시 예외 대신 Unavailable 을 반환함.
 */
class AFFECT_SDK_EXPORT MicroSignalAnalyzer {
public:
    /**
     * @brief 생성자
     * @param config 임계값 설정
     * @param fps 깜빡임 비율 외삽에 사용할 프레임 주기 (0 이하면 7.0)
     */
    explicit MicroSignalAnalyzer(const AnalyzerConfig& config = AnalyzerConfig{},
                                 float fps = 7.0f);

    /**
     * @brief 6개 지표 일괄 분석
     *
     * 깜빡임 창과 최근 기하 이력을 갱신함.
     *
     * @param landmarks 468개 랜드마크
     * @param timestamp 프레임 시각 (초)
     * @param history 세션 시간 이력 (갱신됨)
     * @return SignalType 순서의 결과 묶음
     */
    MicroSignalSet analyze(const LandmarkSet& landmarks,
                           double timestamp,
                           SignalHistory& history) const;

    // ========================================
    // 개별 지표
    // ========================================

    /// 눈썹-눈 거리 / 얼굴 높이가 임계값 초과
    SignalReading detectEyebrowRaise(const LandmarkSet& landmarks) const;

    /// 입술 간격 / 입 너비가 임계값 미만
    SignalReading detectLipPress(const LandmarkSet& landmarks) const;

    /**
     * @brief EAR 기반 깜빡임 비율
     *
     * EAR 을 계산할 수 없는 프레임은 깜빡임 창에 기록하지 않음.
     */
    SignalReading calculateBlinkRate(const LandmarkSet& landmarks,
                                     SignalHistory& history) const;

    /// EAR 가 임계값 초과 (깜빡임의 반대 꼬리)
    SignalReading detectEyeWidening(const LandmarkSet& landmarks) const;

    /// 턱 높이 / 턱 너비가 임계값 미만
    SignalReading detectJawTension(const LandmarkSet& landmarks) const;

    /// 입꼬리 상승 (픽셀). 분류는 항상 Social
    SignalReading detectMicroSmile(const LandmarkSet& landmarks) const;

    // ========================================
    // 기하 헬퍼
    // ========================================

    /**
     * @brief 양쪽 눈 EAR 평균 (한쪽만 유효하면 그 값)
     * @return 두 눈 모두 비정상이면 nullopt
     */
    static std::optional<float> eyeAspectRatio(const LandmarkSet& landmarks);

    /**
     * @brief 단일 눈 EAR
     * @param eye_indices 6개 인덱스 (바깥, 위1, 위2, 안쪽, 아래2, 아래1)
     */
    static std::optional<float> eyeAspectRatio(const LandmarkSet& landmarks,
                                               const int* eye_indices);

    /**
     * @brief 깜빡임 프레임 비율을 분당 횟수로 외삽
     *
     * (blink_frames / window_frames) * fps * 60
     * 예: 30 프레임 중 15, 7 fps -> 210 회/분
     */
    static float blinkRatePerMinute(std::size_t blink_frames,
                                    std::size_t window_frames,
                                    float fps);

    const AnalyzerConfig& config() const noexcept { return config_; }
    float fps() const noexcept { return fps_; }

private:
    SignalReading blinkFromEar(std::optional<float> ear, SignalHistory& history) const;
    SignalReading wideningFromEar(std::optional<float> ear) const;

    AnalyzerConfig config_;
    float fps_;
};

} // namespace affect_sdk
