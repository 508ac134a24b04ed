/**
 * @file micro_signal_analyzer.cpp
 * @brief 랜드마크 기하 기반 미세 표정 분석기 구현
 */

#include "affect_sdk/micro_signal_analyzer.h"
#include "affect_sdk/landmark_extractor.h"

#include <algorithm>
#include <cmath>

namespace affect_sdk {

namespace {

bool isFinitePoint(const Landmark3D& point) {
    return std::isfinite(point.x) && std::isfinite(point.y);
}

/// 2D 유클리드 거리 (z 무시)
float distance2d(const Landmark3D& a, const Landmark3D& b) {
    const float dx = a.x - b.x;
    const float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

/**
 * @brief 기준 거리로 나눈 비율
 * @return 좌표 비정상 또는 기준 거리 0 이면 nullopt
 */
std::optional<float> safeRatio(float numerator, float denominator) {
    if (!std::isfinite(numerator) || !std::isfinite(denominator) || denominator <= 0.0f) {
        return std::nullopt;
    }
    const float ratio = numerator / denominator;
    if (!std::isfinite(ratio)) {
        return std::nullopt;
    }
    return ratio;
}

float clampUnit(float value) {
    if (!std::isfinite(value)) {
        return 0.0f;
    }
    return std::clamp(value, 0.0f, 1.0f);
}

} // anonymous namespace

MicroSignalAnalyzer::MicroSignalAnalyzer(const AnalyzerConfig& config, float fps)
    : config_(config),
      fps_((std::isfinite(fps) && fps > 0.0f) ? fps : 7.0f) {
}

// ============================================================
// 일괄 분석
// ============================================================

MicroSignalSet MicroSignalAnalyzer::analyze(const LandmarkSet& landmarks,
                                            double timestamp,
                                            SignalHistory& history) const {
    MicroSignalSet signals;

    // EAR 은 깜빡임과 눈 크게 뜨기가 공유
    const std::optional<float> ear = eyeAspectRatio(landmarks);

    signals[SignalType::EyebrowRaise] = detectEyebrowRaise(landmarks);
    signals[SignalType::LipPress] = detectLipPress(landmarks);
    signals[SignalType::BlinkRate] = blinkFromEar(ear, history);
    signals[SignalType::EyeWidening] = wideningFromEar(ear);
    signals[SignalType::JawTension] = detectJawTension(landmarks);
    signals[SignalType::MicroSmile] = detectMicroSmile(landmarks);

    GeometrySample sample;
    sample.timestamp = timestamp;
    for (std::size_t i = 0; i < SIGNAL_TYPE_COUNT; ++i) {
        sample.available[i] = signals.readings[i].ok();
        sample.measures[i] = signals.readings[i].valueOrDefault().intensity;
    }
    if (ear) {
        sample.measures[static_cast<std::size_t>(SignalType::BlinkRate)] = *ear;
        sample.measures[static_cast<std::size_t>(SignalType::EyeWidening)] = *ear;
    }
    history.recent_geometry.push(sample);

    return signals;
}

// ============================================================
// 개별 지표
// ============================================================

SignalReading MicroSignalAnalyzer::detectEyebrowRaise(const LandmarkSet& landmarks) const {
    const Landmark3D& left_brow = landmarks[landmark_index::LEFT_EYEBROW_TOP];
    const Landmark3D& left_eye = landmarks[landmark_index::LEFT_EYE_TOP];
    const Landmark3D& right_brow = landmarks[landmark_index::RIGHT_EYEBROW_TOP];
    const Landmark3D& right_eye = landmarks[landmark_index::RIGHT_EYE_TOP];
    const Landmark3D& forehead = landmarks[landmark_index::FOREHEAD_TOP];
    const Landmark3D& chin = landmarks[landmark_index::CHIN];

    if (!isFinitePoint(left_brow) || !isFinitePoint(left_eye) ||
        !isFinitePoint(right_brow) || !isFinitePoint(right_eye) ||
        !isFinitePoint(forehead) || !isFinitePoint(chin)) {
        return SignalReading::unavailable();
    }

    const float avg_dist = (distance2d(left_brow, left_eye) + distance2d(right_brow, right_eye)) / 2.0f;
    const std::optional<float> normalized = safeRatio(avg_dist, distance2d(forehead, chin));
    if (!normalized) {
        return SignalReading::unavailable();
    }

    MicroSignal signal;
    signal.detected = *normalized > config_.eyebrow_raise_threshold;
    signal.intensity = clampUnit((*normalized - config_.eyebrow_raise_threshold) /
                                 config_.eyebrow_raise_range);
    signal.confidence = clampUnit(config_.eyebrow_raise_confidence);
    return SignalReading::fromSignal(signal);
}

SignalReading MicroSignalAnalyzer::detectLipPress(const LandmarkSet& landmarks) const {
    const Landmark3D& upper_lip = landmarks[landmark_index::UPPER_LIP_INNER];
    const Landmark3D& lower_lip = landmarks[landmark_index::LOWER_LIP_INNER];
    const Landmark3D& left_corner = landmarks[landmark_index::MOUTH_LEFT_CORNER];
    const Landmark3D& right_corner = landmarks[landmark_index::MOUTH_RIGHT_CORNER];

    if (!isFinitePoint(upper_lip) || !isFinitePoint(lower_lip) ||
        !isFinitePoint(left_corner) || !isFinitePoint(right_corner)) {
        return SignalReading::unavailable();
    }

    const std::optional<float> normalized = safeRatio(distance2d(upper_lip, lower_lip),
                                                      distance2d(left_corner, right_corner));
    if (!normalized) {
        return SignalReading::unavailable();
    }

    const float threshold = config_.lip_press_threshold;

    MicroSignal signal;
    signal.detected = *normalized < threshold;
    signal.intensity = clampUnit((threshold - *normalized) / threshold);
    signal.confidence = clampUnit(config_.lip_press_confidence);
    return SignalReading::fromSignal(signal);
}

SignalReading MicroSignalAnalyzer::calculateBlinkRate(const LandmarkSet& landmarks,
                                                      SignalHistory& history) const {
    return blinkFromEar(eyeAspectRatio(landmarks), history);
}

SignalReading MicroSignalAnalyzer::detectEyeWidening(const LandmarkSet& landmarks) const {
    return wideningFromEar(eyeAspectRatio(landmarks));
}

SignalReading MicroSignalAnalyzer::detectJawTension(const LandmarkSet& landmarks) const {
    const Landmark3D& left_jaw = landmarks[landmark_index::JAW_LEFT];
    const Landmark3D& right_jaw = landmarks[landmark_index::JAW_RIGHT];
    const Landmark3D& chin = landmarks[landmark_index::CHIN];

    if (!isFinitePoint(left_jaw) || !isFinitePoint(right_jaw) || !isFinitePoint(chin)) {
        return SignalReading::unavailable();
    }

    Landmark3D jaw_center{};
    jaw_center.x = (left_jaw.x + right_jaw.x) / 2.0f;
    jaw_center.y = (left_jaw.y + right_jaw.y) / 2.0f;

    const std::optional<float> ratio = safeRatio(distance2d(chin, jaw_center),
                                                 distance2d(left_jaw, right_jaw));
    if (!ratio) {
        return SignalReading::unavailable();
    }

    MicroSignal signal;
    signal.detected = *ratio < config_.jaw_tension_threshold;
    signal.intensity = clampUnit((config_.jaw_tension_threshold - *ratio) /
                                 config_.jaw_tension_range);
    signal.confidence = clampUnit(config_.jaw_tension_confidence);
    return SignalReading::fromSignal(signal);
}

SignalReading MicroSignalAnalyzer::detectMicroSmile(const LandmarkSet& landmarks) const {
    const Landmark3D& left_corner = landmarks[landmark_index::MOUTH_LEFT_CORNER];
    const Landmark3D& right_corner = landmarks[landmark_index::MOUTH_RIGHT_CORNER];
    const Landmark3D& upper_lip = landmarks[landmark_index::UPPER_LIP_CENTER];

    if (!isFinitePoint(left_corner) || !isFinitePoint(right_corner) || !isFinitePoint(upper_lip)) {
        return SignalReading::unavailable();
    }

    // 이미지 y 축은 아래로 증가: 입꼬리가 윗입술 중앙보다 위에 있으면 양수
    const float corner_y = (left_corner.y + right_corner.y) / 2.0f;
    const float lift = upper_lip.y - corner_y;
    if (!std::isfinite(lift)) {
        return SignalReading::unavailable();
    }

    MicroSignal signal;
    signal.detected = lift > config_.micro_smile_lift_px;
    signal.intensity = clampUnit(lift / config_.micro_smile_full_lift_px);
    signal.confidence = clampUnit(config_.micro_smile_confidence);
    // Duchenne 판정은 눈가 주름의 시간 비교가 필요하므로 아직 Social 고정
    signal.smile_type = SmileType::Social;
    return SignalReading::fromSignal(signal);
}

// ============================================================
// 기하 헬퍼
// ============================================================

std::optional<float> MicroSignalAnalyzer::eyeAspectRatio(const LandmarkSet& landmarks,
                                                         const int* eye_indices) {
    if (!eye_indices) {
        return std::nullopt;
    }

    const Landmark3D& outer = landmarks[eye_indices[0]];
    const Landmark3D& top1 = landmarks[eye_indices[1]];
    const Landmark3D& top2 = landmarks[eye_indices[2]];
    const Landmark3D& inner = landmarks[eye_indices[3]];
    const Landmark3D& bottom2 = landmarks[eye_indices[4]];
    const Landmark3D& bottom1 = landmarks[eye_indices[5]];

    if (!isFinitePoint(outer) || !isFinitePoint(top1) || !isFinitePoint(top2) ||
        !isFinitePoint(inner) || !isFinitePoint(bottom2) || !isFinitePoint(bottom1)) {
        return std::nullopt;
    }

    // EAR = (|p2 - p6| + |p3 - p5|) / (2 |p1 - p4|)
    const float vertical = distance2d(top1, bottom1) + distance2d(top2, bottom2);
    return safeRatio(vertical, 2.0f * distance2d(outer, inner));
}

std::optional<float> MicroSignalAnalyzer::eyeAspectRatio(const LandmarkSet& landmarks) {
    const std::optional<float> left = eyeAspectRatio(landmarks, landmark_index::LEFT_EYE);
    const std::optional<float> right = eyeAspectRatio(landmarks, landmark_index::RIGHT_EYE);

    if (left && right) {
        return (*left + *right) / 2.0f;
    }
    if (left) {
        return left;
    }
    return right;
}

float MicroSignalAnalyzer::blinkRatePerMinute(std::size_t blink_frames,
                                              std::size_t window_frames,
                                              float fps) {
    if (window_frames == 0 || !(fps > 0.0f)) {
        return 0.0f;
    }
    return (static_cast<float>(blink_frames) / static_cast<float>(window_frames)) * fps * 60.0f;
}

// ============================================================
// 내부
// ============================================================

SignalReading MicroSignalAnalyzer::blinkFromEar(std::optional<float> ear,
                                                SignalHistory& history) const {
    if (!ear) {
        // 측정 불가 프레임은 창에 기록하지 않음
        return SignalReading::unavailable();
    }

    history.blink_window.push(*ear < config_.blink_ear_threshold);

    const std::size_t blink_frames = history.blink_window.countIf([](bool blink) { return blink; });
    const float rate = blinkRatePerMinute(blink_frames, history.blink_window.size(), fps_);

    MicroSignal signal;
    signal.rate_per_minute = rate;
    signal.detected = rate > config_.blink_rate_elevated;
    signal.intensity = clampUnit(rate / config_.blink_rate_normalizer);
    signal.confidence = clampUnit(config_.blink_confidence);
    return SignalReading::fromSignal(signal);
}

SignalReading MicroSignalAnalyzer::wideningFromEar(std::optional<float> ear) const {
    if (!ear) {
        return SignalReading::unavailable();
    }

    MicroSignal signal;
    signal.detected = *ear > config_.eye_widening_threshold;
    signal.intensity = clampUnit((*ear - config_.eye_widening_baseline) /
                                 config_.eye_widening_range);
    signal.confidence = clampUnit(config_.eye_widening_confidence);
    return SignalReading::fromSignal(signal);
}

} // namespace affect_sdk
