/**
 * @file serialization.h
 * @brief 분석 레코드 JSON 직렬화
 *
 * 하위 서비스(녹취록 저장, AI 보조)와 맞춘 필드 이름을 그대로 사용.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "affect_sdk/export.h"
#include "affect_sdk/session_pipeline.h"
#include "affect_sdk/types.h"

namespace affect_sdk {

/**
 * @brief 단일 미세 신호 직렬화
 *
 * {detected, intensity, confidence} + 깜빡임은 rate_per_min, 미소는 type
 */
AFFECT_SDK_EXPORT nlohmann::json toJson(SignalType type, const MicroSignal& signal);

/**
 * @brief 프레임 분석 레코드 직렬화
 *
 * 얼굴 미검출 프레임: {timestamp, face_detected: false, error: "No face detected"}
 * 검출 프레임: timestamp, face_detected, emotion_analysis, micro_expressions,
 * composite_scores, clinical_insights
 */
AFFECT_SDK_EXPORT nlohmann::json toJson(const FrameAnalysis& analysis);

/**
 * @brief 세션 요약 직렬화
 */
AFFECT_SDK_EXPORT nlohmann::json toJson(const SessionSummary& summary);

/**
 * @brief 파이프라인 상태 직렬화
 */
AFFECT_SDK_EXPORT nlohmann::json toJson(const PipelineStatus& status);

/**
 * @brief 감정 -> 확률 맵 직렬화 (키는 감정 문자열)
 */
AFFECT_SDK_EXPORT nlohmann::json emotionMapToJson(const std::map<Emotion, float>& values);

/**
 * @brief 직렬화 후 문자열 변환
 * @param indent 들여쓰기 (-1 이면 한 줄)
 */
AFFECT_SDK_EXPORT std::string toJsonString(const FrameAnalysis& analysis, int indent = -1);
AFFECT_SDK_EXPORT std::string toJsonString(const SessionSummary& summary, int indent = -1);

} // namespace affect_sdk
