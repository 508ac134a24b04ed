/**
 * @file serialization.cpp
 * @brief 분석 레코드 JSON 직렬화 구현
 */

#include "affect_sdk/serialization.h"

namespace affect_sdk {

using json = nlohmann::json;

json toJson(SignalType type, const MicroSignal& signal) {
    json j = {
        {"detected", signal.detected},
        {"intensity", signal.intensity},
        {"confidence", signal.confidence}
    };

    if (type == SignalType::BlinkRate) {
        j["rate_per_min"] = signal.rate_per_minute;
    } else if (type == SignalType::MicroSmile) {
        j["type"] = smileTypeToString(signal.smile_type);
    }
    return j;
}

json emotionMapToJson(const std::map<Emotion, float>& values) {
    json j = json::object();
    for (const auto& entry : values) {
        j[emotionToString(entry.first)] = entry.second;
    }
    return j;
}

json toJson(const FrameAnalysis& analysis) {
    if (!analysis.face_detected) {
        return json{
            {"timestamp", analysis.timestamp},
            {"face_detected", false},
            {"error", "No face detected"}
        };
    }

    json micro = json::object();
    for (const auto& entry : analysis.micro_expressions) {
        micro[signalTypeToString(entry.first)] = toJson(entry.first, entry.second);
    }

    const ClinicalInsights& insights = analysis.clinical_insights;

    json j;
    j["timestamp"] = analysis.timestamp;
    j["face_detected"] = true;
    j["emotion_analysis"] = {
        {"dominant_emotion", emotionToString(analysis.emotion_analysis.dominant_emotion)},
        {"confidence", analysis.emotion_analysis.confidence},
        {"emotion_probabilities", emotionMapToJson(analysis.emotion_analysis.probabilities)}
    };
    j["micro_expressions"] = micro;
    j["composite_scores"] = {
        {"stress_score", analysis.composite_scores.stress_score},
        {"anxiety_score", analysis.composite_scores.anxiety_score},
        {"engagement_score", analysis.composite_scores.engagement_score},
        {"overall_confidence", analysis.composite_scores.overall_confidence}
    };
    j["clinical_insights"] = {
        {"primary_state", emotionToString(insights.primary_state)},
        {"stress_level", stressLevelToString(insights.stress_level)},
        {"anxiety_indicators", insights.anxiety_indicators},
        {"positive_indicators", insights.positive_indicators}
    };
    return j;
}

json toJson(const SessionSummary& summary) {
    return json{
        {"session_id", summary.session_id},
        {"started_at", summary.started_at},
        {"duration_seconds", summary.duration_seconds},
        {"total_frames_analyzed", summary.total_frames_analyzed},
        {"frames_received", summary.frames_received},
        {"emotion_distribution", emotionMapToJson(summary.emotion_distribution)},
        {"avg_stress_score", summary.avg_stress_score},
        {"avg_anxiety_score", summary.avg_anxiety_score},
        {"avg_engagement_score", summary.avg_engagement_score},
        {"predominant_emotion", emotionToString(summary.predominant_emotion)}
    };
}

json toJson(const PipelineStatus& status) {
    return json{
        {"available", status.available},
        {"opencv_enabled", status.opencv_enabled},
        {"tflite_enabled", status.tflite_enabled},
        {"models_present", status.models_present},
        {"custom_backends", status.custom_backends},
        {"active_sessions", status.active_sessions},
        {"stored_sessions", status.stored_sessions},
        {"target_fps", status.target_fps}
    };
}

std::string toJsonString(const FrameAnalysis& analysis, int indent) {
    return toJson(analysis).dump(indent);
}

std::string toJsonString(const SessionSummary& summary, int indent) {
    return toJson(summary).dump(indent);
}

} // namespace affect_sdk
