/**
 * @file config.cpp
 * @brief 설정 파일 로더 및 검증 구현
 */

#include "affect_sdk/config.h"

#include <cmath>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace affect_sdk {

namespace {

using json = nlohmann::json;

void setError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

/**
 * @brief 타입 검사 키 리더
 *
 * 존재하지 않는 키는 그대로 두고, 타입이 맞지 않으면 첫 오류만 기록.
 */
class Reader {
public:
    explicit Reader(const json& object) : object_(object) {}

    void number(const char* key, float& out) {
        const json* value = find(key);
        if (!value) return;
        if (!value->is_number()) {
            fail(key, "a number");
            return;
        }
        out = value->get<float>();
    }

    void integer(const char* key, int& out) {
        const json* value = find(key);
        if (!value) return;
        if (!value->is_number_integer()) {
            fail(key, "an integer");
            return;
        }
        out = value->get<int>();
    }

    void boolean(const char* key, bool& out) {
        const json* value = find(key);
        if (!value) return;
        if (!value->is_boolean()) {
            fail(key, "a boolean");
            return;
        }
        out = value->get<bool>();
    }

    void string(const char* key, std::string& out) {
        const json* value = find(key);
        if (!value) return;
        if (!value->is_string()) {
            fail(key, "a string");
            return;
        }
        out = value->get<std::string>();
    }

    bool ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }

private:
    const json* find(const char* key) const {
        auto it = object_.find(key);
        return it == object_.end() ? nullptr : &*it;
    }

    void fail(const char* key, const char* expected) {
        if (error_.empty()) {
            error_ = std::string("'") + key + "' must be " + expected;
        }
    }

    const json& object_;
    std::string error_;
};

bool readAnalyzer(const json& object, AnalyzerConfig& analyzer, std::string* error) {
    Reader r(object);
    r.number("eyebrow_raise_threshold", analyzer.eyebrow_raise_threshold);
    r.number("eyebrow_raise_range", analyzer.eyebrow_raise_range);
    r.number("eyebrow_raise_confidence", analyzer.eyebrow_raise_confidence);
    r.number("lip_press_threshold", analyzer.lip_press_threshold);
    r.number("lip_press_confidence", analyzer.lip_press_confidence);
    r.number("blink_ear_threshold", analyzer.blink_ear_threshold);
    r.number("blink_rate_elevated", analyzer.blink_rate_elevated);
    r.number("blink_rate_normalizer", analyzer.blink_rate_normalizer);
    r.number("blink_confidence", analyzer.blink_confidence);
    r.number("eye_widening_threshold", analyzer.eye_widening_threshold);
    r.number("eye_widening_baseline", analyzer.eye_widening_baseline);
    r.number("eye_widening_range", analyzer.eye_widening_range);
    r.number("eye_widening_confidence", analyzer.eye_widening_confidence);
    r.number("jaw_tension_threshold", analyzer.jaw_tension_threshold);
    r.number("jaw_tension_range", analyzer.jaw_tension_range);
    r.number("jaw_tension_confidence", analyzer.jaw_tension_confidence);
    r.number("micro_smile_lift_px", analyzer.micro_smile_lift_px);
    r.number("micro_smile_full_lift_px", analyzer.micro_smile_full_lift_px);
    r.number("micro_smile_confidence", analyzer.micro_smile_confidence);
    if (!r.ok()) {
        setError(error, "analyzer: " + r.error());
    }
    return r.ok();
}

bool readFusion(const json& object, FusionConfig& fusion, std::string* error) {
    Reader r(object);
    r.number("stress_lip_press_weight", fusion.stress_lip_press_weight);
    r.number("stress_jaw_tension_weight", fusion.stress_jaw_tension_weight);
    r.number("stress_blink_rate_weight", fusion.stress_blink_rate_weight);
    r.number("anxiety_eye_widening_weight", fusion.anxiety_eye_widening_weight);
    r.number("anxiety_eyebrow_raise_weight", fusion.anxiety_eyebrow_raise_weight);
    r.number("anxiety_lip_press_weight", fusion.anxiety_lip_press_weight);
    r.number("engagement_baseline", fusion.engagement_baseline);
    r.number("engagement_smile_boost", fusion.engagement_smile_boost);
    r.number("engagement_eyebrow_boost", fusion.engagement_eyebrow_boost);
    r.number("high_engagement_threshold", fusion.high_engagement_threshold);
    r.number("stress_override_threshold", fusion.stress_override_threshold);
    r.number("anxiety_override_threshold", fusion.anxiety_override_threshold);
    r.number("classifier_weight", fusion.classifier_weight);
    r.number("neutral_micro_confidence", fusion.neutral_micro_confidence);
    r.number("fallback_confidence", fusion.fallback_confidence);
    r.number("stress_moderate_threshold", fusion.stress_moderate_threshold);
    r.number("stress_elevated_threshold", fusion.stress_elevated_threshold);
    if (!r.ok()) {
        setError(error, "fusion: " + r.error());
    }
    return r.ok();
}

bool isUnit(float value) {
    return std::isfinite(value) && value >= 0.0f && value <= 1.0f;
}

bool isPositive(float value) {
    return std::isfinite(value) && value > 0.0f;
}

} // anonymous namespace

bool parsePipelineConfig(const std::string& json_text,
                         PipelineConfig& config,
                         std::string* error) {
    PipelineConfig parsed = config;

    json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded()) {
        setError(error, "config is not valid JSON");
        return false;
    }
    if (!root.is_object()) {
        setError(error, "config root must be a JSON object");
        return false;
    }

    Reader r(root);
    r.string("model_path", parsed.model_path);
    r.string("face_detection_model", parsed.face_detection_model);
    r.string("face_landmark_model", parsed.face_landmark_model);
    r.string("emotion_model", parsed.emotion_model);
    r.number("target_fps", parsed.target_fps);
    r.integer("num_threads", parsed.num_threads);
    r.number("min_detection_confidence", parsed.min_detection_confidence);
    r.boolean("enable_logging", parsed.enable_logging);
    if (!r.ok()) {
        setError(error, r.error());
        return false;
    }

    auto analyzer_it = root.find("analyzer");
    if (analyzer_it != root.end()) {
        if (!analyzer_it->is_object()) {
            setError(error, "'analyzer' must be an object");
            return false;
        }
        if (!readAnalyzer(*analyzer_it, parsed.analyzer, error)) {
            return false;
        }
    }

    auto fusion_it = root.find("fusion");
    if (fusion_it != root.end()) {
        if (!fusion_it->is_object()) {
            setError(error, "'fusion' must be an object");
            return false;
        }
        if (!readFusion(*fusion_it, parsed.fusion, error)) {
            return false;
        }
    }

    if (!validatePipelineConfig(parsed, error)) {
        return false;
    }

    config = parsed;
    return true;
}

bool loadPipelineConfig(const std::string& path,
                        PipelineConfig& config,
                        std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        setError(error, "cannot open config file: " + path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parsePipelineConfig(buffer.str(), config, error);
}

bool validatePipelineConfig(const PipelineConfig& config, std::string* error) {
    if (!isPositive(config.target_fps)) {
        setError(error, "target_fps must be positive");
        return false;
    }
    if (config.num_threads < 1) {
        setError(error, "num_threads must be at least 1");
        return false;
    }
    if (!isUnit(config.min_detection_confidence)) {
        setError(error, "min_detection_confidence must be in [0, 1]");
        return false;
    }

    return validateAnalyzerConfig(config.analyzer, error) &&
           validateFusionConfig(config.fusion, error);
}

bool validateAnalyzerConfig(const AnalyzerConfig& a, std::string* error) {
    if (!isPositive(a.eyebrow_raise_threshold) || !isPositive(a.eyebrow_raise_range) ||
        !isPositive(a.lip_press_threshold) ||
        !isPositive(a.blink_ear_threshold) || !isPositive(a.blink_rate_elevated) ||
        !isPositive(a.blink_rate_normalizer) ||
        !isPositive(a.eye_widening_threshold) || !isPositive(a.eye_widening_range) ||
        !std::isfinite(a.eye_widening_baseline) ||
        !isPositive(a.jaw_tension_threshold) || !isPositive(a.jaw_tension_range) ||
        !std::isfinite(a.micro_smile_lift_px) || !isPositive(a.micro_smile_full_lift_px)) {
        setError(error, "analyzer thresholds and ranges must be positive");
        return false;
    }
    if (!isUnit(a.eyebrow_raise_confidence) || !isUnit(a.lip_press_confidence) ||
        !isUnit(a.blink_confidence) || !isUnit(a.eye_widening_confidence) ||
        !isUnit(a.jaw_tension_confidence) || !isUnit(a.micro_smile_confidence)) {
        setError(error, "analyzer confidences must be in [0, 1]");
        return false;
    }
    return true;
}

bool validateFusionConfig(const FusionConfig& f, std::string* error) {
    const float stress_sum = f.stress_lip_press_weight + f.stress_jaw_tension_weight +
                             f.stress_blink_rate_weight;
    const float anxiety_sum = f.anxiety_eye_widening_weight + f.anxiety_eyebrow_raise_weight +
                              f.anxiety_lip_press_weight;
    if (!(stress_sum > 0.0f) || !(anxiety_sum > 0.0f) ||
        f.stress_lip_press_weight < 0.0f || f.stress_jaw_tension_weight < 0.0f ||
        f.stress_blink_rate_weight < 0.0f || f.anxiety_eye_widening_weight < 0.0f ||
        f.anxiety_eyebrow_raise_weight < 0.0f || f.anxiety_lip_press_weight < 0.0f) {
        setError(error, "fusion weights must be non-negative with a positive sum");
        return false;
    }
    if (!isUnit(f.engagement_baseline) || !isUnit(f.engagement_smile_boost) ||
        !isUnit(f.engagement_eyebrow_boost) || !isUnit(f.high_engagement_threshold) ||
        !isUnit(f.stress_override_threshold) || !isUnit(f.anxiety_override_threshold) ||
        !isUnit(f.classifier_weight) || !isUnit(f.neutral_micro_confidence) ||
        !isUnit(f.fallback_confidence) || !isUnit(f.stress_moderate_threshold) ||
        !isUnit(f.stress_elevated_threshold)) {
        setError(error, "fusion scores and thresholds must be in [0, 1]");
        return false;
    }
    if (f.stress_moderate_threshold > f.stress_elevated_threshold) {
        setError(error, "stress_moderate_threshold must not exceed stress_elevated_threshold");
        return false;
    }

    return true;
}

} // namespace affect_sdk
