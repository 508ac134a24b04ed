/**
 * @file types.cpp
 * @brief 열거형 문자열 변환 구현
 */

#include "affect_sdk/types.h"

#include <algorithm>
#include <cctype>

namespace affect_sdk {

const char* emotionToString(Emotion emotion) {
    switch (emotion) {
        case Emotion::Angry:    return "angry";
        case Emotion::Disgust:  return "disgust";
        case Emotion::Fear:     return "fear";
        case Emotion::Happy:    return "happy";
        case Emotion::Sad:      return "sad";
        case Emotion::Surprise: return "surprise";
        case Emotion::Neutral:  return "neutral";
        case Emotion::Stressed: return "stressed";
        case Emotion::Anxious:  return "anxious";
    }
    return "neutral";
}

bool emotionFromString(const std::string& name, Emotion& out) {
    std::string lower_name = name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    for (int i = 0; i <= static_cast<int>(Emotion::Anxious); ++i) {
        Emotion candidate = static_cast<Emotion>(i);
        if (lower_name == emotionToString(candidate)) {
            out = candidate;
            return true;
        }
    }
    return false;
}

Emotion emotionFromClassIndex(std::size_t index) {
    if (index >= EMOTION_CLASS_COUNT) {
        return Emotion::Neutral;
    }
    return static_cast<Emotion>(index);
}

const char* signalTypeToString(SignalType type) {
    switch (type) {
        case SignalType::EyebrowRaise: return "eyebrow_raise";
        case SignalType::LipPress:     return "lip_press";
        case SignalType::BlinkRate:    return "blink_rate";
        case SignalType::EyeWidening:  return "eye_widening";
        case SignalType::JawTension:   return "jaw_tension";
        case SignalType::MicroSmile:   return "micro_smile";
    }
    return "unknown";
}

const char* stressLevelToString(StressLevel level) {
    switch (level) {
        case StressLevel::Low:      return "low";
        case StressLevel::Moderate: return "moderate";
        case StressLevel::Elevated: return "elevated";
    }
    return "low";
}

const char* smileTypeToString(SmileType type) {
    switch (type) {
        case SmileType::None:     return "none";
        case SmileType::Social:   return "social";
        case SmileType::Duchenne: return "duchenne";
    }
    return "none";
}

const char* sessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::Uninitialized: return "uninitialized";
        case SessionStatus::Tracking:      return "tracking";
        case SessionStatus::Stopped:       return "stopped";
    }
    return "uninitialized";
}

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:                return "Success";
        case ErrorCode::NotInitialized:         return "Not initialized";
        case ErrorCode::AlreadyInitialized:     return "Already initialized";
        case ErrorCode::ModelLoadFailed:        return "Model load failed";
        case ErrorCode::InvalidPath:            return "Invalid path";
        case ErrorCode::ConfigParseFailed:      return "Config parse failed";
        case ErrorCode::InvalidParameter:       return "Invalid parameter";
        case ErrorCode::NullPointer:            return "Null pointer";
        case ErrorCode::FrameFormatUnsupported: return "Frame format unsupported";
        case ErrorCode::DetectionFailed:        return "Detection failed";
        case ErrorCode::NoFaceDetected:         return "No face detected";
        case ErrorCode::SessionNotFound:        return "Session not found";
        case ErrorCode::SessionAlreadyActive:   return "Session already active";
        case ErrorCode::SessionNotTracking:     return "Session not tracking";
        case ErrorCode::Unknown:                return "Unknown error";
    }
    return "Unknown error";
}

} // namespace affect_sdk
