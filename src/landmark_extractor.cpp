/**
 * @file landmark_extractor.cpp
 * @brief LandmarkExtractor 팩토리 함수 및 랜드마크 그룹 테이블 구현
 */

#include "affect_sdk/landmark_extractor.h"
#include "affect_sdk/mediapipe_landmark_extractor.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace affect_sdk {

namespace {

const std::map<std::string, std::vector<int>>& groupTable() {
    static const std::map<std::string, std::vector<int>> table = {
        {"left_eye",      {33, 160, 158, 133, 153, 144}},
        {"right_eye",     {362, 385, 387, 263, 373, 380}},
        {"left_eyebrow",  {46, 53, 52, 65, 55}},
        {"right_eyebrow", {276, 283, 282, 295, 285}},
        {"lips_upper",    {61, 185, 40, 39, 37, 0, 267, 269, 270, 409, 291}},
        {"lips_lower",    {146, 91, 181, 84, 17, 314, 405, 321, 375, 291}},
        {"jaw",           {172, 136, 150, 149, 176, 148, 152, 377, 400, 378, 379}},
        {"nose",          {1, 2, 98, 327}},
    };
    return table;
}

} // anonymous namespace

std::vector<int> landmarkGroup(const std::string& group_name) {
    const auto& table = groupTable();
    auto it = table.find(group_name);
    if (it == table.end()) {
        return {};
    }
    return it->second;
}

std::vector<Landmark3D> landmarkGroupPoints(const LandmarkSet& landmarks,
                                            const std::string& group_name) {
    std::vector<Landmark3D> points;
    for (int index : landmarkGroup(group_name)) {
        points.push_back(landmarks[index]);
    }
    return points;
}

namespace detail {

std::unique_ptr<LandmarkExtractor> createLandmarkExtractor(BackendType type) {
    switch (type) {
        case BackendType::MediaPipe:
            return std::make_unique<MediaPipeLandmarkExtractor>();

        case BackendType::TfLiteFer:
        case BackendType::Unknown:
        default:
            return nullptr;
    }
}

std::unique_ptr<LandmarkExtractor> createLandmarkExtractor(const std::string& type_name) {
    // 소문자로 변환
    std::string lower_name = type_name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower_name == "mediapipe" || lower_name == "face_mesh") {
        return createLandmarkExtractor(BackendType::MediaPipe);
    }

    return nullptr;
}

} // namespace detail
} // namespace affect_sdk
