/**
 * @file landmark_extractor.h
 * @brief 얼굴 랜드마크 추출기 추상 인터페이스
 *
 * Strategy 패턴을 사용하여 랜드마크 모델 구현체를 교체 가능하게 함.
 * 모델 교체 시 분석기/퓨전 엔진은 변경하지 않고 이 어댑터만 교체.
 */

#ifndef AFFECT_SDK_LANDMARK_EXTRACTOR_H
#define AFFECT_SDK_LANDMARK_EXTRACTOR_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "affect_sdk/types.h"
#include "affect_sdk/export.h"

namespace affect_sdk {

/**
 * @brief 랜드마크 추출기 추상 인터페이스
 *
 * - MediaPipeLandmarkExtractor (Face Detection + Face Mesh)
 * - 테스트용 Mock 구현체
 *
 * @note 얼굴 미검출은 에러가 아니며 std::nullopt 로 표현됨
 * @note 구현체는 내부 예외를 삼키지 않고 로그 후 nullopt 로 변환해야 함
 */
class AFFECT_SDK_EXPORT LandmarkExtractor {
public:
    /**
     * @brief 가상 소멸자
     */
    virtual ~LandmarkExtractor() = default;

    /**
     * @brief 추출기 초기화
     * @param model_path 모델 파일 디렉토리 경로
     * @return 초기화 성공 여부
     */
    virtual bool initialize(const std::string& model_path) = 0;

    /**
     * @brief 프레임에서 랜드마크 추출
     * @param frame_data 입력 이미지 데이터 포인터
     * @param width 이미지 너비
     * @param height 이미지 높이
     * @param format 픽셀 포맷
     * @return 468개 랜드마크 (얼굴 미검출 시 nullopt)
     */
    virtual std::optional<LandmarkSet> extract(const uint8_t* frame_data,
                                               int width,
                                               int height,
                                               FrameFormat format) = 0;

    /**
     * @brief 리소스 해제
     */
    virtual void release() = 0;

    /**
     * @brief 초기화 상태 확인
     * @return 초기화되었으면 true
     */
    virtual bool isInitialized() const = 0;

    /**
     * @brief 백엔드 종류 반환
     */
    virtual BackendType getBackendType() const = 0;

    // 복사 금지
    LandmarkExtractor(const LandmarkExtractor&) = delete;
    LandmarkExtractor& operator=(const LandmarkExtractor&) = delete;

    // 이동 금지
    LandmarkExtractor(LandmarkExtractor&&) = delete;
    LandmarkExtractor& operator=(LandmarkExtractor&&) = delete;

protected:
    /**
     * @brief 기본 생성자 (protected - 직접 인스턴스화 금지)
     */
    LandmarkExtractor() = default;
};

/**
 * @brief 세션마다 새 추출기를 만드는 팩토리
 *
 * 반환된 추출기는 이미 초기화된 상태여야 함. 실패 시 nullptr.
 */
using LandmarkExtractorFactory = std::function<std::unique_ptr<LandmarkExtractor>()>;

// ============================================================
// 해부학적 랜드마크 그룹 (MediaPipe Face Mesh 인덱스 기준)
// ============================================================
//
// 모델 인덱스 체계가 다르면 이 테이블만 수정하고 분석 로직은 그대로 둠.
//

namespace landmark_index {

// 눈 (EAR 계산 순서: 바깥, 위1, 위2, 안쪽, 아래2, 아래1)
constexpr int LEFT_EYE[] = {33, 160, 158, 133, 153, 144};
constexpr int RIGHT_EYE[] = {362, 385, 387, 263, 373, 380};

constexpr int LEFT_EYEBROW_TOP = 70;
constexpr int RIGHT_EYEBROW_TOP = 300;
constexpr int LEFT_EYE_TOP = 159;
constexpr int RIGHT_EYE_TOP = 386;

constexpr int FOREHEAD_TOP = 10;
constexpr int CHIN = 152;

constexpr int UPPER_LIP_INNER = 13;
constexpr int LOWER_LIP_INNER = 14;
constexpr int UPPER_LIP_CENTER = 0;
constexpr int MOUTH_LEFT_CORNER = 61;
constexpr int MOUTH_RIGHT_CORNER = 291;

constexpr int JAW_LEFT = 172;
constexpr int JAW_RIGHT = 397;

} // namespace landmark_index

/**
 * @brief 이름으로 랜드마크 그룹 인덱스 조회
 *
 * 지원 이름: "left_eye", "right_eye", "left_eyebrow", "right_eyebrow",
 * "lips_upper", "lips_lower", "jaw", "nose"
 *
 * @param group_name 그룹 이름
 * @return 인덱스 목록 (알 수 없는 이름이면 빈 벡터)
 */
AFFECT_SDK_EXPORT std::vector<int> landmarkGroup(const std::string& group_name);

/**
 * @brief 랜드마크 집합에서 그룹 좌표 추출
 * @param landmarks 랜드마크 집합
 * @param group_name 그룹 이름
 * @return 그룹 좌표 (알 수 없는 이름이면 빈 벡터)
 */
AFFECT_SDK_EXPORT std::vector<Landmark3D> landmarkGroupPoints(const LandmarkSet& landmarks,
                                                              const std::string& group_name);

// ============================================================
// 내부 팩토리 함수 (detail 네임스페이스)
// ============================================================

namespace detail {

/**
 * @brief 추출기 생성 (내부용)
 * @param type 생성할 백엔드 종류
 * @return 미초기화 추출기 (지원하지 않는 종류면 nullptr)
 */
AFFECT_SDK_EXPORT std::unique_ptr<LandmarkExtractor> createLandmarkExtractor(BackendType type);

/**
 * @brief 문자열로 추출기 생성 (내부용)
 * @param type_name 백엔드 이름 ("mediapipe")
 */
AFFECT_SDK_EXPORT std::unique_ptr<LandmarkExtractor> createLandmarkExtractor(const std::string& type_name);

} // namespace detail

} // namespace affect_sdk

#endif // AFFECT_SDK_LANDMARK_EXTRACTOR_H
