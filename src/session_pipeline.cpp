/**
 * @file session_pipeline.cpp
 * @brief SessionPipeline 구현
 *
 * 처리 흐름: 랜드마크 추출 -> 표정 분류 -> 기하 분석 -> 퓨전
 */

#include "affect_sdk/session_pipeline.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <exception>
#include <map>
#include <mutex>

#include "affect_sdk/fusion_engine.h"
#include "affect_sdk/mediapipe_landmark_extractor.h"
#include "affect_sdk/micro_signal_analyzer.h"
#include "affect_sdk/ring_buffer.h"
#include "affect_sdk/tflite_emotion_classifier.h"
#include "face_detector.h"
#include "logging.h"

#ifdef AFFECT_SDK_HAS_OPENCV
#include <opencv2/core.hpp>
#endif

namespace affect_sdk {

namespace {

using Clock = std::chrono::high_resolution_clock;

/// 최근 프레임 보관 개수 (하위 보조 기능용)
constexpr std::size_t RECENT_FRAME_COUNT = 10;

float elapsedMs(Clock::time_point start, Clock::time_point end) {
    return std::chrono::duration<float, std::milli>(end - start).count();
}

/// 현재 시각 ISO-8601 UTC 문자열 ("2026-01-31T09:15:02Z")
std::string utcTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc) == 0) {
        return std::string();
    }
    return std::string(buffer);
}

/**
 * @brief 범위를 벗어난 설정 묶음을 기본값으로 교체
 *
 * 분석기/퓨전 설정은 묶음 단위로 검증하며, 하나라도 어긋나면 해당 묶음 전체를 기본값으로 사용.
 */
PipelineConfig sanitizeConfig(const PipelineConfig& cfg) {
    const PipelineConfig defaults{};
    PipelineConfig config = cfg;
    if (!(config.target_fps > 0.0f) || !std::isfinite(config.target_fps)) {
        config.target_fps = defaults.target_fps;
    }
    if (!validateAnalyzerConfig(config.analyzer)) {
        config.analyzer = defaults.analyzer;
    }
    if (!validateFusionConfig(config.fusion)) {
        config.fusion = defaults.fusion;
    }
    return config;
}

} // anonymous namespace

// ============================================================
// 세션 상태
// ============================================================

/**
 * @brief 세션 하나의 가변 상태
 *
 * 모든 접근은 mutex 를 잡은 상태에서만 이루어짐.
 */
struct SessionSlot {
    std::mutex mutex;

    std::string session_id;
    std::string started_at;
    SessionStatus status = SessionStatus::Tracking;
    bool discarded = false;

    std::unique_ptr<LandmarkExtractor> extractor;
    std::unique_ptr<EmotionClassifier> classifier;   // 없으면 neutral 로 대체

    SignalHistory history;
    std::vector<FrameAnalysis> frames;               // 미검출 포함 전체
    RingBuffer<FrameAnalysis, RECENT_FRAME_COUNT> recent_frames;
    std::size_t face_frame_count = 0;
};

// ============================================================
// Pimpl 구현 클래스
// ============================================================
class SessionPipeline::Impl {
public:
    explicit Impl(const PipelineConfig& cfg)
        : config(sanitizeConfig(cfg)),
          analyzer(config.analyzer, config.target_fps),
          fusion(config.fusion) {}

    PipelineConfig config;
    MicroSignalAnalyzer analyzer;
    FusionEngine fusion;

    mutable std::mutex factory_mutex;
    LandmarkExtractorFactory extractor_factory;     // 비어 있으면 기본 팩토리
    EmotionClassifierFactory classifier_factory;

    mutable std::mutex registry_mutex;
    std::map<std::string, std::shared_ptr<SessionSlot>> sessions;

    std::shared_ptr<SessionSlot> find(const std::string& session_id) const {
        std::lock_guard<std::mutex> lock(registry_mutex);
        auto it = sessions.find(session_id);
        if (it == sessions.end()) {
            return nullptr;
        }
        return it->second;
    }

    // ========================================
    // 백엔드 생성
    // ========================================

    std::unique_ptr<LandmarkExtractor> defaultExtractor() const {
        auto extractor = std::make_unique<MediaPipeLandmarkExtractor>();
        extractor->setModelFiles(config.face_detection_model, config.face_landmark_model);
        extractor->setMinDetectionConfidence(config.min_detection_confidence);
        extractor->setNumThreads(config.num_threads);
        if (!extractor->initialize(config.model_path)) {
            return nullptr;
        }
        return extractor;
    }

    std::unique_ptr<EmotionClassifier> defaultClassifier() const {
        auto classifier = std::make_unique<TfLiteEmotionClassifier>();
        classifier->setModelFiles(config.face_detection_model, config.emotion_model);
        classifier->setMinDetectionConfidence(config.min_detection_confidence);
        classifier->setNumThreads(config.num_threads);
        if (!classifier->initialize(config.model_path)) {
            return nullptr;
        }
        return classifier;
    }

    std::unique_ptr<LandmarkExtractor> makeExtractor() const {
        LandmarkExtractorFactory factory;
        {
            std::lock_guard<std::mutex> lock(factory_mutex);
            factory = extractor_factory;
        }

        std::unique_ptr<LandmarkExtractor> extractor;
        try {
            extractor = factory ? factory() : defaultExtractor();
        } catch (const std::exception& e) {
            internal::logError("landmark extractor creation failed: %s", e.what());
            return nullptr;
        }

        if (extractor && !extractor->isInitialized()) {
            internal::logError("landmark extractor factory returned an uninitialized backend");
            return nullptr;
        }
        return extractor;
    }

    std::unique_ptr<EmotionClassifier> makeClassifier() const {
        EmotionClassifierFactory factory;
        {
            std::lock_guard<std::mutex> lock(factory_mutex);
            factory = classifier_factory;
        }

        std::unique_ptr<EmotionClassifier> classifier;
        try {
            classifier = factory ? factory() : defaultClassifier();
        } catch (const std::exception& e) {
            internal::logError("emotion classifier creation failed: %s", e.what());
            return nullptr;
        }

        if (classifier && !classifier->isInitialized()) {
            internal::logError("emotion classifier factory returned an uninitialized backend");
            return nullptr;
        }
        return classifier;
    }

    /**
     * @brief 새 세션 상태 구성
     *
     * 랜드마크 추출기는 필수, 분류기는 선택 (없으면 neutral 로 대체).
     */
    std::shared_ptr<SessionSlot> createSlot(const std::string& session_id, ErrorCode& error) const {
        auto slot = std::make_shared<SessionSlot>();
        slot->session_id = session_id;
        slot->started_at = utcTimestamp();

        slot->extractor = makeExtractor();
        if (!slot->extractor) {
            internal::logError("session %s: landmark extractor unavailable", session_id.c_str());
            error = ErrorCode::ModelLoadFailed;
            return nullptr;
        }

        slot->classifier = makeClassifier();
        if (!slot->classifier) {
            internal::logWarn("session %s: emotion classifier unavailable, using neutral fallback",
                              session_id.c_str());
        }

        error = ErrorCode::Success;
        return slot;
    }

    // ========================================
    // 프레임 처리
    // ========================================

    std::optional<LandmarkSet> extractLandmarks(SessionSlot& slot,
                                                const uint8_t* frame_data,
                                                int width, int height,
                                                FrameFormat format) const {
        try {
            return slot.extractor->extract(frame_data, width, height, format);
        } catch (const std::exception& e) {
            internal::logWarn("session %s: landmark extraction failed: %s",
                              slot.session_id.c_str(), e.what());
        }
        return std::nullopt;
    }

    std::optional<ClassifierResult> classifyEmotion(SessionSlot& slot,
                                                    const uint8_t* frame_data,
                                                    int width, int height,
                                                    FrameFormat format) const {
        if (!slot.classifier) {
            return std::nullopt;
        }
        try {
            return slot.classifier->classify(frame_data, width, height, format);
        } catch (const std::exception& e) {
            internal::logWarn("session %s: emotion classification failed: %s",
                              slot.session_id.c_str(), e.what());
        }
        return std::nullopt;
    }

    /**
     * @brief 세션 락을 잡은 상태에서 단일 프레임 처리
     */
    ProcessResult processLocked(SessionSlot& slot,
                                const uint8_t* frame_data,
                                int width, int height,
                                FrameFormat format,
                                std::optional<double> timestamp) const {
        ProcessResult result;
        const auto total_start = Clock::now();

        const double frame_time = timestamp
            ? *timestamp
            : static_cast<double>(slot.face_frame_count) / static_cast<double>(config.target_fps);

        // 1. 랜드마크 추출
        const auto landmark_start = Clock::now();
        const std::optional<LandmarkSet> landmarks =
            extractLandmarks(slot, frame_data, width, height, format);
        result.landmark_time_ms = elapsedMs(landmark_start, Clock::now());

        if (!landmarks) {
            FrameAnalysis no_face;
            no_face.timestamp = frame_time;
            no_face.face_detected = false;
            slot.frames.push_back(no_face);

            result.success = true;
            result.analysis = no_face;
            result.processing_time_ms = elapsedMs(total_start, Clock::now());
            return result;
        }

        // 2. 표정 분류
        const auto classify_start = Clock::now();
        const std::optional<ClassifierResult> classified =
            classifyEmotion(slot, frame_data, width, height, format);
        result.classify_time_ms = elapsedMs(classify_start, Clock::now());

        // 3. 기하 분석 + 4. 퓨전
        const auto analysis_start = Clock::now();
        const MicroSignalSet signals = analyzer.analyze(*landmarks, frame_time, slot.history);
        FrameAnalysis analysis = fusion.fuse(classified, signals, frame_time);
        result.analysis_time_ms = elapsedMs(analysis_start, Clock::now());

        slot.frames.push_back(analysis);
        slot.recent_frames.push(analysis);
        ++slot.face_frame_count;

        if (analysis.composite_scores.stress_score > config.fusion.stress_override_threshold) {
            internal::logWarn("session %s: high stress detected at %.1fs",
                              slot.session_id.c_str(), frame_time);
        }
        if (analysis.composite_scores.anxiety_score > config.fusion.anxiety_override_threshold) {
            internal::logWarn("session %s: high anxiety detected at %.1fs",
                              slot.session_id.c_str(), frame_time);
        }

        result.success = true;
        result.analysis = std::move(analysis);
        result.processing_time_ms = elapsedMs(total_start, Clock::now());
        return result;
    }

    ProcessResult process(const std::string& session_id,
                          const uint8_t* frame_data,
                          int width, int height,
                          FrameFormat format,
                          std::optional<double> timestamp) const {
        ProcessResult result;

        if (frame_data == nullptr) {
            result.error_code = ErrorCode::NullPointer;
            return result;
        }
        if (width <= 0 || height <= 0) {
            result.error_code = ErrorCode::InvalidParameter;
            return result;
        }

        std::shared_ptr<SessionSlot> slot = find(session_id);
        if (!slot) {
            result.error_code = ErrorCode::SessionNotFound;
            return result;
        }

        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->discarded) {
            result.error_code = ErrorCode::SessionNotFound;
            return result;
        }
        if (slot->status != SessionStatus::Tracking) {
            result.error_code = ErrorCode::SessionNotTracking;
            return result;
        }

        return processLocked(*slot, frame_data, width, height, format, timestamp);
    }

    static std::optional<SessionSummary> summarizeLocked(const SessionSlot& slot) {
        std::optional<SessionSummary> summary = summarizeFrames(slot.frames);
        if (summary) {
            summary->session_id = slot.session_id;
            summary->started_at = slot.started_at;
        }
        return summary;
    }
};

// ============================================================
// 생성자/소멸자
// ============================================================

SessionPipeline::SessionPipeline(const PipelineConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    internal::setLoggingEnabled(config.enable_logging);

    std::string error;
    if (!validatePipelineConfig(config, &error)) {
        internal::logWarn("pipeline config is out of range (%s), invalid sections use defaults",
                          error.c_str());
    }
}

SessionPipeline::~SessionPipeline() = default;

// ============================================================
// 백엔드 주입
// ============================================================

void SessionPipeline::setLandmarkExtractorFactory(LandmarkExtractorFactory factory) {
    std::lock_guard<std::mutex> lock(impl_->factory_mutex);
    impl_->extractor_factory = std::move(factory);
}

void SessionPipeline::setEmotionClassifierFactory(EmotionClassifierFactory factory) {
    std::lock_guard<std::mutex> lock(impl_->factory_mutex);
    impl_->classifier_factory = std::move(factory);
}

// ============================================================
// 세션 수명
// ============================================================

ErrorCode SessionPipeline::start(const std::string& session_id) {
    if (session_id.empty()) {
        return ErrorCode::InvalidParameter;
    }

    // 모델 로드 전 빠른 중복 검사
    if (status(session_id) == SessionStatus::Tracking) {
        internal::logWarn("session %s is already tracking", session_id.c_str());
        return ErrorCode::SessionAlreadyActive;
    }

    // 모델 로드는 레지스트리 락 밖에서 수행
    ErrorCode error = ErrorCode::Success;
    std::shared_ptr<SessionSlot> slot = impl_->createSlot(session_id, error);
    if (!slot) {
        return error;
    }

    // 레지스트리 락을 쥔 채 슬롯 락을 기다리지 않음: 기존 슬롯을 복사해 확인한 뒤 교체
    std::shared_ptr<SessionSlot> replaced;
    for (;;) {
        std::shared_ptr<SessionSlot> existing;
        {
            std::lock_guard<std::mutex> lock(impl_->registry_mutex);
            auto it = impl_->sessions.find(session_id);
            if (it == impl_->sessions.end()) {
                impl_->sessions.emplace(session_id, slot);
                break;
            }
            existing = it->second;
        }

        std::lock_guard<std::mutex> slot_lock(existing->mutex);
        if (!existing->discarded && existing->status == SessionStatus::Tracking) {
            // 락 밖에서 경쟁한 다른 start 가 먼저 등록함
            return ErrorCode::SessionAlreadyActive;
        }

        std::lock_guard<std::mutex> lock(impl_->registry_mutex);
        auto it = impl_->sessions.find(session_id);
        if (it != impl_->sessions.end() && it->second != existing) {
            continue;   // 확인 사이에 교체됨, 다시 시도
        }
        existing->discarded = true;
        if (it == impl_->sessions.end()) {
            impl_->sessions.emplace(session_id, slot);
        } else {
            it->second = slot;
            replaced = existing;
        }
        break;
    }

    internal::logInfo("emotion tracking started for session %s%s", session_id.c_str(),
                      replaced ? " (previous state replaced)" : "");
    return ErrorCode::Success;
}

SummaryResult SessionPipeline::stop(const std::string& session_id) {
    SummaryResult result;

    std::shared_ptr<SessionSlot> slot = impl_->find(session_id);
    if (!slot) {
        result.error_code = ErrorCode::SessionNotFound;
        return result;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->discarded) {
        result.error_code = ErrorCode::SessionNotFound;
        return result;
    }

    if (slot->status == SessionStatus::Tracking) {
        slot->status = SessionStatus::Stopped;
        internal::logInfo("emotion tracking stopped for session %s (%zu frames)",
                          session_id.c_str(), slot->frames.size());
    }

    result.success = true;
    result.summary = Impl::summarizeLocked(*slot);
    return result;
}

ErrorCode SessionPipeline::discard(const std::string& session_id) {
    std::shared_ptr<SessionSlot> slot;
    {
        std::lock_guard<std::mutex> lock(impl_->registry_mutex);
        auto it = impl_->sessions.find(session_id);
        if (it == impl_->sessions.end()) {
            return ErrorCode::SessionNotFound;
        }
        slot = it->second;
        impl_->sessions.erase(it);
    }

    // 진행 중인 프레임 처리가 끝날 때까지 대기 후 백엔드 해제
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->discarded = true;
    slot->status = SessionStatus::Stopped;
    if (slot->extractor) {
        slot->extractor->release();
    }
    if (slot->classifier) {
        slot->classifier->release();
    }

    internal::logInfo("session %s discarded", session_id.c_str());
    return ErrorCode::Success;
}

SessionStatus SessionPipeline::status(const std::string& session_id) const {
    std::shared_ptr<SessionSlot> slot = impl_->find(session_id);
    if (!slot) {
        return SessionStatus::Uninitialized;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->discarded ? SessionStatus::Uninitialized : slot->status;
}

// ============================================================
// 프레임 처리
// ============================================================

ProcessResult SessionPipeline::processFrame(const std::string& session_id,
                                            const uint8_t* frame_data,
                                            int width,
                                            int height,
                                            FrameFormat format,
                                            double timestamp) {
    return impl_->process(session_id, frame_data, width, height, format, timestamp);
}

ProcessResult SessionPipeline::processFrame(const std::string& session_id,
                                            const uint8_t* frame_data,
                                            int width,
                                            int height,
                                            FrameFormat format) {
    return impl_->process(session_id, frame_data, width, height, format, std::nullopt);
}

ProcessResult SessionPipeline::processFrame(const std::string& session_id,
                                            const cv::Mat& frame,
                                            double timestamp) {
#ifdef AFFECT_SDK_HAS_OPENCV
    ProcessResult result;
    if (frame.empty()) {
        result.error_code = ErrorCode::InvalidParameter;
        return result;
    }

    FrameFormat format;
    switch (frame.type()) {
        case CV_8UC3: format = FrameFormat::BGR; break;
        case CV_8UC4: format = FrameFormat::BGRA; break;
        case CV_8UC1: format = FrameFormat::Grayscale; break;
        default:
            result.error_code = ErrorCode::FrameFormatUnsupported;
            return result;
    }

    // 백엔드는 연속 메모리를 가정함
    const cv::Mat continuous = frame.isContinuous() ? frame : frame.clone();
    return impl_->process(session_id, continuous.data, continuous.cols, continuous.rows,
                          format, timestamp);
#else
    (void)session_id;
    (void)frame;
    (void)timestamp;
    ProcessResult result;
    result.error_code = ErrorCode::FrameFormatUnsupported;
    return result;
#endif
}

ProcessResult SessionPipeline::analyzeOnce(const uint8_t* frame_data,
                                           int width,
                                           int height,
                                           FrameFormat format) {
    ProcessResult result;
    if (frame_data == nullptr) {
        result.error_code = ErrorCode::NullPointer;
        return result;
    }
    if (width <= 0 || height <= 0) {
        result.error_code = ErrorCode::InvalidParameter;
        return result;
    }

    ErrorCode error = ErrorCode::Success;
    std::shared_ptr<SessionSlot> slot = impl_->createSlot("one-shot", error);
    if (!slot) {
        result.error_code = error;
        return result;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    return impl_->processLocked(*slot, frame_data, width, height, format, 0.0);
}

// ============================================================
// 조회
// ============================================================

SummaryResult SessionPipeline::summarize(const std::string& session_id) const {
    SummaryResult result;

    std::shared_ptr<SessionSlot> slot = impl_->find(session_id);
    if (!slot) {
        result.error_code = ErrorCode::SessionNotFound;
        return result;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->discarded) {
        result.error_code = ErrorCode::SessionNotFound;
        return result;
    }

    result.success = true;
    result.summary = Impl::summarizeLocked(*slot);
    return result;
}

std::vector<FrameAnalysis> SessionPipeline::recentFrames(const std::string& session_id) const {
    std::vector<FrameAnalysis> recent;

    std::shared_ptr<SessionSlot> slot = impl_->find(session_id);
    if (!slot) {
        return recent;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->discarded) {
        return recent;
    }
    recent.reserve(slot->recent_frames.size());
    for (std::size_t i = 0; i < slot->recent_frames.size(); ++i) {
        recent.push_back(slot->recent_frames[i]);
    }
    return recent;
}

std::vector<FrameAnalysis> SessionPipeline::frames(const std::string& session_id) const {
    std::shared_ptr<SessionSlot> slot = impl_->find(session_id);
    if (!slot) {
        return {};
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->discarded) {
        return {};
    }
    return slot->frames;
}

std::size_t SessionPipeline::activeSessionCount() const {
    std::vector<std::shared_ptr<SessionSlot>> slots;
    {
        std::lock_guard<std::mutex> lock(impl_->registry_mutex);
        for (const auto& entry : impl_->sessions) {
            slots.push_back(entry.second);
        }
    }

    std::size_t count = 0;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!slot->discarded && slot->status == SessionStatus::Tracking) {
            ++count;
        }
    }
    return count;
}

PipelineStatus SessionPipeline::getStatus() const {
    PipelineStatus status;

#ifdef AFFECT_SDK_HAS_OPENCV
    status.opencv_enabled = true;
#endif
#ifdef AFFECT_SDK_HAS_TFLITE
    status.tflite_enabled = true;
#endif

    const PipelineConfig& cfg = impl_->config;
    status.models_present = internal::validateModelPath(
        cfg.model_path,
        {cfg.face_detection_model, cfg.face_landmark_model, cfg.emotion_model});

    {
        std::lock_guard<std::mutex> lock(impl_->factory_mutex);
        status.custom_backends = static_cast<bool>(impl_->extractor_factory);
    }

    status.available = status.custom_backends ||
                       (status.opencv_enabled && status.tflite_enabled && status.models_present);

    {
        std::lock_guard<std::mutex> lock(impl_->registry_mutex);
        status.stored_sessions = impl_->sessions.size();
    }
    status.active_sessions = activeSessionCount();
    status.target_fps = cfg.target_fps;
    return status;
}

const PipelineConfig& SessionPipeline::config() const noexcept {
    return impl_->config;
}

// ============================================================
// 자유 함수
// ============================================================

std::string formatLiveFeedback(const FrameAnalysis& analysis) {
    char buffer[160];

    if (!analysis.face_detected) {
        std::snprintf(buffer, sizeof(buffer), "%.1fs | no face", analysis.timestamp);
        return std::string(buffer);
    }

    std::string emotion = emotionToString(analysis.emotion_analysis.dominant_emotion);
    std::transform(emotion.begin(), emotion.end(), emotion.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::snprintf(buffer, sizeof(buffer), "%.1fs | %s (%.2f) | Stress: %.2f | Anxiety: %.2f",
                  analysis.timestamp,
                  emotion.c_str(),
                  analysis.emotion_analysis.confidence,
                  analysis.composite_scores.stress_score,
                  analysis.composite_scores.anxiety_score);
    return std::string(buffer);
}

std::optional<SessionSummary> summarizeFrames(const std::vector<FrameAnalysis>& frames) {
    std::array<std::size_t, static_cast<std::size_t>(Emotion::Anxious) + 1> counts{};
    std::size_t face_frames = 0;
    double total_stress = 0.0;
    double total_anxiety = 0.0;
    double total_engagement = 0.0;
    double last_timestamp = 0.0;

    for (const FrameAnalysis& frame : frames) {
        if (!frame.face_detected) {
            continue;
        }
        ++face_frames;
        ++counts[static_cast<std::size_t>(frame.emotion_analysis.dominant_emotion)];
        total_stress += frame.composite_scores.stress_score;
        total_anxiety += frame.composite_scores.anxiety_score;
        total_engagement += frame.composite_scores.engagement_score;
        last_timestamp = frame.timestamp;
    }

    if (face_frames == 0) {
        return std::nullopt;
    }

    SessionSummary summary;
    summary.duration_seconds = last_timestamp;
    summary.total_frames_analyzed = face_frames;
    summary.frames_received = frames.size();

    const double n = static_cast<double>(face_frames);
    summary.avg_stress_score = static_cast<float>(total_stress / n);
    summary.avg_anxiety_score = static_cast<float>(total_anxiety / n);
    summary.avg_engagement_score = static_cast<float>(total_engagement / n);

    // 동률이면 열거 순서가 빠른 감정
    std::size_t best = 0;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        if (counts[i] == 0) {
            continue;
        }
        summary.emotion_distribution[static_cast<Emotion>(i)] =
            static_cast<float>(static_cast<double>(counts[i]) / n);
        if (counts[i] > counts[best]) {
            best = i;
        }
    }
    summary.predominant_emotion = static_cast<Emotion>(best);

    return summary;
}

} // namespace affect_sdk
