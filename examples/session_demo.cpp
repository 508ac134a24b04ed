/**
 * @file session_demo.cpp
 * @brief 웹캠 실시간 감정 분석 세션 데모
 *
 * 웹캠 프레임을 target_fps 주기로 SessionPipeline 에 입력하고
 * 한 줄 피드백을 화면과 콘솔에 출력. 종료 시 세션 요약을 JSON 으로 출력.
 *
 * 키보드 조작:
 *   ESC/Q - 종료
 *   S     - 현재 세션 요약 출력
 *   R     - 세션 재시작
 *   J     - 마지막 프레임 분석 JSON 출력
 *   D     - 디버그 정보 토글
 */

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include "affect_sdk.h"

namespace fs = std::filesystem;

namespace affect_sdk {

/**
 * @brief 세션 데모 클래스
 *
 * 웹캠에서 프레임을 캡처하여 SessionPipeline 으로 분석
 */
class SessionDemo {
public:
    explicit SessionDemo(const PipelineConfig& config)
        : pipeline_(config) {}
    ~SessionDemo() { shutdown(); }

    // 복사/이동 금지
    SessionDemo(const SessionDemo&) = delete;
    SessionDemo& operator=(const SessionDemo&) = delete;
    SessionDemo(SessionDemo&&) = delete;
    SessionDemo& operator=(SessionDemo&&) = delete;

    /**
     * @brief 데모 초기화
     * @return 초기화 성공 여부
     */
    bool initialize() {
        std::cout << "[SessionDemo] 초기화 시작...\n";

        const PipelineStatus status = pipeline_.getStatus();
        std::cout << "[SessionDemo] 파이프라인 상태: " << toJson(status).dump() << "\n";
        if (!status.available) {
            std::cerr << "[SessionDemo] 모델 파일이 없거나 백엔드가 비활성화됨\n";
            return false;
        }

        camera_.open(0);
        if (!camera_.isOpened()) {
            std::cerr << "[SessionDemo] 웹캠을 열 수 없습니다\n";
            return false;
        }

        camera_.set(cv::CAP_PROP_FRAME_WIDTH, 1280);
        camera_.set(cv::CAP_PROP_FRAME_HEIGHT, 720);

        if (!startSession()) {
            return false;
        }

        initialized_ = true;
        std::cout << "[SessionDemo] 초기화 완료\n";
        return true;
    }

    /**
     * @brief 메인 루프 실행
     */
    void run() {
        if (!initialized_) {
            std::cerr << "[SessionDemo] 초기화되지 않았습니다\n";
            return;
        }

        std::cout << "\n===== AffectSDK 세션 데모 =====\n";
        printHelp();
        std::cout << "\n";

        cv::namedWindow(window_name_, cv::WINDOW_AUTOSIZE);

        const auto interval = std::chrono::duration<double>(1.0 / pipeline_.config().target_fps);
        auto last_submit = std::chrono::steady_clock::now() - interval;

        running_ = true;
        while (running_) {
            cv::Mat frame;
            if (!camera_.read(frame) || frame.empty()) {
                std::cerr << "[SessionDemo] 프레임 캡처 실패\n";
                break;
            }
            cv::flip(frame, frame, 1);

            // 목표 주기마다 한 프레임만 분석
            const auto now = std::chrono::steady_clock::now();
            if (now - last_submit >= interval) {
                last_submit = now;
                const double timestamp =
                    std::chrono::duration<double>(now - session_start_).count();

                ProcessResult result = pipeline_.processFrame(session_id_, frame, timestamp);
                if (result.success) {
                    last_result_ = result;
                    std::cout << formatLiveFeedback(result.analysis) << "\n";
                } else {
                    std::cerr << "[SessionDemo] 처리 실패: "
                              << errorCodeToString(result.error_code) << "\n";
                }
            }

            drawOverlays(frame);
            cv::imshow(window_name_, frame);

            const int key = cv::waitKey(1) & 0xFF;
            handleKeyInput(key);
        }

        cv::destroyWindow(window_name_);
    }

    /**
     * @brief 세션 종료 및 리소스 정리
     */
    void shutdown() {
        if (!initialized_) return;

        running_ = false;
        finishSession();

        if (camera_.isOpened()) {
            camera_.release();
        }
        initialized_ = false;
        std::cout << "[SessionDemo] 종료 완료\n";
    }

private:
    bool startSession() {
        std::ostringstream id;
        id << "demo-" << ++session_counter_;
        session_id_ = id.str();

        const ErrorCode error = pipeline_.start(session_id_);
        if (error != ErrorCode::Success) {
            std::cerr << "[SessionDemo] 세션 시작 실패: " << errorCodeToString(error) << "\n";
            return false;
        }

        session_start_ = std::chrono::steady_clock::now();
        last_result_ = ProcessResult{};
        std::cout << "[SessionDemo] 세션 시작: " << session_id_ << "\n";
        return true;
    }

    void finishSession() {
        if (session_id_.empty()) return;

        const SummaryResult summary = pipeline_.stop(session_id_);
        printSummary(summary);
        const ErrorCode error = pipeline_.discard(session_id_);
        if (error != ErrorCode::Success) {
            std::cerr << "[SessionDemo] 세션 폐기 실패: " << errorCodeToString(error) << "\n";
        }
        session_id_.clear();
    }

    void printSummary(const SummaryResult& summary) const {
        if (!summary.success) {
            std::cerr << "[SessionDemo] 요약 실패: " << errorCodeToString(summary.error_code) << "\n";
            return;
        }
        if (!summary.summary) {
            std::cout << "[SessionDemo] 얼굴이 검출된 프레임이 없습니다\n";
            return;
        }
        std::cout << toJsonString(*summary.summary, 2) << "\n";
    }

    void drawOverlays(cv::Mat& frame) const {
        const FrameAnalysis& analysis = last_result_.analysis;

        const cv::Scalar color = !analysis.face_detected
            ? cv::Scalar(0, 0, 255)
            : analysis.clinical_insights.stress_level == StressLevel::Elevated
                ? cv::Scalar(0, 128, 255)
                : cv::Scalar(0, 255, 0);

        cv::putText(frame, formatLiveFeedback(analysis),
                    cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.7, color, 2);

        if (show_debug_) {
            std::ostringstream timing;
            timing << std::fixed << std::setprecision(1)
                   << "Total: " << last_result_.processing_time_ms << "ms"
                   << " | Landmark: " << last_result_.landmark_time_ms << "ms"
                   << " | Classify: " << last_result_.classify_time_ms << "ms";
            cv::putText(frame, timing.str(),
                        cv::Point(10, 60), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                        cv::Scalar(255, 255, 255), 1);

            int y = 90;
            for (const auto& entry : analysis.micro_expressions) {
                std::ostringstream signal;
                signal << std::fixed << std::setprecision(2)
                       << signalTypeToString(entry.first) << ": " << entry.second.intensity;
                cv::putText(frame, signal.str(),
                            cv::Point(10, y), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                            cv::Scalar(255, 255, 0), 1);
                y += 22;
            }
        }

        cv::putText(frame, "Session: " + session_id_,
                    cv::Point(10, frame.rows - 15), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                    cv::Scalar(200, 200, 200), 1);
    }

    void handleKeyInput(int key) {
        switch (key) {
            case 27:    // ESC
            case 'q':
            case 'Q':
                running_ = false;
                break;

            case 's':
            case 'S':
                printSummary(pipeline_.summarize(session_id_));
                break;

            case 'r':
            case 'R':
                finishSession();
                if (!startSession()) {
                    running_ = false;
                }
                break;

            case 'j':
            case 'J':
                std::cout << toJsonString(last_result_.analysis, 2) << "\n";
                break;

            case 'd':
            case 'D':
                show_debug_ = !show_debug_;
                std::cout << "[SessionDemo] 디버그 정보: " << (show_debug_ ? "ON" : "OFF") << "\n";
                break;

            default:
                break;
        }
    }

    static void printHelp() {
        std::cout << "키보드 조작:\n";
        std::cout << "  ESC/Q - 종료\n";
        std::cout << "  S     - 세션 요약 출력\n";
        std::cout << "  R     - 세션 재시작\n";
        std::cout << "  J     - 마지막 분석 JSON 출력\n";
        std::cout << "  D     - 디버그 정보 토글\n";
    }

    SessionPipeline pipeline_;
    cv::VideoCapture camera_;

    std::string session_id_;
    int session_counter_ = 0;
    std::chrono::steady_clock::time_point session_start_;
    ProcessResult last_result_;

    bool initialized_ = false;
    bool running_ = false;
    bool show_debug_ = true;

    const std::string window_name_ = "AffectSDK Session Demo";
};

} // namespace affect_sdk


/**
 * @brief 메인 함수
 *
 * 사용법: session_demo [model_path] [config.json]
 */
int main(int argc, char* argv[]) {
    std::cout << "===================================\n";
    std::cout << "   AffectSDK Session Demo v" << affect_sdk::get_version() << "\n";
    std::cout << "===================================\n\n";

    const fs::path exe_path = fs::absolute(argv[0]).parent_path();

    affect_sdk::PipelineConfig config;

    // 설정 파일 (선택)
    if (argc > 2) {
        std::string error;
        if (!affect_sdk::loadPipelineConfig(argv[2], config, &error)) {
            std::cerr << "[Error] 설정 파일 로드 실패: " << error << "\n";
            return 1;
        }
    }

    // 모델 경로 결정 (명령행 인자 > 설정 파일 > 기본 경로)
    if (argc > 1) {
        config.model_path = argv[1];
    } else if (config.model_path.empty()) {
        const std::vector<fs::path> possible_paths = {
            exe_path / "models",
            exe_path / ".." / "shared" / "models",
            fs::current_path() / "shared" / "models",
            fs::current_path() / ".." / "shared" / "models"
        };
        for (const auto& path : possible_paths) {
            if (fs::exists(path)) {
                config.model_path = fs::canonical(path).string();
                break;
            }
        }
    }

    if (config.model_path.empty() || !fs::exists(config.model_path)) {
        std::cerr << "[Error] 모델 경로를 찾을 수 없습니다.\n";
        std::cerr << "사용법: " << argv[0] << " [model_path] [config.json]\n";
        return 1;
    }

    std::cout << "[Main] 모델 경로: " << config.model_path << "\n";

    affect_sdk::SessionDemo demo(config);
    if (!demo.initialize()) {
        std::cerr << "[Error] 데모 초기화 실패\n";
        return 1;
    }

    demo.run();
    return 0;
}
