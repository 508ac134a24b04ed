// Minimal example: version + one-shot analysis of an image file
#include <iostream>

#include <opencv2/imgcodecs.hpp>

#include "affect_sdk.h"

int main(int argc, char* argv[]) {
    std::cout << "AffectSDK v" << affect_sdk::get_version() << std::endl;

    if (argc < 3) {
        std::cout << "usage: " << argv[0] << " <model_path> <image>" << std::endl;
        return 0;
    }

    affect_sdk::PipelineConfig config;
    config.model_path = argv[1];
    affect_sdk::SessionPipeline pipeline(config);

    cv::Mat image = cv::imread(argv[2], cv::IMREAD_COLOR);
    if (image.empty()) {
        std::cerr << "failed to read " << argv[2] << std::endl;
        return 1;
    }

    affect_sdk::ProcessResult result = pipeline.analyzeOnce(
        image.data, image.cols, image.rows, affect_sdk::FrameFormat::BGR);
    if (!result.success) {
        std::cerr << affect_sdk::errorCodeToString(result.error_code) << std::endl;
        return 1;
    }

    std::cout << affect_sdk::toJsonString(result.analysis, 2) << std::endl;
    return 0;
}
