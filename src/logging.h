/**
 * @file logging.h
 * @brief 내부 stderr 로그 헬퍼
 *
 * "[AffectSDK][LEVEL] message" 형식으로 출력.
 * 출력 여부는 프로세스 전역 플래그 (PipelineConfig::enable_logging 으로 설정).
 */

#pragma once

namespace affect_sdk {
namespace internal {

void setLoggingEnabled(bool enabled);
bool isLoggingEnabled();

void logInfo(const char* format, ...);
void logWarn(const char* format, ...);
void logError(const char* format, ...);

} // namespace internal
} // namespace affect_sdk
