/**
 * @file affect_sdk.h
 * @brief AffectSDK - Main header file
 *
 * Real-time facial emotion analysis pipeline for live sessions
 *
 * @version 0.2.0
 * @copyright 2026
 */

#ifndef AFFECT_SDK_H
#define AFFECT_SDK_H

// Version info
#define AFFECT_SDK_VERSION_MAJOR 0
#define AFFECT_SDK_VERSION_MINOR 2
#define AFFECT_SDK_VERSION_PATCH 0
#define AFFECT_SDK_VERSION_STRING "0.2.0"

#include "affect_sdk/types.h"
#include "affect_sdk/config.h"
#include "affect_sdk/landmark_extractor.h"
#include "affect_sdk/emotion_classifier.h"
#include "affect_sdk/micro_signal_analyzer.h"
#include "affect_sdk/fusion_engine.h"
#include "affect_sdk/session_pipeline.h"
#include "affect_sdk/serialization.h"

namespace affect_sdk {

/**
 * @brief Get SDK version string
 * @return Version string (e.g., "0.2.0")
 */
AFFECT_SDK_EXPORT const char* get_version();

} // namespace affect_sdk

#endif // AFFECT_SDK_H
