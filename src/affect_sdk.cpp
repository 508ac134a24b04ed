/**
 * @file affect_sdk.cpp
 * @brief SDK 버전 정보
 */

#include "affect_sdk.h"

namespace affect_sdk {

const char* get_version() {
    return AFFECT_SDK_VERSION_STRING;
}

} // namespace affect_sdk
