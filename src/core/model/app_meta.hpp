#pragma once

#include <string_view>

#ifndef STRIDE_APP_VERSION
#define STRIDE_APP_VERSION "0.3.0"
#endif

#ifndef STRIDE_BUILD_RELEASE
#define STRIDE_BUILD_RELEASE "Streak Core"
#endif

namespace stride {

inline constexpr std::string_view kAppDisplayName = "stride-core::Step Streak Engine";
inline constexpr std::string_view kRecordFormat = "stride-record-v1";
inline constexpr std::string_view kAppVersion = STRIDE_APP_VERSION;
inline constexpr std::string_view kBuildRelease = STRIDE_BUILD_RELEASE;

}  // namespace stride
