#pragma once

#include <string_view>

#ifndef CPANBRIDGE_VERSION
#define CPANBRIDGE_VERSION "1.0.0"
#endif

namespace cpanbridge {

inline constexpr std::string_view kDaemonVersion = CPANBRIDGE_VERSION;

}  // namespace cpanbridge
