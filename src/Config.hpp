#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>

namespace Config {
constexpr bool kGhostMode = true;
constexpr bool kLogSearchDepth = false;
constexpr double kTimeLimitMs = 5000.0;
constexpr double kMoveTimeFraction = 0.08;
constexpr double kMinMoveTimeMs = 20.0;
constexpr double kMaxMoveTimeMs = 800.0;
constexpr double kTimeSafetyMarginMs = 10.0;
constexpr int kAiMaxDepth = 32;
constexpr int kAiFixedDepth = 4;
constexpr long long kTimeCheckInterval = 1024;
constexpr int kAiMoveDelayMs = 0;
constexpr int kMaxPlies = 400;
}

#endif
