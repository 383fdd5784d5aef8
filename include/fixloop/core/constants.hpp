#pragma once

#include <chrono>
#include <cstddef>

namespace fixloop {

namespace io {
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kInitialOutputReserve = 8192;
inline constexpr std::size_t kMaxOutputSize = 10 * 1024 * 1024;
// Test output kept on the attempt record
inline constexpr std::size_t kStoredOutputSize = 64 * 1024;
}  // namespace io

namespace timing {
inline constexpr auto kSandboxPollInterval = std::chrono::milliseconds(100);
inline constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
inline constexpr auto kDaemonPollInterval = std::chrono::milliseconds(100);
inline constexpr auto kLostRaceRedeliveryDelay = std::chrono::seconds(30);
inline constexpr auto kStoreErrorRedeliveryDelay = std::chrono::seconds(5);
inline constexpr auto kRetentionSweepInterval = std::chrono::minutes(10);
}  // namespace timing

namespace limits {
inline constexpr int kMaxAttemptsCeiling = 10;
inline constexpr int kDefaultMaxAttempts = 3;
inline constexpr int kDefaultReviewRetryLimit = 2;
inline constexpr std::size_t kPromptLogPreview = 500;
}  // namespace limits

}  // namespace fixloop
