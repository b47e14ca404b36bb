#pragma once

#include <chrono>
#include <cstddef>

namespace fleet::core {

/*
  Durations that shape device liveness, action expiry and the reaper.
  Built once from RuntimeConfig by the factory; tests construct it directly.
*/
struct FleetPolicy {
  static constexpr std::chrono::milliseconds kDefaultOfflineThreshold{std::chrono::seconds(90)};
  static constexpr std::chrono::milliseconds kDefaultPendingAdoptionTtl{std::chrono::hours(24)};
  static constexpr std::chrono::milliseconds kDefaultActionTtl{std::chrono::seconds(3600)};
  static constexpr std::chrono::milliseconds kDefaultMaxActionTtl{std::chrono::hours(24 * 7)};

  // online <=> now - last_seen_at < offline_threshold
  std::chrono::milliseconds offline_threshold = kDefaultOfflineThreshold;

  // Pending devices older than this are auto-rejected by the reaper. Zero disables.
  std::chrono::milliseconds pending_adoption_ttl = kDefaultPendingAdoptionTtl;

  std::chrono::milliseconds default_action_ttl = kDefaultActionTtl;
  std::chrono::milliseconds max_action_ttl     = kDefaultMaxActionTtl;
};

struct ReaperOptions {
  static constexpr std::chrono::milliseconds kDefaultInterval{std::chrono::seconds(10)};
  static constexpr std::size_t               kDefaultBatchSize = 500;

  bool                      enabled    = true;
  std::chrono::milliseconds interval   = kDefaultInterval;
  std::size_t               batch_size = kDefaultBatchSize;
};

} // namespace fleet::core
