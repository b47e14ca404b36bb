#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/fleet_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "fleet/coordinator/core/v1/types.pb.h"

namespace fleet::core {

struct Actor {
  fleet::coordinator::core::v1::ActorType type = fleet::coordinator::core::v1::ACTOR_TYPE_UNSPECIFIED;
  std::string                             id;

  static Actor Device(const std::string& device_id);
  static Actor Reaper();
  // Empty name falls back to kDefaultAdministrator.
  static Actor Administrator(const std::string& name);
};

inline constexpr char kDefaultAdministrator[] = "admin";

struct AuditQuery {
  std::optional<fleet::coordinator::core::v1::SubjectType> subject_type;
  std::optional<std::string>                               subject_id;
  uint64_t                                                 after_entry_id = 0;
  // 0 = kDefaultQueryLimit; capped at kMaxQueryLimit.
  std::size_t limit        = 0;
  bool        newest_first = false;
};

struct FleetSummary {
  std::map<fleet::coordinator::core::v1::AdoptionState, uint64_t> devices_by_state;
  std::map<fleet::coordinator::core::v1::ActionStatus, uint64_t>  actions_by_status;
  uint64_t                                                        devices_total  = 0;
  uint64_t                                                        devices_online = 0;
};

/*
  Append-only record of every state transition.

  Record() writes inside the caller's transaction: if the audit row cannot be
  written the caller's state change rolls back with it. Announce() runs after
  the commit and only logs and counts; it never fails.
*/
class AuditLogger {
 public:
  static constexpr std::size_t kDefaultQueryLimit = 100;
  static constexpr std::size_t kMaxQueryLimit     = 1000;
  static constexpr std::size_t kHistoryLimit      = 500;

  AuditLogger(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, FleetPolicy policy);

  db::model::AuditRecord Record(db::Transaction& tx, fleet::coordinator::core::v1::SubjectType subject_type, const std::string& subject_id,
                                std::string_view from_state, std::string_view to_state, const Actor& actor, std::string details = {});

  void Announce(const std::vector<db::model::AuditRecord>& records) const;

  std::vector<fleet::coordinator::core::v1::AuditEntry> Query(const AuditQuery& query);
  std::vector<fleet::coordinator::core::v1::AuditEntry> History(std::size_t limit = kHistoryLimit);

  FleetSummary Summary();

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  FleetPolicy                     policy_;
};

} // namespace fleet::core
