#pragma once

#include <cstdint>
#include <string>

#include "fleet/coordinator/core/v1/types.pb.h"

namespace fleet::db::model {

// Append-only. entry_id is assigned by the store.
struct AuditRecord {
  uint64_t entry_id     = 0;
  uint64_t timestamp_ms = 0;

  fleet::coordinator::core::v1::SubjectType subject_type = fleet::coordinator::core::v1::SUBJECT_TYPE_UNSPECIFIED;
  std::string                               subject_id;

  std::string from_state;
  std::string to_state;

  fleet::coordinator::core::v1::ActorType actor_type = fleet::coordinator::core::v1::ACTOR_TYPE_UNSPECIFIED;
  std::string                             actor_id;

  std::string details;
};

} // namespace fleet::db::model
