#pragma once

#include <cstdint>
#include <string>

#include "fleet/coordinator/core/v1/types.pb.h"

namespace fleet::db::model {

/*
  Persistent action row.

  action_id is assigned by the store on insert (monotonic).
  delivered_at_ms / completed_at_ms are 0 until the matching transition.
  result_json is only set on COMPLETED / FAILED.
*/

struct ActionRecord {
  uint64_t    action_id = 0;
  std::string device_id;
  std::string spec_json;

  fleet::coordinator::core::v1::ActionStatus status = fleet::coordinator::core::v1::ACTION_STATUS_PENDING;

  uint64_t created_at_ms   = 0;
  uint64_t ttl_deadline_ms = 0;
  uint64_t delivered_at_ms = 0;
  uint64_t completed_at_ms = 0;

  std::string result_json;
  std::string created_by;
};

} // namespace fleet::db::model
