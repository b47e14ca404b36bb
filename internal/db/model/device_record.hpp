#pragma once

#include <cstdint>
#include <string>

#include "fleet/coordinator/core/v1/types.pb.h"

namespace fleet::db::model {

/*
  Persistent device row.

  device_id and registered_at_ms never change after insert.
  system_info_json is the agent's last snapshot (SystemInfo as JSON), replaced wholesale.
*/

struct DeviceRecord {
  std::string device_id;

  fleet::coordinator::core::v1::AdoptionState adoption_state = fleet::coordinator::core::v1::ADOPTION_STATE_PENDING;

  uint64_t registered_at_ms = 0;
  uint64_t last_seen_at_ms  = 0;

  std::string system_info_json;
};

} // namespace fleet::db::model
