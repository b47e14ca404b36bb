#pragma once

#include <chrono>
#include <cstdint>

#include "internal/db/model/action_record.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/util/time.hpp"
#include "fleet/coordinator/core/v1/types.pb.h"

namespace fleet::core {

// Derived liveness; never stored.
bool IsOnline(const db::model::DeviceRecord& record, util::TimePoint now, std::chrono::milliseconds offline_threshold);

// Smallest last_seen_at_ms that IsOnline accepts at `now`; never 0.
uint64_t OnlineSinceMs(util::TimePoint now, std::chrono::milliseconds offline_threshold);

fleet::coordinator::core::v1::Device ToDevice(const db::model::DeviceRecord& record, util::TimePoint now,
                                              std::chrono::milliseconds offline_threshold);

fleet::coordinator::core::v1::Action ToAction(const db::model::ActionRecord& record);

fleet::coordinator::core::v1::AuditEntry ToAuditEntry(const db::model::AuditRecord& record);

} // namespace fleet::core
