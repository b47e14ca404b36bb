#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace fleet::db::memory {

class MemoryTransaction;

/*
  In-process store for development and tests.

  Each transaction works on a private copy of the committed state. Commit
  installs the copy only if nobody else committed a write since the copy was
  taken; otherwise it throws TransactionConflict and the caller retries.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDevice(Transaction&, const model::DeviceRecord&) override;
  std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string&) override;
  std::optional<model::DeviceRecord> LockDevice(Transaction&, const std::string&) override;
  Result UpdateDevice(Transaction&, const model::DeviceRecord&,
                      fleet::coordinator::core::v1::AdoptionState expected_state) override;
  std::vector<model::DeviceRecord> ListDevices(Transaction&, const DeviceFilter&) override;
  uint64_t CountDevices(Transaction&, const DeviceFilter&) override;
  std::map<fleet::coordinator::core::v1::AdoptionState, uint64_t> CountDevicesByState(Transaction&) override;

  Result InsertAction(Transaction&, model::ActionRecord&) override;
  std::optional<model::ActionRecord> GetAction(Transaction&, uint64_t) override;
  Result UpdateAction(Transaction&, const model::ActionRecord&,
                      fleet::coordinator::core::v1::ActionStatus expected_status) override;
  std::vector<model::ActionRecord> ListActions(Transaction&, const ActionFilter&) override;
  std::map<fleet::coordinator::core::v1::ActionStatus, uint64_t> CountActionsByStatus(Transaction&) override;

  Result AppendAudit(Transaction&, model::AuditRecord&) override;
  std::vector<model::AuditRecord> ListAudit(Transaction&, const AuditFilter&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::DeviceRecord> devices;
    std::map<uint64_t, model::ActionRecord>    actions;
    std::vector<model::AuditRecord>            audit;

    uint64_t next_action_id = 1;
    uint64_t next_entry_id  = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace fleet::db::memory
