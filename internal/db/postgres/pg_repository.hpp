#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace fleet::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

} // namespace fleet::db::postgres
