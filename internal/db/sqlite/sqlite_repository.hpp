#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fleet::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace fleet::db::sqlite
