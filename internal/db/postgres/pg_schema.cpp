#include "pg_schema.hpp"

namespace fleet::db::postgres {

void BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS devices (device_id TEXT PRIMARY KEY, adoption_state TEXT NOT NULL, registered_at_ms BIGINT NOT NULL, "
          "last_seen_at_ms BIGINT NOT NULL, system_info TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE INDEX IF NOT EXISTS devices_state_idx ON devices(adoption_state, registered_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS actions (action_id BIGSERIAL PRIMARY KEY, device_id TEXT NOT NULL REFERENCES devices(device_id), "
          "spec TEXT NOT NULL, status TEXT NOT NULL, created_at_ms BIGINT NOT NULL, ttl_deadline_ms BIGINT NOT NULL, "
          "delivered_at_ms BIGINT NOT NULL DEFAULT 0, completed_at_ms BIGINT NOT NULL DEFAULT 0, result TEXT NOT NULL DEFAULT '', "
          "created_by TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE INDEX IF NOT EXISTS actions_device_status_idx ON actions(device_id, status, created_at_ms);");
  tx.exec("CREATE INDEX IF NOT EXISTS actions_status_deadline_idx ON actions(status, ttl_deadline_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS audit_log (entry_id BIGSERIAL PRIMARY KEY, timestamp_ms BIGINT NOT NULL, subject_type TEXT NOT NULL, "
          "subject_id TEXT NOT NULL, from_state TEXT NOT NULL, to_state TEXT NOT NULL, actor_type TEXT NOT NULL, actor_id TEXT NOT NULL, "
          "details TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE INDEX IF NOT EXISTS audit_subject_idx ON audit_log(subject_type, subject_id, entry_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS fleet_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");
  tx.exec("INSERT INTO fleet_schema_migrations(version) VALUES(1) ON CONFLICT DO NOTHING;");

  tx.exec("SELECT device_id,adoption_state,registered_at_ms,last_seen_at_ms,system_info FROM devices LIMIT 1;");
  tx.exec("SELECT action_id,device_id,spec,status,created_at_ms,ttl_deadline_ms,delivered_at_ms,completed_at_ms,result,created_by FROM actions LIMIT 1;");
  tx.exec("SELECT entry_id,timestamp_ms,subject_type,subject_id,from_state,to_state,actor_type,actor_id,details FROM audit_log LIMIT 1;");
  tx.commit();
}

} // namespace fleet::db::postgres
