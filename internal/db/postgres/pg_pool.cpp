#include "pg_pool.hpp"

namespace fleet::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) {
        return Wrap(conn.release());
      }
      // dropped by the server; forget it and make room for a fresh one
      --live_connections_;
      continue;
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_device",
               "SELECT device_id,adoption_state,registered_at_ms,last_seen_at_ms,system_info "
               "FROM devices WHERE device_id=$1");

  conn.prepare("lock_device",
               "SELECT device_id,adoption_state,registered_at_ms,last_seen_at_ms,system_info "
               "FROM devices WHERE device_id=$1 FOR UPDATE");

  conn.prepare("insert_device",
               "INSERT INTO devices(device_id,adoption_state,registered_at_ms,last_seen_at_ms,system_info) "
               "VALUES($1,$2,$3,$4,$5) ON CONFLICT (device_id) DO NOTHING");

  conn.prepare("update_device",
               "UPDATE devices SET adoption_state=$2,last_seen_at_ms=$3,system_info=$4 "
               "WHERE device_id=$1 AND adoption_state=$5");

  conn.prepare("get_action",
               "SELECT action_id,device_id,spec,status,created_at_ms,ttl_deadline_ms,delivered_at_ms,completed_at_ms,result,created_by "
               "FROM actions WHERE action_id=$1");

  conn.prepare("insert_action",
               "INSERT INTO actions(device_id,spec,status,created_at_ms,ttl_deadline_ms,delivered_at_ms,completed_at_ms,result,created_by) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) RETURNING action_id");

  conn.prepare("update_action",
               "UPDATE actions SET status=$2,ttl_deadline_ms=$3,delivered_at_ms=$4,completed_at_ms=$5,result=$6 "
               "WHERE action_id=$1 AND status=$7");

  conn.prepare("insert_audit",
               "INSERT INTO audit_log(timestamp_ms,subject_type,subject_id,from_state,to_state,actor_type,actor_id,details) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING entry_id");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace fleet::db::postgres
