#pragma once

#include "sqlite_db.hpp"

namespace fleet::db::sqlite {

// Creates devices / actions / audit_log when missing and checks their columns.
void BootstrapSchema(SqliteDB& db);

} // namespace fleet::db::sqlite
