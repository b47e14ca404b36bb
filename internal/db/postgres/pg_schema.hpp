#pragma once

#include "pg_pool.hpp"

namespace fleet::db::postgres {

void BootstrapSchema(PgPool& pool);

} // namespace fleet::db::postgres
