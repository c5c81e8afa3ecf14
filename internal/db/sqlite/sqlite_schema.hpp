#pragma once

#include "sqlite_db.hpp"

namespace commute::db::sqlite {

// Creates tables and read-path indexes. Safe to run on every start.
void BootstrapSchema(SqliteDB& db);

} // namespace commute::db::sqlite
