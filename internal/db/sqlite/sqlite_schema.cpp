#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace commute::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS locations (id INTEGER PRIMARY KEY, label TEXT NOT NULL UNIQUE, address TEXT NOT NULL, lat REAL, lon REAL, created_at DATETIME DEFAULT CURRENT_TIMESTAMP);",
      "CREATE TABLE IF NOT EXISTS samples (id INTEGER PRIMARY KEY, created_at DATETIME DEFAULT CURRENT_TIMESTAMP, batch_id TEXT NOT NULL, batch_ts DATETIME NOT NULL, origin_label TEXT NOT NULL, dest_label TEXT NOT NULL, description TEXT NOT NULL, meters INTEGER NOT NULL, miles REAL NOT NULL, duration_seconds INTEGER NOT NULL, duration_static_minutes INTEGER NOT NULL, duration_minutes INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_samples_batch ON samples(batch_id);",
      "CREATE INDEX IF NOT EXISTS idx_samples_batch_ts ON samples(batch_ts);",
      "CREATE INDEX IF NOT EXISTS idx_samples_route ON samples(origin_label, dest_label);",
      "CREATE INDEX IF NOT EXISTS idx_samples_created_at ON samples(created_at);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT label,address,lat,lon,created_at FROM locations LIMIT 1;");
  db.Exec("SELECT id,created_at,batch_id,batch_ts,origin_label,dest_label,description,meters,miles,duration_seconds,duration_static_minutes,duration_minutes FROM samples LIMIT 1;");
}

} // namespace commute::db::sqlite
