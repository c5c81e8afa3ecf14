#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace commute::db::sqlite {

/*
  SQLite-backed repository.

  Every Begin() opens a fresh connection to `path`; the transaction owns it.
  The schema must already exist (see BootstrapSchema).
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::string path);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::LocationRecord> GetLocation(Transaction&, const std::string& label) override;
  Result UpsertLocation(Transaction&, const model::LocationRecord&) override;

  Result InsertSample(Transaction&, model::SampleRecord&) override;
  std::vector<model::SampleRecord> ListSamplesByBatch(Transaction&, const std::string& batch_id) override;
  std::vector<model::SampleRecord> ListSamples(Transaction&, const SampleQuery& query) override;

private:
  std::string path_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
