#include "internal/core/batch_writer.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../test_support.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using commute::core::BatchWriter;
using commute::db::Repository;
using commute::model::SampleMetrics;

std::vector<SampleMetrics> ThreeRoutes() {
  return {
      {"I-95 N", 16000, 9.9, 1200, 18, 20},
      {"US-1 N", 17500, 10.9, 1500, 21, 25},
      {"NJ-17 S", 19794, 12.3, 1532, 23, 26},
  };
}

std::vector<commute::db::model::SampleRecord> Batch(Repository& repo, const std::string& batch_id) {
  auto tx   = repo.Begin();
  auto rows = repo.ListSamplesByBatch(*tx, batch_id);
  tx->Rollback();
  return rows;
}

size_t AllSamples(Repository& repo) {
  commute::db::SampleQuery query;
  query.origin_label = "Home";
  query.dest_label   = "Work";
  query.since        = "1970-01-01 00:00:00";

  auto tx   = repo.Begin();
  auto rows = repo.ListSamples(*tx, query);
  tx->Rollback();
  return rows.size();
}

void TestBatchIsCohesive(const std::shared_ptr<Repository>& repo) {
  BatchWriter writer(repo);

  const auto receipt = writer.Commit("Home", "Work", ThreeRoutes());
  assert(receipt.has_value());
  assert(receipt->records.size() == 3);
  // dashed RFC4122 version 4
  assert(receipt->batch_id.size() == 36);
  assert(receipt->batch_id[8] == '-' && receipt->batch_id[13] == '-' && receipt->batch_id[18] == '-' &&
         receipt->batch_id[23] == '-');
  assert(receipt->batch_id[14] == '4');
  assert(std::string("89ab").find(receipt->batch_id[19]) != std::string::npos);
  assert(receipt->batch_ts.size() == 19);

  const auto rows = Batch(*repo, receipt->batch_id);
  assert(rows.size() == 3);
  for (const auto& row : rows) {
    assert(row.batch_id == receipt->batch_id);
    assert(row.batch_ts == receipt->batch_ts);
    assert(row.origin_label == "Home");
    assert(row.dest_label == "Work");
    assert(row.id > 0);
    assert(!row.created_at.empty());
  }
  assert(rows[2].description == "NJ-17 S");
  assert(rows[2].meters == 19794);
  assert(rows[2].duration_seconds == 1532);
  assert(rows[2].duration_static_minutes == 23);
  assert(rows[2].duration_minutes == 26);

  // a second invocation gets its own batch
  const auto next = writer.Commit("Home", "Work", ThreeRoutes());
  assert(next->batch_id != receipt->batch_id);
  assert(AllSamples(*repo) == 6);
}

void TestEmptyInputWritesNothing(const std::shared_ptr<Repository>& repo) {
  BatchWriter writer(repo);
  assert(!writer.Commit("Home", "Work", {}).has_value());
  assert(AllSamples(*repo) == 0);
}

void TestFailedInsertRollsBackBatch(const std::shared_ptr<Repository>& repo) {
  auto        failing = std::make_shared<commute::testing::FailingInsertRepository>(repo, 2);
  BatchWriter writer(failing);

  bool threw = false;
  try {
    (void)writer.Commit("Home", "Work", ThreeRoutes());
  } catch (const commute::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(failing->inserts == 2);
  assert(!failing->seen_batch_id.empty());
  assert(Batch(*repo, failing->seen_batch_id).empty());
  assert(AllSamples(*repo) == 0);
}

void TestSqliteConstraintRollsBackBatch() {
  const auto path = commute::testing::FreshSqlitePath("batch_writer_trigger");
  {
    commute::db::sqlite::SqliteDB db(path);
    db.Exec(
        "CREATE TRIGGER reject_second_route BEFORE INSERT ON samples "
        "WHEN (SELECT COUNT(*) FROM samples WHERE batch_id = NEW.batch_id) >= 1 "
        "BEGIN SELECT RAISE(ABORT, 'second route rejected'); END;");
  }

  auto        repo = std::make_shared<commute::db::sqlite::SqliteRepository>(path);
  BatchWriter writer(repo);

  bool threw = false;
  try {
    (void)writer.Commit("Home", "Work", ThreeRoutes());
  } catch (const commute::util::StorageError& e) {
    threw = std::string(e.what()).find("second route rejected") != std::string::npos;
  }
  assert(threw);
  assert(AllSamples(*repo) == 0);

  // a single-route batch still goes through
  const auto receipt = writer.Commit("Home", "Work", {ThreeRoutes()[0]});
  assert(receipt.has_value());
  assert(AllSamples(*repo) == 1);
}

} // namespace

int main() {
  TestBatchIsCohesive(std::make_shared<commute::db::memory::MemoryRepository>());
  TestBatchIsCohesive(commute::testing::MakeSqliteRepository("batch_writer_cohesive"));

  TestEmptyInputWritesNothing(std::make_shared<commute::db::memory::MemoryRepository>());
  TestEmptyInputWritesNothing(commute::testing::MakeSqliteRepository("batch_writer_empty"));

  TestFailedInsertRollsBackBatch(std::make_shared<commute::db::memory::MemoryRepository>());
  TestFailedInsertRollsBackBatch(commute::testing::MakeSqliteRepository("batch_writer_failed_insert"));

  TestSqliteConstraintRollsBackBatch();

  std::cout << "commute_unit_batch_writer: pass\n";
  return 0;
}
