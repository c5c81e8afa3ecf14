#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/sample_query.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/location_record.hpp"
#include "internal/db/model/sample_record.hpp"

namespace commute::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - A batch of samples inserted in one transaction is visible all at once
    or not at all

  The DB is the source of truth for:
    resolved location coordinates
    sampled travel times
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Locations
  // ---------------------------------------------------------------------

  virtual std::optional<model::LocationRecord> GetLocation(Transaction&, const std::string& label) = 0;

  // Insert, or overwrite address/lat/lon of an existing label.
  virtual Result UpsertLocation(Transaction&, const model::LocationRecord&) = 0;

  // ---------------------------------------------------------------------
  // Samples (append-only)
  // ---------------------------------------------------------------------

  // Assigns record.id and record.created_at.
  virtual Result InsertSample(Transaction&, model::SampleRecord& record) = 0;

  virtual std::vector<model::SampleRecord> ListSamplesByBatch(Transaction&, const std::string& batch_id) = 0;

  virtual std::vector<model::SampleRecord> ListSamples(Transaction&, const SampleQuery& query) = 0;
};

} // namespace commute::db
