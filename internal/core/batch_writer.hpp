#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/sample_metrics.hpp"

namespace commute::core {

struct BatchReceipt {
  std::string batch_id;
  std::string batch_ts;

  // Rows as written, ids assigned.
  std::vector<db::model::SampleRecord> records;
};

/*
  Persists all route alternatives of one invocation as one batch.

  Every record gets the same freshly generated batch_id and batch_ts. The
  inserts share one transaction: on any failure nothing is kept and
  util::StorageError propagates. An empty input writes nothing and returns
  nullopt.
*/
class BatchWriter {
 public:
  explicit BatchWriter(std::shared_ptr<db::Repository> repository);

  std::optional<BatchReceipt> Commit(const std::string& origin_label, const std::string& dest_label,
                                     const std::vector<model::SampleMetrics>& metrics);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace commute::core
