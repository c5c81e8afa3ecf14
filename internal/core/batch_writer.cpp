#include "batch_writer.hpp"

#include "internal/core/storage_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace commute::core {

using observability::IntField;
using observability::StringField;

BatchWriter::BatchWriter(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<BatchReceipt> BatchWriter::Commit(const std::string& origin_label, const std::string& dest_label,
                                                const std::vector<model::SampleMetrics>& metrics) {
  if (metrics.empty()) {
    return std::nullopt;
  }

  BatchReceipt receipt;
  receipt.batch_id = util::ToString(util::GenerateUUID());
  receipt.batch_ts = util::FormatUtcTimestamp(util::Now());
  receipt.records.reserve(metrics.size());

  auto tx = repository_->Begin();
  try {
    for (const auto& m : metrics) {
      db::model::SampleRecord record;
      record.batch_id                = receipt.batch_id;
      record.batch_ts                = receipt.batch_ts;
      record.origin_label            = origin_label;
      record.dest_label              = dest_label;
      record.description             = m.description;
      record.meters                  = m.meters;
      record.miles                   = m.miles;
      record.duration_seconds        = m.duration_seconds;
      record.duration_static_minutes = m.duration_static_minutes;
      record.duration_minutes        = m.duration_minutes;

      ThrowIfDbError(repository_->InsertSample(*tx, record), "insert sample " + std::to_string(receipt.records.size() + 1) + "/" +
                                                                 std::to_string(metrics.size()));
      receipt.records.push_back(std::move(record));
    }
    tx->Commit();
  } catch (const util::StorageError& e) {
    tx.reset();
    COMMUTE_LOG_ERROR("batch rolled back", {StringField("batch_id", receipt.batch_id), StringField("error", e.what())});
    throw;
  }

  COMMUTE_LOG_INFO("batch committed", {StringField("batch_id", receipt.batch_id), StringField("batch_ts", receipt.batch_ts),
                                       IntField("routes", static_cast<int64_t>(receipt.records.size()))});
  return receipt;
}

} // namespace commute::core
