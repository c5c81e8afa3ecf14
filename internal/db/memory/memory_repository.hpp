#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace commute::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::LocationRecord> GetLocation(Transaction&, const std::string& label) override;
  Result UpsertLocation(Transaction&, const model::LocationRecord&) override;

  Result InsertSample(Transaction&, model::SampleRecord&) override;
  std::vector<model::SampleRecord> ListSamplesByBatch(Transaction&, const std::string& batch_id) override;
  std::vector<model::SampleRecord> ListSamples(Transaction&, const SampleQuery& query) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::LocationRecord> locations;
    std::vector<model::SampleRecord> samples;
    int64_t next_sample_id = 1;
  };

  std::mutex mutex_;
  State committed_;
};

}
