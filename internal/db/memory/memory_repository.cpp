#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace commute::db::memory {

namespace {

// "YYYY-MM-DD HH:MM:SS" -> "HH:MM:SS"
std::string ClockPart(const std::string& timestamp) {
  return timestamp.size() >= 19 ? timestamp.substr(11, 8) : std::string();
}

bool ChronologicalLess(const model::SampleRecord& a, const model::SampleRecord& b) {
  if (a.created_at != b.created_at) return a.created_at < b.created_at;
  return a.id < b.id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::LocationRecord> MemoryRepository::GetLocation(Transaction& t, const std::string& label) {
  const auto& s  = TX(t).View();
  auto        it = s.locations.find(label);
  if (it == s.locations.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertLocation(Transaction& t, const model::LocationRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.locations.find(r.label);
  if (it == s.locations.end()) {
    auto record = r;
    if (record.created_at.empty()) record.created_at = util::FormatUtcTimestamp(util::Now());
    s.locations.emplace(record.label, std::move(record));
    return Result::Ok();
  }

  it->second.address = r.address;
  it->second.lat     = r.lat;
  it->second.lon     = r.lon;
  return Result::Ok();
}

Result MemoryRepository::InsertSample(Transaction& t, model::SampleRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.created_at.empty()) r.created_at = util::FormatUtcTimestamp(util::Now());
  r.id = s.next_sample_id++;
  s.samples.push_back(r);
  return Result::Ok();
}

std::vector<model::SampleRecord> MemoryRepository::ListSamplesByBatch(Transaction& t, const std::string& batch_id) {
  std::vector<model::SampleRecord> out;
  for (const auto& r : TX(t).View().samples)
    if (r.batch_id == batch_id) out.push_back(r);
  return out;
}

std::vector<model::SampleRecord> MemoryRepository::ListSamples(Transaction& t, const SampleQuery& q) {
  std::vector<model::SampleRecord> out;
  for (const auto& r : TX(t).View().samples) {
    if (r.origin_label != q.origin_label || r.dest_label != q.dest_label) continue;
    if (r.created_at < q.since) continue;

    const auto clock = ClockPart(r.created_at);
    if (q.time_of_day_start && clock < *q.time_of_day_start) continue;
    if (q.time_of_day_end && clock > *q.time_of_day_end) continue;

    out.push_back(r);
  }

  std::sort(out.begin(), out.end(), ChronologicalLess);
  if (q.limit && out.size() > *q.limit) {
    out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(*q.limit));
  }
  return out;
}

} // namespace commute::db::memory
