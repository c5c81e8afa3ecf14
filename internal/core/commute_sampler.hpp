#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/batch_writer.hpp"
#include "internal/core/direction_selector.hpp"
#include "internal/core/location_resolver.hpp"
#include "internal/core/route_client.hpp"
#include "internal/model/direction.hpp"
#include "internal/model/sample_metrics.hpp"
#include "internal/util/time.hpp"

namespace commute::core {

struct SampleRun {
  model::Direction direction = model::Direction::kSkip;

  std::string origin_label;
  std::string dest_label;

  std::vector<model::SampleMetrics> routes;

  // Absent when the run was skipped.
  std::optional<BatchReceipt> batch;
};

/*
  One sampling invocation:

    select direction -> resolve origin/destination -> fetch routes
                     -> extract every route -> commit one batch

  Any failure propagates before the commit, so a failed run writes no
  samples. Location cache upserts made before the failure stay.
*/
class CommuteSampler {
 public:
  CommuteSampler(const commute::runtime::config::RuntimeConfig& config, std::shared_ptr<LocationResolver> resolver,
                 std::shared_ptr<RouteClient> routes, std::shared_ptr<BatchWriter> writer);

  SampleRun RunOnce(util::TimePoint now);

 private:
  commute::runtime::config::EndpointConfig home_;
  commute::runtime::config::EndpointConfig work_;

  DirectionSelector                 selector_;
  std::shared_ptr<LocationResolver> resolver_;
  std::shared_ptr<RouteClient>      routes_;
  std::shared_ptr<BatchWriter>      writer_;
};

} // namespace commute::core
