#pragma once

#include <optional>

#include "config/config.pb.h"
#include "internal/model/direction.hpp"
#include "internal/util/time.hpp"

namespace commute::core {

/*
  Decides which way to sample from the local time of day.

    05:30:00 - 10:30:00  home -> work
    10:40:00 - 18:30:00  work -> home
    otherwise            skip

  Both ends inclusive. A forced direction wins over the clock. The zone is
  resolved up front, so an unknown name fails at construction.
*/
class DirectionSelector {
 public:
  explicit DirectionSelector(const commute::runtime::config::ScheduleConfig& schedule);

  model::Direction Select(util::TimePoint now) const;

  static model::Direction ChooseDirection(const util::TimeOfDay& local, std::optional<model::Direction> forced);

 private:
  const util::TimeZone*           zone_;
  std::optional<model::Direction> forced_;
};

} // namespace commute::core
