#include "direction_selector.hpp"

#include "internal/util/errors.hpp"

namespace commute::core {

namespace {

struct Window {
  util::TimeOfDay  start;
  util::TimeOfDay  end;
  model::Direction direction;
};

constexpr Window kWindows[] = {
    {{5, 30, 0}, {10, 30, 0}, model::Direction::kHomeToWork},
    {{10, 40, 0}, {18, 30, 0}, model::Direction::kWorkToHome},
};

} // namespace

DirectionSelector::DirectionSelector(const commute::runtime::config::ScheduleConfig& schedule)
    : zone_(util::LocateZone(schedule.timezone())) {
  if (!schedule.force_direction().empty()) {
    forced_ = model::ParseDirection(schedule.force_direction());
    if (!forced_) {
      throw util::ConfigurationError("unknown forced direction '" + schedule.force_direction() + "'");
    }
  }
}

model::Direction DirectionSelector::Select(util::TimePoint now) const {
  if (forced_) return *forced_;
  return ChooseDirection(util::LocalTimeOfDay(now, zone_), std::nullopt);
}

model::Direction DirectionSelector::ChooseDirection(const util::TimeOfDay& local, std::optional<model::Direction> forced) {
  if (forced) return *forced;

  const int t = local.SecondsSinceMidnight();
  for (const auto& window : kWindows) {
    if (t >= window.start.SecondsSinceMidnight() && t <= window.end.SecondsSinceMidnight()) {
      return window.direction;
    }
  }
  return model::Direction::kSkip;
}

} // namespace commute::core
