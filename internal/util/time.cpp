#include "time.hpp"

namespace assetdiff::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::optional<std::pair<int, int>> ParseDailyAt(const std::string& value) {
  if (value.size() != 5 || value[2] != ':') {
    return std::nullopt;
  }
  for (std::size_t i : {0u, 1u, 3u, 4u}) {
    if (value[i] < '0' || value[i] > '9') return std::nullopt;
  }

  const int hour   = (value[0] - '0') * 10 + (value[1] - '0');
  const int minute = (value[3] - '0') * 10 + (value[4] - '0');
  if (hour >= 24 || minute >= 60) {
    return std::nullopt;
  }
  return std::make_pair(hour, minute);
}

TimePoint NextDailyTrigger(TimePoint now, int hour, int minute) {
  using namespace std::chrono;

  const auto day_start = floor<days>(now);
  auto       trigger   = day_start + hours(hour) + minutes(minute);
  if (trigger <= now) {
    trigger += days(1);
  }
  return time_point_cast<Clock::duration>(trigger);
}

} // namespace assetdiff::util
