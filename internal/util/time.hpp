#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace assetdiff::util {

/*
  Time utilities. Single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);

// "HH:MM" -> (hour, minute)
std::optional<std::pair<int, int>> ParseDailyAt(const std::string& value);

/*
  Next occurrence of hour:minute UTC strictly after `now`.
*/
TimePoint NextDailyTrigger(TimePoint now, int hour, int minute);

} // namespace assetdiff::util
