#pragma once

#include <chrono>

namespace tandem {

// system_clock, since dates written on the wire need conversions to Unix epoch time.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

}  // namespace tandem
