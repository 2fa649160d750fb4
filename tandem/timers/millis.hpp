#pragma once

#include <chrono>

namespace tandem::timers {

using Millis = std::chrono::milliseconds;

template <typename Duration>
inline Millis ToMillis(Duration dur) {
  return std::chrono::duration_cast<Millis>(dur);
}

}  // namespace tandem::timers
