#pragma once

#include <chrono>
#include <cstdint>

class Timer
{
public:
  /* monotonic clock, for cadences and durations */
  static inline uint64_t timestamp_ns()
  {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch() )
      .count();
  }

  static inline double timestamp_s() { return timestamp_ns() / 1e9; }

  /* wall clock, embedded in media units so a receiver on another host can measure latency */
  static inline double wall_clock_s()
  {
    return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::system_clock::now().time_since_epoch() )
             .count()
           / 1e6;
  }
};
