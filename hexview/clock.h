// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __HEXVIEW_CLOCK_H
#define __HEXVIEW_CLOCK_H

#include <cstdint>
#include <time.h>

namespace hexview {

// Current monotonic time in nanoseconds.
inline uint64_t Now() {
  struct timespec tp;
  clock_gettime(CLOCK_MONOTONIC, &tp);
  return static_cast<uint64_t>(tp.tv_sec) * 1000000000LL +
         static_cast<uint64_t>(tp.tv_nsec);
}

// Wall clock time in nanoseconds since the epoch, for log timestamps.
inline uint64_t WallTime() {
  struct timespec tp;
  clock_gettime(CLOCK_REALTIME, &tp);
  return static_cast<uint64_t>(tp.tv_sec) * 1000000000LL +
         static_cast<uint64_t>(tp.tv_nsec);
}

} // namespace hexview

#endif //  __HEXVIEW_CLOCK_H
