#pragma once

#include <cstdint>

#include "sdmount_config.hpp"
#include "sdmount_port.hpp"

namespace sdmount {

// Cooperative single-caller throttle: keeps consecutive storage operations at
// least floor_ms apart. It does not order concurrent callers.
struct RateLimiter {
    Clock *clock = nullptr;
    uint32_t floor_ms = kDiagRateFloorMs;
    int64_t last_op_us = 0;
    bool has_last_op = false;
};

void rate_limiter_init(RateLimiter *limiter, Clock *clock, uint32_t floor_ms);

// Blocks until floor_ms has passed since the previous operation (no wait for
// the first one), then records now. Returns the time spent waiting in us.
int64_t rate_limiter_throttle(RateLimiter *limiter);

// Forgets the previous operation; the next throttle never waits.
void rate_limiter_reset(RateLimiter *limiter);

}  // namespace sdmount
