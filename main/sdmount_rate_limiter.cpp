#include "sdmount_rate_limiter.hpp"

#include "esp_log.h"

namespace sdmount {
namespace {

constexpr const char *kTag = "sdmount_rate";

}  // namespace

void rate_limiter_init(RateLimiter *limiter, Clock *clock, uint32_t floor_ms)
{
    if (limiter == nullptr) {
        return;
    }
    limiter->clock = clock;
    limiter->floor_ms = floor_ms;
    rate_limiter_reset(limiter);
}

int64_t rate_limiter_throttle(RateLimiter *limiter)
{
    if (limiter == nullptr || limiter->clock == nullptr) {
        return 0;
    }

    int64_t waited_us = 0;
    const int64_t floor_us = static_cast<int64_t>(limiter->floor_ms) * 1000;
    if (limiter->has_last_op) {
        const int64_t since_last_us = limiter->clock->now_us() - limiter->last_op_us;
        if (since_last_us < floor_us) {
            waited_us = floor_us - since_last_us;
            ESP_LOGD(kTag, "rate limiting: waiting %.3fs", waited_us / 1e6);
            limiter->clock->sleep_us(waited_us);
        }
    }

    limiter->last_op_us = limiter->clock->now_us();
    limiter->has_last_op = true;
    return waited_us;
}

void rate_limiter_reset(RateLimiter *limiter)
{
    if (limiter == nullptr) {
        return;
    }
    limiter->last_op_us = 0;
    limiter->has_last_op = false;
}

}  // namespace sdmount
