#include "backoff.hpp"

int64_t backoff_delay_ms(int64_t base_ms, int retry_count, int64_t cap_ms) {
    if (base_ms <= 0) return 0;
    if (base_ms >= cap_ms) return cap_ms;

    int64_t delay = base_ms;
    for (int i = 1; i < retry_count; ++i) {
        if (delay > cap_ms / 2) return cap_ms;
        delay *= 2;
    }
    return delay < cap_ms ? delay : cap_ms;
}
