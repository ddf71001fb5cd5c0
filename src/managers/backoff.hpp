#pragma once

#include <cstdint>
#include <core/constants.hpp>

// Delay before retry number `retry_count` (1-based):
// base_ms * 2^(retry_count-1), never above cap_ms.
int64_t backoff_delay_ms(int64_t base_ms, int retry_count, int64_t cap_ms = RETRY_MAX_BACKOFF_MS);
