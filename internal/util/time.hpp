#pragma once

#include <cstdint>

namespace offline::util {

/*
  Wall-clock helpers. Durable records carry unix epoch milliseconds.
*/

uint64_t NowMillis();

// now - age, clamped at zero
uint64_t MillisAgo(uint64_t now_ms, uint64_t age_ms);

constexpr uint64_t kMillisPerHour = 60ull * 60ull * 1000ull;
constexpr uint64_t kMillisPerDay  = 24ull * kMillisPerHour;

} // namespace offline::util
