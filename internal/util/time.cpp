#include "time.hpp"

#include <chrono>

namespace offline::util {

uint64_t NowMillis() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

uint64_t MillisAgo(uint64_t now_ms, uint64_t age_ms) {
  return now_ms > age_ms ? now_ms - age_ms : 0;
}

} // namespace offline::util
