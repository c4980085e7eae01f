#include "smartuuid/core/random_source.h"

#include <algorithm>

namespace smartuuid::core {

UuidBytes SystemRandomSource::next_bytes() {
  // A version-4 draw leaves 122 random bits; the 6 fixed bits are
  // overwritten by make_v8 anyway, so no entropy that survives is lost.
  const Uuid128 draw = generator_();
  return to_bytes(draw);
}

UuidBytes SequenceRandomSource::next_bytes() {
  const std::uint8_t value = next_.fetch_add(1, std::memory_order_relaxed);
  UuidBytes bytes{};
  std::fill(bytes.begin(), bytes.end(), value);
  return bytes;
}

IRandomSource& default_random_source() {
  thread_local SystemRandomSource source;
  return source;
}

}  // namespace smartuuid::core
