#pragma once

#include "smartuuid/core/uuid128.h"

#include <boost/uuid/random_generator.hpp>

#include <atomic>
#include <cstdint>

namespace smartuuid::core {

// Abstract entropy source for identifier generation.
// Allows production code to draw OS entropy while tests/demos use reproducible bytes.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Draw 16 fresh bytes.
  // Contract: never returns partially filled output; failure is reported by throwing.
  virtual UuidBytes next_bytes() = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Production source: cryptographic-quality bytes from the platform (getrandom/urandom).
// Throws boost::uuids::entropy_error when the platform RNG is unavailable.
// Not thread-safe: use one instance per thread (see default_random_source()).
class SystemRandomSource final : public IRandomSource {
 public:
  SystemRandomSource() = default;
  ~SystemRandomSource() override = default;

  // Not copyable or movable (owns a platform entropy handle)
  SystemRandomSource(const SystemRandomSource&) = delete;
  SystemRandomSource& operator=(const SystemRandomSource&) = delete;
  SystemRandomSource(SystemRandomSource&&) = delete;
  SystemRandomSource& operator=(SystemRandomSource&&) = delete;

  UuidBytes next_bytes() override;

 private:
  boost::uuids::random_generator generator_;
};

// Deterministic source: call N returns 16 copies of (seed + N) mod 256.
// For tests and demos where reproducible output is required.
// Thread-safe. Same sequence of next_bytes() calls produces same bytes.
class SequenceRandomSource final : public IRandomSource {
 public:
  explicit SequenceRandomSource(std::uint8_t seed = 0) : next_(seed) {}
  ~SequenceRandomSource() override = default;

  // Not copyable or movable (contains atomic counter)
  SequenceRandomSource(const SequenceRandomSource&) = delete;
  SequenceRandomSource& operator=(const SequenceRandomSource&) = delete;
  SequenceRandomSource(SequenceRandomSource&&) = delete;
  SequenceRandomSource& operator=(SequenceRandomSource&&) = delete;

  UuidBytes next_bytes() override;

 private:
  std::atomic<std::uint8_t> next_;
};

// default_random_source returns the calling thread's SystemRandomSource.
// Each thread owns its instance, so concurrent generation shares no mutable state.
[[nodiscard]] IRandomSource& default_random_source();

}  // namespace smartuuid::core
