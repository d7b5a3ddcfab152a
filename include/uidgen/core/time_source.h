#pragma once

#include "uidgen/core/time.h"

namespace uidgen::core {

// Abstract time source for instant injection.
// Allows production code to read the system clock while tests drive a simulated one.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class ITimeSource {
 public:
  virtual ~ITimeSource() = default;

  // Return the current instant.
  // Contract: non-blocking; called once per generated identifier.
  virtual Timestamp now() = 0;

 protected:
  ITimeSource() = default;
  ITimeSource(const ITimeSource&) = default;
  ITimeSource& operator=(const ITimeSource&) = default;
  ITimeSource(ITimeSource&&) = default;
  ITimeSource& operator=(ITimeSource&&) = default;
};

// Production time source: returns the system clock (UTC).
class SystemTimeSource final : public ITimeSource {
 public:
  SystemTimeSource() = default;
  ~SystemTimeSource() override = default;

  SystemTimeSource(const SystemTimeSource&) = default;
  SystemTimeSource& operator=(const SystemTimeSource&) = default;
  SystemTimeSource(SystemTimeSource&&) = default;
  SystemTimeSource& operator=(SystemTimeSource&&) = default;

  Timestamp now() override;
};

// Fixed time source: returns the same instant until moved by set() or advance().
// For deterministic tests and replays.
class FixedTimeSource final : public ITimeSource {
 public:
  explicit FixedTimeSource(Timestamp fixed_time) : fixed_time_(fixed_time) {}
  ~FixedTimeSource() override = default;

  FixedTimeSource(const FixedTimeSource&) = default;
  FixedTimeSource& operator=(const FixedTimeSource&) = default;
  FixedTimeSource(FixedTimeSource&&) = default;
  FixedTimeSource& operator=(FixedTimeSource&&) = default;

  Timestamp now() override;

  void set(Timestamp fixed_time) { fixed_time_ = fixed_time; }
  void advance(Clock::duration delta) { fixed_time_ += delta; }

 private:
  Timestamp fixed_time_;
};

}  // namespace uidgen::core
