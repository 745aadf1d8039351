#pragma once

#include "flakeid/core/time.h"

#include <mutex>

namespace flakeid::core {

// Abstract clock interface for time injection.
// Allows production code to use system time while tests/demos control time explicitly.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return the current wall-clock instant.
  virtual Timestamp now() = 0;

  // Suspend the calling thread for at least `duration`.
  // Contract: after return, now() has advanced by at least `duration`.
  virtual void sleep_for(Duration duration) = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time and really sleeps.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Timestamp now() override;
  void sleep_for(Duration duration) override;
};

// Manual clock: time only moves when told to, for deterministic tests/demos.
// sleep_for() advances the clock instead of blocking and records the total slept duration.
// Thread-safe.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(Timestamp start) : now_(start) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains mutex)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  Timestamp now() override;
  void sleep_for(Duration duration) override;

  void set(Timestamp ts);
  void advance(Duration duration);
  [[nodiscard]] Duration total_slept() const;

 private:
  mutable std::mutex mutex_;
  Timestamp now_;
  Duration slept_{Duration::zero()};
};

// system_clock returns the process-wide SystemClock instance.
SystemClock& system_clock();

}  // namespace flakeid::core
