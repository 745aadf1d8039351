#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/core/time.h"
#include "flakeid/flake/layout.h"
#include "flakeid/flake/settings.h"

#include <cstdint>
#include <memory>
#include <mutex>

namespace flakeid::flake {

// Generator issues unique, time-ordered 64-bit identifiers.
//
// Identifiers are unique per (machine ID, service ID) pair and strictly increasing while the
// clock moves forward. Up to 4096 identifiers are issued per 10 ms tick; once a tick's
// sequence space is exhausted, next_id() blocks the caller until the following tick begins.
// A clock that moves backwards is tolerated: issuance continues on the last recorded tick.
//
// Thread-safe: next_id() is serialized by an internal mutex, including the wait.
class Generator {
 public:
  // create validates the settings and evaluates the providers once.
  // `clock` must outlive the returned generator.
  [[nodiscard]] static core::Result<std::shared_ptr<Generator>, core::CreateError> create(
      const Settings& settings, core::IClock& clock = core::system_clock());

  ~Generator() = default;

  // Not copyable or movable (owns the issuance state and its mutex)
  Generator(const Generator&) = delete;
  Generator& operator=(const Generator&) = delete;
  Generator(Generator&&) = delete;
  Generator& operator=(Generator&&) = delete;

  // next_id fails with kOverTimeLimit once 2^41 ticks have elapsed since the start time.
  // The failure is permanent for this instance.
  [[nodiscard]] core::Result<Id, core::IssueError> next_id();

  [[nodiscard]] std::uint16_t machine_id() const { return machine_id_; }
  [[nodiscard]] std::uint16_t service_id() const { return service_id_; }
  [[nodiscard]] core::Timestamp start_time() const { return core::from_ticks(start_ticks_); }

 private:
  Generator(core::IClock& clock, std::int64_t start_ticks, std::uint16_t machine_id,
            std::uint16_t service_id);

  [[nodiscard]] std::int64_t current_elapsed_time();
  void sleep_until_elapsed(std::int64_t elapsed);

  core::IClock& clock_;
  const std::int64_t start_ticks_;
  const std::uint16_t machine_id_;
  const std::uint16_t service_id_;

  std::mutex mutex_;
  std::int64_t elapsed_time_{0};
  // Starts at the maximum so the first issuance on the start tick wraps to a fresh tick.
  std::uint16_t sequence_{kMaxSequence};
};

}  // namespace flakeid::flake
