#include "flakeid/flake/generator.h"

namespace flakeid::flake {

namespace {

using CreateResult = core::Result<std::shared_ptr<Generator>, core::CreateError>;
using IssueResult = core::Result<Id, core::IssueError>;

}  // namespace

CreateResult Generator::create(const Settings& settings, core::IClock& clock) {
  if (settings.start_time.has_value() && settings.start_time.value() > clock.now()) {
    return CreateResult::err(core::CreateError::kStartTimeInFuture);
  }
  const core::Timestamp start = settings.start_time.value_or(core::kDefaultStartTime);

  std::uint16_t machine_id = 0;
  if (settings.machine_id) {
    const auto result = settings.machine_id();
    if (!result.has_value()) {
      return CreateResult::err(core::CreateError::kMachineIdUnavailable);
    }
    machine_id = result.value();
  }

  std::uint16_t service_id = 0;
  if (settings.service_id) {
    const auto result = settings.service_id();
    if (!result.has_value()) {
      return CreateResult::err(core::CreateError::kServiceIdUnavailable);
    }
    service_id = result.value();
  }

  if (machine_id > kMaxMachineId) {
    return CreateResult::err(core::CreateError::kMachineIdOutOfRange);
  }
  if (service_id > kMaxServiceId) {
    return CreateResult::err(core::CreateError::kServiceIdOutOfRange);
  }

  if (settings.check_machine_id && !settings.check_machine_id(machine_id)) {
    return CreateResult::err(core::CreateError::kMachineIdRejected);
  }
  if (settings.check_service_id && !settings.check_service_id(service_id)) {
    return CreateResult::err(core::CreateError::kServiceIdRejected);
  }

  // Private constructor: std::make_shared cannot reach it.
  return CreateResult::ok(std::shared_ptr<Generator>(
      new Generator(clock, core::to_ticks(start), machine_id, service_id)));
}

Generator::Generator(core::IClock& clock, const std::int64_t start_ticks,
                     const std::uint16_t machine_id, const std::uint16_t service_id)
    : clock_(clock), start_ticks_(start_ticks), machine_id_(machine_id), service_id_(service_id) {}

IssueResult Generator::next_id() {
  std::lock_guard<std::mutex> lock(mutex_);

  const std::int64_t current = current_elapsed_time();
  if (elapsed_time_ < current) {
    elapsed_time_ = current;
    sequence_ = 0;
  } else {
    // Same tick, or the clock went backwards: stay on the recorded tick.
    sequence_ = static_cast<std::uint16_t>((sequence_ + 1) & kMaxSequence);
    if (sequence_ == 0) {
      ++elapsed_time_;
      sleep_until_elapsed(elapsed_time_);
    }
  }

  if (elapsed_time_ > static_cast<std::int64_t>(kMaxTime)) {
    return IssueResult::err(core::IssueError::kOverTimeLimit);
  }
  return IssueResult::ok(compose(static_cast<std::uint64_t>(elapsed_time_), machine_id_,
                                 service_id_, sequence_));
}

std::int64_t Generator::current_elapsed_time() {
  return core::to_ticks(clock_.now()) - start_ticks_;
}

void Generator::sleep_until_elapsed(const std::int64_t elapsed) {
  const core::Timestamp boundary = core::from_ticks(start_ticks_ + elapsed);
  const core::Timestamp now = clock_.now();
  if (boundary > now) {
    clock_.sleep_for(boundary - now);
  }
}

}  // namespace flakeid::flake
