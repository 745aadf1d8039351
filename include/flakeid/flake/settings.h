#pragma once

#include "flakeid/core/result.h"
#include "flakeid/core/time.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace flakeid::flake {

// IdProvider yields a machine or service ID, or a reason it could not.
using IdProvider = std::function<core::Result<std::uint16_t, std::string>()>;

// IdValidator accepts or rejects an obtained ID (e.g. a uniqueness check).
using IdValidator = std::function<bool(std::uint16_t)>;

// Settings is the construction input of a Generator.
//
// start_time: elapsed time is counted from here. Unset means kDefaultStartTime.
//   A start time ahead of the current time prevents creation.
// machine_id / service_id: evaluated once during creation. Unset means ID 0.
//   A provider error prevents creation.
// check_machine_id / check_service_id: unset means no validation.
//   Returning false prevents creation.
struct Settings {
  std::optional<core::Timestamp> start_time;  // NOLINT(readability-identifier-naming)
  IdProvider machine_id;                      // NOLINT(readability-identifier-naming)
  IdProvider service_id;                      // NOLINT(readability-identifier-naming)
  IdValidator check_machine_id;               // NOLINT(readability-identifier-naming)
  IdValidator check_service_id;               // NOLINT(readability-identifier-naming)

  // use_fixed_ids installs providers that always return the given IDs.
  void use_fixed_ids(std::uint16_t machine, std::uint16_t service);

  void set_start_time(core::Timestamp ts) { start_time = ts; }
};

}  // namespace flakeid::flake
