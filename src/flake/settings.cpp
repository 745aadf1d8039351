#include "flakeid/flake/settings.h"

#include "flakeid/flake/providers.h"

namespace flakeid::flake {

void Settings::use_fixed_ids(const std::uint16_t machine, const std::uint16_t service) {
  machine_id = fixed_id(machine);
  service_id = fixed_id(service);
}

}  // namespace flakeid::flake
