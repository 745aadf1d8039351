#pragma once

#include "flakeid/flake/layout.h"

#include <nlohmann/json.hpp>

namespace flakeid::flake {

// id_parts_to_json renders a decomposition with the keys
// "id", "msb", "time", "machine-id", "service-id", "sequence".
[[nodiscard]] nlohmann::json id_parts_to_json(const IdParts& parts);

}  // namespace flakeid::flake
