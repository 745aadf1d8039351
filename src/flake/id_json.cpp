#include "flakeid/flake/id_json.h"

namespace flakeid::flake {

nlohmann::json id_parts_to_json(const IdParts& parts) {
  nlohmann::json j;
  j["id"] = parts.id;
  j["msb"] = parts.msb;
  j["time"] = parts.time;
  j["machine-id"] = parts.machine_id;
  j["service-id"] = parts.service_id;
  j["sequence"] = parts.sequence;
  return j;
}

}  // namespace flakeid::flake
