#include "decompose_logic.h"

#include "flakeid/core/result.h"
#include "flakeid/flake/id_json.h"
#include "flakeid/flake/layout.h"

#include <nlohmann/json.hpp>

int execute_decompose(const std::string& text, const flakeid::flake::IdFormat format,
                      std::ostream& out, std::ostream& err) {
  const auto id = flakeid::flake::parse_id(text, format);
  if (!id.has_value()) {
    err << "Error: cannot parse '" << text << "': " << flakeid::core::error_message(id.error())
        << "\n";
    return 1;
  }

  out << flakeid::flake::id_parts_to_json(flakeid::flake::decompose(id.value())).dump(2) << "\n";
  return 0;
}
