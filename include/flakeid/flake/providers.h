#pragma once

#include "flakeid/flake/settings.h"

#include <cstdint>
#include <string>

namespace flakeid::flake {

// fixed_id always yields `value`.
[[nodiscard]] IdProvider fixed_id(std::uint16_t value);

// env_id reads a decimal ID from environment variable `name` each time it is called.
// Fails when the variable is unset, empty, non-numeric, or above 65535.
[[nodiscard]] IdProvider env_id(std::string name);

// private_ipv4_id derives an ID from the low 5 bits of the first non-loopback private IPv4
// address (10.0.0.0/8, 172.16.0.0/12, 192.168.0.0/16). Fails when there is none.
[[nodiscard]] IdProvider private_ipv4_id();

// is_private_ipv4 tests a host-order IPv4 address against the RFC 1918 ranges.
[[nodiscard]] bool is_private_ipv4(std::uint32_t address);

}  // namespace flakeid::flake
