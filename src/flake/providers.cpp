#include "flakeid/flake/providers.h"

#include "flakeid/flake/layout.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>

namespace flakeid::flake {

namespace {

using ProviderResult = core::Result<std::uint16_t, std::string>;

}  // namespace

IdProvider fixed_id(const std::uint16_t value) {
  return [value]() { return ProviderResult::ok(value); };
}

IdProvider env_id(std::string name) {
  return [name = std::move(name)]() {
    const char* raw = std::getenv(name.c_str());
    if (raw == nullptr || *raw == '\0') {
      return ProviderResult::err("environment variable " + name + " is not set");
    }

    const std::string_view text{raw};
    unsigned int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() ||
        value > std::numeric_limits<std::uint16_t>::max()) {
      return ProviderResult::err("environment variable " + name + " is not a valid ID: " +
                                 std::string{text});
    }
    return ProviderResult::ok(static_cast<std::uint16_t>(value));
  };
}

bool is_private_ipv4(const std::uint32_t address) {
  const std::uint32_t a = address >> 24;
  const std::uint32_t b = (address >> 16) & 0xFF;
  return a == 10 || (a == 172 && b >= 16 && b < 32) || (a == 192 && b == 168);
}

IdProvider private_ipv4_id() {
  return []() {
    struct ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
      return ProviderResult::err(std::string{"getifaddrs failed: "} + std::strerror(errno));
    }

    std::optional<std::uint16_t> id;
    for (const struct ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
      if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
        continue;
      }
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      const auto* addr = reinterpret_cast<const struct sockaddr_in*>(it->ifa_addr);
      const std::uint32_t ip = ntohl(addr->sin_addr.s_addr);
      if ((ip >> 24) == 127 || !is_private_ipv4(ip)) {
        continue;
      }
      id = static_cast<std::uint16_t>(ip & kMaxMachineId);
      break;
    }
    freeifaddrs(interfaces);

    if (!id.has_value()) {
      return ProviderResult::err("no private IPv4 address found");
    }
    return ProviderResult::ok(id.value());
  };
}

}  // namespace flakeid::flake
