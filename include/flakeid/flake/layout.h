#pragma once

#include <compare>
#include <cstdint>

namespace flakeid::flake {

// Bit layout of an identifier, most significant first:
//
// +-----------------------------------------------------------------------------+
// | 1 bit unused | 41 bit time | 5 bit machine ID | 5 bit service ID | 12 bit seq |
// +-----------------------------------------------------------------------------+
//
// time is counted in 10 ms ticks since the configured start time (about 697 years).
inline constexpr int kBitLenTime = 41;
inline constexpr int kBitLenMachineId = 5;
inline constexpr int kBitLenServiceId = 5;
inline constexpr int kBitLenSequence = 12;

inline constexpr int kServiceIdShift = kBitLenSequence;
inline constexpr int kMachineIdShift = kBitLenServiceId + kBitLenSequence;
inline constexpr int kTimeShift = kBitLenMachineId + kBitLenServiceId + kBitLenSequence;
inline constexpr int kMsbShift = kTimeShift + kBitLenTime;

inline constexpr std::uint64_t kMaxTime = (std::uint64_t{1} << kBitLenTime) - 1;
inline constexpr std::uint16_t kMaxMachineId = (1U << kBitLenMachineId) - 1;
inline constexpr std::uint16_t kMaxServiceId = (1U << kBitLenServiceId) - 1;
inline constexpr std::uint16_t kMaxSequence = (1U << kBitLenSequence) - 1;

// Id is the 64-bit identifier as a vocabulary type.
struct Id {
  std::uint64_t value{0};
  auto operator<=>(const Id&) const = default;
};

// IdParts is the decomposition of an Id into its logical fields.
struct IdParts {
  std::uint64_t id{0};           // NOLINT(readability-identifier-naming)
  std::uint64_t msb{0};          // NOLINT(readability-identifier-naming)
  std::uint64_t time{0};         // NOLINT(readability-identifier-naming)
  std::uint16_t machine_id{0};   // NOLINT(readability-identifier-naming)
  std::uint16_t service_id{0};   // NOLINT(readability-identifier-naming)
  std::uint16_t sequence{0};     // NOLINT(readability-identifier-naming)
  bool operator==(const IdParts&) const = default;
};

// compose packs the four fields. Each field is masked to its width, so callers must
// range-check beforehand if truncation would be an error.
constexpr Id compose(const std::uint64_t time, const std::uint16_t machine_id,
                     const std::uint16_t service_id, const std::uint16_t sequence) {
  return Id{(time & kMaxTime) << kTimeShift |
            static_cast<std::uint64_t>(machine_id & kMaxMachineId) << kMachineIdShift |
            static_cast<std::uint64_t>(service_id & kMaxServiceId) << kServiceIdShift |
            static_cast<std::uint64_t>(sequence & kMaxSequence)};
}

// decompose is the exact inverse of compose. Any 64-bit value decomposes.
constexpr IdParts decompose(const Id id) {
  return IdParts{
      id.value,
      id.value >> kMsbShift,
      (id.value >> kTimeShift) & kMaxTime,
      static_cast<std::uint16_t>((id.value >> kMachineIdShift) & kMaxMachineId),
      static_cast<std::uint16_t>((id.value >> kServiceIdShift) & kMaxServiceId),
      static_cast<std::uint16_t>(id.value & kMaxSequence),
  };
}

}  // namespace flakeid::flake
