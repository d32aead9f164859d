#pragma once

#include <array>
#include <conduit/schema/primitives.hpp>
#include <cstdint>

// Schema type: extra args.
// Relay workflow: Transport-specific arguments attached to an outbound
// message. Serialized as kExtraArgsV1Tag followed by the SCALE body.
namespace conduit::schema {

inline constexpr auto kExtraArgsV1Tag =
    std::array<uint8_t, 4>{0x97, 0xa6, 0x57, 0xc9};

// Execution ceiling granted to the receiving unit.
inline constexpr uint64_t kDefaultGasLimit = 200'000;

template <uint16_t Version>
struct extra_args;

template <>
struct extra_args<1> final {
  uint64_t gas_limit{kDefaultGasLimit};
};

using extra_args_v1_t = extra_args<1>;

}  // namespace conduit::schema
