#pragma once

#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/unit_info.hpp>
#include <conduit/storage/overlay.hpp>
#include <cstdint>

namespace conduit::relay {

/// State a relay operation runs against: the current transaction overlay and
/// the unit's provisioning metadata.
struct context final {
  conduit::schema::encoding::scale_encoder_t& encoder;
  conduit::storage::overlay& state;
  const conduit::schema::unit_info_t& unit;
  uint64_t height{};
};

}  // namespace conduit::relay
