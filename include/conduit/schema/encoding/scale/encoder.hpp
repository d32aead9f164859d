#pragma once
#include <conduit/common/critical.hpp>
#include <conduit/schema/block_result.hpp>
#include <conduit/schema/dispatch_function.hpp>
#include <conduit/schema/encoding/encoder.hpp>
#include <conduit/schema/extra_args.hpp>
#include <conduit/schema/failure_record.hpp>
#include <conduit/schema/inbound_message.hpp>
#include <conduit/schema/initialize.hpp>
#include <conduit/schema/outbox_entry.hpp>
#include <conduit/schema/transaction.hpp>
#include <conduit/schema/unit_info.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Schema structs are aggregates; the SCALE codec decomposes them field by
// field in declaration order, so field order is part of the wire format.
namespace conduit::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  conduit::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, conduit::schema::bytes_t& out);

  template <typename T>
  T decode(const conduit::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const conduit::schema::bytes_view_t& bytes);
};

template <typename T>
conduit::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    conduit::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        conduit::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const conduit::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    conduit::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const conduit::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace conduit::schema::encoding

namespace conduit::schema::encoding {

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace conduit::schema::encoding
