#pragma once
#include <conduit/schema/primitives.hpp>
#include <optional>
#include <span>

namespace conduit::schema::encoding {

// Encoding library is a build-time choice: callers hold an
// encoder<library_tag> and never name the codec directly.
template <typename Library>
struct encoder {
  template <typename T>
  conduit::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, conduit::schema::bytes_t& out);

  template <typename T>
  T decode(const conduit::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const conduit::schema::bytes_view_t& bytes);
};

}  // namespace conduit::schema::encoding
