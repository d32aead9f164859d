#pragma once
#include <conduit/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace conduit::storage {

using key_value_entry_t =
    std::pair<conduit::schema::bytes_t, conduit::schema::bytes_t>;

/// Pending mutation: a value to write, or std::nullopt to delete the key.
using write_entry_t = std::pair<conduit::schema::bytes_t,
                                std::optional<conduit::schema::bytes_t>>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  conduit::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const conduit::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const conduit::schema::bytes_view_t& key,
           const T& value);

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<conduit::schema::bytes_t> get_raw(
      const conduit::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const conduit::schema::bytes_view_t& prefix) const;

  /// Atomically apply writes together with the new committed checkpoint.
  void commit(const std::vector<write_entry_t>& writes,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace conduit::storage
