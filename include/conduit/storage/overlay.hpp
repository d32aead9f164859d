#pragma once
#include <conduit/schema/primitives.hpp>
#include <conduit/storage/rocksdb/storage.hpp>
#include <conduit/storage/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace conduit::storage {

/// Write buffer layered over committed storage or over another overlay.
///
/// Reads see this layer first, then each parent in turn, then the database.
/// Nothing reaches the parent until merge_into_parent(); discarding a layer
/// drops every write made through it. The engine stacks one layer per block,
/// one per transaction and one per inbound payload application.
class overlay final {
 public:
  explicit overlay(const storage<rocksdb_storage_tag>& base);
  explicit overlay(overlay& parent);

  overlay(const overlay&) = delete;
  overlay& operator=(const overlay&) = delete;

  std::optional<conduit::schema::bytes_t> get_raw(
      const conduit::schema::bytes_view_t& key) const;
  void put_raw(const conduit::schema::bytes_view_t& key,
               conduit::schema::bytes_t value);
  void erase(const conduit::schema::bytes_view_t& key);
  bool contains(const conduit::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const conduit::schema::bytes_view_t& key) const {
    auto value = get_raw(key);
    if (!value) {
      return std::nullopt;
    }
    return {encoder.template decode<T>(
        conduit::schema::bytes_view_t{value->data(), value->size()})};
  }

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const conduit::schema::bytes_view_t& key,
           const T& value) {
    put_raw(key, encoder.encode(value));
  }

  /// Entries visible through this layer, ordered by key.
  std::vector<key_value_entry_t> list_by_prefix(
      const conduit::schema::bytes_view_t& prefix) const;

  /// Move every pending write into the parent layer.
  void merge_into_parent();

  /// Drop every pending write.
  void discard();

  /// Pending writes in key order, for a root layer being committed.
  std::vector<write_entry_t> writes() const;

  bool empty() const;

 private:
  const storage<rocksdb_storage_tag>* base_{nullptr};
  overlay* parent_{nullptr};
  std::map<conduit::schema::bytes_t, std::optional<conduit::schema::bytes_t>>
      pending_;
};

}  // namespace conduit::storage
