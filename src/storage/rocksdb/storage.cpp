#include <conduit/common/critical.hpp>
#include <conduit/storage/rocksdb/storage.hpp>

namespace conduit::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    conduit::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<conduit::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const conduit::schema::bytes_view_t& key) const {
  if (!database) {
    conduit::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    conduit::common::critical("Failed to get value from RocksDB");
  }
  return conduit::schema::bytes_t{std::begin(value), std::end(value)};
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(conduit::schema::make_bytes_view(
      std::string_view{detail::kCommittedStateKey}));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, conduit::schema::hash32_t>>(
          conduit::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    conduit::common::critical("failed to decode committed state");
  }
  auto state = committed_state{};
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  return state;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const conduit::schema::bytes_view_t& prefix) const {
  if (!database) {
    conduit::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    conduit::common::critical("RocksDB iteration failed");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(
    const std::vector<write_entry_t>& writes,
    const committed_state& state) const {
  if (!database) {
    conduit::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice = detail::to_slice(
        conduit::schema::bytes_view_t{key.data(), key.size()});
    auto status = value ? batch.Put(key_slice,
                                    detail::to_slice(conduit::schema::bytes_view_t{
                                        value->data(), value->size()}))
                        : batch.Delete(key_slice);
    if (!status.ok()) {
      conduit::common::critical("failed staging write batch entry");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status = batch.Put(
      std::string{detail::kCommittedStateKey},
      std::string{reinterpret_cast<const char*>(encoded.data()),
                  encoded.size()});
  if (!state_status.ok()) {
    conduit::common::critical("failed staging committed state");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit block to RocksDB: {}",
                  write_status.ToString());
    conduit::common::critical("failed to commit block");
  }
}

}  // namespace conduit::storage
