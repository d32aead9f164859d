#include <conduit/storage/overlay.hpp>

#include <algorithm>
#include <iterator>

namespace conduit::storage {

namespace {

bool has_prefix(const conduit::schema::bytes_t& key,
                const conduit::schema::bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

overlay::overlay(const storage<rocksdb_storage_tag>& base) : base_{&base} {}

overlay::overlay(overlay& parent) : parent_{&parent} {}

std::optional<conduit::schema::bytes_t> overlay::get_raw(
    const conduit::schema::bytes_view_t& key) const {
  auto it = pending_.find(conduit::schema::make_bytes(key));
  if (it != std::end(pending_)) {
    return it->second;
  }
  if (parent_ != nullptr) {
    return parent_->get_raw(key);
  }
  return base_->get_raw(key);
}

void overlay::put_raw(const conduit::schema::bytes_view_t& key,
                      conduit::schema::bytes_t value) {
  pending_[conduit::schema::make_bytes(key)] = std::move(value);
}

void overlay::erase(const conduit::schema::bytes_view_t& key) {
  pending_[conduit::schema::make_bytes(key)] = std::nullopt;
}

bool overlay::contains(const conduit::schema::bytes_view_t& key) const {
  return get_raw(key).has_value();
}

std::vector<key_value_entry_t> overlay::list_by_prefix(
    const conduit::schema::bytes_view_t& prefix) const {
  auto inherited = parent_ != nullptr ? parent_->list_by_prefix(prefix)
                                      : base_->list_by_prefix(prefix);
  auto merged =
      std::map<conduit::schema::bytes_t, conduit::schema::bytes_t>{};
  for (auto& [key, value] : inherited) {
    merged.emplace(std::move(key), std::move(value));
  }

  auto it = pending_.lower_bound(conduit::schema::make_bytes(prefix));
  for (; it != std::end(pending_) && has_prefix(it->first, prefix); ++it) {
    if (it->second) {
      merged[it->first] = *it->second;
    } else {
      merged.erase(it->first);
    }
  }

  auto entries = std::vector<key_value_entry_t>{};
  entries.reserve(merged.size());
  for (auto& [key, value] : merged) {
    entries.emplace_back(key, std::move(value));
  }
  return entries;
}

void overlay::merge_into_parent() {
  if (parent_ == nullptr) {
    conduit::common::critical("root overlay has no parent to merge into");
  }
  for (auto& [key, value] : pending_) {
    parent_->pending_[key] = std::move(value);
  }
  pending_.clear();
}

void overlay::discard() {
  pending_.clear();
}

std::vector<write_entry_t> overlay::writes() const {
  return std::vector<write_entry_t>{std::begin(pending_), std::end(pending_)};
}

bool overlay::empty() const {
  return pending_.empty();
}

}  // namespace conduit::storage
