#pragma once

#include <conduit/relay/context.hpp>
#include <conduit/schema/error_state.hpp>
#include <conduit/schema/failure_record.hpp>
#include <conduit/schema/primitives.hpp>
#include <optional>
#include <vector>

namespace conduit::relay {

/// Durable record of inbound messages whose application failed.
///
/// A record is created only by the inbound path and removed only by a
/// successful recovery. Absence reads as resolved.
class failure_ledger final {
 public:
  explicit failure_ledger(context& ctx);

  std::optional<conduit::schema::failure_record_t> find(
      const conduit::schema::message_id_t& message_id) const;
  bool contains(const conduit::schema::message_id_t& message_id) const;
  conduit::schema::error_state_t status(
      const conduit::schema::message_id_t& message_id) const;
  std::vector<conduit::schema::failure_record_t> list() const;

  void record(const conduit::schema::failure_record_t& record);
  void clear(const conduit::schema::message_id_t& message_id);

 private:
  context& ctx_;
};

}  // namespace conduit::relay
