#include <conduit/relay/failure_ledger.hpp>

#include <conduit/schema/key/engine_keys.hpp>

namespace conduit::relay {

failure_ledger::failure_ledger(context& ctx) : ctx_{ctx} {}

std::optional<conduit::schema::failure_record_t> failure_ledger::find(
    const conduit::schema::message_id_t& message_id) const {
  return ctx_.state.get<conduit::schema::failure_record_t>(
      ctx_.encoder,
      conduit::schema::key::make_failed_message_key(ctx_.encoder, message_id));
}

bool failure_ledger::contains(
    const conduit::schema::message_id_t& message_id) const {
  return ctx_.state.contains(
      conduit::schema::key::make_failed_message_key(ctx_.encoder, message_id));
}

conduit::schema::error_state_t failure_ledger::status(
    const conduit::schema::message_id_t& message_id) const {
  auto found = find(message_id);
  return found ? found->error_state : conduit::schema::error_state_t::resolved;
}

std::vector<conduit::schema::failure_record_t> failure_ledger::list() const {
  auto prefix = conduit::schema::key::make_prefix_key(
      ctx_.encoder, conduit::schema::key::kFailedMessageKeyPrefix);
  auto out = std::vector<conduit::schema::failure_record_t>{};
  for (const auto& [key, value] : ctx_.state.list_by_prefix(prefix)) {
    out.push_back(ctx_.encoder.decode<conduit::schema::failure_record_t>(
        conduit::schema::bytes_view_t{value.data(), value.size()}));
  }
  return out;
}

void failure_ledger::record(const conduit::schema::failure_record_t& record) {
  ctx_.state.put(ctx_.encoder,
                 conduit::schema::key::make_failed_message_key(
                     ctx_.encoder, record.message_id),
                 record);
}

void failure_ledger::clear(const conduit::schema::message_id_t& message_id) {
  ctx_.state.erase(
      conduit::schema::key::make_failed_message_key(ctx_.encoder, message_id));
}

}  // namespace conduit::relay
