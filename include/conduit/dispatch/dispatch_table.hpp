#pragma once

#include <conduit/schema/dispatch_function.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/transaction_result.hpp>
#include <conduit/storage/overlay.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace conduit::dispatch {

enum class visibility_t : uint8_t {
  // Reachable by any signed caller through call_facet.
  external = 0,
  // Reachable only with the unit itself as caller, i.e. from an inbound
  // message or a recovery retry.
  self_only = 1,
};

/// Submits a data-only message from the unit through the outbound path,
/// paying the fee in the unit's fee token.
using message_sender_t = std::function<conduit::schema::transaction_result_t(
    const conduit::schema::address_t& caller,
    conduit::schema::chain_selector_t destination,
    const conduit::schema::address_t& receiver,
    conduit::schema::bytes_t data)>;

/// Execution environment handed to a facet function.
struct facet_context final {
  conduit::schema::address_t caller;
  conduit::schema::address_t self;
  uint64_t height{};
  conduit::storage::overlay& state;
  conduit::schema::encoding::scale_encoder_t& encoder;
  // Empty while applying an inbound payload: delivered messages never
  // originate new ones.
  message_sender_t send_message;
};

/// `arguments` is the call data with the selector stripped. Handlers report
/// expected failures through the result code and may throw std::exception
/// for anything else.
using facet_handler_t = std::function<conduit::schema::transaction_result_t(
    facet_context& context,
    const conduit::schema::bytes_view_t& arguments)>;

/// Selector to handler map assembled at provisioning time.
///
/// The table is closed: once sealed it never changes, and dispatch only ever
/// invokes handlers registered here.
class dispatch_table final {
 public:
  struct entry final {
    conduit::schema::dispatch_function_t function;
    visibility_t visibility{visibility_t::external};
    facet_handler_t handler;
  };

  /// Register `signature` under its selector. Duplicate selectors and
  /// registration after seal() are fatal.
  void add(std::string facet,
           std::string signature,
           visibility_t visibility,
           facet_handler_t handler);

  void seal();
  bool sealed() const;

  const entry* find(const conduit::schema::selector_t& selector) const;
  std::vector<conduit::schema::dispatch_function_t> functions() const;

  conduit::schema::transaction_result_t dispatch(
      facet_context& context,
      const conduit::schema::bytes_view_t& call_data) const;

 private:
  std::map<conduit::schema::selector_t, entry> entries_;
  bool sealed_{false};
};

}  // namespace conduit::dispatch
