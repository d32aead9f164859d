#pragma once

#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/role_id.hpp>
#include <conduit/schema/transaction_result.hpp>
#include <conduit/schema/upsert_role_assignment.hpp>
#include <conduit/storage/overlay.hpp>
#include <optional>

namespace conduit::access {

/// Role membership consumed by the relay core.
class access_control final {
 public:
  access_control(conduit::schema::encoding::scale_encoder_t& encoder,
                 conduit::storage::overlay& state);

  bool has_role(conduit::schema::role_id_t role,
                const conduit::schema::address_t& account) const;

  /// std::nullopt when `caller` holds `role`, otherwise an unauthorized
  /// result ready to return.
  std::optional<conduit::schema::transaction_result_t> require_role(
      conduit::schema::role_id_t role,
      const conduit::schema::address_t& caller) const;

  /// Admin-gated grant or revoke.
  conduit::schema::transaction_result_t upsert_role_assignment(
      const conduit::schema::address_t& caller,
      const conduit::schema::upsert_role_assignment_t& assignment);

  /// Provisioning-time grant; bypasses the admin guard.
  void grant(conduit::schema::role_id_t role,
             const conduit::schema::address_t& account);

 private:
  conduit::schema::encoding::scale_encoder_t& encoder_;
  conduit::storage::overlay& state_;
};

}  // namespace conduit::access
