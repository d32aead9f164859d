#pragma once

#include <conduit/relay/local_router.hpp>
#include <conduit/schema/initialize.hpp>
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace conduit::config {

/// Daemon settings, read from the command line and an optional INI file.
struct daemon_options final {
  std::string grpc_address{"0.0.0.0:26658"};
  std::string db_path{"conduit.db"};
  std::string log_level{"info"};
  std::string log_file{"conduit.log"};
  bool strict_crypto{true};
  std::string chain_name{"conduit-local"};

  // Applied once, when the database holds no unit.
  conduit::schema::initialize_t genesis;

  conduit::relay::fee_schedule fees;
  std::set<conduit::schema::chain_selector_t> supported_chains;
};

/// Parses `argv`; returns nullopt after printing help to `out`.
/// Malformed values are fatal.
std::optional<daemon_options> parse_options(int argc,
                                            const char* const argv[],
                                            std::ostream& out);

/// "asset:owner:amount" with hex addresses and a decimal amount.
std::optional<conduit::schema::genesis_allocation_t> parse_allocation(
    const std::string& value);

}  // namespace conduit::config
