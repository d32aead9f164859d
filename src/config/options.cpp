#include <boost/program_options.hpp>
#include <conduit/common/critical.hpp>
#include <conduit/config/options.hpp>
#include <fstream>
#include <spdlog/spdlog.h>

namespace po = boost::program_options;

namespace conduit::config {

namespace {

conduit::schema::address_t require_address(const std::string& option,
                                           const std::string& value) {
  auto address = conduit::schema::try_make_address(std::string_view{value});
  if (!address) {
    conduit::common::critical(
        "option '{}' expects a 20-byte hex address, got '{}'", option, value);
  }
  return *address;
}

conduit::schema::amount_t require_amount(const std::string& option,
                                         const std::string& value) {
  auto amount = conduit::schema::try_make_amount(value);
  if (!amount) {
    conduit::common::critical("option '{}' expects a decimal amount, got '{}'",
                              option, value);
  }
  return *amount;
}

}  // namespace

std::optional<conduit::schema::genesis_allocation_t> parse_allocation(
    const std::string& value) {
  auto first = value.find(':');
  if (first == std::string::npos) {
    return std::nullopt;
  }
  auto second = value.find(':', first + 1);
  if (second == std::string::npos) {
    return std::nullopt;
  }

  auto asset = conduit::schema::try_make_address(
      std::string_view{value}.substr(0, first));
  auto owner = conduit::schema::try_make_address(
      std::string_view{value}.substr(first + 1, second - first - 1));
  auto amount = conduit::schema::try_make_amount(
      std::string_view{value}.substr(second + 1));
  if (!asset || !owner || !amount) {
    return std::nullopt;
  }
  return conduit::schema::genesis_allocation_t{
      .asset = *asset, .owner = *owner, .amount = *amount};
}

std::optional<daemon_options> parse_options(const int argc,
                                            const char* const argv[],
                                            std::ostream& out) {
  auto options = daemon_options{};
  auto config_file = std::string{};
  auto router = std::string{};
  auto fee_token = std::string{};
  auto self = std::string{};
  auto base_fee = std::string{"0"};
  auto per_byte_fee = std::string{"0"};
  auto admins = std::vector<std::string>{};
  auto allocations = std::vector<std::string>{};
  auto supported_chains = std::vector<uint64_t>{};

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "Path to an INI-style configuration file");

  auto daemon = po::options_description{"Conduit"};
  daemon.add_options()(
      "grpc-address,g",
      po::value<std::string>(&options.grpc_address)
          ->default_value(options.grpc_address),
      "IP:Port for the relay gRPC service")(
      "db-path,d",
      po::value<std::string>(&options.db_path)->default_value(options.db_path),
      "RocksDB directory")(
      "log-level,l",
      po::value<std::string>(&options.log_level)
          ->default_value(options.log_level),
      "trace, debug, info, warn, error or critical")(
      "log-file",
      po::value<std::string>(&options.log_file)
          ->default_value(options.log_file),
      "File sink path")(
      "strict-crypto",
      po::value<bool>(&options.strict_crypto)
          ->default_value(options.strict_crypto),
      "Verify signatures with OpenSSL")(
      "chain-name",
      po::value<std::string>(&options.chain_name)
          ->default_value(options.chain_name),
      "Chain name hashed into the transaction chain id")(
      "local-chain-selector",
      po::value<uint64_t>(&options.genesis.local_chain_selector)
          ->default_value(0),
      "Chain selector of this domain")(
      "self-address", po::value<std::string>(&self),
      "Unit identity (20-byte hex)")(
      "name",
      po::value<std::string>(&options.genesis.name)->default_value("conduit"),
      "Unit name")(
      "symbol",
      po::value<std::string>(&options.genesis.symbol)->default_value("CDT"),
      "Unit symbol")("base-uri",
                     po::value<std::string>(&options.genesis.base_uri)
                         ->default_value(""),
                     "Unit base URI")(
      "router", po::value<std::string>(&router),
      "Initial transport router address (20-byte hex)")(
      "fee-token", po::value<std::string>(&fee_token),
      "Fee token address; empty or zero pays in the native asset")(
      "gas-limit",
      po::value<uint64_t>(&options.genesis.gas_limit)
          ->default_value(conduit::schema::kDefaultGasLimit),
      "Destination-side gas limit attached to outbound messages")(
      "admin", po::value<std::vector<std::string>>(&admins)->composing(),
      "Address granted the admin role at provisioning (repeatable)")(
      "allocation",
      po::value<std::vector<std::string>>(&allocations)->composing(),
      "Genesis balance as asset:owner:amount (repeatable)")(
      "router-base-fee", po::value<std::string>(&base_fee),
      "Flat fee charged by the local router")(
      "router-per-byte-fee", po::value<std::string>(&per_byte_fee),
      "Fee charged per payload byte by the local router")(
      "router-supported-chain",
      po::value<std::vector<uint64_t>>(&supported_chains)->composing(),
      "Destination chain reachable through the local router (repeatable)");

  auto command_line = po::options_description{};
  command_line.add(generic).add(daemon);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, command_line), vm);
    po::notify(vm);
    if (!config_file.empty()) {
      auto stream = std::ifstream{config_file};
      if (!stream) {
        conduit::common::critical("cannot open config file '{}'", config_file);
      }
      po::store(po::parse_config_file(stream, daemon), vm);
      po::notify(vm);
    }
  } catch (const po::error& ex) {
    conduit::common::critical("invalid options: {}", ex.what());
  }

  if (vm.contains("help")) {
    out << command_line << std::endl;
    return std::nullopt;
  }

  if (spdlog::level::from_str(options.log_level) == spdlog::level::off &&
      options.log_level != "off") {
    conduit::common::critical("unknown log level '{}'", options.log_level);
  }

  if (!self.empty()) {
    options.genesis.self = require_address("self-address", self);
  }
  if (!router.empty()) {
    options.genesis.router = require_address("router", router);
  }
  if (!fee_token.empty()) {
    options.genesis.fee_token = require_address("fee-token", fee_token);
  }
  for (const auto& admin : admins) {
    options.genesis.admins.push_back(require_address("admin", admin));
  }
  for (const auto& value : allocations) {
    auto allocation = parse_allocation(value);
    if (!allocation) {
      conduit::common::critical(
          "option 'allocation' expects asset:owner:amount, got '{}'", value);
    }
    options.genesis.allocations.push_back(*allocation);
  }
  options.fees.base_fee = require_amount("router-base-fee", base_fee);
  options.fees.per_byte_fee =
      require_amount("router-per-byte-fee", per_byte_fee);
  options.supported_chains.insert(std::begin(supported_chains),
                                  std::end(supported_chains));
  return options;
}

}  // namespace conduit::config
