#include <boost/program_options.hpp>
#include <conduit/common/critical.hpp>
#include <conduit/execution/engine.hpp>
#include <conduit/facets/cross_chain_mint.hpp>
#include <conduit/relay/codec.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/role_id.hpp>
#include <conduit/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = conduit::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

const std::string& require(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    conduit::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

conduit::schema::bytes_t get_bytes(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  auto decoded =
      conduit::schema::try_from_hex(vm[name].as<std::string>());
  if (!decoded) {
    conduit::common::critical("--{} is not valid hex", name);
  }
  return *decoded;
}

conduit::schema::hash32_t get_hash32(const po::variables_map& vm,
                                     const std::string& name) {
  auto hash = conduit::schema::try_make_hash32(require(vm, name));
  if (!hash) {
    conduit::common::critical("--{} must be 32 bytes of hex", name);
  }
  return *hash;
}

conduit::schema::address_t get_address(const po::variables_map& vm,
                                       const std::string& name) {
  auto address =
      conduit::schema::try_make_address(std::string_view{require(vm, name)});
  if (!address) {
    conduit::common::critical("--{} must be 20 bytes of hex", name);
  }
  return *address;
}

conduit::schema::address_t get_optional_address(const po::variables_map& vm,
                                                const std::string& name) {
  if (!vm.contains(name)) {
    return conduit::schema::kNativeAsset;
  }
  return get_address(vm, name);
}

conduit::schema::amount_t get_amount(const po::variables_map& vm,
                                     const std::string& name) {
  auto amount = conduit::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    conduit::common::critical("--{} must be a decimal amount", name);
  }
  return *amount;
}

conduit::schema::role_id_t get_role(const po::variables_map& vm) {
  auto role = conduit::schema::try_from_string<conduit::schema::role_id_t>(
      vm["role"].as<std::string>());
  if (!role) {
    conduit::common::critical("--role must be admin|minter");
  }
  return *role;
}

template <typename Array>
Array copy_exact(const conduit::schema::bytes_t& bytes,
                 const std::string_view what) {
  auto out = Array{};
  if (bytes.size() != out.size()) {
    conduit::common::critical(std::string{what} + " has the wrong length");
  }
  std::copy(std::begin(bytes), std::end(bytes), std::begin(out));
  return out;
}

conduit::schema::signer_id_t make_signer(const po::variables_map& vm) {
  auto kind = vm["signer-kind"].as<std::string>();
  auto bytes = get_bytes(vm, "signer");
  if (kind == "named") {
    return conduit::schema::signer_id_t{
        copy_exact<conduit::schema::named_signer_t>(bytes, "named signer")};
  }
  if (kind == "ed25519") {
    return conduit::schema::signer_id_t{conduit::schema::ed25519_signer_id{
        .public_key = copy_exact<std::array<uint8_t, 32>>(
            bytes, "ed25519 public key")}};
  }
  if (kind == "secp256k1") {
    return conduit::schema::signer_id_t{conduit::schema::secp256k1_signer_id{
        .public_key = copy_exact<std::array<uint8_t, 33>>(
            bytes, "secp256k1 public key")}};
  }
  conduit::common::critical("--signer-kind must be named|ed25519|secp256k1");
}

conduit::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto bytes = get_bytes(vm, "signature-hex");
  if (kind == "ed25519") {
    if (bytes.empty()) {
      return conduit::schema::ed25519_signature_t{};
    }
    return copy_exact<conduit::schema::ed25519_signature_t>(
        bytes, "ed25519 signature");
  }
  if (kind == "secp256k1") {
    if (bytes.empty()) {
      return conduit::schema::secp256k1_signature_t{};
    }
    return copy_exact<conduit::schema::secp256k1_signature_t>(
        bytes, "secp256k1 signature");
  }
  conduit::common::critical("--signature-kind must be ed25519|secp256k1");
}

conduit::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "send_message") {
    return conduit::schema::send_message_t{
        .destination_chain_selector = vm["chain-selector"].as<uint64_t>(),
        .receiver = get_address(vm, "receiver"),
        .data = get_bytes(vm, "data-hex"),
        .token = get_optional_address(vm, "token"),
        .amount = get_amount(vm, "amount"),
        .fee_token = get_optional_address(vm, "fee-token")};
  }
  if (payload == "receive_message") {
    return conduit::schema::receive_message_t{
        .message = get_bytes(vm, "message-hex")};
  }
  if (payload == "retry_failed_message") {
    return conduit::schema::retry_failed_message_t{
        .message_id = get_hash32(vm, "message-id"),
        .data = get_bytes(vm, "data-hex")};
  }
  if (payload == "set_destination_chain") {
    return conduit::schema::set_destination_chain_t{
        .chain_selector = vm["chain-selector"].as<uint64_t>(),
        .allowed = vm["allowed"].as<bool>()};
  }
  if (payload == "set_source_chain") {
    return conduit::schema::set_source_chain_t{
        .chain_selector = vm["chain-selector"].as<uint64_t>(),
        .allowed = vm["allowed"].as<bool>()};
  }
  if (payload == "set_sender") {
    return conduit::schema::set_sender_t{
        .chain_selector = vm["chain-selector"].as<uint64_t>(),
        .sender = get_address(vm, "sender"),
        .allowed = vm["allowed"].as<bool>()};
  }
  if (payload == "set_router") {
    return conduit::schema::set_router_t{.router = get_address(vm, "router")};
  }
  if (payload == "upsert_role_assignment") {
    return conduit::schema::upsert_role_assignment_t{
        .role = get_role(vm),
        .account = get_address(vm, "account"),
        .enabled = vm["allowed"].as<bool>()};
  }
  if (payload == "call_facet") {
    return conduit::schema::call_facet_t{.data = get_bytes(vm, "data-hex")};
  }
  conduit::common::critical("unsupported payload type '" + payload + "'");
}

conduit::schema::transaction_t build_transaction(const po::variables_map& vm) {
  if (!vm.contains("payload")) {
    conduit::common::critical("transaction mode requires --payload");
  }
  return conduit::schema::transaction_t{
      .version = 1,
      .chain_id = vm.contains("chain-id")
                      ? get_hash32(vm, "chain-id")
                      : conduit::execution::make_chain_id(
                            vm["chain-name"].as<std::string>()),
      .nonce = vm["nonce"].as<uint64_t>(),
      .signer = make_signer(vm),
      .payload = build_payload(vm),
      .signature = make_signature(vm)};
}

conduit::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/unit/info" ||
      path == "/relay/router" || path == "/relay/failed_messages" ||
      path == "/relay/outbox" || path == "/dispatch/functions" ||
      path == "/facet/mint/name" || path == "/facet/mint/symbol") {
    return {};
  }
  if (path == "/allowlist/destination" || path == "/allowlist/source") {
    return encoder.encode(vm["chain-selector"].as<uint64_t>());
  }
  if (path == "/allowlist/sender") {
    return encoder.encode(std::tuple{vm["chain-selector"].as<uint64_t>(),
                                     get_address(vm, "sender")});
  }
  if (path == "/relay/failed_message" || path == "/relay/message_status") {
    return encoder.encode(get_hash32(vm, "message-id"));
  }
  if (path == "/access/role") {
    return encoder.encode(std::tuple{get_role(vm), get_address(vm, "account")});
  }
  if (path == "/assets/balance") {
    return encoder.encode(std::tuple{get_optional_address(vm, "token"),
                                     get_address(vm, "account")});
  }
  if (path == "/assets/allowance") {
    return encoder.encode(std::tuple{get_optional_address(vm, "token"),
                                     get_address(vm, "account"),
                                     get_address(vm, "spender")});
  }
  if (path == "/facet/mint/owner" || path == "/facet/mint/token_uri") {
    return encoder.encode(get_amount(vm, "token-id"));
  }
  conduit::common::critical("unsupported query path '" + path + "'");
}

conduit::schema::bytes_t build_inbound_message(const po::variables_map& vm) {
  auto message = conduit::schema::inbound_message_t{};
  message.message_id = get_hash32(vm, "message-id");
  message.source_chain_selector = vm["chain-selector"].as<uint64_t>();
  message.sender = conduit::schema::make_bytes(get_address(vm, "sender"));
  message.data = get_bytes(vm, "data-hex");
  auto amount = get_amount(vm, "amount");
  if (vm.contains("token") && amount > 0) {
    message.token_amounts.push_back(conduit::schema::token_amount_t{
        .token = conduit::schema::make_bytes(get_address(vm, "token")),
        .amount = amount});
  }
  return conduit::relay::codec::encode_inbound(message);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction [options]\n"
            << "  transaction_builder signing-bytes [options]\n"
            << "  transaction_builder query-key [options]\n"
            << "  transaction_builder inbound-message [options]\n"
            << "  transaction_builder mint-call [options]\n"
            << "  transaction_builder burn-and-mint-call [options]\n"
            << "  transaction_builder chain-id [--chain-name NAME]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-bytes|query-key|inbound-message|mint-call|"
      "burn-and-mint-call|chain-id")(
      "payload", po::value<std::string>(), "transaction payload type")(
      "path", po::value<std::string>(), "query path")(
      "chain-name", po::value<std::string>()->default_value("conduit-local"),
      "chain name hashed into the chain id")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex override")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer-kind", po::value<std::string>()->default_value("named"),
      "named|ed25519|secp256k1")("signer", po::value<std::string>(),
                                 "signer hash32 or public key hex")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex", po::value<std::string>(),
                           "signature bytes hex")(
      "chain-selector", po::value<uint64_t>()->default_value(0),
      "destination, source or allowlisted chain selector")(
      "receiver", po::value<std::string>(), "destination receiver address")(
      "sender", po::value<std::string>(), "remote sender address")(
      "router", po::value<std::string>(), "router address")(
      "account", po::value<std::string>(), "account address")(
      "spender", po::value<std::string>(), "allowance spender address")(
      "token", po::value<std::string>(), "token address (zero is native)")(
      "fee-token", po::value<std::string>(), "fee token address")(
      "amount", po::value<std::string>()->default_value("0"),
      "decimal token amount")("token-id",
                              po::value<std::string>()->default_value("0"),
                              "decimal token id")(
      "message-id", po::value<std::string>(), "message id hash32 hex")(
      "message-hex", po::value<std::string>(), "encoded inbound message hex")(
      "data-hex", po::value<std::string>(), "payload or call data hex")(
      "role", po::value<std::string>()->default_value("admin"),
      "admin|minter")("allowed", po::value<bool>()->default_value(true),
                      "allow or enable flag");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    conduit::common::critical(std::string{"invalid arguments: "} + ex.what());
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto encoder = encoder_t{};
  if (command == "transaction" || command == "tx") {
    std::cout << conduit::schema::to_base64(encoder.encode(build_transaction(vm))) << '\n';
    return 0;
  }

  if (command == "signing-bytes") {
    auto bytes =
        conduit::execution::make_signing_bytes(encoder, build_transaction(vm));
    std::cout << conduit::schema::to_hex(
                     conduit::schema::bytes_view_t{bytes.data(), bytes.size()})
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      conduit::common::critical("query-key mode requires --path");
    }
    std::cout << conduit::schema::to_base64(build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "inbound-message") {
    auto bytes = build_inbound_message(vm);
    std::cout << conduit::schema::to_hex(
                     conduit::schema::bytes_view_t{bytes.data(), bytes.size()})
              << '\n';
    return 0;
  }

  if (command == "mint-call") {
    auto bytes = conduit::facets::cross_chain_mint::make_mint_call(
        get_address(vm, "account"), get_amount(vm, "token-id"));
    std::cout << conduit::schema::to_hex(
                     conduit::schema::bytes_view_t{bytes.data(), bytes.size()})
              << '\n';
    return 0;
  }

  if (command == "burn-and-mint-call") {
    auto bytes = conduit::facets::cross_chain_mint::make_burn_and_mint_call(
        vm["chain-selector"].as<uint64_t>(), get_address(vm, "receiver"),
        get_address(vm, "account"), get_amount(vm, "token-id"));
    std::cout << conduit::schema::to_hex(
                     conduit::schema::bytes_view_t{bytes.data(), bytes.size()})
              << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << conduit::schema::to_hex(conduit::execution::make_chain_id(
                     vm["chain-name"].as<std::string>()))
              << '\n';
    return 0;
  }

  conduit::common::critical(
      "command must be "
      "transaction|signing-bytes|query-key|inbound-message|mint-call|"
      "burn-and-mint-call|chain-id");
}
