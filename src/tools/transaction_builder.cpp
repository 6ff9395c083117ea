#include <boost/program_options.hpp>
#include <vigil/common/critical.hpp>
#include <vigil/crypto/verify.hpp>
#include <vigil/execution/details.hpp>
#include <vigil/execution/signing.hpp>
#include <vigil/schema/encoding/scale/encoder.hpp>
#include <vigil/schema/event_kind.hpp>
#include <vigil/schema/key/address.hpp>
#include <vigil/schema/transaction.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = vigil::schema::encoding::encoder<
    vigil::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

vigil::schema::hash32_t get_hash32(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    vigil::common::critical("missing required hash argument");
  }
  auto hash = vigil::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    vigil::common::critical("hash arguments must be 64 hex characters");
  }
  return *hash;
}

std::optional<vigil::crypto::ed25519_seed_t> get_seed(
    const po::variables_map& vm) {
  if (!vm.contains("seed")) {
    return std::nullopt;
  }
  auto seed = vigil::crypto::ed25519_seed_t{};
  auto bytes = get_hash32(vm, "seed");
  std::copy(std::begin(bytes), std::end(bytes), std::begin(seed));
  return seed;
}

vigil::schema::identity_t seed_identity(
    const vigil::crypto::ed25519_seed_t& seed) {
  auto identity = vigil::crypto::derive_identity(seed);
  if (!identity) {
    vigil::common::critical("failed to derive Ed25519 public key from seed");
  }
  return *identity;
}

vigil::schema::identity_t resolve_signer(const po::variables_map& vm) {
  auto seed = get_seed(vm);
  if (!seed) {
    return get_hash32(vm, "signer");
  }
  auto identity = seed_identity(*seed);
  if (vm.contains("signer") && get_hash32(vm, "signer") != identity) {
    vigil::common::critical("--signer does not match the key derived from --seed");
  }
  return identity;
}

uint8_t parse_event_kind(const std::string& value) {
  if (auto kind = vigil::schema::try_from_string<vigil::schema::event_kind_t>(
          value)) {
    return static_cast<uint8_t>(*kind);
  }
  // Raw values outside the known kinds stay encodable.
  auto raw = uint8_t{};
  auto [end, ec] =
      std::from_chars(value.data(), value.data() + value.size(), raw);
  if (ec != std::errc{} || end != value.data() + value.size()) {
    vigil::common::critical("event-kind must be a kind name or 0-255");
  }
  return raw;
}

vigil::schema::transaction_payload_t build_payload(
    const po::variables_map& vm,
    const vigil::schema::identity_t& signer) {
  auto payload = vm["payload"].as<std::string>();
  auto authority_owner =
      vm.contains("authority") ? get_hash32(vm, "authority") : signer;
  if (payload == "initialize") {
    return vigil::schema::initialize_t{};
  }
  if (payload == "log_event") {
    auto details = vm["details"].as<std::string>();
    auto digest = vm.contains("digest")
                      ? get_hash32(vm, "digest")
                      : vigil::execution::hash_details(details);
    auto length = vm.contains("details-length")
                      ? vm["details-length"].as<uint16_t>()
                      : vigil::execution::details_length(details);
    return vigil::schema::log_event_t{
        .authority_owner = authority_owner,
        .event_kind = parse_event_kind(vm["event-kind"].as<std::string>()),
        .content_digest = digest,
        .allowed = vm["allowed"].as<bool>(),
        .details_length = length};
  }
  if (payload == "close_event") {
    if (!vm.contains("sequence-index")) {
      vigil::common::critical("close_event requires --sequence-index");
    }
    return vigil::schema::close_event_t{
        .authority_owner = authority_owner,
        .sequence_index = vm["sequence-index"].as<uint64_t>()};
  }
  vigil::common::critical("payload must be initialize|log_event|close_event");
}

vigil::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info") {
    return {};
  }
  auto owner = get_hash32(vm, "owner");
  if (path == "/authority" || path == "/balance" || path == "/nonce" ||
      path == "/address/authority") {
    return encoder.encode(owner);
  }
  if (path == "/event" || path == "/address/event") {
    if (!vm.contains("sequence-index")) {
      vigil::common::critical("event queries require --sequence-index");
    }
    return encoder.encode(
        std::tuple{owner, vm["sequence-index"].as<uint64_t>()});
  }
  if (path == "/events/recent") {
    return encoder.encode(std::tuple{owner, vm["limit"].as<uint64_t>()});
  }
  vigil::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  vigil_tx transaction [options]\n"
            << "  vigil_tx query-key [options]\n"
            << "  vigil_tx address --owner <hex> [--sequence-index N]\n"
            << "  vigil_tx hash-details --details <text>\n"
            << "  vigil_tx public-key --seed <hex>\n"
            << "  vigil_tx chain-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"vigil_tx options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|address|hash-details|public-key|chain-id")(
      "payload", po::value<std::string>(),
      "initialize|log_event|close_event")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "nonce", po::value<uint64_t>()->default_value(0), "transaction nonce")(
      "signer", po::value<std::string>(), "signer public key hex")(
      "seed", po::value<std::string>(), "Ed25519 secret seed hex; signs")(
      "authority", po::value<std::string>(),
      "authority owner hex, defaults to the signer")(
      "event-kind", po::value<std::string>()->default_value("general_action"),
      "event kind name or raw value")(
      "details", po::value<std::string>()->default_value(""),
      "off-ledger event details")("digest", po::value<std::string>(),
                                  "content digest hex, overrides --details")(
      "details-length", po::value<uint16_t>(),
      "advisory details length, overrides --details")(
      "allowed", po::value<bool>()->default_value(false),
      "whether the action was allowed")(
      "sequence-index", po::value<uint64_t>(), "event sequence index")(
      "owner", po::value<std::string>(), "record owner hex")(
      "limit", po::value<uint64_t>()->default_value(0),
      "recent events limit, 0 for all")("path", po::value<std::string>(),
                                        "query route");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto encoder = encoder_t{};

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      vigil::common::critical("transaction mode requires --payload");
    }
    auto signer = resolve_signer(vm);
    auto transaction = vigil::schema::transaction_t{
        .version = 1,
        .chain_id = vm.contains("chain-id") ? get_hash32(vm, "chain-id")
                                            : vigil::execution::chain_id(),
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = signer,
        .payload = build_payload(vm, signer),
        .signature = {}};
    if (auto seed = get_seed(vm)) {
      auto message = vigil::execution::make_signing_payload(encoder, transaction);
      auto signature = vigil::crypto::sign(
          vigil::schema::make_bytes_view(message), *seed);
      if (!signature) {
        vigil::common::critical("failed to sign transaction");
      }
      transaction.signature = *signature;
    }
    std::cout << vigil::schema::to_base64(encoder.encode(transaction)) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      vigil::common::critical("query-key mode requires --path");
    }
    std::cout << vigil::schema::to_base64(build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "address") {
    auto owner = get_hash32(vm, "owner");
    auto derived = vm.contains("sequence-index")
                       ? vigil::schema::key::derive_event_address(
                             owner, vm["sequence-index"].as<uint64_t>())
                       : vigil::schema::key::derive_authority_address(owner);
    std::cout << vigil::schema::to_hex(derived.address) << ' '
              << static_cast<uint32_t>(derived.proof) << '\n';
    return 0;
  }

  if (command == "hash-details") {
    auto details = vm["details"].as<std::string>();
    std::cout << vigil::schema::to_hex(vigil::execution::hash_details(details))
              << ' ' << vigil::execution::details_length(details) << '\n';
    return 0;
  }

  if (command == "public-key") {
    auto seed = get_seed(vm);
    if (!seed) {
      vigil::common::critical("public-key mode requires --seed");
    }
    std::cout << vigil::schema::to_hex(seed_identity(*seed)) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << vigil::schema::to_hex(vigil::execution::chain_id()) << '\n';
    return 0;
  }

  vigil::common::critical(
      "command must be transaction|query-key|address|hash-details|public-key|"
      "chain-id");
}
