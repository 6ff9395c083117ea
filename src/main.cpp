#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <vigil/execution/engine.hpp>
#include <vigil/schema/encoding/scale/encoder.hpp>
#include <iostream>
#include <string>

namespace {

void install_logger(const std::string& log_file, const std::string& level) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "vigild", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

std::string describe(const vigil::schema::notification_t& notification) {
  using namespace vigil::schema;
  return std::visit(
      overloaded{
          [](const audit_initialized_t& n) {
            return "AuditInitialized owner=" + to_hex(n.owner_identity) +
                   " timestamp=" + std::to_string(n.timestamp);
          },
          [](const security_event_logged_t& n) {
            return "SecurityEventLogged owner=" + to_hex(n.owner_identity) +
                   " index=" + std::to_string(n.sequence_index) +
                   " type=" + std::string{to_string(n.event_kind)} +
                   " allowed=" + (n.allowed ? "true" : "false") +
                   " digest=" + to_hex(n.content_digest) +
                   " timestamp=" + std::to_string(n.timestamp);
          },
          [](const security_event_closed_t& n) {
            return "SecurityEventClosed owner=" + to_hex(n.owner_identity) +
                   " index=" + std::to_string(n.sequence_index);
          }},
      notification);
}

void print_result(const vigil::schema::transaction_result_t& result) {
  std::cout << "code=" << result.code << '\n';
  if (!result.codespace.empty()) {
    std::cout << "codespace=" << result.codespace << '\n';
  }
  if (!result.log.empty()) {
    std::cout << "log=" << result.log << '\n';
  }
  if (!result.info.empty()) {
    std::cout << "info=" << result.info << '\n';
  }
  if (!result.data.empty()) {
    std::cout << "data=" << vigil::schema::to_base64(result.data) << '\n';
  }
  for (const auto& notification : result.notifications) {
    std::cout << "notification=" << describe(notification) << '\n';
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  namespace po = boost::program_options;

  auto command = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto strict_crypto = true;

  auto vm = po::variables_map{};
  auto description = po::options_description{"vigild"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command),
      "submit|check|query|credit")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("vigil.db"),
      "RocksDB directory holding the ledger")(
      "strict-crypto", po::value<bool>(&strict_crypto)->default_value(true),
      "Verify Ed25519 transaction signatures")(
      "log-file", po::value<std::string>(&log_file)->default_value("vigild.log"),
      "Log file path")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "tx", po::value<std::string>(), "base64 transaction for submit/check")(
      "path", po::value<std::string>(), "query route")(
      "data", po::value<std::string>()->default_value(""),
      "base64 query data")("identity", po::value<std::string>(),
                           "identity hex for credit")(
      "lamports", po::value<uint64_t>()->default_value(0),
      "amount for credit")("verbose,v", "Enable verbose output");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    return 0;
  }

  install_logger(log_file, vm.contains("verbose") ? "debug" : log_level);

  auto encoder = vigil::execution::encoder_t{};
  auto storage =
      vigil::storage::make_storage<vigil::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = vigil::execution::engine{
      encoder, storage, vigil::execution::make_system_time_source(),
      strict_crypto};

  auto exit_code = 0;
  if (command == "submit" || command == "check") {
    if (!vm.contains("tx")) {
      spdlog::error("{} requires --tx", command);
      exit_code = 2;
    } else if (auto raw = vigil::schema::try_from_base64(
                   vm["tx"].as<std::string>())) {
      auto bytes = vigil::schema::make_bytes_view(*raw);
      auto result = command == "submit" ? engine.execute_transaction(bytes)
                                        : engine.check_transaction(bytes);
      print_result(result);
      exit_code = result.code == 0 ? 0 : 1;
    } else {
      spdlog::error("--tx is not valid base64");
      exit_code = 2;
    }
  } else if (command == "query") {
    auto data = vigil::schema::try_from_base64(vm["data"].as<std::string>());
    if (!vm.contains("path") || !data) {
      spdlog::error("query requires --path and base64 --data");
      exit_code = 2;
    } else {
      auto result = engine.query(vm["path"].as<std::string>(),
                                 vigil::schema::make_bytes_view(*data));
      std::cout << "code=" << result.code << '\n';
      if (!result.log.empty()) {
        std::cout << "log=" << result.log << '\n';
      }
      std::cout << "value=" << vigil::schema::to_base64(result.value) << '\n';
      exit_code = result.code == 0 ? 0 : 1;
    }
  } else if (command == "credit") {
    auto identity = vm.contains("identity")
                        ? vigil::schema::try_make_hash32(
                              vm["identity"].as<std::string>())
                        : std::nullopt;
    if (!identity) {
      spdlog::error("credit requires a 32 byte hex --identity");
      exit_code = 2;
    } else {
      exit_code =
          engine.credit(*identity, vm["lamports"].as<uint64_t>()) ? 0 : 1;
    }
  } else {
    spdlog::error("command must be submit|check|query|credit");
    exit_code = 2;
  }

  spdlog::shutdown();
  return exit_code;
}
