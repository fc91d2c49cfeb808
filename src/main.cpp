#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <sentinel/blake3/hash.hpp>
#include <sentinel/execution/hooks.hpp>
#include <sentinel/execution/ledger.hpp>
#include <sentinel/host/storage_host.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

constexpr int kExitOk = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage = 2;

/// Accounts are given either as 64 hex characters or as a name, which is
/// hashed into an account id.
sentinel::schema::account_id_t parse_account(const std::string& value) {
  if (auto id = sentinel::schema::try_make_hash32(value)) {
    return *id;
  }
  return sentinel::blake3::hash(std::string_view{value});
}

bool require(const po::variables_map& vm,
             const std::vector<std::string>& names,
             const std::string& command) {
  for (const auto& name : names) {
    if (!vm.contains(name)) {
      std::cerr << command << ": missing --" << name << std::endl;
      return false;
    }
  }
  return true;
}

void print_result(const sentinel::schema::operation_result_t& result) {
  std::cout << "code=" << result.code << " log=" << result.log
            << " codespace=" << result.codespace << " info=\"" << result.info
            << "\"" << std::endl;
  for (const auto& event : result.events) {
    std::cout << "event seq=" << event.sequence
              << " kind=" << sentinel::schema::to_string(event.kind)
              << " actor=" << sentinel::schema::to_hex(event.actor)
              << " counterparty=" << sentinel::schema::to_hex(event.counterparty)
              << " amount=" << event.amount << std::endl;
  }
}

int finish(const sentinel::schema::operation_result_t& result,
           const sentinel::host::storage_host& host,
           const sentinel::schema::account_id_t& caller) {
  print_result(result);
  if (!result.ok()) {
    return kExitRejected;
  }
  host.record_activity(caller);
  return kExitOk;
}

void configure_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "sentinel", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto config_path = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto parameters = sentinel::execution::hook_parameters{};

  auto general = po::options_description{"Sentinel"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI style configuration file")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("sentinel.db"),
      "RocksDB directory holding the ledger")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "Also write logs to this file")(
      "cap-rate",
      po::value<uint64_t>(&parameters.cap_rate)
          ->default_value(sentinel::execution::kDefaultCapRate),
      "Withdraw cap rate numerator")(
      "scale-factor",
      po::value<uint64_t>(&parameters.scale_factor)
          ->default_value(sentinel::execution::kDefaultScaleFactor),
      "Withdraw cap rate denominator")(
      "reference-floor",
      po::value<uint64_t>(&parameters.reference_floor)
          ->default_value(sentinel::execution::kDefaultReferenceFloor),
      "Reference currency balance a recipient must exceed");

  auto operation = po::options_description{"Command arguments"};
  operation.add_options()("caller", po::value<std::string>(),
                          "Authenticated caller account")(
      "to", po::value<std::string>(), "Destination account")(
      "from", po::value<std::string>(), "Source account for burn")(
      "account", po::value<std::string>(), "Account to inspect or configure")(
      "amount", po::value<uint64_t>(), "Amount in base units")(
      "name", po::value<std::string>(), "Asset name")(
      "symbol", po::value<std::string>(), "Asset symbol")(
      "decimals", po::value<unsigned>(), "Asset decimals (0-255)")(
      "counter", po::value<uint64_t>(), "Host activity counter")(
      "from-sequence", po::value<uint64_t>()->default_value(1),
      "First event sequence")(
      "to-sequence",
      po::value<uint64_t>()->default_value(
          std::numeric_limits<uint64_t>::max()),
      "Last event sequence");

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&command));
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto visible = po::options_description{};
  visible.add(general).add(operation);
  auto all = po::options_description{};
  all.add(general).add(operation).add(hidden);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto file = std::ifstream{vm["config"].as<std::string>()};
      if (!file) {
        std::cerr << "cannot open config file '"
                  << vm["config"].as<std::string>() << "'" << std::endl;
        return kExitUsage;
      }
      po::store(po::parse_config_file(file, general), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl;
    return kExitUsage;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << "usage: sentinel [options] <command>\n"
                 "commands: init mint burn transfer balance supply descriptor"
                 " events audit set-activity set-reference\n"
              << visible << std::endl;
    return vm.contains("help") ? kExitOk : kExitUsage;
  }
  if (parameters.scale_factor == 0) {
    std::cerr << "--scale-factor must be non-zero" << std::endl;
    return kExitUsage;
  }

  configure_logging(log_level, log_file);
  spdlog::debug("cap rate {}/{}, reference floor {}", parameters.cap_rate,
                parameters.scale_factor, parameters.reference_floor);

  auto storage =
      sentinel::storage::make_storage<sentinel::storage::rocksdb_storage_tag>(
          db_path);
  auto host = sentinel::host::storage_host{storage};
  auto ledger = sentinel::execution::ledger{
      storage, sentinel::execution::make_standard_hooks(host, parameters)};

  auto account = [&](const std::string& name) {
    return parse_account(vm[name].as<std::string>());
  };
  auto exit_code = kExitOk;

  if (command == "init") {
    if (!require(vm, {"caller", "name", "symbol", "decimals"}, command)) {
      exit_code = kExitUsage;
    } else if (vm["decimals"].as<unsigned>() >
               std::numeric_limits<uint8_t>::max()) {
      std::cerr << "init: --decimals must be at most 255" << std::endl;
      exit_code = kExitUsage;
    } else {
      exit_code = finish(
          ledger.initialize(account("caller"), vm["name"].as<std::string>(),
                            vm["symbol"].as<std::string>(),
                            static_cast<uint8_t>(vm["decimals"].as<unsigned>())),
          host, account("caller"));
    }
  } else if (command == "mint") {
    exit_code = require(vm, {"caller", "to", "amount"}, command)
                    ? finish(ledger.mint(account("caller"), account("to"),
                                         vm["amount"].as<uint64_t>()),
                             host, account("caller"))
                    : kExitUsage;
  } else if (command == "burn") {
    exit_code = require(vm, {"caller", "from", "amount"}, command)
                    ? finish(ledger.burn(account("caller"), account("from"),
                                         vm["amount"].as<uint64_t>()),
                             host, account("caller"))
                    : kExitUsage;
  } else if (command == "transfer") {
    exit_code = require(vm, {"caller", "to", "amount"}, command)
                    ? finish(ledger.transfer(account("caller"), account("to"),
                                             vm["amount"].as<uint64_t>()),
                             host, account("caller"))
                    : kExitUsage;
  } else if (command == "balance") {
    if (require(vm, {"account"}, command)) {
      auto id = account("account");
      std::cout << sentinel::schema::to_hex(id) << " balance="
                << ledger.balance_of(id)
                << " activity=" << host.activity_counter(id)
                << " reference=" << host.reference_balance(id) << std::endl;
    } else {
      exit_code = kExitUsage;
    }
  } else if (command == "supply") {
    std::cout << ledger.total_supply() << std::endl;
  } else if (command == "descriptor") {
    if (auto descriptor = ledger.asset_descriptor()) {
      std::cout << "name=" << descriptor->name
                << " symbol=" << descriptor->symbol
                << " decimals=" << static_cast<unsigned>(descriptor->decimals)
                << std::endl;
    } else {
      std::cout << "asset not registered" << std::endl;
      exit_code = kExitRejected;
    }
  } else if (command == "events") {
    auto head = storage.load_event_head();
    for (const auto& event :
         storage.load_events(vm["from-sequence"].as<uint64_t>(),
                             vm["to-sequence"].as<uint64_t>())) {
      std::cout << event.sequence << " "
                << sentinel::schema::to_string(event.kind) << " "
                << sentinel::schema::to_hex(event.actor) << " "
                << sentinel::schema::to_hex(event.counterparty) << " "
                << event.amount << std::endl;
    }
    std::cout << "head count=" << head.count
              << " digest=" << sentinel::schema::to_hex(head.digest)
              << std::endl;
  } else if (command == "audit") {
    auto audit = ledger.audit();
    std::cout << "ok=" << std::boolalpha << audit.ok
              << " supply=" << audit.total_supply
              << " balance_sum=" << audit.balance_sum.str()
              << " accounts=" << audit.accounts << std::endl;
    exit_code = audit.ok ? kExitOk : kExitRejected;
  } else if (command == "set-activity") {
    if (require(vm, {"account", "counter"}, command)) {
      exit_code = host.set_activity_counter(account("account"),
                                            vm["counter"].as<uint64_t>())
                      ? kExitOk
                      : kExitRejected;
    } else {
      exit_code = kExitUsage;
    }
  } else if (command == "set-reference") {
    if (require(vm, {"account", "amount"}, command)) {
      host.set_reference_balance(account("account"),
                                 vm["amount"].as<uint64_t>());
    } else {
      exit_code = kExitUsage;
    }
  } else {
    std::cerr << "unknown command '" << command << "'" << std::endl;
    exit_code = kExitUsage;
  }

  spdlog::shutdown();
  return exit_code;
}
