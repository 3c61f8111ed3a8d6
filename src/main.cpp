#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tranche/common/critical.hpp>
#include <tranche/execution/balance_ledger.hpp>
#include <tranche/execution/engine.hpp>
#include <tranche/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace tranche::schema;

namespace {

namespace po = boost::program_options;
using tranche::execution::engine;

void configure_logging(const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  // Console output goes to stderr; stdout carries command results.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("tranche.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "tranche", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

hash32_t get_hash32(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    tranche::common::critical("missing required argument --" + name);
  }
  auto value = try_make_hash32(vm[name].as<std::string>());
  if (!value) {
    tranche::common::critical("--" + name + " must be 32-byte hex");
  }
  return *value;
}

amount_t parse_amount(const std::string& text) {
  auto value = try_make_amount(text);
  if (!value) {
    tranche::common::critical("invalid amount '" + text + "'");
  }
  return *value;
}

amount_t get_amount(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    tranche::common::critical("missing required argument --" + name);
  }
  return parse_amount(vm[name].as<std::string>());
}

uint64_t get_u64(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    tranche::common::critical("missing required argument --" + name);
  }
  return vm[name].as<uint64_t>();
}

schedule_id_t get_id(const po::variables_map& vm) {
  if (!vm.contains("id")) {
    tranche::common::critical("missing required argument --id");
  }
  return vm["id"].as<schedule_id_t>();
}

schedule_kind_t get_kind(const po::variables_map& vm) {
  auto kind = try_from_string<schedule_kind_t>(vm["kind"].as<std::string>());
  if (!kind) {
    tranche::common::critical("--kind must be stream|vesting");
  }
  return *kind;
}

/// recipient:token:amount:start:end
create_stream_t parse_stream_entry(const std::string& text) {
  auto fields = std::vector<std::string>{};
  auto begin = size_t{0};
  while (true) {
    auto end = text.find(':', begin);
    fields.push_back(text.substr(begin, end - begin));
    if (end == std::string::npos) {
      break;
    }
    begin = end + 1;
  }
  if (fields.size() != 5) {
    tranche::common::critical("--stream expects recipient:token:amount:start:end");
  }
  auto recipient = try_make_hash32(fields[0]);
  auto token = try_make_hash32(fields[1]);
  if (!recipient || !token) {
    tranche::common::critical("--stream recipient and token must be hex");
  }
  return create_stream_t{.recipient = *recipient,
                         .token = *token,
                         .total_amount = parse_amount(fields[2]),
                         .start_time = std::stoull(fields[3]),
                         .end_time = std::stoull(fields[4])};
}

template <typename T>
int report_failure(const operation_result<T>& result) {
  std::cerr << "error: " << to_string(result.code) << ": " << result.log
            << '\n';
  return static_cast<int>(result.code);
}

void print_schedule(const schedule_t& value) {
  std::cout << "kind=" << to_string(kind_of(value)) << '\n'
            << "id=" << value.id << '\n'
            << "sender=" << to_hex(value.sender) << '\n'
            << "recipient=" << to_hex(value.recipient) << '\n'
            << "token=" << to_hex(value.token) << '\n'
            << "total_amount=" << to_string(value.total_amount) << '\n'
            << "claimed_amount=" << to_string(value.claimed_amount) << '\n'
            << "refunded_amount=" << to_string(value.refunded_amount) << '\n'
            << "status=" << to_string(value.status) << '\n'
            << "created_at=" << value.created_at << '\n'
            << "last_update_time=" << value.last_update_time << '\n';
  std::visit(overloaded{[](const stream_terms_t& terms) {
                          std::cout << "start_time=" << terms.start_time << '\n'
                                    << "end_time=" << terms.end_time << '\n';
                        },
                        [](const vesting_terms_t& terms) {
                          std::cout
                              << "start_time=" << terms.start_time << '\n'
                              << "cliff_duration=" << terms.cliff_duration
                              << '\n'
                              << "cliff_amount=" << to_string(terms.cliff_amount)
                              << '\n'
                              << "total_duration=" << terms.total_duration
                              << '\n';
                        }},
             value.terms);
  if (value.terminated_at) {
    std::cout << "terminated_at=" << *value.terminated_at << '\n';
  }
  if (!value.label.empty()) {
    std::cout << "label=" << value.label << '\n';
  }
  std::cout << "revocable=" << (value.revocable ? "true" : "false") << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  tranche init --admin HEX\n"
            << "  tranche mint --token HEX --account HEX --amount N\n"
            << "  tranche balance --token HEX --account HEX\n"
            << "  tranche create-stream --sender HEX --recipient HEX "
               "--token HEX --amount N --start T --end T\n"
            << "  tranche create-streams --sender HEX "
               "--stream recipient:token:amount:start:end ...\n"
            << "  tranche create-vesting --grantor HEX --beneficiary HEX "
               "--token HEX --amount N --start T --cliff S --cliff-amount N "
               "--duration S [--label L] [--revocable BOOL]\n"
            << "  tranche claim --kind K --recipient HEX --id N\n"
            << "  tranche cancel --sender HEX --id N\n"
            << "  tranche revoke --grantor HEX --id N\n"
            << "  tranche show|claimable|progress|history --kind K --id N\n"
            << "  tranche list --kind K (--sender HEX | --recipient HEX)\n\n";
  std::cout << options << '\n';
}

int run(const std::string& command,
        const po::variables_map& vm,
        engine& releases,
        tranche::execution::balance_ledger& ledger,
        std::optional<account_id_t>& actor) {
  if (command == "init") {
    actor = get_hash32(vm, "admin");
    auto result = releases.initialize(*actor);
    if (!result.ok()) {
      return report_failure(result);
    }
    std::cout << to_hex(*result.value) << '\n';
    return 0;
  }

  if (command == "mint") {
    auto token = get_hash32(vm, "token");
    auto account = get_hash32(vm, "account");
    auto code = ledger.mint(token, account, get_amount(vm, "amount"));
    if (code != error_code::ok) {
      std::cerr << "error: " << to_string(code) << ": mint rejected\n";
      return static_cast<int>(code);
    }
    std::cout << to_string(ledger.balance_of(token, account)) << '\n';
    return 0;
  }

  if (command == "balance") {
    std::cout << to_string(ledger.balance_of(get_hash32(vm, "token"),
                                             get_hash32(vm, "account")))
              << '\n';
    return 0;
  }

  if (command == "create-stream") {
    actor = get_hash32(vm, "sender");
    auto result = releases.create_stream(
        *actor, create_stream_t{.recipient = get_hash32(vm, "recipient"),
                                .token = get_hash32(vm, "token"),
                                .total_amount = get_amount(vm, "amount"),
                                .start_time = get_u64(vm, "start"),
                                .end_time = get_u64(vm, "end")});
    if (!result.ok()) {
      return report_failure(result);
    }
    std::cout << *result.value << '\n';
    return 0;
  }

  if (command == "create-streams") {
    actor = get_hash32(vm, "sender");
    auto entries = std::vector<create_stream_t>{};
    if (vm.contains("stream")) {
      for (const auto& text : vm["stream"].as<std::vector<std::string>>()) {
        entries.push_back(parse_stream_entry(text));
      }
    }
    auto result = releases.create_streams(*actor, entries);
    if (!result.ok()) {
      return report_failure(result);
    }
    for (const auto id : *result.value) {
      std::cout << id << '\n';
    }
    return 0;
  }

  if (command == "create-vesting") {
    actor = get_hash32(vm, "grantor");
    auto result = releases.create_vesting(
        *actor,
        create_vesting_t{.beneficiary = get_hash32(vm, "beneficiary"),
                         .token = get_hash32(vm, "token"),
                         .total_amount = get_amount(vm, "amount"),
                         .start_time = get_u64(vm, "start"),
                         .cliff_duration = vm["cliff"].as<uint64_t>(),
                         .cliff_amount = get_amount(vm, "cliff-amount"),
                         .total_duration = get_u64(vm, "duration"),
                         .label = vm["label"].as<std::string>(),
                         .revocable = vm["revocable"].as<bool>()});
    if (!result.ok()) {
      return report_failure(result);
    }
    std::cout << *result.value << '\n';
    return 0;
  }

  if (command == "claim") {
    actor = get_hash32(vm, "recipient");
    auto result = get_kind(vm) == schedule_kind_t::stream
                      ? releases.claim_stream(*actor, get_id(vm))
                      : releases.claim_vesting(*actor, get_id(vm));
    if (!result.ok()) {
      return report_failure(result);
    }
    std::cout << to_string(*result.value) << '\n';
    return 0;
  }

  if (command == "cancel" || command == "revoke") {
    actor = get_hash32(vm, command == "cancel" ? "sender" : "grantor");
    auto result = command == "cancel"
                      ? releases.cancel_stream(*actor, get_id(vm))
                      : releases.revoke_vesting(*actor, get_id(vm));
    if (!result.ok()) {
      return report_failure(result);
    }
    std::cout << to_string(*result.value) << '\n';
    return 0;
  }

  if (command == "show") {
    auto result = releases.get(get_kind(vm), get_id(vm));
    if (!result.ok()) {
      return report_failure(result);
    }
    print_schedule(*result.value);
    return 0;
  }

  if (command == "claimable") {
    auto result = releases.claimable(get_kind(vm), get_id(vm));
    if (!result.ok()) {
      return report_failure(result);
    }
    std::cout << to_string(*result.value) << '\n';
    return 0;
  }

  if (command == "progress") {
    auto result = releases.progress(get_kind(vm), get_id(vm));
    if (!result.ok()) {
      return report_failure(result);
    }
    const auto& value = *result.value;
    std::cout << "total=" << to_string(value.total_amount)
              << " accrued=" << to_string(value.accrued_amount)
              << " claimed=" << to_string(value.claimed_amount)
              << " claimable=" << to_string(value.claimable_amount)
              << " refunded=" << to_string(value.refunded_amount)
              << " status=" << to_string(value.status) << '\n';
    return 0;
  }

  if (command == "list") {
    auto kind = get_kind(vm);
    auto ids = vm.contains("sender")
                   ? releases.schedules_by_sender(kind, get_hash32(vm, "sender"))
                   : releases.schedules_by_recipient(
                         kind, get_hash32(vm, "recipient"));
    for (const auto id : ids) {
      std::cout << id << '\n';
    }
    return 0;
  }

  if (command == "history") {
    auto result = releases.claim_history(get_kind(vm), get_id(vm));
    if (!result.ok()) {
      return report_failure(result);
    }
    for (const auto& record : *result.value) {
      std::cout << to_string(record.amount) << ' ' << record.timestamp << '\n';
    }
    return 0;
  }

  tranche::common::critical("unknown command '" + command + "'");
}

}  // namespace

int main(int argc, const char** argv) try {
  auto command = std::string{};
  auto db_path = std::string{};
  auto config_path = std::string{};

  auto generic = po::options_description{"tranche options"};
  generic.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "init|mint|balance|create-stream|create-streams|create-vesting|claim|"
      "cancel|revoke|show|claimable|progress|list|history")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with default option values");

  auto settings = po::options_description{"settings"};
  settings.add_options()(
      "db-path", po::value<std::string>(&db_path)->default_value("tranche.db"),
      "RocksDB directory")("now", po::value<uint64_t>(),
                           "ledger time in seconds (defaults to system clock)")(
      "verbose,v", po::bool_switch(), "enable debug logging");

  auto arguments = po::options_description{"arguments"};
  arguments.add_options()("admin", po::value<std::string>(), "admin hex")(
      "account", po::value<std::string>(), "account hex")(
      "token", po::value<std::string>(), "token hex")(
      "sender", po::value<std::string>(), "stream sender hex")(
      "recipient", po::value<std::string>(), "recipient hex")(
      "grantor", po::value<std::string>(), "vesting grantor hex")(
      "beneficiary", po::value<std::string>(), "vesting beneficiary hex")(
      "amount", po::value<std::string>(), "amount in smallest units")(
      "start", po::value<uint64_t>(), "start time in seconds")(
      "end", po::value<uint64_t>(), "stream end time in seconds")(
      "cliff", po::value<uint64_t>()->default_value(0),
      "cliff duration in seconds")(
      "cliff-amount", po::value<std::string>()->default_value("0"),
      "amount unlocked at the cliff")("duration", po::value<uint64_t>(),
                                      "total vesting duration in seconds")(
      "label", po::value<std::string>()->default_value(""), "grant label")(
      "revocable", po::value<bool>()->default_value(true),
      "whether the grantor may revoke")(
      "stream", po::value<std::vector<std::string>>()->multitoken(),
      "batch entry recipient:token:amount:start:end")(
      "kind", po::value<std::string>()->default_value("stream"),
      "stream|vesting")("id", po::value<schedule_id_t>(), "schedule id");

  auto options = po::options_description{};
  options.add(generic).add(settings).add(arguments);

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

  if (!config_path.empty()) {
    po::store(po::parse_config_file<char>(config_path.c_str(), settings), vm);
    po::notify(vm);
  }

  configure_logging(vm["verbose"].as<bool>());

  auto now = vm.contains("now")
                 ? vm["now"].as<uint64_t>()
                 : static_cast<uint64_t>(
                       std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count());

  auto encoder = tranche::execution::encoder_t{};
  auto storage = tranche::storage::make_storage<
      tranche::storage::rocksdb_storage_tag>(db_path);
  auto ledger = tranche::execution::balance_ledger{encoder, storage};
  auto releases = engine{encoder, storage};

  // The acting account is whichever role the command names.
  auto actor = std::optional<account_id_t>{};
  releases.set_authorizer(
      [&actor](const account_id_t& account) { return actor == account; });
  releases.set_transfer_executor(ledger.executor());
  releases.set_block_time(now);

  auto status = run(command, vm, releases, ledger, actor);
  spdlog::shutdown();
  return status;
} catch (const std::exception& ex) {
  tranche::common::critical(ex.what());
}
