#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <invoicer/execution/engine.hpp>
#include <invoicer/ledger/account_book.hpp>
#include <invoicer/schema/encoding/scale/encoder.hpp>
#include <invoicer/schema/invoice_operation.hpp>
#include <invoicer/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

namespace po = boost::program_options;

using encoder_t = invoicer::schema::encoding::encoder<
    invoicer::schema::encoding::scale_encoder_tag>;

struct usage_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

invoicer::schema::party_id_t require_party(const po::variables_map& vm,
                                           const std::string& name) {
  if (!vm.contains(name)) {
    throw usage_error{"missing required option --" + name};
  }
  auto party =
      invoicer::schema::try_make_hash32(vm[name].as<std::string>());
  if (!party) {
    throw usage_error{"--" + name + " must be 64 hex characters"};
  }
  return *party;
}

invoicer::schema::amount_t require_amount(const po::variables_map& vm,
                                          const std::string& name) {
  if (!vm.contains(name)) {
    throw usage_error{"missing required option --" + name};
  }
  auto amount =
      invoicer::schema::try_parse_amount(vm[name].as<std::string>());
  if (!amount) {
    throw usage_error{"--" + name + " must be a non-negative integer"};
  }
  return *amount;
}

template <typename T>
T require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    throw usage_error{"missing required option --" + name};
  }
  return vm[name].as<T>();
}

std::string optional_string(const po::variables_map& vm,
                            const std::string& name) {
  return vm.contains(name) ? vm[name].as<std::string>() : std::string{};
}

invoicer::schema::timestamp_milliseconds_t current_time_ms() {
  return static_cast<invoicer::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

void print_invoice(const invoicer::schema::invoice_state_t& state) {
  std::cout << "id: " << state.id << '\n'
            << "issuer_name: " << state.issuer_name << '\n'
            << "client_name: " << state.client_name << '\n'
            << "issuer: " << invoicer::schema::to_hex(state.issuer) << '\n'
            << "recipient: " << invoicer::schema::to_hex(state.recipient)
            << '\n'
            << "amount: " << state.amount.str() << '\n'
            << "due_date: " << state.due_date << '\n'
            << "issuer_status: " << invoicer::schema::to_string(state.issuer_status)
            << '\n'
            << "recipient_status: "
            << invoicer::schema::to_string(state.recipient_status) << '\n'
            << "creation_date: " << state.creation_date << '\n'
            << "last_modified_date: " << state.last_modified_date << '\n'
            << "message: " << state.message << std::endl;
}

void print_event(const invoicer::schema::invoice_event_record_t& record) {
  std::cout << record.event_id << ' ' << record.recorded_at << ' ';
  std::visit(
      overloaded{
          [](const invoicer::schema::invoice_created_event_t& event) {
            std::cout << "created id=" << event.id
                      << " issuer=" << invoicer::schema::to_hex(event.issuer)
                      << " recipient="
                      << invoicer::schema::to_hex(event.recipient)
                      << " amount=" << event.amount.str()
                      << " due_date=" << event.due_date;
          },
          [](const invoicer::schema::invoice_updated_event_t& event) {
            std::cout << "updated id=" << event.id << " issuer_status="
                      << invoicer::schema::to_string(event.issuer_status)
                      << " recipient_status="
                      << invoicer::schema::to_string(event.recipient_status);
          }},
      record.event);
  std::cout << std::endl;
}

int print_result(const invoicer::schema::operation_result_t& result) {
  if (result.code != 0) {
    std::cout << result.codespace << " failed: " << result.log << " ("
              << result.info << ")" << std::endl;
    return 1;
  }
  std::cout << result.codespace << " ok: " << result.info;
  if (result.invoice_id != 0) {
    std::cout << " [invoice " << result.invoice_id << "]";
  }
  std::cout << std::endl;
  return 0;
}

std::optional<invoicer::schema::invoice_operation_t> make_operation(
    const std::string& command,
    const po::variables_map& vm) {
  if (command == "create") {
    return invoicer::schema::create_invoice_t{
        .issuer_name = optional_string(vm, "issuer-name"),
        .client_name = optional_string(vm, "client-name"),
        .recipient = require_party(vm, "recipient"),
        .amount = require_amount(vm, "amount"),
        .due_date = require<uint64_t>(vm, "due-date"),
        .message = optional_string(vm, "message")};
  }
  if (command == "approve") {
    return invoicer::schema::approve_invoice_t{.id = require<uint64_t>(vm, "id")};
  }
  if (command == "reject") {
    return invoicer::schema::reject_invoice_t{.id = require<uint64_t>(vm, "id")};
  }
  if (command == "modify") {
    return invoicer::schema::modify_invoice_t{
        .id = require<uint64_t>(vm, "id"),
        .client_name = optional_string(vm, "client-name"),
        .amount = require_amount(vm, "amount"),
        .due_date = require<uint64_t>(vm, "due-date"),
        .message = optional_string(vm, "message")};
  }
  if (command == "pay") {
    return invoicer::schema::pay_invoice_t{
        .id = require<uint64_t>(vm, "id"),
        .tendered_amount = require_amount(vm, "tendered")};
  }
  if (command == "sweep") {
    return invoicer::schema::sweep_overdue_t{};
  }
  return std::nullopt;
}

int run_command(const std::string& command,
                const po::variables_map& vm,
                invoicer::execution::engine& engine,
                invoicer::ledger::account_book& book) {
  if (auto operation = make_operation(command, vm)) {
    auto context = invoicer::schema::invocation_context_t{
        .caller = require_party(vm, "caller"),
        .now = vm.contains("now") ? vm["now"].as<uint64_t>()
                                  : current_time_ms()};
    return print_result(engine.execute(context, *operation));
  }
  if (command == "show") {
    auto invoice = engine.find_invoice(require<uint64_t>(vm, "id"));
    if (!invoice) {
      std::cout << "invoice not found" << std::endl;
      return 1;
    }
    print_invoice(*invoice);
    return 0;
  }
  if (command == "list") {
    for (const auto id : engine.list_invoices(require_party(vm, "party"))) {
      std::cout << id << std::endl;
    }
    return 0;
  }
  if (command == "events") {
    auto from = vm.contains("from") ? vm["from"].as<uint64_t>() : uint64_t{1};
    auto to = vm.contains("to") ? vm["to"].as<uint64_t>()
                                : std::numeric_limits<uint64_t>::max();
    for (const auto& record : engine.events(from, to)) {
      print_event(record);
    }
    return 0;
  }
  if (command == "deposit") {
    book.deposit(require_party(vm, "party"), require_amount(vm, "amount"));
    std::cout << "deposit ok" << std::endl;
    return 0;
  }
  if (command == "balance") {
    std::cout << book.balance(require_party(vm, "party")).str() << std::endl;
    return 0;
  }
  throw usage_error{"unknown command '" + command + "'"};
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto sweep_mode_name = std::string{};
  auto command = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Invoicer"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("invoicer-db"),
      "RocksDB directory holding the ledger")(
      "admin,a", po::value<std::string>(),
      "Administrative identity (64 hex chars), required on first open")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&log_file)->default_value("invoicer.log"),
      "Log file path")(
      "sweep-mode",
      po::value<std::string>(&sweep_mode_name)->default_value("literal"),
      "Overdue sweep rule: literal or conjunctive")(
      "command,c", po::value<std::string>(&command),
      "create, approve, reject, modify, pay, sweep, show, list, events, "
      "deposit or balance")(
      "caller", po::value<std::string>(), "Calling identity (64 hex chars)")(
      "now", po::value<uint64_t>(),
      "Invocation time in ms since epoch (defaults to the system clock)")(
      "id", po::value<uint64_t>(), "Invoice id")(
      "recipient", po::value<std::string>(), "Recipient identity")(
      "issuer-name", po::value<std::string>(), "Issuer label")(
      "client-name", po::value<std::string>(), "Client label")(
      "amount", po::value<std::string>(), "Invoice or deposit amount")(
      "due-date", po::value<uint64_t>(), "Due date in ms since epoch")(
      "message", po::value<std::string>(), "Free-text note")(
      "tendered", po::value<std::string>(), "Amount tendered for payment")(
      "party", po::value<std::string>(), "Identity for list/deposit/balance")(
      "from", po::value<uint64_t>(), "First event id")(
      "to", po::value<uint64_t>(), "Last event id");
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
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    return vm.contains("help") ? 0 : 1;
  }

  auto sweep_mode =
      invoicer::schema::try_from_string<invoicer::schema::sweep_mode_t>(
          sweep_mode_name);
  if (!sweep_mode) {
    std::cerr << "unknown sweep mode '" << sweep_mode_name << "'" << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto exit_code = 0;
  try {
    auto encoder = encoder_t{};
    auto storage = invoicer::storage::make_storage<
        invoicer::storage::rocksdb_storage_tag>(db_path);
    auto administrator = invoicer::schema::party_id_t{};
    if (vm.contains("admin")) {
      administrator = require_party(vm, "admin");
      if (invoicer::schema::is_zero(administrator)) {
        throw usage_error{"--admin must not be the null identity"};
      }
    } else if (auto stored = invoicer::execution::engine::stored_administrator(
                   encoder, storage)) {
      administrator = *stored;
    } else {
      throw usage_error{"--admin is required to initialize a new ledger"};
    }
    auto book = invoicer::ledger::account_book{encoder, storage};
    auto engine = invoicer::execution::engine{encoder, storage, administrator,
                                              *sweep_mode};
    engine.set_transfer_rail(book.rail());
    exit_code = run_command(command, vm, engine, book);
  } catch (const usage_error& ex) {
    spdlog::error("{}", ex.what());
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
