#include <spdlog/spdlog.h>
#include <invoicer/execution/approval.hpp>
#include <invoicer/execution/engine.hpp>
#include <invoicer/schema/key/engine_keys.hpp>
#include <exception>
#include <iterator>
#include <string>
#include <utility>

using namespace invoicer::schema;

namespace {

inline constexpr auto kCreateCodespace = std::string_view{"invoicer.create"};
inline constexpr auto kApproveCodespace = std::string_view{"invoicer.approve"};
inline constexpr auto kRejectCodespace = std::string_view{"invoicer.reject"};
inline constexpr auto kModifyCodespace = std::string_view{"invoicer.modify"};
inline constexpr auto kPayCodespace = std::string_view{"invoicer.pay"};
inline constexpr auto kSweepCodespace = std::string_view{"invoicer.sweep"};

operation_result_t make_failure(const std::string_view codespace,
                                const invoice_error_code code,
                                const invoice_id_t invoice_id,
                                std::string info) {
  auto result = operation_result_t{};
  result.code = to_code(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  result.invoice_id = invoice_id;
  spdlog::warn("{} rejected for invoice {}: {} ({})", codespace, invoice_id,
               result.log, result.info);
  return result;
}

operation_result_t make_success(const std::string_view codespace,
                                const invoice_id_t invoice_id,
                                std::string info) {
  auto result = operation_result_t{};
  result.codespace = std::string{codespace};
  result.invoice_id = invoice_id;
  result.info = std::move(info);
  return result;
}

invoice_updated_event_t make_updated_event(const invoice_state_t& state) {
  return invoice_updated_event_t{.id = state.id,
                                 .issuer_status = state.issuer_status,
                                 .recipient_status = state.recipient_status};
}

std::string_view role_name(const invoicer::execution::party_role_t role) {
  switch (role) {
    case invoicer::execution::party_role_t::issuer:
      return "issuer";
    case invoicer::execution::party_role_t::recipient:
      return "recipient";
    case invoicer::execution::party_role_t::none:
      break;
  }
  return "none";
}

}  // namespace

namespace invoicer::execution {

engine::engine(
    invoicer::schema::encoding::encoder<
        invoicer::schema::encoding::scale_encoder_tag>& encoder,
    invoicer::storage::storage<invoicer::storage::rocksdb_storage_tag>& storage,
    const party_id_t& administrator,
    const sweep_mode_t sweep_mode)
    : encoder_{encoder}, storage_{storage}, sweep_mode_{sweep_mode} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state(administrator);
  spdlog::info(
      "Invoice engine ready with {} invoice(s), {} event(s), sweep mode '{}'",
      invoice_count_, event_count_, to_string(sweep_mode_));
}

operation_result_t engine::create_invoice(const invocation_context_t& context,
                                          const create_invoice_t& request) {
  auto lock = std::scoped_lock{mutex_};
  return create_invoice_locked(context, request);
}

operation_result_t engine::approve_invoice(const invocation_context_t& context,
                                           const approve_invoice_t& request) {
  auto lock = std::scoped_lock{mutex_};
  return approve_invoice_locked(context, request);
}

operation_result_t engine::reject_invoice(const invocation_context_t& context,
                                          const reject_invoice_t& request) {
  auto lock = std::scoped_lock{mutex_};
  return reject_invoice_locked(context, request);
}

operation_result_t engine::modify_invoice(const invocation_context_t& context,
                                          const modify_invoice_t& request) {
  auto lock = std::scoped_lock{mutex_};
  return modify_invoice_locked(context, request);
}

operation_result_t engine::pay_invoice(const invocation_context_t& context,
                                       const pay_invoice_t& request) {
  auto lock = std::scoped_lock{mutex_};
  return pay_invoice_locked(context, request);
}

operation_result_t engine::sweep_overdue(const invocation_context_t& context,
                                         const sweep_overdue_t&) {
  auto lock = std::scoped_lock{mutex_};
  return sweep_overdue_locked(context);
}

operation_result_t engine::execute(const invocation_context_t& context,
                                   const invoice_operation_t& operation) {
  auto lock = std::scoped_lock{mutex_};
  return std::visit(
      overloaded{[&](const create_invoice_t& request) {
                   return create_invoice_locked(context, request);
                 },
                 [&](const approve_invoice_t& request) {
                   return approve_invoice_locked(context, request);
                 },
                 [&](const reject_invoice_t& request) {
                   return reject_invoice_locked(context, request);
                 },
                 [&](const modify_invoice_t& request) {
                   return modify_invoice_locked(context, request);
                 },
                 [&](const pay_invoice_t& request) {
                   return pay_invoice_locked(context, request);
                 },
                 [&](const sweep_overdue_t&) {
                   return sweep_overdue_locked(context);
                 }},
      operation);
}

operation_result_t engine::create_invoice_locked(
    const invocation_context_t& context,
    const create_invoice_t& request) {
  if (is_zero(request.recipient)) {
    return make_failure(kCreateCodespace,
                        invoice_error_code::invalid_recipient, 0,
                        "recipient must not be the null identity");
  }
  if (request.recipient == context.caller) {
    return make_failure(kCreateCodespace, invoice_error_code::self_assignment,
                        0, "issuer and recipient must differ");
  }
  if (request.due_date <= context.now) {
    return make_failure(kCreateCodespace,
                        invoice_error_code::due_date_in_past, 0,
                        "due date must be later than the current time");
  }

  auto state = invoice_state_t{};
  state.id = invoice_count_ + 1;
  state.issuer_name = request.issuer_name;
  state.client_name = request.client_name;
  state.issuer = context.caller;
  state.recipient = request.recipient;
  state.amount = request.amount;
  state.due_date = request.due_date;
  // Issuing an invoice is the issuer's approval of its terms.
  state.issuer_status = issuer_status_t::approved;
  state.recipient_status = recipient_status_t::pending;
  state.creation_date = context.now;
  state.last_modified_date = context.now;
  state.message = request.message;

  auto entries = std::vector<invoicer::storage::key_value_entry_t>{};
  stage_invoice(entries, state);
  entries.emplace_back(key::make_index_key(state.issuer, state.id),
                       encoder_.encode(state.id));
  entries.emplace_back(key::make_index_key(state.recipient, state.id),
                       encoder_.encode(state.id));

  auto result = make_success(kCreateCodespace, state.id, "invoice created");
  commit(entries,
         {invoice_created_event_t{.id = state.id,
                                  .issuer = state.issuer,
                                  .recipient = state.recipient,
                                  .amount = state.amount,
                                  .due_date = state.due_date}},
         state.id, context.now, result);
  spdlog::info("Created invoice {} from {} to {} for {}", state.id,
               to_hex(state.issuer), to_hex(state.recipient),
               state.amount.str());
  return result;
}

operation_result_t engine::approve_invoice_locked(
    const invocation_context_t& context,
    const approve_invoice_t& request) {
  auto state = load_invoice(request.id).value_or(invoice_state_t{});
  auto role = resolve_party_role(state, context.caller);
  if (auto error = validate_party_action(state, role)) {
    return make_failure(kApproveCodespace, *error, request.id,
                        role == party_role_t::none
                            ? "caller is not a party to the invoice"
                            : "caller's status is not pending");
  }

  apply_approval(state, role);
  state.last_modified_date = context.now;

  auto entries = std::vector<invoicer::storage::key_value_entry_t>{};
  stage_invoice(entries, state);
  auto result = make_success(kApproveCodespace, state.id, "invoice approved");
  commit(entries, {make_updated_event(state)}, invoice_count_, context.now,
         result);
  spdlog::debug("Invoice {} approved by {}", state.id, role_name(role));
  return result;
}

operation_result_t engine::reject_invoice_locked(
    const invocation_context_t& context,
    const reject_invoice_t& request) {
  auto state = load_invoice(request.id).value_or(invoice_state_t{});
  auto role = resolve_party_role(state, context.caller);
  if (auto error = validate_party_action(state, role)) {
    return make_failure(kRejectCodespace, *error, request.id,
                        role == party_role_t::none
                            ? "caller is not a party to the invoice"
                            : "caller's status is not pending");
  }

  apply_rejection(state);
  state.last_modified_date = context.now;

  auto entries = std::vector<invoicer::storage::key_value_entry_t>{};
  stage_invoice(entries, state);
  auto result = make_success(kRejectCodespace, state.id, "invoice rejected");
  commit(entries, {make_updated_event(state)}, invoice_count_, context.now,
         result);
  spdlog::info("Invoice {} rejected by {}", state.id, role_name(role));
  return result;
}

operation_result_t engine::modify_invoice_locked(
    const invocation_context_t& context,
    const modify_invoice_t& request) {
  auto state = load_invoice(request.id).value_or(invoice_state_t{});
  auto role = resolve_party_role(state, context.caller);
  if (role == party_role_t::none) {
    return make_failure(kModifyCodespace, invoice_error_code::unauthorized,
                        request.id, "caller is not a party to the invoice");
  }
  if (request.due_date <= context.now) {
    return make_failure(kModifyCodespace,
                        invoice_error_code::due_date_in_past, request.id,
                        "due date must be later than the current time");
  }
  if (auto error = validate_party_action(state, role)) {
    return make_failure(kModifyCodespace, *error, request.id,
                        "caller's status is not pending");
  }

  apply_reopen(state, role);
  state.client_name = request.client_name;
  state.amount = request.amount;
  state.due_date = request.due_date;
  state.message = request.message;
  state.last_modified_date = context.now;

  auto entries = std::vector<invoicer::storage::key_value_entry_t>{};
  stage_invoice(entries, state);
  auto result = make_success(kModifyCodespace, state.id, "invoice modified");
  commit(entries, {make_updated_event(state)}, invoice_count_, context.now,
         result);
  spdlog::debug("Invoice {} modified by {}", state.id, role_name(role));
  return result;
}

operation_result_t engine::pay_invoice_locked(
    const invocation_context_t& context,
    const pay_invoice_t& request) {
  auto state = load_invoice(request.id).value_or(invoice_state_t{});
  if (resolve_party_role(state, context.caller) != party_role_t::recipient) {
    return make_failure(kPayCodespace, invoice_error_code::unauthorized,
                        request.id, "only the recipient may pay");
  }
  if (!settlement_ready(state)) {
    return make_failure(kPayCodespace, invoice_error_code::not_approved,
                        request.id, "both parties must approve before payment");
  }
  if (request.tendered_amount != state.amount) {
    return make_failure(kPayCodespace, invoice_error_code::amount_mismatch,
                        request.id,
                        "tendered " + request.tendered_amount.str() +
                            ", owed " + state.amount.str());
  }

  apply_settlement(state);
  state.last_modified_date = context.now;

  if (!transfer_rail_) {
    return make_failure(kPayCodespace, invoice_error_code::transfer_failed,
                        request.id, "no transfer rail installed");
  }

  // The rail stages its balance writes into the same batch as the record, so
  // the movement of value and the paid status land together.
  auto entries = std::vector<invoicer::storage::key_value_entry_t>{};
  stage_invoice(entries, state);
  auto transferred = false;
  try {
    transferred = transfer_rail_(context.caller, state.issuer,
                                 request.tendered_amount, entries);
  } catch (const std::exception& ex) {
    return make_failure(kPayCodespace, invoice_error_code::transfer_failed,
                        request.id, ex.what());
  }
  if (!transferred) {
    return make_failure(kPayCodespace, invoice_error_code::transfer_failed,
                        request.id, "transfer rail declined the payment");
  }

  auto result = make_success(kPayCodespace, state.id, "invoice paid");
  commit(entries, {make_updated_event(state)}, invoice_count_, context.now,
         result);
  spdlog::info("Invoice {} settled for {}", state.id, state.amount.str());
  return result;
}

operation_result_t engine::sweep_overdue_locked(
    const invocation_context_t& context) {
  if (context.caller != administrator_) {
    return make_failure(kSweepCodespace, invoice_error_code::unauthorized, 0,
                        "only the administrator may sweep");
  }

  auto prefix = key::make_prefix_key(key::kInvoiceKeyPrefix);
  auto rows = storage_.list_by_prefix(make_bytes_view(prefix));
  auto entries = std::vector<invoicer::storage::key_value_entry_t>{};
  auto events = std::vector<invoice_event_t>{};
  for (const auto& [row_key, row_value] : rows) {
    if (!key::parse_invoice_key(make_bytes_view(row_key))) {
      continue;
    }
    auto state =
        encoder_.try_decode<invoice_state_t>(make_bytes_view(row_value));
    if (!state) {
      invoicer::common::critical("Failed to decode invoice record '{}'",
                                 to_hex(make_bytes_view(row_key)));
    }
    if (!sweep_applies(*state, context.now, sweep_mode_)) {
      continue;
    }
    state->recipient_status = recipient_status_t::overdue;
    state->last_modified_date = context.now;
    stage_invoice(entries, *state);
    events.push_back(make_updated_event(*state));
  }

  auto marked = events.size();
  auto result = make_success(
      kSweepCodespace, 0,
      "marked " + std::to_string(marked) + " invoice(s) overdue");
  if (!entries.empty()) {
    commit(entries, std::move(events), invoice_count_, context.now, result);
  }
  spdlog::info("Overdue sweep at {} marked {} of {} invoice(s)", context.now,
               marked, rows.size());
  return result;
}

invoice_state_t engine::get_invoice(const invoice_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return load_invoice(id).value_or(invoice_state_t{});
}

std::optional<invoice_state_t> engine::find_invoice(
    const invoice_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return load_invoice(id);
}

std::vector<invoice_id_t> engine::list_invoices(
    const party_id_t& party) const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = key::make_index_prefix_key(party);
  auto rows = storage_.list_by_prefix(make_bytes_view(prefix));
  auto ids = std::vector<invoice_id_t>{};
  ids.reserve(rows.size());
  for (const auto& [row_key, row_value] : rows) {
    ids.push_back(encoder_.decode<invoice_id_t>(make_bytes_view(row_value)));
  }
  return ids;
}

std::vector<invoice_id_t> engine::list_invoices(
    const invocation_context_t& context) const {
  return list_invoices(context.caller);
}

invoice_id_t engine::invoice_count() const {
  auto lock = std::scoped_lock{mutex_};
  return invoice_count_;
}

std::vector<invoice_event_record_t> engine::events(
    const uint64_t from_event_id,
    const uint64_t to_event_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<invoice_event_record_t>{};
  if (from_event_id > to_event_id) {
    return out;
  }
  auto prefix = key::make_prefix_key(key::kEventPrefix);
  auto rows = storage_.list_by_prefix(make_bytes_view(prefix));
  for (const auto& [row_key, row_value] : rows) {
    auto event_id = key::parse_event_key(make_bytes_view(row_key));
    if (!event_id || *event_id < from_event_id) {
      continue;
    }
    if (*event_id > to_event_id) {
      break;
    }
    out.push_back(
        encoder_.decode<invoice_event_record_t>(make_bytes_view(row_value)));
  }
  return out;
}

const party_id_t& engine::administrator() const {
  return administrator_;
}

sweep_mode_t engine::sweep_mode() const {
  return sweep_mode_;
}

void engine::set_transfer_rail(transfer_rail_t rail) {
  auto lock = std::scoped_lock{mutex_};
  transfer_rail_ = std::move(rail);
}

uint64_t engine::subscribe(invoice_event_listener_t listener) {
  auto lock = std::scoped_lock{mutex_};
  auto subscription_id = next_subscription_id_++;
  listeners_.emplace(subscription_id, std::move(listener));
  return subscription_id;
}

bool engine::unsubscribe(const uint64_t subscription_id) {
  auto lock = std::scoped_lock{mutex_};
  return listeners_.erase(subscription_id) > 0;
}

std::optional<invoice_state_t> engine::load_invoice(
    const invoice_id_t id) const {
  if (id == 0) {
    return std::nullopt;
  }
  auto invoice_key = key::make_invoice_key(id);
  return storage_.get<invoice_state_t>(encoder_,
                                       make_bytes_view(invoice_key));
}

void engine::stage_invoice(
    std::vector<invoicer::storage::key_value_entry_t>& entries,
    const invoice_state_t& state) {
  entries.emplace_back(key::make_invoice_key(state.id), encoder_.encode(state));
}

void engine::commit(std::vector<invoicer::storage::key_value_entry_t>& entries,
                    std::vector<invoice_event_t> events,
                    const invoice_id_t invoice_count,
                    const timestamp_milliseconds_t now,
                    operation_result_t& result) {
  auto records = std::vector<invoice_event_record_t>{};
  records.reserve(events.size());
  auto event_count = event_count_;
  for (const auto& event : events) {
    auto record = invoice_event_record_t{
        .event_id = ++event_count, .recorded_at = now, .event = event};
    entries.emplace_back(key::make_event_key(record.event_id),
                         encoder_.encode(record));
    records.push_back(std::move(record));
  }
  if (invoice_count != invoice_count_) {
    entries.emplace_back(key::make_prefix_key(key::kInvoiceCountKey),
                         encoder_.encode(invoice_count));
  }
  if (event_count != event_count_) {
    entries.emplace_back(key::make_prefix_key(key::kEventCountKey),
                         encoder_.encode(event_count));
  }

  storage_.write_batch(entries);
  invoice_count_ = invoice_count;
  event_count_ = event_count;
  result.events = std::move(events);

  for (const auto& record : records) {
    for (const auto& [subscription_id, listener] : listeners_) {
      try {
        listener(record);
      } catch (const std::exception& ex) {
        spdlog::error("Listener {} failed on event {}: {}", subscription_id,
                      record.event_id, ex.what());
      }
    }
  }
}

std::optional<party_id_t> engine::stored_administrator(
    invoicer::schema::encoding::encoder<
        invoicer::schema::encoding::scale_encoder_tag>& encoder,
    invoicer::storage::storage<invoicer::storage::rocksdb_storage_tag>&
        storage) {
  auto admin_key = key::make_prefix_key(key::kAdministratorKey);
  return storage.get<party_id_t>(encoder, make_bytes_view(admin_key));
}

void engine::load_persisted_state(const party_id_t& administrator) {
  spdlog::debug("Loading persisted ledger state");
  auto admin_key = key::make_prefix_key(key::kAdministratorKey);
  if (auto stored = storage_.get<party_id_t>(encoder_,
                                             make_bytes_view(admin_key))) {
    administrator_ = *stored;
    if (administrator_ != administrator) {
      spdlog::warn(
          "Ignoring configured administrator {}; store is administered by {}",
          to_hex(administrator), to_hex(administrator_));
    }
  } else {
    if (is_zero(administrator)) {
      invoicer::common::critical(
          "Refusing to record the null identity as ledger administrator");
    }
    administrator_ = administrator;
    storage_.put(encoder_, make_bytes_view(admin_key), administrator_);
  }

  auto invoice_count_key = key::make_prefix_key(key::kInvoiceCountKey);
  invoice_count_ = storage_
                       .get<invoice_id_t>(encoder_,
                                          make_bytes_view(invoice_count_key))
                       .value_or(0);
  auto event_count_key = key::make_prefix_key(key::kEventCountKey);
  event_count_ =
      storage_.get<uint64_t>(encoder_, make_bytes_view(event_count_key))
          .value_or(0);
}

}  // namespace invoicer::execution
