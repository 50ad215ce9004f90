#pragma once

#include <invoicer/execution/transfer_rail.hpp>
#include <invoicer/schema/encoding/encoder.hpp>
#include <invoicer/schema/encoding/scale/encoder.hpp>
#include <invoicer/schema/invocation_context.hpp>
#include <invoicer/schema/invoice_error_code.hpp>
#include <invoicer/schema/invoice_event.hpp>
#include <invoicer/schema/invoice_event_record.hpp>
#include <invoicer/schema/invoice_operation.hpp>
#include <invoicer/schema/invoice_state.hpp>
#include <invoicer/schema/operation_result.hpp>
#include <invoicer/schema/primitives.hpp>
#include <invoicer/schema/sweep_mode.hpp>
#include <invoicer/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace invoicer::execution {

/// Synchronous observer of emitted invoice events.
///
/// Invoked while the engine lock is held; must not call back into the engine.
/// An exception thrown by a listener is logged and does not reach the caller
/// or the remaining listeners.
using invoice_event_listener_t =
    std::function<void(const invoicer::schema::invoice_event_record_t&)>;

/// Two-party invoice ledger.
///
/// Owns the invoice records, the per-party index and the event log. Every
/// entry point runs under one mutex and every mutation commits through a
/// single storage write batch, so each operation either lands completely or
/// leaves no trace.
class engine final {
 public:
  /// Bind the engine to its codec and store.
  ///
  /// `administrator` is recorded on first open only; a store that already
  /// carries an administrative identity keeps it. Recording the null
  /// identity is a critical fault.
  explicit engine(
      invoicer::schema::encoding::encoder<
          invoicer::schema::encoding::scale_encoder_tag>& encoder,
      invoicer::storage::storage<invoicer::storage::rocksdb_storage_tag>&
          storage,
      const invoicer::schema::party_id_t& administrator,
      invoicer::schema::sweep_mode_t sweep_mode =
          invoicer::schema::sweep_mode_t::literal);

  /// Create an invoice issued by the caller. On success `invoice_id` holds
  /// the newly assigned id.
  invoicer::schema::operation_result_t create_invoice(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::create_invoice_t& request);

  /// Move the caller's own status from pending to approved.
  invoicer::schema::operation_result_t approve_invoice(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::approve_invoice_t& request);

  /// Veto the invoice while the caller's own status is still pending. Both
  /// statuses become rejected.
  invoicer::schema::operation_result_t reject_invoice(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::reject_invoice_t& request);

  /// Revise terms and re-open approval on the counterparty's side.
  invoicer::schema::operation_result_t modify_invoice(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::modify_invoice_t& request);

  /// Settle a dual-approved invoice through the installed transfer rail.
  invoicer::schema::operation_result_t pay_invoice(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::pay_invoice_t& request);

  /// Administrative pass marking past-due invoices overdue.
  invoicer::schema::operation_result_t sweep_overdue(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::sweep_overdue_t& request = {});

  /// Dispatch any ledger operation to its handler.
  invoicer::schema::operation_result_t execute(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::invoice_operation_t& operation);

  /// Stored record, or the value-initialized record (id 0) when unassigned.
  invoicer::schema::invoice_state_t get_invoice(
      invoicer::schema::invoice_id_t id) const;

  std::optional<invoicer::schema::invoice_state_t> find_invoice(
      invoicer::schema::invoice_id_t id) const;

  /// Ids the party participates in, in creation order.
  std::vector<invoicer::schema::invoice_id_t> list_invoices(
      const invoicer::schema::party_id_t& party) const;

  /// Ids the calling party participates in.
  std::vector<invoicer::schema::invoice_id_t> list_invoices(
      const invoicer::schema::invocation_context_t& context) const;

  /// Last assigned invoice id (0 on an empty ledger).
  invoicer::schema::invoice_id_t invoice_count() const;

  /// Persisted events with ids in the inclusive range.
  std::vector<invoicer::schema::invoice_event_record_t> events(
      uint64_t from_event_id,
      uint64_t to_event_id) const;

  const invoicer::schema::party_id_t& administrator() const;

  /// Administrative identity recorded in `storage`, if any engine has opened
  /// it yet.
  static std::optional<invoicer::schema::party_id_t> stored_administrator(
      invoicer::schema::encoding::encoder<
          invoicer::schema::encoding::scale_encoder_tag>& encoder,
      invoicer::storage::storage<invoicer::storage::rocksdb_storage_tag>&
          storage);

  invoicer::schema::sweep_mode_t sweep_mode() const;

  /// Install the value-transfer collaborator used by `pay_invoice`.
  void set_transfer_rail(transfer_rail_t rail);

  /// Register an event listener; returns a handle for `unsubscribe`.
  uint64_t subscribe(invoice_event_listener_t listener);

  /// Remove a listener; false when the handle is unknown.
  bool unsubscribe(uint64_t subscription_id);

 private:
  invoicer::schema::operation_result_t create_invoice_locked(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::create_invoice_t& request);
  invoicer::schema::operation_result_t approve_invoice_locked(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::approve_invoice_t& request);
  invoicer::schema::operation_result_t reject_invoice_locked(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::reject_invoice_t& request);
  invoicer::schema::operation_result_t modify_invoice_locked(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::modify_invoice_t& request);
  invoicer::schema::operation_result_t pay_invoice_locked(
      const invoicer::schema::invocation_context_t& context,
      const invoicer::schema::pay_invoice_t& request);
  invoicer::schema::operation_result_t sweep_overdue_locked(
      const invoicer::schema::invocation_context_t& context);

  /// Read a record without taking the lock.
  std::optional<invoicer::schema::invoice_state_t> load_invoice(
      invoicer::schema::invoice_id_t id) const;

  /// Stage a record write.
  void stage_invoice(std::vector<invoicer::storage::key_value_entry_t>& entries,
                     const invoicer::schema::invoice_state_t& state);

  /// Append event records and counters to `entries`, write the batch, then
  /// notify listeners. `result.events` receives the emitted events.
  void commit(std::vector<invoicer::storage::key_value_entry_t>& entries,
              std::vector<invoicer::schema::invoice_event_t> events,
              invoicer::schema::invoice_id_t invoice_count,
              invoicer::schema::timestamp_milliseconds_t now,
              invoicer::schema::operation_result_t& result);

  /// Load administrator and counters from storage at startup.
  void load_persisted_state(const invoicer::schema::party_id_t& administrator);

  mutable std::mutex mutex_;
  invoicer::schema::encoding::encoder<
      invoicer::schema::encoding::scale_encoder_tag>& encoder_;
  invoicer::storage::storage<invoicer::storage::rocksdb_storage_tag>& storage_;
  invoicer::schema::party_id_t administrator_{};
  invoicer::schema::sweep_mode_t sweep_mode_{
      invoicer::schema::sweep_mode_t::literal};
  invoicer::schema::invoice_id_t invoice_count_{};
  uint64_t event_count_{};
  transfer_rail_t transfer_rail_;
  std::map<uint64_t, invoice_event_listener_t> listeners_;
  uint64_t next_subscription_id_{1};
};

}  // namespace invoicer::execution
