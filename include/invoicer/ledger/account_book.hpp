#pragma once

#include <invoicer/execution/transfer_rail.hpp>
#include <invoicer/schema/encoding/scale/encoder.hpp>
#include <invoicer/schema/primitives.hpp>
#include <invoicer/storage/rocksdb/storage.hpp>
#include <mutex>
#include <vector>

namespace invoicer::ledger {

/// Party balances kept beside the invoice records.
///
/// Serves as the reference transfer rail: `rail()` returns a callback that
/// stages the debit and credit into the caller's write batch. Balances are
/// read when the transfer is staged, so the book must not be written between
/// staging and the caller's commit; the engine stages and commits under its
/// own lock.
class account_book final {
 public:
  explicit account_book(
      invoicer::schema::encoding::encoder<
          invoicer::schema::encoding::scale_encoder_tag>& encoder,
      invoicer::storage::storage<invoicer::storage::rocksdb_storage_tag>&
          storage);

  /// Credit `amount` to `party`.
  void deposit(const invoicer::schema::party_id_t& party,
               const invoicer::schema::amount_t& amount);

  /// Current balance; zero for a party that never held funds.
  invoicer::schema::amount_t balance(
      const invoicer::schema::party_id_t& party) const;

  /// Append the balance writes of a transfer to `batch` without persisting
  /// them. Returns false, leaving `batch` untouched, when `from` holds less
  /// than `amount` or the credit would overflow.
  bool stage_transfer(
      const invoicer::schema::party_id_t& from,
      const invoicer::schema::party_id_t& to,
      const invoicer::schema::amount_t& amount,
      std::vector<invoicer::storage::key_value_entry_t>& batch) const;

  /// Debit `from` and credit `to` in one write. Returns false without
  /// touching either balance when the transfer cannot be staged.
  bool transfer(const invoicer::schema::party_id_t& from,
                const invoicer::schema::party_id_t& to,
                const invoicer::schema::amount_t& amount);

  /// `stage_transfer` as a callback for `engine::set_transfer_rail`. The book
  /// must outlive every engine it is installed on.
  invoicer::execution::transfer_rail_t rail();

 private:
  bool stage_transfer_locked(
      const invoicer::schema::party_id_t& from,
      const invoicer::schema::party_id_t& to,
      const invoicer::schema::amount_t& amount,
      std::vector<invoicer::storage::key_value_entry_t>& batch) const;

  invoicer::schema::amount_t load_balance(
      const invoicer::schema::party_id_t& party) const;

  mutable std::mutex mutex_;
  invoicer::schema::encoding::encoder<
      invoicer::schema::encoding::scale_encoder_tag>& encoder_;
  invoicer::storage::storage<invoicer::storage::rocksdb_storage_tag>& storage_;
};

}  // namespace invoicer::ledger
