#include <spdlog/spdlog.h>
#include <invoicer/ledger/account_book.hpp>
#include <invoicer/schema/key/engine_keys.hpp>
#include <limits>
#include <vector>

using namespace invoicer::schema;

namespace invoicer::ledger {

account_book::account_book(
    invoicer::schema::encoding::encoder<
        invoicer::schema::encoding::scale_encoder_tag>& encoder,
    invoicer::storage::storage<invoicer::storage::rocksdb_storage_tag>& storage)
    : encoder_{encoder}, storage_{storage} {}

void account_book::deposit(const party_id_t& party, const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto current = load_balance(party);
  if (current > std::numeric_limits<amount_t>::max() - amount) {
    invoicer::common::critical("Deposit would overflow balance of {}",
                               to_hex(party));
  }
  auto balance_key = key::make_balance_key(party);
  storage_.put(encoder_, make_bytes_view(balance_key), amount_t{current + amount});
  spdlog::debug("Deposited {} to {}", amount.str(), to_hex(party));
}

amount_t account_book::balance(const party_id_t& party) const {
  auto lock = std::scoped_lock{mutex_};
  return load_balance(party);
}

bool account_book::stage_transfer(
    const party_id_t& from,
    const party_id_t& to,
    const amount_t& amount,
    std::vector<invoicer::storage::key_value_entry_t>& batch) const {
  auto lock = std::scoped_lock{mutex_};
  return stage_transfer_locked(from, to, amount, batch);
}

bool account_book::transfer(const party_id_t& from,
                            const party_id_t& to,
                            const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto entries = std::vector<invoicer::storage::key_value_entry_t>{};
  if (!stage_transfer_locked(from, to, amount, entries)) {
    return false;
  }
  if (!entries.empty()) {
    storage_.write_batch(entries);
  }
  return true;
}

invoicer::execution::transfer_rail_t account_book::rail() {
  return [this](const party_id_t& from, const party_id_t& to,
                const amount_t& amount,
                std::vector<invoicer::storage::key_value_entry_t>& batch) {
    return stage_transfer(from, to, amount, batch);
  };
}

bool account_book::stage_transfer_locked(
    const party_id_t& from,
    const party_id_t& to,
    const amount_t& amount,
    std::vector<invoicer::storage::key_value_entry_t>& batch) const {
  auto from_balance = load_balance(from);
  if (from_balance < amount) {
    spdlog::warn("Transfer of {} from {} declined: balance {}", amount.str(),
                 to_hex(from), from_balance.str());
    return false;
  }
  if (from == to) {
    return true;
  }
  auto to_balance = load_balance(to);
  if (to_balance > std::numeric_limits<amount_t>::max() - amount) {
    spdlog::warn("Transfer of {} to {} declined: balance would overflow",
                 amount.str(), to_hex(to));
    return false;
  }

  batch.emplace_back(key::make_balance_key(from),
                     encoder_.encode(amount_t{from_balance - amount}));
  batch.emplace_back(key::make_balance_key(to),
                     encoder_.encode(amount_t{to_balance + amount}));
  spdlog::debug("Staged transfer of {} from {} to {}", amount.str(),
                to_hex(from), to_hex(to));
  return true;
}

amount_t account_book::load_balance(const party_id_t& party) const {
  auto balance_key = key::make_balance_key(party);
  return storage_.get<amount_t>(encoder_, make_bytes_view(balance_key))
      .value_or(amount_t{0});
}

}  // namespace invoicer::ledger
