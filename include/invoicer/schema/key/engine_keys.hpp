#pragma once

#include <invoicer/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Invoice workflow: canonical key prefixes and key codecs for invoice records,
// the party index, balances, and the event log. Ids are written big-endian so
// RocksDB iteration order is ascending id order.
namespace invoicer::schema::key {

inline constexpr std::string_view kAdministratorKey{"SYS|APP|ADMIN"};
inline constexpr std::string_view kInvoiceCountKey{"SYS|APP|INVOICE_COUNT"};
inline constexpr std::string_view kEventCountKey{"SYS|APP|EVENT_COUNT"};
inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kInvoiceKeyPrefix{"SYS|STATE|INVOICE|"};
inline constexpr std::string_view kIndexKeyPrefix{"SYS|STATE|INDEX|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline constexpr std::array<std::string_view, 8> kEngineKeyspaces{
    kAdministratorKey, kInvoiceCountKey, kEventCountKey, kStatePrefix,
    kInvoiceKeyPrefix, kIndexKeyPrefix,  kBalanceKeyPrefix, kEventPrefix};

invoicer::schema::bytes_t make_prefix_key(std::string_view prefix);

invoicer::schema::bytes_t make_invoice_key(invoice_id_t id);

/// Prefix covering every index entry of one party.
invoicer::schema::bytes_t make_index_prefix_key(const party_id_t& party);

invoicer::schema::bytes_t make_index_key(const party_id_t& party,
                                         invoice_id_t id);

invoicer::schema::bytes_t make_balance_key(const party_id_t& party);

invoicer::schema::bytes_t make_event_key(uint64_t event_id);

/// Recover the id suffix of an invoice key, std::nullopt on a foreign key.
std::optional<invoice_id_t> parse_invoice_key(
    const invoicer::schema::bytes_view_t& key);

std::optional<uint64_t> parse_event_key(
    const invoicer::schema::bytes_view_t& key);

}  // namespace invoicer::schema::key
