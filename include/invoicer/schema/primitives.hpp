#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace invoicer::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;
using invoice_id_t = uint64_t;

/// Opaque 32-byte identity of a ledger participant.
///
/// The all-zero value is the null identity and is never a valid recipient.
using party_id_t = hash32_t;

bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& value);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& value);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

/// Parse a decimal amount string; std::nullopt on empty or non-digit input.
std::optional<amount_t> try_parse_amount(const std::string_view value);

}  // namespace invoicer::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
