#pragma once

#include <invoicer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: issuer status.
// Invoice workflow: the issuer's view of an invoice. Creation counts as the
// issuer's approval; payment_received and rejected are terminal.
namespace invoicer::schema {

enum class issuer_status_t : uint8_t {
  pending = 0,
  approved = 1,
  payment_received = 2,
  rejected = 3
};

inline constexpr auto kIssuerStatusMappings =
    std::array{std::pair<std::string_view, issuer_status_t>{
                   "pending", issuer_status_t::pending},
               std::pair<std::string_view, issuer_status_t>{
                   "approved", issuer_status_t::approved},
               std::pair<std::string_view, issuer_status_t>{
                   "payment_received", issuer_status_t::payment_received},
               std::pair<std::string_view, issuer_status_t>{
                   "rejected", issuer_status_t::rejected}};

template <>
inline std::optional<issuer_status_t> try_from_string<issuer_status_t>(
    const std::string_view value) {
  return from_string(value, kIssuerStatusMappings);
}

inline constexpr std::string_view to_string(const issuer_status_t value) {
  return to_string(value, kIssuerStatusMappings).value_or("unknown");
}

}  // namespace invoicer::schema
