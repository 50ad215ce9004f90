#pragma once

#include <invoicer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: recipient status.
// Invoice workflow: the paying party's view of an invoice. Only the overdue
// sweep writes `overdue`.
namespace invoicer::schema {

enum class recipient_status_t : uint8_t {
  pending = 0,
  approved = 1,
  paid = 2,
  overdue = 3,
  rejected = 4
};

inline constexpr auto kRecipientStatusMappings =
    std::array{std::pair<std::string_view, recipient_status_t>{
                   "pending", recipient_status_t::pending},
               std::pair<std::string_view, recipient_status_t>{
                   "approved", recipient_status_t::approved},
               std::pair<std::string_view, recipient_status_t>{
                   "paid", recipient_status_t::paid},
               std::pair<std::string_view, recipient_status_t>{
                   "overdue", recipient_status_t::overdue},
               std::pair<std::string_view, recipient_status_t>{
                   "rejected", recipient_status_t::rejected}};

template <>
inline std::optional<recipient_status_t> try_from_string<recipient_status_t>(
    const std::string_view value) {
  return from_string(value, kRecipientStatusMappings);
}

inline constexpr std::string_view to_string(const recipient_status_t value) {
  return to_string(value, kRecipientStatusMappings).value_or("unknown");
}

}  // namespace invoicer::schema
