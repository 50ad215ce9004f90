#pragma once

#include <invoicer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: invoice error code.
// Invoice workflow: precondition failures reported by ledger operations. Every
// code means the operation was rejected with no persisted side effect.
namespace invoicer::schema {

enum class invoice_error_code : uint32_t {
  unauthorized = 1,
  invalid_recipient = 2,
  self_assignment = 3,
  due_date_in_past = 4,
  invalid_transition = 5,
  not_approved = 6,
  amount_mismatch = 7,
  transfer_failed = 8,
};

inline constexpr auto kInvoiceErrorCodeMappings = std::array{
    std::pair<std::string_view, invoice_error_code>{
        "unauthorized", invoice_error_code::unauthorized},
    std::pair<std::string_view, invoice_error_code>{
        "invalid_recipient", invoice_error_code::invalid_recipient},
    std::pair<std::string_view, invoice_error_code>{
        "self_assignment", invoice_error_code::self_assignment},
    std::pair<std::string_view, invoice_error_code>{
        "due_date_in_past", invoice_error_code::due_date_in_past},
    std::pair<std::string_view, invoice_error_code>{
        "invalid_transition", invoice_error_code::invalid_transition},
    std::pair<std::string_view, invoice_error_code>{
        "not_approved", invoice_error_code::not_approved},
    std::pair<std::string_view, invoice_error_code>{
        "amount_mismatch", invoice_error_code::amount_mismatch},
    std::pair<std::string_view, invoice_error_code>{
        "transfer_failed", invoice_error_code::transfer_failed}};

template <>
inline std::optional<invoice_error_code> try_from_string<invoice_error_code>(
    const std::string_view value) {
  return from_string(value, kInvoiceErrorCodeMappings);
}

inline constexpr std::string_view to_string(const invoice_error_code value) {
  return to_string(value, kInvoiceErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const invoice_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace invoicer::schema
