#pragma once

#include <invoicer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: sweep mode.
// Invoice workflow: selects which past-due invoices the overdue sweep
// rewrites. `literal` rewrites every past-due invoice; `conjunctive` leaves
// paid, rejected and already-overdue invoices alone.
namespace invoicer::schema {

enum class sweep_mode_t : uint8_t { literal = 0, conjunctive = 1 };

inline constexpr auto kSweepModeMappings =
    std::array{std::pair<std::string_view, sweep_mode_t>{
                   "literal", sweep_mode_t::literal},
               std::pair<std::string_view, sweep_mode_t>{
                   "conjunctive", sweep_mode_t::conjunctive}};

template <>
inline std::optional<sweep_mode_t> try_from_string<sweep_mode_t>(
    const std::string_view value) {
  return from_string(value, kSweepModeMappings);
}

inline constexpr std::string_view to_string(const sweep_mode_t value) {
  return to_string(value, kSweepModeMappings).value_or("unknown");
}

}  // namespace invoicer::schema
