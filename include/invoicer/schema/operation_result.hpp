#pragma once

#include <invoicer/schema/invoice_event.hpp>
#include <invoicer/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: operation result.
// Invoice workflow: outcome of one ledger operation. `code` is 0 on success
// and otherwise an `invoice_error_code`; `events` lists what was emitted.
namespace invoicer::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  invoice_id_t invoice_id{};
  std::vector<invoice_event_t> events;
};

using operation_result_t = operation_result<1>;

}  // namespace invoicer::schema
