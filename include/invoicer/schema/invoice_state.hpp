#pragma once
#include <invoicer/schema/issuer_status.hpp>
#include <invoicer/schema/primitives.hpp>
#include <invoicer/schema/recipient_status.hpp>
#include <string>

// Schema type: invoice state.
// Invoice workflow: the stored record for one invoice. The value-initialized
// record (id 0) is what lookups return for unassigned ids.
namespace invoicer::schema {

template <uint16_t Version>
struct invoice_state;

template <>
struct invoice_state<1> final {
  uint16_t version{1};
  invoice_id_t id{};
  std::string issuer_name;
  std::string client_name;
  party_id_t issuer{};
  party_id_t recipient{};
  amount_t amount{};
  timestamp_milliseconds_t due_date{};
  issuer_status_t issuer_status{issuer_status_t::pending};
  recipient_status_t recipient_status{recipient_status_t::pending};
  timestamp_milliseconds_t creation_date{};
  timestamp_milliseconds_t last_modified_date{};
  std::string message;
};

using invoice_state_t = invoice_state<1>;

}  // namespace invoicer::schema
