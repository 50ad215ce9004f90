#pragma once

#include <invoicer/schema/issuer_status.hpp>
#include <invoicer/schema/primitives.hpp>
#include <invoicer/schema/recipient_status.hpp>
#include <cstdint>
#include <variant>

// Schema type: invoice event.
// Invoice workflow: notifications published after each successful mutation,
// in the order the mutations happened.
namespace invoicer::schema {

template <uint16_t Version>
struct invoice_created_event;

template <>
struct invoice_created_event<1> final {
  uint16_t version{1};
  invoice_id_t id{};
  party_id_t issuer{};
  party_id_t recipient{};
  amount_t amount{};
  timestamp_milliseconds_t due_date{};
};

template <uint16_t Version>
struct invoice_updated_event;

template <>
struct invoice_updated_event<1> final {
  uint16_t version{1};
  invoice_id_t id{};
  issuer_status_t issuer_status{};
  recipient_status_t recipient_status{};
};

using invoice_created_event_t = invoice_created_event<1>;
using invoice_updated_event_t = invoice_updated_event<1>;
using invoice_event_t =
    std::variant<invoice_created_event_t, invoice_updated_event_t>;

}  // namespace invoicer::schema
