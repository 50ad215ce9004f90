#pragma once

#include <invoicer/schema/invoice_event.hpp>
#include <invoicer/schema/primitives.hpp>

// Schema type: invoice event record.
// Invoice workflow: persisted form of an emitted event, numbered from 1 in
// emission order.
namespace invoicer::schema {

template <uint16_t Version>
struct invoice_event_record;

template <>
struct invoice_event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  timestamp_milliseconds_t recorded_at{};
  invoice_event_t event;
};

using invoice_event_record_t = invoice_event_record<1>;

}  // namespace invoicer::schema
