#pragma once
#include <invoicer/schema/primitives.hpp>
#include <string>

// Schema type: modify invoice.
// Invoice workflow: revised terms. Issuer name and both parties are fixed at
// creation and are not part of a modification.
namespace invoicer::schema {

template <uint16_t Version>
struct modify_invoice;

template <>
struct modify_invoice<1> final {
  uint16_t version{1};
  invoice_id_t id{};
  std::string client_name;
  amount_t amount{};
  timestamp_milliseconds_t due_date{};
  std::string message;
};

using modify_invoice_t = modify_invoice<1>;

}  // namespace invoicer::schema
