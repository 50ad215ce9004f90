#pragma once
#include <invoicer/schema/primitives.hpp>
#include <string>

// Schema type: create invoice.
// Invoice workflow: terms for a new invoice. The caller becomes the issuer.
namespace invoicer::schema {

template <uint16_t Version>
struct create_invoice;

template <>
struct create_invoice<1> final {
  uint16_t version{1};
  std::string issuer_name;
  std::string client_name;
  party_id_t recipient{};
  amount_t amount{};
  timestamp_milliseconds_t due_date{};
  std::string message;
};

using create_invoice_t = create_invoice<1>;

}  // namespace invoicer::schema
