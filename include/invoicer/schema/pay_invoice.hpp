#pragma once
#include <invoicer/schema/primitives.hpp>

namespace invoicer::schema {

template <uint16_t Version>
struct pay_invoice;

template <>
struct pay_invoice<1> final {
  uint16_t version{1};
  invoice_id_t id{};
  amount_t tendered_amount{};
};

using pay_invoice_t = pay_invoice<1>;

}  // namespace invoicer::schema
