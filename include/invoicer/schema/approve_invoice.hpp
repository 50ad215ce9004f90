#pragma once
#include <invoicer/schema/primitives.hpp>

namespace invoicer::schema {

template <uint16_t Version>
struct approve_invoice;

template <>
struct approve_invoice<1> final {
  uint16_t version{1};
  invoice_id_t id{};
};

using approve_invoice_t = approve_invoice<1>;

}  // namespace invoicer::schema
