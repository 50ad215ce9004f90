#pragma once
#include <invoicer/schema/primitives.hpp>

namespace invoicer::schema {

template <uint16_t Version>
struct reject_invoice;

template <>
struct reject_invoice<1> final {
  uint16_t version{1};
  invoice_id_t id{};
};

using reject_invoice_t = reject_invoice<1>;

}  // namespace invoicer::schema
