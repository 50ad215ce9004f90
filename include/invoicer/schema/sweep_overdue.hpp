#pragma once
#include <cstdint>

namespace invoicer::schema {

template <uint16_t Version>
struct sweep_overdue;

template <>
struct sweep_overdue<1> final {
  uint16_t version{1};
};

using sweep_overdue_t = sweep_overdue<1>;

}  // namespace invoicer::schema
