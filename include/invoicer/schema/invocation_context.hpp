#pragma once

#include <invoicer/schema/primitives.hpp>

// Schema type: invocation context.
// Invoice workflow: caller identity and current time supplied by the
// execution substrate. Both are trusted as given.
namespace invoicer::schema {

template <uint16_t Version>
struct invocation_context;

template <>
struct invocation_context<1> final {
  uint16_t version{1};
  party_id_t caller{};
  timestamp_milliseconds_t now{};
};

using invocation_context_t = invocation_context<1>;

}  // namespace invoicer::schema
