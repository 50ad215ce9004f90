#pragma once
#include <invoicer/schema/primitives.hpp>
#include <optional>
#include <span>

namespace invoicer::schema::encoding {

// Codec seam for everything the ledger persists. The concrete library is a
// build time choice made by specializing on a tag type; hot swapping is not
// supported.
template <typename Library>
struct encoder {
  template <typename T>
  invoicer::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, invoicer::schema::bytes_t& out);

  template <typename T>
  T decode(const invoicer::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const invoicer::schema::bytes_view_t& bytes);
};

}  // namespace invoicer::schema::encoding
