#include <invoicer/schema/key/engine_keys.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <iterator>

namespace invoicer::schema::key {

namespace {

void append_big_endian(invoicer::schema::bytes_t& out, const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  const auto* raw = reinterpret_cast<const uint8_t*>(buffer.data());
  out.insert(std::end(out), raw, raw + sizeof(uint64_t));
}

std::optional<uint64_t> read_big_endian_suffix(
    const invoicer::schema::bytes_view_t& key,
    const std::string_view prefix) {
  if (key.size() != prefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(prefix), std::end(prefix), std::begin(key),
                  [](const char lhs, const uint8_t rhs) {
                    return static_cast<uint8_t>(lhs) == rhs;
                  })) {
    return std::nullopt;
  }
  auto buffer = boost::endian::big_uint64_buf_t{};
  std::copy_n(key.data() + prefix.size(), sizeof(uint64_t),
              reinterpret_cast<uint8_t*>(buffer.data()));
  return buffer.value();
}

}  // namespace

invoicer::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return invoicer::schema::make_bytes(prefix);
}

invoicer::schema::bytes_t make_invoice_key(const invoice_id_t id) {
  auto key = make_prefix_key(kInvoiceKeyPrefix);
  append_big_endian(key, id);
  return key;
}

invoicer::schema::bytes_t make_index_prefix_key(const party_id_t& party) {
  auto key = make_prefix_key(kIndexKeyPrefix);
  key.insert(std::end(key), std::begin(party), std::end(party));
  return key;
}

invoicer::schema::bytes_t make_index_key(const party_id_t& party,
                                         const invoice_id_t id) {
  auto key = make_index_prefix_key(party);
  append_big_endian(key, id);
  return key;
}

invoicer::schema::bytes_t make_balance_key(const party_id_t& party) {
  auto key = make_prefix_key(kBalanceKeyPrefix);
  key.insert(std::end(key), std::begin(party), std::end(party));
  return key;
}

invoicer::schema::bytes_t make_event_key(const uint64_t event_id) {
  auto key = make_prefix_key(kEventPrefix);
  append_big_endian(key, event_id);
  return key;
}

std::optional<invoice_id_t> parse_invoice_key(
    const invoicer::schema::bytes_view_t& key) {
  return read_big_endian_suffix(key, kInvoiceKeyPrefix);
}

std::optional<uint64_t> parse_event_key(
    const invoicer::schema::bytes_view_t& key) {
  return read_big_endian_suffix(key, kEventPrefix);
}

}  // namespace invoicer::schema::key
