#include <invoicer/schema/encoding/scale/encoder.hpp>
#include <invoicer/schema/invoice_error_code.hpp>
#include <invoicer/schema/invoice_event.hpp>
#include <invoicer/schema/invoice_event_record.hpp>
#include <invoicer/schema/invoice_state.hpp>
#include <invoicer/schema/issuer_status.hpp>
#include <invoicer/schema/operation_result.hpp>
#include <invoicer/schema/recipient_status.hpp>
#include <invoicer/schema/sweep_mode.hpp>
#include <invoicer/testing/common.hpp>
#include <gtest/gtest.h>

#include <string_view>
#include <variant>

namespace {

using encoder_t = invoicer::schema::encoding::encoder<
    invoicer::schema::encoding::scale_encoder_tag>;

invoicer::schema::invoice_state_t make_invoice() {
  auto state = invoicer::schema::invoice_state_t{};
  state.id = 7;
  state.issuer_name = "Acme Ltd";
  state.client_name = "Globex";
  state.issuer = invoicer::testing::make_party(10);
  state.recipient = invoicer::testing::make_party(20);
  state.amount = invoicer::schema::amount_t{"340282366920938463463374607431768211457"};
  state.due_date = 1'700'000'000'000;
  state.issuer_status = invoicer::schema::issuer_status_t::approved;
  state.recipient_status = invoicer::schema::recipient_status_t::overdue;
  state.creation_date = 1'600'000'000'000;
  state.last_modified_date = 1'650'000'000'000;
  state.message = "net 30";
  return state;
}

}  // namespace

TEST(encoding_types, defaults_are_stable) {
  auto state = invoicer::schema::invoice_state_t{};
  EXPECT_EQ(state.version, 1u);
  EXPECT_EQ(state.id, 0u);
  EXPECT_TRUE(invoicer::schema::is_zero(state.issuer));
  EXPECT_TRUE(invoicer::schema::is_zero(state.recipient));
  EXPECT_EQ(state.amount, 0);
  EXPECT_EQ(state.issuer_status, invoicer::schema::issuer_status_t::pending);
  EXPECT_EQ(state.recipient_status,
            invoicer::schema::recipient_status_t::pending);

  auto result = invoicer::schema::operation_result_t{};
  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(result.invoice_id, 0u);
  EXPECT_TRUE(result.events.empty());
}

TEST(encoding_types, status_names_match_wire_strings) {
  EXPECT_EQ(invoicer::schema::to_string(
                invoicer::schema::issuer_status_t::payment_received),
            "payment_received");
  EXPECT_EQ(invoicer::schema::to_string(
                invoicer::schema::recipient_status_t::overdue),
            "overdue");
  EXPECT_EQ(invoicer::schema::try_from_string<
                invoicer::schema::recipient_status_t>("paid"),
            invoicer::schema::recipient_status_t::paid);
  EXPECT_FALSE(invoicer::schema::try_from_string<
                   invoicer::schema::issuer_status_t>("overdue")
                   .has_value());
  EXPECT_EQ(invoicer::schema::try_from_string<invoicer::schema::sweep_mode_t>(
                "conjunctive"),
            invoicer::schema::sweep_mode_t::conjunctive);
}

TEST(encoding_types, error_codes_are_numbered_and_named) {
  using invoicer::schema::invoice_error_code;
  EXPECT_EQ(invoicer::schema::to_code(invoice_error_code::unauthorized), 1u);
  EXPECT_EQ(invoicer::schema::to_code(invoice_error_code::transfer_failed), 8u);
  EXPECT_EQ(invoicer::schema::to_string(invoice_error_code::self_assignment),
            "self_assignment");
  EXPECT_EQ(invoicer::schema::try_from_string<invoice_error_code>(
                "amount_mismatch"),
            invoice_error_code::amount_mismatch);
}

TEST(encoding_types, invoice_state_scale_round_trips) {
  auto encoder = encoder_t{};
  auto state = make_invoice();
  auto encoded = encoder.encode(state);
  auto decoded = encoder.decode<invoicer::schema::invoice_state_t>(
      invoicer::schema::make_bytes_view(encoded));

  EXPECT_EQ(decoded.id, state.id);
  EXPECT_EQ(decoded.issuer_name, state.issuer_name);
  EXPECT_EQ(decoded.client_name, state.client_name);
  EXPECT_EQ(decoded.issuer, state.issuer);
  EXPECT_EQ(decoded.recipient, state.recipient);
  EXPECT_EQ(decoded.amount, state.amount);
  EXPECT_EQ(decoded.due_date, state.due_date);
  EXPECT_EQ(decoded.issuer_status, state.issuer_status);
  EXPECT_EQ(decoded.recipient_status, state.recipient_status);
  EXPECT_EQ(decoded.creation_date, state.creation_date);
  EXPECT_EQ(decoded.last_modified_date, state.last_modified_date);
  EXPECT_EQ(decoded.message, state.message);
}

TEST(encoding_types, event_record_keeps_variant_alternative) {
  auto encoder = encoder_t{};
  auto record = invoicer::schema::invoice_event_record_t{
      .event_id = 3,
      .recorded_at = 99,
      .event = invoicer::schema::invoice_updated_event_t{
          .id = 7,
          .issuer_status = invoicer::schema::issuer_status_t::rejected,
          .recipient_status = invoicer::schema::recipient_status_t::rejected}};
  auto encoded = encoder.encode(record);
  auto decoded = encoder.decode<invoicer::schema::invoice_event_record_t>(
      invoicer::schema::make_bytes_view(encoded));

  EXPECT_EQ(decoded.event_id, 3u);
  EXPECT_EQ(decoded.recorded_at, 99u);
  ASSERT_TRUE(std::holds_alternative<invoicer::schema::invoice_updated_event_t>(
      decoded.event));
  const auto& updated =
      std::get<invoicer::schema::invoice_updated_event_t>(decoded.event);
  EXPECT_EQ(updated.id, 7u);
  EXPECT_EQ(updated.issuer_status, invoicer::schema::issuer_status_t::rejected);
  EXPECT_EQ(updated.recipient_status,
            invoicer::schema::recipient_status_t::rejected);
}

TEST(encoding_types, truncated_invoice_bytes_fail_to_decode) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(make_invoice());
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder.try_decode<invoicer::schema::invoice_state_t>(
                          invoicer::schema::make_bytes_view(encoded))
                   .has_value());
}
