#include <invoicer/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <stdexcept>
#include <variant>
#include <vector>

namespace {

using fixture = invoicer::testing::engine_fixture;
using invoicer::schema::issuer_status_t;
using invoicer::schema::recipient_status_t;
using invoicer::testing::kDay;
using invoicer::testing::kNow;

}  // namespace

TEST(engine_events, create_emits_created_event) {
  auto f = fixture{"invoicer_engine_events_create"};
  auto result = f.engine().create_invoice(fixture::ctx(fixture::issuer()),
                                          fixture::standard_terms(75));
  ASSERT_EQ(result.events.size(), 1u);
  ASSERT_TRUE(std::holds_alternative<invoicer::schema::invoice_created_event_t>(
      result.events[0]));
  const auto& created =
      std::get<invoicer::schema::invoice_created_event_t>(result.events[0]);
  EXPECT_EQ(created.id, result.invoice_id);
  EXPECT_EQ(created.issuer, fixture::issuer());
  EXPECT_EQ(created.recipient, fixture::recipient());
  EXPECT_EQ(created.amount, 75);
  EXPECT_EQ(created.due_date, kNow + kDay);
}

TEST(engine_events, updates_carry_both_statuses) {
  auto f = fixture{"invoicer_engine_events_update"};
  auto id = f.create_standard();
  auto result =
      f.engine().reject_invoice(fixture::ctx(fixture::recipient()), {.id = id});
  ASSERT_EQ(result.events.size(), 1u);
  const auto& updated =
      std::get<invoicer::schema::invoice_updated_event_t>(result.events[0]);
  EXPECT_EQ(updated.id, id);
  EXPECT_EQ(updated.issuer_status, issuer_status_t::rejected);
  EXPECT_EQ(updated.recipient_status, recipient_status_t::rejected);
}

TEST(engine_events, failures_emit_nothing) {
  auto f = fixture{"invoicer_engine_events_failure"};
  auto id = f.create_standard();
  auto delivered = 0;
  f.engine().subscribe(
      [&delivered](const invoicer::schema::invoice_event_record_t&) {
        ++delivered;
      });

  auto result =
      f.engine().approve_invoice(fixture::ctx(fixture::issuer()), {.id = id});
  EXPECT_NE(result.code, 0u);
  EXPECT_TRUE(result.events.empty());
  EXPECT_EQ(delivered, 0);
  EXPECT_EQ(f.engine().events(1, 100).size(), 1u);
}

TEST(engine_events, log_is_numbered_in_mutation_order) {
  auto f = fixture{"invoicer_engine_events_log"};
  auto first = f.create_standard();
  auto second = f.create_standard();
  ASSERT_EQ(f.engine()
                .approve_invoice(fixture::ctx(fixture::recipient(), kNow + 1),
                                 {.id = second})
                .code,
            0u);
  ASSERT_EQ(f.engine()
                .reject_invoice(fixture::ctx(fixture::recipient(), kNow + 2),
                                {.id = first})
                .code,
            0u);

  auto records = f.engine().events(1, 100);
  ASSERT_EQ(records.size(), 4u);
  for (std::size_t i = 0; i < records.size(); ++i) {
    EXPECT_EQ(records[i].event_id, i + 1);
  }
  EXPECT_TRUE(std::holds_alternative<invoicer::schema::invoice_created_event_t>(
      records[0].event));
  EXPECT_TRUE(std::holds_alternative<invoicer::schema::invoice_created_event_t>(
      records[1].event));
  EXPECT_EQ(records[2].recorded_at, kNow + 1);
  EXPECT_EQ(std::get<invoicer::schema::invoice_updated_event_t>(records[2].event).id,
            second);
  EXPECT_EQ(std::get<invoicer::schema::invoice_updated_event_t>(records[3].event).id,
            first);

  auto window = f.engine().events(2, 3);
  ASSERT_EQ(window.size(), 2u);
  EXPECT_EQ(window.front().event_id, 2u);
  EXPECT_EQ(window.back().event_id, 3u);
  EXPECT_TRUE(f.engine().events(3, 2).empty());
}

TEST(engine_events, subscribers_see_events_in_order_until_unsubscribed) {
  auto f = fixture{"invoicer_engine_events_subscribe"};
  auto seen = std::vector<uint64_t>{};
  auto handle = f.engine().subscribe(
      [&seen](const invoicer::schema::invoice_event_record_t& record) {
        seen.push_back(record.event_id);
      });

  auto id = f.create_standard();
  ASSERT_EQ(f.engine()
                .approve_invoice(fixture::ctx(fixture::recipient()), {.id = id})
                .code,
            0u);
  EXPECT_EQ(seen, (std::vector<uint64_t>{1, 2}));

  EXPECT_TRUE(f.engine().unsubscribe(handle));
  EXPECT_FALSE(f.engine().unsubscribe(handle));
  f.create_standard();
  EXPECT_EQ(seen.size(), 2u);
}

TEST(engine_events, throwing_listener_does_not_fail_the_operation) {
  auto f = fixture{"invoicer_engine_events_throwing_listener"};
  f.engine().subscribe([](const invoicer::schema::invoice_event_record_t&) {
    throw std::runtime_error{"listener failure"};
  });
  auto delivered = std::vector<uint64_t>{};
  f.engine().subscribe(
      [&delivered](const invoicer::schema::invoice_event_record_t& record) {
        delivered.push_back(record.event_id);
      });

  auto result = f.engine().create_invoice(fixture::ctx(fixture::issuer()),
                                          fixture::standard_terms());
  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(result.invoice_id, 1u);
  EXPECT_EQ(delivered, (std::vector<uint64_t>{1}));
  EXPECT_EQ(f.engine().invoice_count(), 1u);
  EXPECT_EQ(f.engine().events(1, 100).size(), 1u);
}
