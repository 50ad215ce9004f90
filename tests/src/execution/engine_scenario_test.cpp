#include <invoicer/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <thread>
#include <vector>

namespace {

using fixture = invoicer::testing::engine_fixture;
using invoicer::schema::invoice_error_code;
using invoicer::schema::issuer_status_t;
using invoicer::schema::recipient_status_t;
using invoicer::testing::kDay;
using invoicer::testing::kNow;

}  // namespace

TEST(engine_scenario, create_approve_and_pay) {
  auto f = fixture{"invoicer_scenario_settle"};
  const auto issuer = fixture::issuer();
  const auto recipient = fixture::recipient();
  f.book().deposit(recipient, 1000);

  auto created = f.engine().create_invoice(
      fixture::ctx(issuer),
      invoicer::schema::create_invoice_t{.issuer_name = "A",
                                         .client_name = "B",
                                         .recipient = recipient,
                                         .amount = 100,
                                         .due_date = kNow + kDay,
                                         .message = ""});
  ASSERT_EQ(created.code, 0u);
  auto id = created.invoice_id;

  ASSERT_EQ(f.engine()
                .approve_invoice(fixture::ctx(recipient, kNow + 1), {.id = id})
                .code,
            0u);
  // Creation already counts as the issuer's approval, so a second one is
  // refused and changes nothing.
  EXPECT_EQ(f.engine()
                .approve_invoice(fixture::ctx(issuer, kNow + 2), {.id = id})
                .code,
            invoicer::schema::to_code(invoice_error_code::invalid_transition));

  auto paid = f.engine().pay_invoice(fixture::ctx(recipient, kNow + 3),
                                     {.id = id, .tendered_amount = 100});
  ASSERT_EQ(paid.code, 0u);

  auto state = f.engine().get_invoice(id);
  EXPECT_EQ(state.issuer_status, issuer_status_t::payment_received);
  EXPECT_EQ(state.recipient_status, recipient_status_t::paid);
  EXPECT_EQ(f.book().balance(issuer), 100);
  EXPECT_EQ(f.book().balance(recipient), 900);
  EXPECT_EQ(f.engine().events(1, 100).size(), 3u);
}

TEST(engine_scenario, rejection_is_final_for_both_parties) {
  auto f = fixture{"invoicer_scenario_reject"};
  f.book().deposit(fixture::recipient(), 1000);
  auto id = f.create_standard(100);

  ASSERT_EQ(f.engine().get_invoice(id).issuer_status, issuer_status_t::approved);
  ASSERT_EQ(f.engine()
                .reject_invoice(fixture::ctx(fixture::recipient()), {.id = id})
                .code,
            0u);
  auto state = f.engine().get_invoice(id);
  EXPECT_EQ(state.issuer_status, issuer_status_t::rejected);
  EXPECT_EQ(state.recipient_status, recipient_status_t::rejected);

  auto not_approved = invoicer::schema::to_code(invoice_error_code::not_approved);
  auto invalid_transition =
      invoicer::schema::to_code(invoice_error_code::invalid_transition);
  EXPECT_EQ(f.engine()
                .pay_invoice(fixture::ctx(fixture::recipient()),
                             {.id = id, .tendered_amount = 100})
                .code,
            not_approved);
  for (const auto& party : {fixture::issuer(), fixture::recipient()}) {
    EXPECT_EQ(
        f.engine().approve_invoice(fixture::ctx(party), {.id = id}).code,
        invalid_transition);
    EXPECT_EQ(
        f.engine().reject_invoice(fixture::ctx(party), {.id = id}).code,
        invalid_transition);
  }
  EXPECT_EQ(f.book().balance(fixture::recipient()), 1000);
}

TEST(engine_scenario, concurrent_creates_receive_unique_ids) {
  auto f = fixture{"invoicer_scenario_concurrent"};
  constexpr auto kThreads = 4;
  constexpr auto kPerThread = 25;

  auto ids = std::vector<std::vector<invoicer::schema::invoice_id_t>>(kThreads);
  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&f, &ids, t] {
      for (auto i = 0; i < kPerThread; ++i) {
        auto result = f.engine().create_invoice(
            fixture::ctx(invoicer::testing::make_party(static_cast<uint8_t>(200 + t))),
            fixture::standard_terms(i + 1));
        if (result.code == 0) {
          ids[t].push_back(result.invoice_id);
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  auto all = std::set<invoicer::schema::invoice_id_t>{};
  for (auto t = 0; t < kThreads; ++t) {
    ASSERT_EQ(ids[t].size(), static_cast<std::size_t>(kPerThread));
    EXPECT_TRUE(std::is_sorted(ids[t].begin(), ids[t].end()));
    all.insert(ids[t].begin(), ids[t].end());
  }
  EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(*all.begin(), 1u);
  EXPECT_EQ(*all.rbegin(), static_cast<uint64_t>(kThreads * kPerThread));
  EXPECT_EQ(f.engine().invoice_count(), *all.rbegin());
  EXPECT_EQ(f.engine().list_invoices(fixture::recipient()).size(), all.size());
  EXPECT_EQ(f.engine().events(1, 1000).size(), all.size());
}
