#include <rndr/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using rndr::schema::ledger_error_code;
using rndr::testing::kAlice;
using rndr::testing::kBob;
using rndr::testing::kCarol;
using rndr::testing::kDave;
using rndr::testing::kEscrowAddress;
using rndr::testing::kEscrowOwner;
using rndr::testing::kTokenAddress;
using rndr::testing::make_amount;

namespace {

class escrow_ledger_test : public rndr::testing::ledger_fixture {
 protected:
  /// Route `amount` of Alice's tokens into the escrow for `user_id`.
  void hold(const std::string& user_id, const uint64_t amount) {
    auto context = as(kAlice);
    auto failed = token_->hold_in_escrow(context, user_id, make_amount(amount));
    ASSERT_FALSE(failed.has_value()) << failed->message;
  }

  void prepare(const uint64_t minted) {
    mint(kAlice, minted);
    point_token_at_escrow();
  }
};

}  // namespace

TEST_F(escrow_ledger_test, fund_user_only_accepts_the_render_token) {
  auto stranger = as(kAlice);
  auto failed = escrow_->fund_user(stranger, "job1", make_amount(10));
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->code, ledger_error_code::not_authorized);
  EXPECT_EQ(escrowed("job1"), make_amount(0));

  auto owner = as(kEscrowOwner);
  auto by_owner = escrow_->fund_user(owner, "job1", make_amount(10));
  ASSERT_TRUE(by_owner.has_value());
  EXPECT_EQ(by_owner->code, ledger_error_code::not_authorized);

  auto token = as(kTokenAddress);
  ASSERT_FALSE(escrow_->fund_user(token, "job1", make_amount(10)).has_value());
  EXPECT_EQ(escrowed("job1"), make_amount(10));
}

TEST_F(escrow_ledger_test, total_held_follows_funding_and_paid_legs) {
  prepare(100);
  hold("job1", 40);
  hold("job2", 30);
  EXPECT_EQ(escrow_->state(*scope_).total_held, make_amount(70));
  flush();

  auto disburser = as(kEscrowOwner);
  auto failed =
      escrow_->disburse_funds(disburser, "job1", {kBob, kCarol},
                              {make_amount(25), make_amount(25)});
  ASSERT_TRUE(failed.has_value());
  EXPECT_TRUE(failed->partial);
  EXPECT_EQ(escrow_->state(*scope_).total_held, make_amount(45));
  EXPECT_EQ(escrow_->state(*scope_).total_held,
            escrowed("job1") + escrowed("job2"));
  EXPECT_EQ(balance(kEscrowAddress), make_amount(45));
}

TEST_F(escrow_ledger_test, initialized_reflects_the_state_row) {
  EXPECT_TRUE(escrow_->initialized(*scope_));
  EXPECT_TRUE(token_->initialized(*scope_));
  auto unset = rndr::execution::escrow_ledger{rndr::testing::make_account(0xEE)};
  EXPECT_FALSE(unset.initialized(*scope_));
}

TEST_F(escrow_ledger_test, disburse_only_accepts_the_disbursal_address) {
  prepare(100);
  hold("job1", 40);
  flush();

  auto stranger = as(kAlice);
  auto failed =
      escrow_->disburse_funds(stranger, "job1", {kBob}, {make_amount(10)});
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->code, ledger_error_code::not_authorized);
  EXPECT_EQ(escrowed("job1"), make_amount(40));
  EXPECT_TRUE(scope_->events().empty());
}

TEST_F(escrow_ledger_test, disburse_pays_every_leg_in_order) {
  prepare(100);
  hold("job1", 40);
  flush();

  auto disburser = as(kEscrowOwner);
  ASSERT_FALSE(escrow_
                   ->disburse_funds(disburser, "job1", {kBob, kCarol},
                                    {make_amount(15), make_amount(25)})
                   .has_value());
  EXPECT_EQ(balance(kBob), make_amount(15));
  EXPECT_EQ(balance(kCarol), make_amount(25));
  EXPECT_EQ(balance(kEscrowAddress), make_amount(0));
  EXPECT_EQ(escrowed("job1"), make_amount(0));
  EXPECT_EQ(emitted_types(),
            (std::vector<std::string>{"transfer", "transfer",
                                      "user_balance_update"}));
  EXPECT_EQ(rndr::testing::find_attribute(scope_->events()[0].event, "from"),
            rndr::schema::to_string(kEscrowAddress));
  EXPECT_EQ(
      rndr::testing::find_attribute(scope_->events()[2].event, "balance"),
      "0");
}

TEST_F(escrow_ledger_test, disburse_stops_at_first_short_leg) {
  prepare(100);
  hold("job1", 40);
  flush();

  auto disburser = as(kEscrowOwner);
  auto failed =
      escrow_->disburse_funds(disburser, "job1", {kBob, kCarol},
                              {make_amount(25), make_amount(25)});
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->code, ledger_error_code::insufficient_escrow_balance);
  EXPECT_TRUE(failed->partial);
  EXPECT_NE(failed->message.find("paid 1 of 2 legs"), std::string::npos);

  EXPECT_EQ(balance(kBob), make_amount(25));
  EXPECT_EQ(balance(kCarol), make_amount(0));
  EXPECT_EQ(escrowed("job1"), make_amount(15));
  EXPECT_EQ(balance(kEscrowAddress), make_amount(15));
  EXPECT_EQ(emitted_types(),
            (std::vector<std::string>{"transfer", "user_balance_update"}));
}

TEST_F(escrow_ledger_test, first_leg_failure_is_not_partial) {
  prepare(100);
  hold("job1", 10);
  flush();

  auto disburser = as(kEscrowOwner);
  auto failed = escrow_->disburse_funds(
      disburser, "job1", {rndr::schema::make_null_address()},
      {make_amount(5)});
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->code, ledger_error_code::invalid_recipient);
  EXPECT_FALSE(failed->partial);
  EXPECT_EQ(escrowed("job1"), make_amount(10));
  EXPECT_EQ(balance(kEscrowAddress), make_amount(10));
}

TEST_F(escrow_ledger_test, disburse_rejects_empty_balance_and_bad_lengths) {
  prepare(100);
  hold("job1", 10);
  flush();

  auto disburser = as(kEscrowOwner);
  auto empty = escrow_->disburse_funds(disburser, "nobody", {kBob},
                                       {make_amount(1)});
  ASSERT_TRUE(empty.has_value());
  EXPECT_EQ(empty->code, ledger_error_code::no_balance);

  auto mismatch = escrow_->disburse_funds(disburser, "job1", {kBob, kCarol},
                                          {make_amount(1)});
  ASSERT_TRUE(mismatch.has_value());
  EXPECT_EQ(mismatch->code, ledger_error_code::length_mismatch);
  EXPECT_EQ(escrowed("job1"), make_amount(10));
}

TEST_F(escrow_ledger_test, null_disbursal_address_disables_payouts) {
  prepare(100);
  hold("job1", 10);

  auto owner = as(kEscrowOwner);
  ASSERT_FALSE(escrow_
                   ->change_disbursal_address(
                       owner, rndr::schema::make_null_address())
                   .has_value());
  EXPECT_TRUE(rndr::schema::is_null(escrow_->state(*scope_).disbursal_address));

  auto failed =
      escrow_->disburse_funds(owner, "job1", {kBob}, {make_amount(1)});
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->code, ledger_error_code::not_authorized);
}

TEST_F(escrow_ledger_test, reconfiguration_is_owner_only) {
  auto stranger = as(kAlice);
  auto disbursal = escrow_->change_disbursal_address(stranger, kDave);
  ASSERT_TRUE(disbursal.has_value());
  EXPECT_EQ(disbursal->code, ledger_error_code::not_owner);

  auto token = escrow_->change_render_token_address(stranger, kDave);
  ASSERT_TRUE(token.has_value());
  EXPECT_EQ(token->code, ledger_error_code::not_owner);

  auto owner = as(kEscrowOwner);
  auto null_token = escrow_->change_render_token_address(
      owner, rndr::schema::make_null_address());
  ASSERT_TRUE(null_token.has_value());
  EXPECT_EQ(null_token->code, ledger_error_code::invalid_address);

  flush();
  ASSERT_FALSE(escrow_->change_disbursal_address(owner, kDave).has_value());
  EXPECT_EQ(escrow_->state(*scope_).disbursal_address, kDave);
  ASSERT_EQ(scope_->events().size(), 1u);
  EXPECT_EQ(scope_->events()[0].event.type, "disbursal_address_update");

  ASSERT_FALSE(escrow_->transfer_ownership(owner, kBob).has_value());
  EXPECT_EQ(escrow_->state(*scope_).owner, kBob);
  auto demoted = escrow_->change_disbursal_address(owner, kCarol);
  ASSERT_TRUE(demoted.has_value());
  EXPECT_EQ(demoted->code, ledger_error_code::not_owner);
}

TEST_F(escrow_ledger_test, job_payloads_alias_user_operations) {
  auto token = as(kTokenAddress);
  ASSERT_FALSE(escrow_
                   ->execute(token, rndr::schema::fund_job_t{
                                        .job_id = "render-7", .amount = 12})
                   .has_value());
  EXPECT_EQ(escrowed("render-7"), make_amount(12));

  auto failed = escrow_->execute(
      token, rndr::schema::transfer_t{.to = kBob, .amount = 1});
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->code, ledger_error_code::unsupported_operation);
}
