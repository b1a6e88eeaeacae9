#include <tokens/secure/ledger.hpp>
#include <tokens/test_common/ledger_context.hpp>

#include <gtest/gtest.h>

namespace
{
tokens::account const alice{ "alice" };
tokens::account const bob{ "bob" };
tokens::account const charlie{ "charlie" };
tokens::account const david{ "david" };
}

TEST (allowance, approve)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_EQ (0, ledger.allowance (alice, bob));
	ASSERT_FALSE (ledger.approve (alice, bob, 100));
	ASSERT_EQ (100, ledger.allowance (alice, bob));
	// Approving moves no funds
	ASSERT_EQ (1000, ledger.balance (alice));
	ASSERT_EQ (0, ledger.balance (bob));
}

TEST (allowance, directional)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.approve (alice, bob, 100));
	ASSERT_EQ (0, ledger.allowance (bob, alice));
	ASSERT_EQ (0, ledger.allowance (alice, charlie));
	ASSERT_EQ (0, ledger.allowance (charlie, bob));
}

TEST (allowance, approve_self)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_EQ (tokens::token_status::self_approval, ledger.approve (alice, alice, 100).code);
	ASSERT_EQ (0, ledger.allowance (alice, alice));
}

TEST (allowance, approve_zero)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.approve (alice, bob, 0));
	ASSERT_EQ (0, ledger.allowance (alice, bob));
}

// Approving an account with no balance is accepted, funds are checked on use
TEST (allowance, approve_without_balance)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.approve (bob, charlie, tokens::amount_max));
	ASSERT_EQ (tokens::amount_max, ledger.allowance (bob, charlie));
}

TEST (allowance, approve_overwrite)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.approve (alice, bob, 100));
	ASSERT_FALSE (ledger.approve (alice, bob, 200));
	ASSERT_EQ (200, ledger.allowance (alice, bob));
	ASSERT_FALSE (ledger.approve (alice, bob, 50));
	ASSERT_EQ (50, ledger.allowance (alice, bob));
}

// Setting zero revokes, and reads the same as never approved
TEST (allowance, approve_revoke)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.approve (alice, bob, 100));
	ASSERT_FALSE (ledger.approve (alice, bob, 0));
	ASSERT_EQ (ledger.allowance (alice, charlie), ledger.allowance (alice, bob));
	ASSERT_EQ (tokens::token_result::shortfall (tokens::token_status::insufficient_allowance, 1, 0), ledger.transfer_from (bob, alice, charlie, 1));
}

TEST (allowance, transfer_from)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.approve (alice, bob, 100));
	auto result = ledger.transfer_from (bob, alice, charlie, 50);
	ASSERT_EQ (tokens::token_status::progress, result.code);
	ASSERT_EQ (950, ledger.balance (alice));
	ASSERT_EQ (50, ledger.balance (charlie));
	ASSERT_EQ (0, ledger.balance (bob));
	ASSERT_EQ (50, ledger.allowance (alice, bob));
	ASSERT_EQ (1000, ledger.total_supply ());
}

// The spender may also be the destination
TEST (allowance, transfer_from_to_spender)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.approve (alice, bob, 100));
	ASSERT_FALSE (ledger.transfer_from (bob, alice, bob, 100));
	ASSERT_EQ (900, ledger.balance (alice));
	ASSERT_EQ (100, ledger.balance (bob));
	ASSERT_EQ (0, ledger.allowance (alice, bob));
}

TEST (allowance, transfer_from_insufficient_allowance)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.approve (alice, bob, 50));
	auto result = ledger.transfer_from (bob, alice, charlie, 100);
	ASSERT_EQ (tokens::token_result::shortfall (tokens::token_status::insufficient_allowance, 100, 50), result);
	ASSERT_EQ (1000, ledger.balance (alice));
	ASSERT_EQ (0, ledger.balance (charlie));
	ASSERT_EQ (50, ledger.allowance (alice, bob));
}

TEST (allowance, transfer_from_never_approved)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_EQ (tokens::token_result::shortfall (tokens::token_status::insufficient_allowance, 10, 0), ledger.transfer_from (bob, alice, charlie, 10));
}

// An allowance granted in the opposite direction can't be used
TEST (allowance, transfer_from_wrong_direction)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.approve (bob, alice, 100));
	ASSERT_EQ (tokens::token_status::insufficient_allowance, ledger.transfer_from (bob, alice, charlie, 10).code);
	ASSERT_EQ (1000, ledger.balance (alice));
}

TEST (allowance, transfer_from_insufficient_balance)
{
	auto ctx = tokens::test::context::ledger_genesis (100);
	auto & ledger = ctx.ledger ();
	tokens::account const genesis{ "genesis" };
	ASSERT_FALSE (ledger.approve (genesis, bob, 200));
	auto result = ledger.transfer_from (bob, genesis, charlie, 150);
	ASSERT_EQ (tokens::token_result::shortfall (tokens::token_status::insufficient_balance, 150, 100), result);
	ASSERT_EQ (100, ledger.balance (genesis));
	ASSERT_EQ (200, ledger.allowance (genesis, bob));
}

TEST (allowance, transfer_from_overflow)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ctx.mint (charlie, tokens::amount_max);
	ASSERT_FALSE (ledger.approve (alice, bob, 100));
	ASSERT_EQ (tokens::token_status::balance_overflow, ledger.transfer_from (bob, alice, charlie, 1).code);
	ASSERT_EQ (1000, ledger.balance (alice));
	ASSERT_EQ (100, ledger.allowance (alice, bob));
}

TEST (allowance, transfer_from_updates_allowance)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.approve (alice, bob, 100));
	ASSERT_FALSE (ledger.transfer_from (bob, alice, charlie, 30));
	ASSERT_FALSE (ledger.transfer_from (bob, alice, david, 20));
	ASSERT_EQ (50, ledger.allowance (alice, bob));
	ASSERT_EQ (30, ledger.balance (charlie));
	ASSERT_EQ (20, ledger.balance (david));
	ASSERT_FALSE (ledger.transfer_from (bob, alice, charlie, 50));
	ASSERT_EQ (0, ledger.allowance (alice, bob));
	ASSERT_EQ (tokens::token_status::insufficient_allowance, ledger.transfer_from (bob, alice, charlie, 1).code);
}

// Only the (from, spender) pair is consumed
TEST (allowance, transfer_from_other_pairs_unchanged)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.transfer (alice, charlie, 100));
	ASSERT_FALSE (ledger.approve (alice, bob, 100));
	ASSERT_FALSE (ledger.approve (alice, david, 70));
	ASSERT_FALSE (ledger.approve (charlie, bob, 40));
	ASSERT_FALSE (ledger.transfer_from (bob, alice, david, 25));
	ASSERT_EQ (75, ledger.allowance (alice, bob));
	ASSERT_EQ (70, ledger.allowance (alice, david));
	ASSERT_EQ (40, ledger.allowance (charlie, bob));
	ASSERT_EQ (0, ledger.allowance (bob, alice));
}

// Direct transfers by the owner leave the allowance alone
TEST (allowance, transfer_keeps_allowance)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.approve (alice, bob, 100));
	ASSERT_FALSE (ledger.transfer (alice, charlie, 500));
	ASSERT_EQ (100, ledger.allowance (alice, bob));
}

TEST (allowance, transfer_from_check_order)
{
	auto ctx = tokens::test::context::ledger_genesis (10);
	auto & ledger = ctx.ledger ();
	tokens::account const genesis{ "genesis" };
	// Self transfer ahead of zero amount and allowance
	ASSERT_EQ (tokens::token_status::self_transfer, ledger.transfer_from (bob, genesis, genesis, 0).code);
	// Zero amount ahead of allowance
	ASSERT_EQ (tokens::token_status::zero_amount, ledger.transfer_from (bob, genesis, charlie, 0).code);
	// Allowance ahead of balance when both fall short
	ASSERT_FALSE (ledger.approve (genesis, bob, 5));
	ASSERT_EQ (tokens::token_result::shortfall (tokens::token_status::insufficient_allowance, 20, 5), ledger.transfer_from (bob, genesis, charlie, 20));
	// Balance ahead of overflow
	ASSERT_FALSE (ledger.approve (genesis, bob, 100));
	ctx.mint (charlie, tokens::amount_max);
	ASSERT_EQ (tokens::token_result::shortfall (tokens::token_status::insufficient_balance, 20, 10), ledger.transfer_from (bob, genesis, charlie, 20));
}

// Spender and owner being identical is not rejected by transfer_from, it needs a self allowance which approve refuses
TEST (allowance, transfer_from_by_owner)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_EQ (tokens::token_result::shortfall (tokens::token_status::insufficient_allowance, 10, 0), ledger.transfer_from (alice, alice, bob, 10));
}
