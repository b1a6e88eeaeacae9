#include <tokens/secure/ledger.hpp>
#include <tokens/secure/ledger_config.hpp>
#include <tokens/test_common/ledger_context.hpp>

#include <gtest/gtest.h>

#include <type_traits>

namespace
{
tokens::account const alice{ "alice" };
tokens::account const bob{ "bob" };
tokens::account const charlie{ "charlie" };
}

// Copies would let two ledgers claim the same supply
static_assert (!std::is_copy_constructible_v<tokens::ledger>);
static_assert (!std::is_copy_assignable_v<tokens::ledger>);

// Creator holds the whole supply, nobody else has anything
TEST (ledger, genesis_balance)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_EQ (1000, ledger.total_supply ());
	ASSERT_EQ (1000, ledger.balance (alice));
	ASSERT_EQ (0, ledger.balance (bob));
	ASSERT_EQ (1, ledger.account_count ());
}

TEST (ledger, zero_supply)
{
	auto ctx = tokens::test::context::ledger_genesis (0);
	auto & ledger = ctx.ledger ();
	ASSERT_EQ (0, ledger.total_supply ());
	ASSERT_EQ (0, ledger.balance (tokens::account{ "genesis" }));
	ASSERT_EQ (tokens::token_status::insufficient_balance, ledger.transfer (tokens::account{ "genesis" }, alice, 1).code);
}

TEST (ledger, max_supply)
{
	auto ctx = tokens::test::context::ledger_genesis (tokens::amount_max);
	auto & ledger = ctx.ledger ();
	ASSERT_EQ (tokens::amount_max, ledger.balance (tokens::account{ "genesis" }));
	ASSERT_EQ (tokens::token_status::progress, ledger.transfer (tokens::account{ "genesis" }, alice, tokens::amount_max).code);
	ASSERT_EQ (0, ledger.balance (tokens::account{ "genesis" }));
	ASSERT_EQ (tokens::amount_max, ledger.balance (alice));
}

// Lookups on never credited accounts don't create entries
TEST (ledger, balance_missing_account)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_EQ (0, ledger.balance (tokens::account{ "unknown" }));
	ASSERT_EQ (0, ledger.balance (tokens::account{}));
	ASSERT_EQ (1, ledger.account_count ());
}

TEST (ledger, construct_from_config)
{
	tokens::ledger_config config;
	config.genesis_account = bob;
	config.genesis_amount = 500;
	tokens::logger logger;
	tokens::ledger ledger{ config, logger };
	ASSERT_EQ (500, ledger.balance (bob));
	ASSERT_EQ (500, ledger.total_supply ());
	ASSERT_EQ (0, ledger.balance (alice));
}

TEST (ledger, transfer)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	auto result = ledger.transfer (alice, bob, 100);
	ASSERT_FALSE (result);
	ASSERT_EQ (tokens::token_status::progress, result.code);
	ASSERT_EQ (900, ledger.balance (alice));
	ASSERT_EQ (100, ledger.balance (bob));
	ASSERT_EQ (1000, ledger.total_supply ());
	ASSERT_EQ (2, ledger.account_count ());
}

TEST (ledger, transfer_entire_balance)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.transfer (alice, bob, 1000));
	ASSERT_EQ (0, ledger.balance (alice));
	ASSERT_EQ (1000, ledger.balance (bob));
	// Emptied accounts keep reading as zero and can receive again
	ASSERT_FALSE (ledger.transfer (bob, alice, 1));
	ASSERT_EQ (1, ledger.balance (alice));
	ASSERT_EQ (999, ledger.balance (bob));
}

TEST (ledger, transfer_chain)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_FALSE (ledger.transfer (alice, bob, 300));
	ASSERT_FALSE (ledger.transfer (bob, charlie, 200));
	ASSERT_FALSE (ledger.transfer (charlie, alice, 50));
	ASSERT_EQ (750, ledger.balance (alice));
	ASSERT_EQ (100, ledger.balance (bob));
	ASSERT_EQ (150, ledger.balance (charlie));
	ASSERT_EQ (1000, ctx.balance_sum ());
}

TEST (ledger, transfer_insufficient_balance)
{
	auto ctx = tokens::test::context::ledger_genesis (100);
	auto & ledger = ctx.ledger ();
	tokens::account const genesis{ "genesis" };
	auto result = ledger.transfer (genesis, bob, 200);
	ASSERT_TRUE (result);
	ASSERT_EQ (tokens::token_result::shortfall (tokens::token_status::insufficient_balance, 200, 100), result);
	ASSERT_EQ (200, result.required);
	ASSERT_EQ (100, result.available);
	ASSERT_EQ (100, ledger.balance (genesis));
	ASSERT_EQ (0, ledger.balance (bob));
	// A failed transfer doesn't create the destination entry
	ASSERT_EQ (1, ledger.account_count ());
}

TEST (ledger, transfer_from_empty_account)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	auto result = ledger.transfer (bob, charlie, 1);
	ASSERT_EQ (tokens::token_result::shortfall (tokens::token_status::insufficient_balance, 1, 0), result);
}

TEST (ledger, transfer_self)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_EQ (tokens::token_status::self_transfer, ledger.transfer (alice, alice, 100).code);
	ASSERT_EQ (1000, ledger.balance (alice));
}

TEST (ledger, transfer_zero_amount)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ASSERT_EQ (tokens::token_status::zero_amount, ledger.transfer (alice, bob, 0).code);
	ASSERT_EQ (1000, ledger.balance (alice));
	ASSERT_EQ (1, ledger.account_count ());
}

TEST (ledger, transfer_overflow)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ctx.mint (bob, tokens::amount_max - 100);
	ASSERT_EQ (tokens::token_status::balance_overflow, ledger.transfer (alice, bob, 200).code);
	ASSERT_EQ (1000, ledger.balance (alice));
	ASSERT_EQ (tokens::amount_max - 100, ledger.balance (bob));
	// Filling up to exactly the maximum is allowed
	ASSERT_FALSE (ledger.transfer (alice, bob, 100));
	ASSERT_EQ (tokens::amount_max, ledger.balance (bob));
}

TEST (ledger, transfer_overflow_at_max)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	ctx.mint (bob, tokens::amount_max);
	ASSERT_EQ (tokens::token_status::balance_overflow, ledger.transfer (alice, bob, 1).code);
	ASSERT_EQ (1000, ledger.balance (alice));
	ASSERT_EQ (tokens::amount_max, ledger.balance (bob));
}

// First failing check wins
TEST (ledger, transfer_check_order)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	// Self transfer is reported ahead of a zero amount
	ASSERT_EQ (tokens::token_status::self_transfer, ledger.transfer (alice, alice, 0).code);
	// Zero amount is reported ahead of the missing balance
	ASSERT_EQ (tokens::token_status::zero_amount, ledger.transfer (bob, charlie, 0).code);
	// Insufficient balance is reported ahead of an overflowing destination
	ctx.mint (charlie, tokens::amount_max);
	ASSERT_EQ (tokens::token_status::insufficient_balance, ledger.transfer (alice, charlie, 2000).code);
}

TEST (ledger, result_error_code)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	auto ok = ledger.transfer (alice, bob, 1);
	ASSERT_FALSE (ok.error_code ());
	auto failed = ledger.transfer (alice, alice, 1);
	ASSERT_EQ (std::error_code (tokens::error_token::self_transfer), failed.error_code ());
	ASSERT_EQ ("Source and destination accounts are the same", failed.error_code ().message ());
}
