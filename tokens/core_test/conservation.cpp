#include <tokens/secure/ledger.hpp>
#include <tokens/test_common/ledger_context.hpp>

#include <gtest/gtest.h>

#include <array>
#include <map>
#include <random>
#include <utility>

namespace
{
std::array<tokens::account, 5> const accounts{ tokens::account{ "alice" }, tokens::account{ "bob" }, tokens::account{ "charlie" }, tokens::account{ "david" }, tokens::account{ "eve" } };

class snapshot
{
public:
	explicit snapshot (tokens::ledger const & ledger)
	{
		for (auto const & owner : accounts)
		{
			balances[owner.to_string ()] = ledger.balance (owner);
			for (auto const & spender : accounts)
			{
				allowances[{ owner.to_string (), spender.to_string () }] = ledger.allowance (owner, spender);
			}
		}
	}

	bool operator== (snapshot const & other) const
	{
		return balances == other.balances && allowances == other.allowances;
	}

	std::map<std::string, tokens::amount> balances;
	std::map<std::pair<std::string, std::string>, tokens::amount> allowances;
};

void run_random_sequence (unsigned seed, tokens::amount supply, unsigned operations)
{
	auto ctx = tokens::test::context::ledger_genesis (supply);
	auto & ledger = ctx.ledger ();
	tokens::account const genesis{ "genesis" };
	// Spread the supply so every account has something to move
	for (auto const & account : accounts)
	{
		ASSERT_FALSE (ledger.transfer (genesis, account, supply / (accounts.size () + 1)));
	}
	std::mt19937 rng{ seed };
	std::uniform_int_distribution<std::size_t> pick{ 0, accounts.size () - 1 };
	std::uniform_int_distribution<int> op{ 0, 2 };
	std::uniform_int_distribution<tokens::amount> amount{ 0, supply / 4 };
	for (unsigned i = 0; i < operations; ++i)
	{
		auto const & a = accounts[pick (rng)];
		auto const & b = accounts[pick (rng)];
		auto const & c = accounts[pick (rng)];
		auto const value = amount (rng);
		snapshot const before{ ledger };
		tokens::token_result result;
		switch (op (rng))
		{
			case 0:
				result = ledger.transfer (a, b, value);
				break;
			case 1:
				result = ledger.approve (a, b, value);
				break;
			default:
				result = ledger.transfer_from (c, a, b, value);
				if (!result)
				{
					ASSERT_EQ (before.allowances.at ({ a.to_string (), c.to_string () }) - value, ledger.allowance (a, c));
				}
				break;
		}
		if (result)
		{
			ASSERT_TRUE (before == snapshot{ ledger }) << "operation " << i << " failed with " << result << " but modified the ledger";
		}
		ASSERT_EQ (supply, ctx.balance_sum ());
		ASSERT_EQ (supply, ledger.total_supply ());
	}
}
}

TEST (conservation, random_sequence)
{
	run_random_sequence (1, 1000, 2000);
}

TEST (conservation, random_sequence_large_supply)
{
	run_random_sequence (7, tokens::amount_max, 2000);
}

TEST (conservation, random_sequence_seeds)
{
	for (unsigned seed = 100; seed < 110; ++seed)
	{
		run_random_sequence (seed, 600, 300);
	}
}

// Only the (from, spender) pair changes on a successful transfer_from
TEST (conservation, transfer_from_touches_one_pair)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	for (auto const & spender : accounts)
	{
		if (spender != accounts[0])
		{
			ASSERT_FALSE (ledger.approve (accounts[0], spender, 100));
		}
	}
	snapshot before{ ledger };
	ASSERT_FALSE (ledger.transfer_from (accounts[2], accounts[0], accounts[1], 40));
	snapshot after{ ledger };
	for (auto const & [key, value] : before.allowances)
	{
		if (key.first == "alice" && key.second == "charlie")
		{
			ASSERT_EQ (value - 40, after.allowances.at (key));
		}
		else
		{
			ASSERT_EQ (value, after.allowances.at (key));
		}
	}
}

TEST (conservation, failures_leave_ledger_unchanged)
{
	auto ctx = tokens::test::context::ledger_alice ();
	auto & ledger = ctx.ledger ();
	tokens::account const & alice = accounts[0];
	tokens::account const & bob = accounts[1];
	tokens::account const & charlie = accounts[2];
	ASSERT_FALSE (ledger.approve (alice, bob, 10));
	snapshot const before{ ledger };
	ASSERT_TRUE (ledger.transfer (alice, alice, 1));
	ASSERT_TRUE (ledger.transfer (alice, bob, 0));
	ASSERT_TRUE (ledger.transfer (alice, bob, 1001));
	ASSERT_TRUE (ledger.transfer (bob, charlie, 1));
	ASSERT_TRUE (ledger.approve (alice, alice, 5));
	ASSERT_TRUE (ledger.transfer_from (bob, alice, charlie, 11));
	ASSERT_TRUE (ledger.transfer_from (charlie, alice, bob, 1));
	ASSERT_TRUE (before == snapshot{ ledger });
	// Failed transfers to new accounts create no entries
	ASSERT_EQ (1, ledger.account_count ());
}
