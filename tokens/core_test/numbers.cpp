#include <tokens/lib/numbers.hpp>
#include <tokens/lib/utility.hpp>
#include <tokens/secure/allowance_info.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <unordered_set>
#include <vector>

TEST (account, equality)
{
	tokens::account alice{ "alice" };
	ASSERT_EQ (alice, tokens::account{ std::string ("alice") });
	ASSERT_NE (alice, tokens::account{ "Alice" });
	ASSERT_NE (alice, tokens::account{ "alice " });
	ASSERT_TRUE (tokens::account{}.is_empty ());
	ASSERT_FALSE (alice.is_empty ());
	ASSERT_EQ ("alice", alice.to_string ());
}

TEST (account, ordering)
{
	ASSERT_LT (tokens::account{ "alice" }, tokens::account{ "bob" });
	ASSERT_FALSE (tokens::account{ "bob" } < tokens::account{ "alice" });
	ASSERT_FALSE (tokens::account{ "alice" } < tokens::account{ "alice" });
}

TEST (account, hash)
{
	std::unordered_set<tokens::account> accounts;
	accounts.insert (tokens::account{ "alice" });
	accounts.insert (tokens::account{ "bob" });
	accounts.insert (tokens::account{ "alice" });
	ASSERT_EQ (2, accounts.size ());
	ASSERT_EQ (1, accounts.count (tokens::account{ "bob" }));
	ASSERT_EQ (std::hash<tokens::account>{}(tokens::account{ "alice" }), std::hash<tokens::account>{}(tokens::account{ "alice" }));
}

TEST (account, stream)
{
	std::stringstream stream;
	stream << tokens::account{ "alice" };
	ASSERT_EQ ("alice", stream.str ());
}

TEST (amount, add_overflows)
{
	ASSERT_FALSE (tokens::add_overflows (0, 0));
	ASSERT_FALSE (tokens::add_overflows (tokens::amount_max, 0));
	ASSERT_FALSE (tokens::add_overflows (tokens::amount_max - 100, 100));
	ASSERT_TRUE (tokens::add_overflows (tokens::amount_max - 100, 101));
	ASSERT_TRUE (tokens::add_overflows (tokens::amount_max, 1));
	ASSERT_TRUE (tokens::add_overflows (1, tokens::amount_max));
	ASSERT_TRUE (tokens::add_overflows (tokens::amount_max, tokens::amount_max));
}

TEST (amount, to_string_dec)
{
	ASSERT_EQ ("0", tokens::to_string_dec (0));
	ASSERT_EQ ("18446744073709551615", tokens::to_string_dec (tokens::amount_max));
}

TEST (allowance_key, directional)
{
	tokens::allowance_key forward{ tokens::account{ "alice" }, tokens::account{ "bob" } };
	tokens::allowance_key backward{ tokens::account{ "bob" }, tokens::account{ "alice" } };
	ASSERT_FALSE (forward == backward);
	ASSERT_TRUE (forward == (tokens::allowance_key{ tokens::account{ "alice" }, tokens::account{ "bob" } }));
	ASSERT_NE (std::hash<tokens::allowance_key>{}(forward), std::hash<tokens::allowance_key>{}(backward));
	ASSERT_TRUE (forward < backward);
	std::unordered_set<tokens::allowance_key> keys{ forward, backward, forward };
	ASSERT_EQ (2, keys.size ());
}

TEST (allowance_key, stream)
{
	std::stringstream stream;
	stream << tokens::allowance_key{ tokens::account{ "alice" }, tokens::account{ "bob" } };
	ASSERT_EQ ("Owner: alice, Spender: bob", stream.str ());
}

TEST (util, split)
{
	auto parts = tokens::util::split ("ledger=debug,config=trace", ",");
	ASSERT_EQ (2, parts.size ());
	ASSERT_EQ ("ledger=debug", parts[0]);
	ASSERT_EQ ("config=trace", parts[1]);
	ASSERT_EQ (1, tokens::util::split ("", ",").size ());
	ASSERT_EQ (3, tokens::util::split ("a==b", "=").size ());
}

TEST (util, join)
{
	std::vector<int> values{ 1, 2, 3 };
	ASSERT_EQ ("1, 2, 3", tokens::util::join (values, ", ", [] (int value) { return value; }));
	ASSERT_EQ ("", tokens::util::join (std::vector<int>{}, ", ", [] (int value) { return value; }));
}
