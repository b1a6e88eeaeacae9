#include <tokens/test_common/ledger_context.hpp>

tokens::test::context::ledger_context::ledger_context (tokens::account const & creator, tokens::amount initial_supply) :
	logger_m{ "test" },
	ledger_m{ creator, initial_supply, logger_m }
{
}

tokens::ledger & tokens::test::context::ledger_context::ledger ()
{
	return ledger_m;
}

tokens::logger & tokens::test::context::ledger_context::logger ()
{
	return logger_m;
}

void tokens::test::context::ledger_context::mint (tokens::account const & account, tokens::amount amount)
{
	ledger_m.balances.insert_or_assign (account, amount);
}

boost::multiprecision::uint128_t tokens::test::context::ledger_context::balance_sum () const
{
	boost::multiprecision::uint128_t result{ 0 };
	for (auto const & [account, balance] : ledger_m.balances)
	{
		result += balance;
	}
	return result;
}

tokens::test::context::ledger_context tokens::test::context::ledger_alice ()
{
	return ledger_context{ tokens::account{ "alice" }, 1000 };
}

tokens::test::context::ledger_context tokens::test::context::ledger_genesis (tokens::amount initial_supply)
{
	return ledger_context{ tokens::account{ "genesis" }, initial_supply };
}
