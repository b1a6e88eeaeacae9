#pragma once

#include <tokens/lib/logging.hpp>
#include <tokens/secure/ledger.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace tokens::test::context
{
class ledger_context
{
public:
	ledger_context (tokens::account const & creator, tokens::amount initial_supply);
	tokens::ledger & ledger ();
	tokens::logger & logger ();

	/** Overwrites the balance of \p account, bypassing every ledger check. Breaks the supply invariant on purpose */
	void mint (tokens::account const & account, tokens::amount amount);
	/** Sum of all balance entries, wider than tokens::amount so minted balances can't wrap it */
	boost::multiprecision::uint128_t balance_sum () const;

private:
	tokens::logger logger_m;
	tokens::ledger ledger_m;
};

/** "alice" holding a supply of 1000 */
ledger_context ledger_alice ();
ledger_context ledger_genesis (tokens::amount initial_supply);
}
