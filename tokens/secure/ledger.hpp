#pragma once

#include <tokens/lib/logging.hpp>
#include <tokens/lib/numbers.hpp>
#include <tokens/secure/allowance_info.hpp>
#include <tokens/secure/common.hpp>

#include <unordered_map>

namespace tokens::test::context
{
class ledger_context;
}

namespace tokens
{
class ledger_config;

/**
 * Balances, allowances and the fixed total supply of a single token
 * The sum of all balances equals total_supply () after every call. A call returning anything other than
 * token_status::progress has not modified the ledger.
 * Not thread safe, callers serialize access.
 */
class ledger final
{
	friend class tokens::test::context::ledger_context;

public:
	ledger (tokens::account const & creator, tokens::amount initial_supply, tokens::logger & = tokens::default_logger ());
	explicit ledger (tokens::ledger_config const &, tokens::logger & = tokens::default_logger ());

	ledger (ledger const &) = delete;
	ledger & operator= (ledger const &) = delete;

	/** Returns 0 for accounts that were never credited */
	tokens::amount balance (tokens::account const &) const;
	/** Amount \p spender may still move out of \p owner's balance, 0 if never approved */
	tokens::amount allowance (tokens::account const & owner, tokens::account const & spender) const;
	tokens::amount total_supply () const;
	std::size_t account_count () const;

	tokens::token_result transfer (tokens::account const & from, tokens::account const & to, tokens::amount);
	/** Replaces the allowance of (owner, spender), a zero amount is accepted */
	tokens::token_result approve (tokens::account const & owner, tokens::account const & spender, tokens::amount);
	/** Moves funds from \p from to \p to on behalf of \p spender, consuming the allowance \p from granted \p spender */
	tokens::token_result transfer_from (tokens::account const & spender, tokens::account const & from, tokens::account const & to, tokens::amount);

private:
	tokens::token_status check_parties (tokens::account const & from, tokens::account const & to, tokens::amount) const;
	tokens::token_result check_funds (tokens::account const & from, tokens::account const & to, tokens::amount) const;
	// Requires a successful check_funds
	void move (tokens::account const & from, tokens::account const & to, tokens::amount);

	tokens::logger & logger;
	std::unordered_map<tokens::account, tokens::amount> balances;
	std::unordered_map<tokens::allowance_key, tokens::amount> allowances;
	tokens::amount const supply;
};
}
