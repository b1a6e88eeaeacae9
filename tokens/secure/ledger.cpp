#include <tokens/lib/utility.hpp>
#include <tokens/secure/ledger.hpp>
#include <tokens/secure/ledger_config.hpp>

tokens::ledger::ledger (tokens::account const & creator, tokens::amount initial_supply, tokens::logger & logger_a) :
	logger{ logger_a },
	supply{ initial_supply }
{
	balances.emplace (creator, initial_supply);
	logger.info (tokens::log::type::ledger, "Ledger initialized with supply {} held by: {}", tokens::to_string_dec (supply), creator.to_string ());
}

tokens::ledger::ledger (tokens::ledger_config const & config_a, tokens::logger & logger_a) :
	ledger (config_a.genesis_account, config_a.genesis_amount, logger_a)
{
}

tokens::amount tokens::ledger::balance (tokens::account const & account_a) const
{
	auto existing = balances.find (account_a);
	return existing != balances.end () ? existing->second : 0;
}

tokens::amount tokens::ledger::allowance (tokens::account const & owner_a, tokens::account const & spender_a) const
{
	auto existing = allowances.find (tokens::allowance_key{ owner_a, spender_a });
	return existing != allowances.end () ? existing->second : 0;
}

tokens::amount tokens::ledger::total_supply () const
{
	return supply;
}

std::size_t tokens::ledger::account_count () const
{
	return balances.size ();
}

tokens::token_result tokens::ledger::transfer (tokens::account const & from_a, tokens::account const & to_a, tokens::amount amount_a)
{
	tokens::token_result result{ check_parties (from_a, to_a, amount_a) };
	if (result.code == tokens::token_status::progress)
	{
		result = check_funds (from_a, to_a, amount_a);
		if (result.code == tokens::token_status::progress)
		{
			move (from_a, to_a, amount_a);
			logger.debug (tokens::log::type::ledger, "Transferred {} from: {} to: {}", amount_a, from_a.to_string (), to_a.to_string ());
		}
	}
	return result;
}

tokens::token_result tokens::ledger::approve (tokens::account const & owner_a, tokens::account const & spender_a, tokens::amount amount_a)
{
	tokens::token_result result{ owner_a == spender_a ? tokens::token_status::self_approval : tokens::token_status::progress };
	if (result.code == tokens::token_status::progress)
	{
		allowances.insert_or_assign (tokens::allowance_key{ owner_a, spender_a }, amount_a);
		logger.debug (tokens::log::type::ledger, "Approved {} for spender: {} by owner: {}", amount_a, spender_a.to_string (), owner_a.to_string ());
	}
	return result;
}

tokens::token_result tokens::ledger::transfer_from (tokens::account const & spender_a, tokens::account const & from_a, tokens::account const & to_a, tokens::amount amount_a)
{
	tokens::token_result result{ check_parties (from_a, to_a, amount_a) };
	if (result.code == tokens::token_status::progress)
	{
		// Allowance is checked ahead of the balance, a spender exceeding both learns about the allowance
		auto allowance_l = allowance (from_a, spender_a);
		if (allowance_l < amount_a)
		{
			result = tokens::token_result::shortfall (tokens::token_status::insufficient_allowance, amount_a, allowance_l);
		}
		if (result.code == tokens::token_status::progress)
		{
			result = check_funds (from_a, to_a, amount_a);
			if (result.code == tokens::token_status::progress)
			{
				move (from_a, to_a, amount_a);
				auto existing = allowances.find (tokens::allowance_key{ from_a, spender_a });
				debug_assert (existing != allowances.end ());
				existing->second -= amount_a;
				logger.debug (tokens::log::type::ledger, "Spender: {} transferred {} from: {} to: {}", spender_a.to_string (), amount_a, from_a.to_string (), to_a.to_string ());
			}
		}
	}
	return result;
}

tokens::token_status tokens::ledger::check_parties (tokens::account const & from_a, tokens::account const & to_a, tokens::amount amount_a) const
{
	auto result = from_a == to_a ? tokens::token_status::self_transfer : tokens::token_status::progress;
	if (result == tokens::token_status::progress)
	{
		result = amount_a == 0 ? tokens::token_status::zero_amount : tokens::token_status::progress;
	}
	return result;
}

tokens::token_result tokens::ledger::check_funds (tokens::account const & from_a, tokens::account const & to_a, tokens::amount amount_a) const
{
	tokens::token_result result;
	auto from_balance = balance (from_a);
	if (from_balance < amount_a)
	{
		result = tokens::token_result::shortfall (tokens::token_status::insufficient_balance, amount_a, from_balance);
	}
	if (result.code == tokens::token_status::progress)
	{
		result.code = tokens::add_overflows (balance (to_a), amount_a) ? tokens::token_status::balance_overflow : tokens::token_status::progress;
	}
	return result;
}

void tokens::ledger::move (tokens::account const & from_a, tokens::account const & to_a, tokens::amount amount_a)
{
	// Creating the destination entry is the only step that can throw, it runs before any balance changes.
	// References stay valid across a rehash, iterators do not
	auto & destination = balances[to_a];
	auto & source = balances.at (from_a);
	debug_assert (source >= amount_a);
	debug_assert (!tokens::add_overflows (destination, amount_a));
	source -= amount_a;
	destination += amount_a;
}
