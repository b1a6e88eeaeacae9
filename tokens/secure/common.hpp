#pragma once

#include <tokens/lib/errors.hpp>
#include <tokens/lib/numbers.hpp>

#include <ostream>
#include <string_view>
#include <system_error>

namespace tokens
{
/**
 * Outcome of a ledger operation
 * Values are stable; checks run in a fixed order and the first failing one is reported
 */
enum class token_status
{
	progress, // Operation applied
	self_transfer, // Source and destination are the same account
	zero_amount, // Nothing to move
	insufficient_balance, // Source cannot cover the amount
	balance_overflow, // Destination balance would exceed tokens::amount_max
	self_approval, // Owner tried to approve itself as spender
	insufficient_allowance // Spender's remaining allowance cannot cover the amount
};

std::string_view to_string (tokens::token_status);

/** Maps a failing status onto the error_token category, progress maps to an empty error code */
std::error_code to_error_code (tokens::token_status);

class token_result final
{
public:
	token_result () = default;
	token_result (tokens::token_status);

	/** Result for the two shortfall statuses, carrying the requested and the available amount */
	static token_result shortfall (tokens::token_status, tokens::amount required, tokens::amount available);

	/** True if the operation failed */
	explicit operator bool () const;
	std::error_code error_code () const;
	bool operator== (tokens::token_result const &) const;

	tokens::token_status code{ tokens::token_status::progress };
	tokens::amount required{ 0 };
	tokens::amount available{ 0 };

	friend std::ostream & operator<< (std::ostream & os, tokens::token_result const & result)
	{
		os << to_string (result.code);
		if (result.code == tokens::token_status::insufficient_balance || result.code == tokens::token_status::insufficient_allowance)
		{
			os << " (required: " << result.required << ", available: " << result.available << ")";
		}
		return os;
	}
};
}
