#include <tokens/lib/utility.hpp>
#include <tokens/secure/common.hpp>

#include <magic_enum.hpp>

std::string_view tokens::to_string (tokens::token_status code)
{
	return magic_enum::enum_name (code);
}

std::error_code tokens::to_error_code (tokens::token_status code)
{
	switch (code)
	{
		case tokens::token_status::progress:
			return {};
		case tokens::token_status::self_transfer:
			return tokens::error_token::self_transfer;
		case tokens::token_status::zero_amount:
			return tokens::error_token::zero_amount;
		case tokens::token_status::insufficient_balance:
			return tokens::error_token::insufficient_balance;
		case tokens::token_status::balance_overflow:
			return tokens::error_token::balance_overflow;
		case tokens::token_status::self_approval:
			return tokens::error_token::self_approval;
		case tokens::token_status::insufficient_allowance:
			return tokens::error_token::insufficient_allowance;
	}
	debug_assert (false, "Invalid token status");
	return tokens::error_token::generic;
}

tokens::token_result::token_result (tokens::token_status code_a) :
	code (code_a)
{
	debug_assert (code != tokens::token_status::insufficient_balance && code != tokens::token_status::insufficient_allowance, "shortfall statuses carry amounts");
}

tokens::token_result tokens::token_result::shortfall (tokens::token_status code_a, tokens::amount required_a, tokens::amount available_a)
{
	debug_assert (code_a == tokens::token_status::insufficient_balance || code_a == tokens::token_status::insufficient_allowance);
	debug_assert (available_a < required_a);
	tokens::token_result result;
	result.code = code_a;
	result.required = required_a;
	result.available = available_a;
	return result;
}

tokens::token_result::operator bool () const
{
	return code != tokens::token_status::progress;
}

std::error_code tokens::token_result::error_code () const
{
	return tokens::to_error_code (code);
}

bool tokens::token_result::operator== (tokens::token_result const & other_a) const
{
	return code == other_a.code && required == other_a.required && available == other_a.available;
}
