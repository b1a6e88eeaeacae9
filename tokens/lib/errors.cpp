#include <tokens/lib/errors.hpp>

#include <utility>

std::string tokens::error_common_messages::message (int ev) const
{
	switch (static_cast<tokens::error_common> (ev))
	{
		case tokens::error_common::generic:
			return "Unknown error";
		case tokens::error_common::exception:
			return "Exception thrown";
	}

	return "Invalid error code";
}

std::string tokens::error_token_messages::message (int ev) const
{
	switch (static_cast<tokens::error_token> (ev))
	{
		case tokens::error_token::generic:
			return "Unknown error";
		case tokens::error_token::self_transfer:
			return "Source and destination accounts are the same";
		case tokens::error_token::zero_amount:
			return "Amount must be greater than zero";
		case tokens::error_token::insufficient_balance:
			return "Insufficient balance";
		case tokens::error_token::balance_overflow:
			return "Destination balance would overflow";
		case tokens::error_token::self_approval:
			return "Owner and spender are the same";
		case tokens::error_token::insufficient_allowance:
			return "Insufficient allowance";
	}

	return "Invalid error code";
}

std::string tokens::error_config_messages::message (int ev) const
{
	switch (static_cast<tokens::error_config> (ev))
	{
		case tokens::error_config::generic:
			return "Unknown error";
		case tokens::error_config::invalid_value:
			return "Invalid configuration value";
		case tokens::error_config::missing_value:
			return "Missing value in configuration";
	}

	return "Invalid error code";
}

tokens::error::error (std::error_code code_a) :
	code{ code_a }
{
}

tokens::error::error (std::exception const & exception_a) :
	code{ tokens::error_common::exception },
	message{ exception_a.what () }
{
}

tokens::error & tokens::error::operator= (std::error_code code_a)
{
	code = code_a;
	message.clear ();
	return *this;
}

tokens::error & tokens::error::operator= (std::exception const & exception_a)
{
	code = tokens::error_common::exception;
	message = exception_a.what ();
	return *this;
}

tokens::error::operator bool () const
{
	return static_cast<bool> (code);
}

tokens::error::operator std::error_code () const
{
	return code;
}

std::string tokens::error::get_message () const
{
	if (!code)
	{
		return {};
	}
	return message.empty () ? code.message () : message;
}

tokens::error & tokens::error::set (std::string message_a, std::error_code code_a)
{
	code = code_a;
	message = std::move (message_a);
	return *this;
}

tokens::error & tokens::error::set_message (std::string message_a)
{
	if (!code)
	{
		code = tokens::error_common::generic;
	}
	message = std::move (message_a);
	return *this;
}

tokens::error & tokens::error::clear ()
{
	code.clear ();
	message.clear ();
	return *this;
}
