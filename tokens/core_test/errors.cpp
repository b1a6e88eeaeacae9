#include <tokens/lib/errors.hpp>
#include <tokens/secure/common.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

TEST (errors, categories)
{
	ASSERT_STREQ ("error_common", std::error_code (tokens::error_common::generic).category ().name ());
	ASSERT_STREQ ("error_token", std::error_code (tokens::error_token::generic).category ().name ());
	ASSERT_STREQ ("error_config", std::error_code (tokens::error_config::generic).category ().name ());
	ASSERT_NE (std::error_code (tokens::error_token::generic), std::error_code (tokens::error_config::generic));
}

TEST (errors, token_messages)
{
	ASSERT_EQ ("Source and destination accounts are the same", std::error_code (tokens::error_token::self_transfer).message ());
	ASSERT_EQ ("Amount must be greater than zero", std::error_code (tokens::error_token::zero_amount).message ());
	ASSERT_EQ ("Insufficient balance", std::error_code (tokens::error_token::insufficient_balance).message ());
	ASSERT_EQ ("Destination balance would overflow", std::error_code (tokens::error_token::balance_overflow).message ());
	ASSERT_EQ ("Owner and spender are the same", std::error_code (tokens::error_token::self_approval).message ());
	ASSERT_EQ ("Insufficient allowance", std::error_code (tokens::error_token::insufficient_allowance).message ());
	ASSERT_EQ ("Invalid error code", tokens::error_token_category ().message (100));
}

TEST (errors, token_status_mapping)
{
	ASSERT_FALSE (tokens::to_error_code (tokens::token_status::progress));
	ASSERT_EQ (std::error_code (tokens::error_token::self_transfer), tokens::to_error_code (tokens::token_status::self_transfer));
	ASSERT_EQ (std::error_code (tokens::error_token::zero_amount), tokens::to_error_code (tokens::token_status::zero_amount));
	ASSERT_EQ (std::error_code (tokens::error_token::insufficient_balance), tokens::to_error_code (tokens::token_status::insufficient_balance));
	ASSERT_EQ (std::error_code (tokens::error_token::balance_overflow), tokens::to_error_code (tokens::token_status::balance_overflow));
	ASSERT_EQ (std::error_code (tokens::error_token::self_approval), tokens::to_error_code (tokens::token_status::self_approval));
	ASSERT_EQ (std::error_code (tokens::error_token::insufficient_allowance), tokens::to_error_code (tokens::token_status::insufficient_allowance));
}

TEST (errors, token_status_names)
{
	ASSERT_EQ ("progress", tokens::to_string (tokens::token_status::progress));
	ASSERT_EQ ("insufficient_allowance", tokens::to_string (tokens::token_status::insufficient_allowance));
}

TEST (errors, token_result)
{
	tokens::token_result success;
	ASSERT_FALSE (success);
	ASSERT_FALSE (success.error_code ());
	tokens::token_result failure{ tokens::token_status::balance_overflow };
	ASSERT_TRUE (failure);
	ASSERT_EQ (tokens::error_token::balance_overflow, failure.error_code ());
	ASSERT_NE (success, failure);
	auto shortfall = tokens::token_result::shortfall (tokens::token_status::insufficient_balance, 200, 100);
	ASSERT_EQ (200, shortfall.required);
	ASSERT_EQ (100, shortfall.available);
	// Amounts take part in equality
	ASSERT_NE (shortfall, tokens::token_result::shortfall (tokens::token_status::insufficient_balance, 200, 99));
	ASSERT_NE (shortfall, tokens::token_result::shortfall (tokens::token_status::insufficient_allowance, 200, 100));
}

TEST (errors, token_result_stream)
{
	std::stringstream stream;
	stream << tokens::token_result::shortfall (tokens::token_status::insufficient_allowance, 100, 50);
	ASSERT_EQ ("insufficient_allowance (required: 100, available: 50)", stream.str ());
	std::stringstream stream2;
	stream2 << tokens::token_result{ tokens::token_status::self_approval };
	ASSERT_EQ ("self_approval", stream2.str ());
}

TEST (errors, error_adapter)
{
	tokens::error error;
	ASSERT_FALSE (error);
	ASSERT_EQ ("", error.get_message ());
	error = tokens::error_config::invalid_value;
	ASSERT_TRUE (error);
	ASSERT_EQ ("Invalid configuration value", error.get_message ());
	error.set ("genesis_amount is not a number", tokens::error_config::invalid_value);
	ASSERT_EQ ("genesis_amount is not a number", error.get_message ());
	// Assigning a code drops the previous message
	error = tokens::error_config::missing_value;
	ASSERT_EQ ("Missing value in configuration", error.get_message ());
	error.clear ();
	ASSERT_FALSE (error);
	ASSERT_EQ ("", error.get_message ());
}

TEST (errors, error_set_message)
{
	tokens::error error;
	error.set_message ("custom");
	ASSERT_TRUE (error);
	ASSERT_EQ (tokens::error_common::generic, std::error_code (error));
	ASSERT_EQ ("custom", error.get_message ());
	// Keeps an existing code
	error = tokens::error_config::missing_value;
	error.set_message ("ledger table is missing");
	ASSERT_EQ (tokens::error_config::missing_value, std::error_code (error));
	ASSERT_EQ ("ledger table is missing", error.get_message ());
	error.set ("config", tokens::error_config::generic);
	ASSERT_EQ (tokens::error_config::generic, std::error_code (error));
}

TEST (errors, error_from_exception)
{
	tokens::error error{ std::runtime_error ("failure") };
	ASSERT_TRUE (error);
	ASSERT_EQ (tokens::error_common::exception, std::error_code (error));
	ASSERT_EQ ("failure", error.get_message ());
	tokens::error assigned;
	assigned = std::invalid_argument ("bad argument");
	ASSERT_EQ (tokens::error_common::exception, std::error_code (assigned));
	ASSERT_EQ ("bad argument", assigned.get_message ());
	ASSERT_EQ ("Exception thrown", std::error_code (tokens::error_common::exception).message ());
}
