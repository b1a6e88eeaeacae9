#include <tokens/lib/logging.hpp>
#include <tokens/secure/ledger.hpp>
#include <tokens/secure/ledger_config.hpp>

#include <gtest/gtest.h>

// Must run first, nothing else in this binary initializes logging
TEST (uninitialized_logging, ledger_construction)
{
	ASSERT_FALSE (tokens::logger::is_initialized ());
	tokens::ledger ledger{ tokens::account{ "alice" }, 1000 };
	ASSERT_TRUE (tokens::logger::is_initialized ());
	ASSERT_EQ (1000, ledger.balance (tokens::account{ "alice" }));
	ASSERT_EQ (tokens::token_status::progress, ledger.transfer (tokens::account{ "alice" }, tokens::account{ "bob" }, 10).code);
	ASSERT_EQ (10, ledger.balance (tokens::account{ "bob" }));
}

TEST (uninitialized_logging, ledger_from_config)
{
	tokens::ledger_config config;
	config.genesis_account = tokens::account{ "treasury" };
	config.genesis_amount = 500;
	tokens::ledger ledger{ config };
	ASSERT_EQ (500, ledger.total_supply ());
	ASSERT_EQ (500, ledger.balance (tokens::account{ "treasury" }));
}

// Creating a logger without initialization doesn't abort, its output is discarded
TEST (uninitialized_logging, standalone_logger)
{
	tokens::logger logger{ "standalone" };
	logger.info (tokens::log::type::test, "Discarded {}", 1);
	tokens::logger::flush ();
	ASSERT_EQ (&tokens::default_logger (), &tokens::default_logger ());
}
