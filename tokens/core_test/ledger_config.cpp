#include <tokens/lib/config.hpp>
#include <tokens/lib/tomlconfig.hpp>
#include <tokens/secure/ledger.hpp>
#include <tokens/secure/ledger_config.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace
{
/** Creates an empty directory under the temp path, removed on destruction */
class unique_directory
{
public:
	explicit unique_directory (std::string const & name) :
		path{ std::filesystem::temp_directory_path () / name }
	{
		std::filesystem::remove_all (path);
		std::filesystem::create_directories (path);
	}
	~unique_directory ()
	{
		std::error_code ec;
		std::filesystem::remove_all (path, ec);
	}
	std::filesystem::path const path;
};
}

TEST (ledger_config, defaults)
{
	tokens::ledger_config config;
	ASSERT_EQ (tokens::account{ "genesis" }, config.genesis_account);
	ASSERT_EQ (0, config.genesis_amount);
}

// Defaults are kept when the [ledger] table is absent
TEST (ledger_config, deserialize_empty)
{
	tokens::tomlconfig toml;
	tokens::ledger_config config;
	ASSERT_FALSE (config.deserialize_toml (toml));
	ASSERT_EQ (tokens::account{ "genesis" }, config.genesis_account);
	ASSERT_EQ (0, config.genesis_amount);
}

TEST (ledger_config, deserialize)
{
	std::stringstream ss;
	ss << R"toml(
	[ledger]
	genesis_account = "alice"
	genesis_amount = "18446744073709551615"
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	tokens::ledger_config config;
	ASSERT_FALSE (config.deserialize_toml (toml));
	ASSERT_EQ (tokens::account{ "alice" }, config.genesis_account);
	ASSERT_EQ (tokens::amount_max, config.genesis_amount);
}

// Integers are accepted as well as strings
TEST (ledger_config, deserialize_integer_amount)
{
	std::stringstream ss;
	ss << R"toml(
	[ledger]
	genesis_amount = 1000
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	tokens::ledger_config config;
	ASSERT_FALSE (config.deserialize_toml (toml));
	ASSERT_EQ (tokens::account{ "genesis" }, config.genesis_account);
	ASSERT_EQ (1000, config.genesis_amount);
}

TEST (ledger_config, empty_account)
{
	std::stringstream ss;
	ss << R"toml(
	[ledger]
	genesis_account = ""
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	tokens::ledger_config config;
	auto error = config.deserialize_toml (toml);
	ASSERT_EQ (tokens::error_config::invalid_value, std::error_code (error));
	ASSERT_EQ ("genesis_account must not be empty", error.get_message ());
}

TEST (ledger_config, negative_amount)
{
	std::stringstream ss;
	ss << R"toml(
	[ledger]
	genesis_amount = -5
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	tokens::ledger_config config;
	auto error = config.deserialize_toml (toml);
	ASSERT_EQ (tokens::error_config::invalid_value, std::error_code (error));
	ASSERT_EQ ("genesis_amount is not a 64-bit unsigned integer", error.get_message ());
}

TEST (ledger_config, amount_out_of_range)
{
	std::stringstream ss;
	ss << R"toml(
	[ledger]
	genesis_amount = "18446744073709551616"
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	tokens::ledger_config config;
	ASSERT_EQ (tokens::error_config::invalid_value, std::error_code (config.deserialize_toml (toml)));
}

TEST (ledger_config, serialize)
{
	tokens::ledger_config config;
	config.genesis_account = tokens::account{ "alice" };
	config.genesis_amount = tokens::amount_max;
	tokens::tomlconfig toml;
	ASSERT_FALSE (config.serialize_toml (toml));
	auto ledger = toml.get_optional_child ("ledger");
	ASSERT_TRUE (ledger);
	ASSERT_EQ ("alice", ledger->get<std::string> ("genesis_account"));
	ASSERT_EQ ("18446744073709551615", ledger->get<std::string> ("genesis_amount"));

	std::stringstream ss;
	ss << toml.to_string ();
	tokens::tomlconfig read;
	ASSERT_FALSE (read.read (ss));
	tokens::ledger_config config2;
	ASSERT_FALSE (config2.deserialize_toml (read));
	ASSERT_EQ (config.genesis_account, config2.genesis_account);
	ASSERT_EQ (config.genesis_amount, config2.genesis_amount);
}

TEST (ledger_config, read_missing_file)
{
	unique_directory dir{ "tokens_ledger_config_missing" };
	tokens::ledger_config config;
	ASSERT_FALSE (tokens::read_ledger_config_toml (dir.path, config));
	ASSERT_EQ (tokens::account{ "genesis" }, config.genesis_account);
	ASSERT_EQ (0, config.genesis_amount);
}

TEST (ledger_config, read_file)
{
	unique_directory dir{ "tokens_ledger_config_file" };
	{
		std::ofstream file (tokens::get_ledger_toml_config_path (dir.path));
		file << "[ledger]\ngenesis_account = \"treasury\"\ngenesis_amount = 250\n";
	}
	tokens::ledger_config config;
	ASSERT_FALSE (tokens::read_ledger_config_toml (dir.path, config));
	ASSERT_EQ (tokens::account{ "treasury" }, config.genesis_account);
	ASSERT_EQ (250, config.genesis_amount);
}

TEST (ledger_config, read_with_overrides)
{
	unique_directory dir{ "tokens_ledger_config_overrides" };
	{
		std::ofstream file (tokens::get_ledger_toml_config_path (dir.path));
		file << "[ledger]\ngenesis_account = \"treasury\"\ngenesis_amount = 250\n";
	}
	tokens::ledger_config config;
	ASSERT_FALSE (tokens::read_ledger_config_toml (dir.path, config, { "[ledger]", "genesis_amount = 400" }));
	ASSERT_EQ (tokens::account{ "treasury" }, config.genesis_account);
	ASSERT_EQ (400, config.genesis_amount);
}

TEST (ledger_config, overrides_without_file)
{
	unique_directory dir{ "tokens_ledger_config_overrides_only" };
	tokens::ledger_config config;
	ASSERT_FALSE (tokens::read_ledger_config_toml (dir.path, config, { "[ledger]", "genesis_account = \"alice\"" }));
	ASSERT_EQ (tokens::account{ "alice" }, config.genesis_account);
	ASSERT_EQ (0, config.genesis_amount);
}

TEST (ledger_config, load_config_file_invalid)
{
	unique_directory dir{ "tokens_ledger_config_invalid" };
	{
		std::ofstream file (tokens::get_ledger_toml_config_path (dir.path));
		file << "[ledger]\ngenesis_amount = \"lots\"\n";
	}
	ASSERT_THROW (tokens::load_config_file<tokens::ledger_config> (tokens::ledger_config{}, "config-ledger.toml", dir.path, {}), std::runtime_error);
}

TEST (ledger_config, ledger_from_config)
{
	unique_directory dir{ "tokens_ledger_config_ledger" };
	auto config = tokens::load_config_file<tokens::ledger_config> (tokens::ledger_config{}, "config-ledger.toml", dir.path, { "[ledger]", "genesis_account = \"alice\"", "genesis_amount = 1000" });
	tokens::ledger ledger{ config };
	ASSERT_EQ (1000, ledger.balance (tokens::account{ "alice" }));
	ASSERT_EQ (1000, ledger.total_supply ());
}
