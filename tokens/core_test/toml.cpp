#include <tokens/lib/config.hpp>
#include <tokens/lib/tomlconfig.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <limits>
#include <map>
#include <sstream>
#include <string>

TEST (toml, read_values)
{
	std::stringstream ss;
	ss << R"toml(
	name = "ledger"
	count = 42
	enabled = true
	[child]
	value = "18446744073709551615"
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	ASSERT_EQ ("ledger", toml.get<std::string> ("name"));
	ASSERT_EQ (42, toml.get<uint64_t> ("count"));
	ASSERT_TRUE (toml.get<bool> ("enabled"));
	// Integers also read as strings
	ASSERT_EQ ("42", toml.get<std::string> ("count"));
	auto child = toml.get_optional_child ("child");
	ASSERT_TRUE (child);
	ASSERT_EQ (std::numeric_limits<uint64_t>::max (), child->get<uint64_t> ("value"));
	ASSERT_FALSE (toml.get_error ());
}

// Missing keys and tables leave targets alone and aren't errors
TEST (toml, missing_keys)
{
	tokens::tomlconfig toml;
	uint64_t value{ 7 };
	toml.get ("missing", value);
	ASSERT_EQ (7, value);
	ASSERT_FALSE (toml.has_key ("missing"));
	ASSERT_FALSE (toml.get_optional_child ("missing"));
	ASSERT_FALSE (toml.get_error ());
}

TEST (toml, invalid_value)
{
	std::stringstream ss;
	ss << R"toml(
	amount = "ten"
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	uint64_t value{ 5 };
	toml.get ("amount", value);
	ASSERT_EQ (5, value);
	ASSERT_EQ (tokens::error_config::invalid_value, std::error_code (toml.get_error ()));
	ASSERT_EQ ("amount is not a 64-bit unsigned integer", toml.get_error ().get_message ());
}

TEST (toml, negative_unsigned)
{
	std::stringstream ss;
	ss << R"toml(
	amount = -1
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	uint64_t value{ 5 };
	toml.get ("amount", value);
	ASSERT_EQ (tokens::error_config::invalid_value, std::error_code (toml.get_error ()));
	ASSERT_EQ (5, value);
}

TEST (toml, invalid_bool)
{
	std::stringstream ss;
	ss << R"toml(
	flag = "yes"
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	bool flag{ true };
	toml.get ("flag", flag);
	ASSERT_TRUE (flag);
	ASSERT_EQ ("flag is not a boolean", toml.get_error ().get_message ());
}

TEST (toml, child_not_a_table)
{
	std::stringstream ss;
	ss << R"toml(
	ledger = 5
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	ASSERT_FALSE (toml.get_optional_child ("ledger"));
	ASSERT_EQ (tokens::error_config::invalid_value, std::error_code (toml.get_error ()));
}

// The first error stays until cleared, child tables report into the same error
TEST (toml, first_error_kept)
{
	std::stringstream ss;
	ss << R"toml(
	first = "a"
	[child]
	second = "b"
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	uint64_t value{ 0 };
	toml.get ("first", value);
	toml.get_optional_child ("child")->get ("second", value);
	ASSERT_EQ ("first is not a 64-bit unsigned integer", toml.get_error ().get_message ());
	toml.get_error ().clear ();
	toml.get_optional_child ("child")->get ("second", value);
	ASSERT_EQ ("second is not a 64-bit unsigned integer", toml.get_error ().get_message ());
}

TEST (toml, parse_error)
{
	std::stringstream ss;
	ss << R"toml(
	key = = value
	)toml";

	tokens::tomlconfig toml;
	ASSERT_TRUE (toml.read (ss));
	ASSERT_EQ (tokens::error_common::exception, std::error_code (toml.get_error ()));
}

TEST (toml, overrides_take_precedence)
{
	std::stringstream ss;
	ss << R"toml(
	top = 1
	[ledger]
	genesis_account = "alice"
	genesis_amount = 100
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss, { "[ledger]", "genesis_amount = 500" }));
	ASSERT_EQ (1, toml.get<uint64_t> ("top"));
	auto ledger = toml.get_optional_child ("ledger");
	ASSERT_TRUE (ledger);
	// Tables merge, the override replaces only its own keys
	ASSERT_EQ ("alice", ledger->get<std::string> ("genesis_account"));
	ASSERT_EQ (500, ledger->get<uint64_t> ("genesis_amount"));
}

TEST (toml, missing_file)
{
	tokens::tomlconfig toml;
	auto path = std::filesystem::temp_directory_path () / "tokens_toml_missing_file.toml";
	std::filesystem::remove (path);
	ASSERT_EQ (tokens::error_config::missing_value, std::error_code (toml.read (path)));
}

TEST (toml, read_with_overrides_missing_file)
{
	tokens::tomlconfig toml;
	auto path = std::filesystem::temp_directory_path () / "tokens_toml_overrides_only.toml";
	std::filesystem::remove (path);
	ASSERT_FALSE (tokens::read_toml_with_overrides (path, { "value = 3" }, toml));
	ASSERT_EQ (3, toml.get<uint64_t> ("value"));
}

TEST (toml, put_and_write)
{
	tokens::tomlconfig toml;
	toml.put ("name", std::string ("tokens"));
	tokens::tomlconfig child;
	child.put ("enabled", true);
	toml.put_child ("child", child);

	std::stringstream ss;
	ss << toml.to_string ();
	tokens::tomlconfig read;
	ASSERT_FALSE (read.read (ss));
	ASSERT_EQ ("tokens", read.get<std::string> ("name"));
	ASSERT_TRUE (read.get_optional_child ("child")->get<bool> ("enabled"));
}

TEST (toml, entries)
{
	std::stringstream ss;
	ss << R"toml(
	ledger = "info"
	count = 3
	[nested]
	skipped = true
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	auto entries = toml.entries ();
	ASSERT_EQ (2, entries.size ());
	std::map<std::string, std::string> sorted (entries.begin (), entries.end ());
	ASSERT_EQ ("info", sorted["ledger"]);
	ASSERT_EQ ("3", sorted["count"]);
}
