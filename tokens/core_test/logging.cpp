#include <tokens/lib/logging.hpp>
#include <tokens/lib/logging_enums.hpp>
#include <tokens/lib/tomlconfig.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace
{
/** Sets an environment variable for the lifetime of the object */
class scoped_env
{
public:
	scoped_env (char const * name_a, char const * value_a) :
		name{ name_a }
	{
		::setenv (name, value_a, 1);
	}
	~scoped_env ()
	{
		::unsetenv (name);
	}
	char const * name;
};

std::filesystem::path empty_data_path (std::string const & name)
{
	auto path = std::filesystem::temp_directory_path () / name;
	std::filesystem::remove_all (path);
	std::filesystem::create_directories (path);
	return path;
}
}

TEST (log_parse, parse_level)
{
	ASSERT_EQ (tokens::log::level::debug, tokens::log::parse_level ("debug"));
	ASSERT_EQ (tokens::log::level::warn, tokens::log::parse_level ("WARN"));
	ASSERT_EQ (tokens::log::level::off, tokens::log::parse_level ("off"));
	ASSERT_THROW (tokens::log::parse_level ("verbose"), std::invalid_argument);
	ASSERT_THROW (tokens::log::parse_level (""), std::invalid_argument);
}

TEST (log_parse, parse_type)
{
	ASSERT_EQ (tokens::log::type::ledger, tokens::log::parse_type ("ledger"));
	ASSERT_EQ (tokens::log::type::test, tokens::log::parse_type ("test"));
	ASSERT_THROW (tokens::log::parse_type ("network"), std::invalid_argument);
	ASSERT_THROW (tokens::log::parse_type (""), std::invalid_argument);
}

TEST (log_parse, invalid_level_message)
{
	try
	{
		tokens::log::parse_level ("loud");
		FAIL () << "parse_level accepted an invalid level";
	}
	catch (std::invalid_argument const & ex)
	{
		ASSERT_EQ (std::string ("Invalid log level: loud. Must be one of: trace, debug, info, warn, error, critical, off"), ex.what ());
	}
}

TEST (log_parse, names)
{
	ASSERT_EQ ("ledger", tokens::log::to_string (tokens::log::type::ledger));
	ASSERT_EQ ("warn", tokens::log::to_string (tokens::log::level::warn));
	auto const & levels = tokens::log::all_levels ();
	ASSERT_EQ (7, levels.size ());
	ASSERT_EQ (tokens::log::level::trace, levels.front ());
	ASSERT_EQ (tokens::log::level::off, levels.back ());
}

TEST (log_config, presets)
{
	auto tests = tokens::log_config::tests_default ();
	ASSERT_EQ (tokens::log::level::off, tests.default_level);
	ASSERT_FALSE (tests.file.enable);

	auto console = tokens::log_config::console_default ();
	ASSERT_EQ (tokens::log::level::info, console.default_level);
	ASSERT_EQ (tokens::log::level::error, console.flush_level);
	ASSERT_TRUE (console.console.enable);
	ASSERT_FALSE (console.file.enable);
	ASSERT_TRUE (console.levels.empty ());
}

TEST (log_config, serialize)
{
	auto config = tokens::log_config::console_default ();
	config.file.enable = true;
	config.flush_level = tokens::log::level::warn;
	config.levels[tokens::log::type::ledger] = tokens::log::level::trace;
	config.file.max_size = 1024;
	config.console.colors = false;

	tokens::tomlconfig toml;
	ASSERT_FALSE (config.serialize_toml (toml));

	std::stringstream ss;
	ss << toml.to_string ();
	tokens::tomlconfig read;
	ASSERT_FALSE (read.read (ss));
	tokens::log_config config2;
	ASSERT_FALSE (config2.deserialize_toml (read));
	ASSERT_EQ (tokens::log::level::info, config2.default_level);
	ASSERT_EQ (tokens::log::level::warn, config2.flush_level);
	ASSERT_EQ (tokens::log::level::trace, config2.levels[tokens::log::type::ledger]);
	ASSERT_EQ (1024, config2.file.max_size);
	ASSERT_TRUE (config2.file.enable);
	ASSERT_FALSE (config2.console.colors);
	ASSERT_TRUE (config2.console.enable);
}

TEST (log_config, deserialize)
{
	std::stringstream ss;
	ss << R"toml(
	[log]
	default_level = "debug"
	[log.console]
	enable = false
	[log.levels]
	ledger = "trace"
	unknown = "info"
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	auto config = tokens::log_config::console_default ();
	ASSERT_FALSE (config.deserialize_toml (toml));
	ASSERT_EQ (tokens::log::level::debug, config.default_level);
	ASSERT_FALSE (config.console.enable);
	// Unknown logger names are skipped
	ASSERT_EQ (1, config.levels.size ());
	ASSERT_EQ (tokens::log::level::trace, config.levels[tokens::log::type::ledger]);
}

TEST (log_config, deserialize_invalid_level)
{
	std::stringstream ss;
	ss << R"toml(
	[log]
	default_level = "loud"
	)toml";

	tokens::tomlconfig toml;
	ASSERT_FALSE (toml.read (ss));
	tokens::log_config config;
	auto error = config.deserialize_toml (toml);
	ASSERT_TRUE (error);
	ASSERT_EQ (tokens::log::level::info, config.default_level);
}

// A missing config-log.toml keeps the fallback
TEST (log_config, load_missing_file)
{
	auto path = empty_data_path ("tokens_log_config_missing");
	auto config = tokens::load_log_config (tokens::log_config::tests_default (), path);
	ASSERT_EQ (tokens::log::level::off, config.default_level);
	std::filesystem::remove_all (path);
}

TEST (log_config, load_overrides)
{
	auto path = empty_data_path ("tokens_log_config_overrides");
	auto config = tokens::load_log_config (tokens::log_config::tests_default (), path, { "[log]", "default_level = \"warn\"" });
	ASSERT_EQ (tokens::log::level::warn, config.default_level);
	std::filesystem::remove_all (path);
}

TEST (log_config, load_invalid_file)
{
	auto path = empty_data_path ("tokens_log_config_invalid");
	{
		std::ofstream file (path / "config-log.toml");
		file << "[log]\ndefault_level = \"loud\"\n";
	}
	auto config = tokens::load_log_config (tokens::log_config::tests_default (), path);
	ASSERT_EQ (tokens::log::level::off, config.default_level);
	std::filesystem::remove_all (path);
}

TEST (log_config, environment)
{
	auto path = empty_data_path ("tokens_log_config_environment");
	scoped_env level{ "TOKENS_LOG", "debug" };
	scoped_env levels{ "TOKENS_LOG_LEVELS", "ledger=trace,test=error,bogus=info,broken" };
	auto config = tokens::load_log_config (tokens::log_config::tests_default (), path);
	ASSERT_EQ (tokens::log::level::debug, config.default_level);
	ASSERT_EQ (2, config.levels.size ());
	ASSERT_EQ (tokens::log::level::trace, config.levels[tokens::log::type::ledger]);
	ASSERT_EQ (tokens::log::level::error, config.levels[tokens::log::type::test]);
	std::filesystem::remove_all (path);
}

TEST (log_config, environment_invalid_level)
{
	auto path = empty_data_path ("tokens_log_config_environment_invalid");
	scoped_env level{ "TOKENS_LOG", "loud" };
	auto config = tokens::load_log_config (tokens::log_config::tests_default (), path);
	ASSERT_EQ (tokens::log::level::off, config.default_level);
	std::filesystem::remove_all (path);
}

TEST (logger, configured_level)
{
	tokens::logger logger{ "configured_level" };
	// Tests run with the tests_default preset
	ASSERT_EQ (tokens::log::level::off, logger.configured_level (tokens::log::type::ledger));
	logger.info (tokens::log::type::test, "Logging with level {}", "off");
	tokens::logger::flush ();
}

TEST (logger, initialize)
{
	auto config = tokens::log_config::tests_default ();
	config.levels[tokens::log::type::ledger] = tokens::log::level::warn;
	tokens::logger::initialize (config);
	{
		tokens::logger logger{ "initialize" };
		ASSERT_EQ (tokens::log::level::warn, logger.configured_level (tokens::log::type::ledger));
		ASSERT_EQ (tokens::log::level::off, logger.configured_level (tokens::log::type::test));
	}
	// Restore the test setup for the remaining tests
	tokens::logger::initialize_for_tests (tokens::log_config::tests_default ());
}
