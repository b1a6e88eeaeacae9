#pragma once

#include <tokens/lib/logging_enums.hpp>
#include <tokens/lib/tomlconfig.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace tokens
{
/** Sinks and levels, read from the [log] table of config-log.toml */
class log_config final
{
public:
	tokens::error serialize_toml (tokens::tomlconfig &) const;
	tokens::error deserialize_toml (tokens::tomlconfig &);

	tokens::log::level default_level{ tokens::log::level::info };
	tokens::log::level flush_level{ tokens::log::level::error };
	/** Levels overriding default_level for single tags */
	std::map<tokens::log::type, tokens::log::level> levels;

	struct console_config
	{
		bool enable{ true };
		bool colors{ true };
	};

	/** Rotating log files under <data_path>/log, requires a data path */
	struct file_config
	{
		bool enable{ false };
		std::size_t max_size{ 32 * 1024 * 1024 };
		std::size_t rotation_count{ 4 };
	};

	console_config console;
	file_config file;

	/** Info level to the console */
	static log_config console_default ();
	/** Nothing below off, keeps test output readable unless TOKENS_LOG is set */
	static log_config tests_default ();
};

/**
 * Reads config-log.toml from \p data_path on top of \p fallback, then applies the TOKENS_LOG and TOKENS_LOG_LEVELS environment variables.
 * Returns \p fallback if the file is invalid.
 */
tokens::log_config load_log_config (tokens::log_config fallback, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides = {});

/**
 * Tagged logging through one spdlog logger per tag, all writing to the process wide sinks.
 * A logger created before one of the initialize functions ran writes nowhere.
 */
class logger final
{
public:
	explicit logger (std::string identifier = "");
	~logger ();

	logger (logger const &) = delete;
	logger & operator= (logger const &) = delete;

	static void initialize (tokens::log_config fallback, std::optional<std::filesystem::path> data_path = std::nullopt, std::vector<std::string> const & config_overrides = {});
	/** Reads config-log.toml from the working directory, logger names include the identifier */
	static void initialize_for_tests (tokens::log_config fallback);
	/** Discards everything */
	static void initialize_dummy ();
	static bool is_initialized ();
	static void flush ();

	template <class... Args>
	void log (tokens::log::level level, tokens::log::type tag, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (tag).log (to_spdlog_level (level), fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void debug (tokens::log::type tag, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (tag).debug (fmt, std::forward<Args> (args)...);
	}

	template <class... Args>
	void info (tokens::log::type tag, spdlog::format_string_t<Args...> fmt, Args &&... args)
	{
		get_logger (tag).info (fmt, std::forward<Args> (args)...);
	}

	/** Level the logger for \p tag is created with under the current configuration */
	tokens::log::level configured_level (tokens::log::type tag) const;

private:
	static bool global_initialized;
	static bool global_qualified_names;
	static tokens::log_config global_config;
	static std::vector<spdlog::sink_ptr> global_sinks;

	static void initialize_sinks (tokens::log_config const &, std::optional<std::filesystem::path> const & data_path);
	static spdlog::level::level_enum to_spdlog_level (tokens::log::level);

	spdlog::logger & get_logger (tokens::log::type);

	std::string const identifier;
	std::map<tokens::log::type, std::shared_ptr<spdlog::logger>> spd_loggers;
	std::shared_mutex mutex;
};

/**
 * Logger for code that isn't handed one, such as a ledger constructed without a logger.
 * Sets up discarding sinks if logging wasn't initialized yet.
 */
tokens::logger & default_logger ();
}
