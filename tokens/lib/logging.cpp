#include <tokens/lib/config.hpp>
#include <tokens/lib/env.hpp>
#include <tokens/lib/logging.hpp>
#include <tokens/lib/utility.hpp>

#include <fmt/chrono.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>

/*
 * log_config
 */

tokens::log_config tokens::log_config::console_default ()
{
	return log_config{};
}

tokens::log_config tokens::log_config::tests_default ()
{
	log_config config{};
	config.default_level = tokens::log::level::off;
	return config;
}

tokens::error tokens::log_config::serialize_toml (tokens::tomlconfig & toml) const
{
	tokens::tomlconfig log_l;
	log_l.put ("default_level", std::string{ to_string (default_level) });
	log_l.put ("flush_level", std::string{ to_string (flush_level) });

	tokens::tomlconfig console_l;
	console_l.put ("enable", console.enable);
	console_l.put ("colors", console.colors);
	log_l.put_child ("console", console_l);

	tokens::tomlconfig file_l;
	file_l.put ("enable", file.enable);
	file_l.put ("max_size", static_cast<int64_t> (file.max_size));
	file_l.put ("rotation_count", static_cast<int64_t> (file.rotation_count));
	log_l.put_child ("file", file_l);

	tokens::tomlconfig levels_l;
	for (auto const & [tag, level] : levels)
	{
		levels_l.put (std::string{ to_string (tag) }, std::string{ to_string (level) });
	}
	log_l.put_child ("levels", levels_l);

	toml.put_child ("log", log_l);
	return toml.get_error ();
}

tokens::error tokens::log_config::deserialize_toml (tokens::tomlconfig & toml)
{
	auto log_l = toml.get_optional_child ("log");
	if (!log_l)
	{
		return toml.get_error ();
	}
	try
	{
		if (log_l->has_key ("default_level"))
		{
			default_level = tokens::log::parse_level (log_l->get<std::string> ("default_level"));
		}
		if (log_l->has_key ("flush_level"))
		{
			flush_level = tokens::log::parse_level (log_l->get<std::string> ("flush_level"));
		}
	}
	catch (std::invalid_argument const & ex)
	{
		toml.get_error ().set (ex.what (), tokens::error_config::invalid_value);
	}

	if (auto console_l = log_l->get_optional_child ("console"))
	{
		console_l->get ("enable", console.enable);
		console_l->get ("colors", console.colors);
	}
	if (auto file_l = log_l->get_optional_child ("file"))
	{
		file_l->get ("enable", file.enable);
		file_l->get ("max_size", file.max_size);
		file_l->get ("rotation_count", file.rotation_count);
	}
	if (auto levels_l = log_l->get_optional_child ("levels"))
	{
		for (auto const & [tag, level] : levels_l->entries ())
		{
			// Unknown tags are skipped so config files outlive removed tags
			try
			{
				levels[tokens::log::parse_type (tag)] = tokens::log::parse_level (level);
			}
			catch (std::invalid_argument const & ex)
			{
				std::cerr << "Ignoring [log.levels] entry: " << ex.what () << std::endl;
			}
		}
	}
	return toml.get_error ();
}

// Logging isn't set up while its own config is read, problems go to std::cerr
tokens::log_config tokens::load_log_config (tokens::log_config fallback, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides)
{
	tokens::log_config config;
	try
	{
		config = tokens::load_config_file<tokens::log_config> (fallback, "config-log.toml", data_path, config_overrides);
	}
	catch (std::runtime_error const & ex)
	{
		std::cerr << "Unable to load log config, using defaults: " << ex.what () << std::endl;
		return fallback;
	}

	// TOKENS_LOG=debug
	if (auto env_level = tokens::env::get ("TOKENS_LOG"))
	{
		try
		{
			config.default_level = tokens::log::parse_level (*env_level);
		}
		catch (std::invalid_argument const & ex)
		{
			std::cerr << "Ignoring TOKENS_LOG: " << ex.what () << std::endl;
		}
	}

	// TOKENS_LOG_LEVELS=ledger=trace,test=debug
	if (auto env_levels = tokens::env::get ("TOKENS_LOG_LEVELS"))
	{
		for (auto const & entry : tokens::util::split (*env_levels, ","))
		{
			try
			{
				auto tag_level = tokens::util::split (entry, "=");
				if (tag_level.size () != 2)
				{
					throw std::invalid_argument ("Expected tag=level, got: " + entry);
				}
				config.levels[tokens::log::parse_type (tag_level[0])] = tokens::log::parse_level (tag_level[1]);
			}
			catch (std::invalid_argument const & ex)
			{
				std::cerr << "Ignoring TOKENS_LOG_LEVELS entry: " << ex.what () << std::endl;
			}
		}
	}
	return config;
}

/*
 * logger
 */

bool tokens::logger::global_initialized{ false };
bool tokens::logger::global_qualified_names{ false };
tokens::log_config tokens::logger::global_config{};
std::vector<spdlog::sink_ptr> tokens::logger::global_sinks{};

void tokens::logger::initialize (tokens::log_config fallback, std::optional<std::filesystem::path> data_path, std::vector<std::string> const & config_overrides)
{
	auto config = data_path ? tokens::load_log_config (std::move (fallback), *data_path, config_overrides) : std::move (fallback);
	initialize_sinks (config, data_path);
	global_qualified_names = false;
	global_initialized = true;
}

void tokens::logger::initialize_for_tests (tokens::log_config fallback)
{
	auto const working_path = std::filesystem::current_path ();
	initialize_sinks (tokens::load_log_config (std::move (fallback), working_path), working_path);
	for (auto & sink : global_sinks)
	{
		sink->set_formatter (std::make_unique<spdlog::pattern_formatter> ("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v"));
	}
	// Tests run several ledgers side by side, told apart by the logger identifier
	global_qualified_names = true;
	global_initialized = true;
}

void tokens::logger::initialize_dummy ()
{
	auto config = tokens::log_config::tests_default ();
	config.console.enable = false;
	initialize_sinks (config, std::nullopt);
	global_sinks.push_back (std::make_shared<spdlog::sinks::null_sink_mt> ());
	global_qualified_names = false;
	global_initialized = true;
}

bool tokens::logger::is_initialized ()
{
	return global_initialized;
}

void tokens::logger::initialize_sinks (tokens::log_config const & config, std::optional<std::filesystem::path> const & data_path)
{
	global_config = config;
	global_sinks.clear ();
	spdlog::set_automatic_registration (false);
	spdlog::set_level (to_spdlog_level (config.default_level));

	if (config.console.enable)
	{
		if (config.console.colors)
		{
			global_sinks.push_back (std::make_shared<spdlog::sinks::stdout_color_sink_mt> ());
		}
		else
		{
			global_sinks.push_back (std::make_shared<spdlog::sinks::stdout_sink_mt> ());
		}
	}

	if (config.file.enable)
	{
		release_assert (data_path.has_value (), "file logging requires a data path");
		auto const now = std::chrono::system_clock::now ();
		auto const filename = fmt::format ("log_{:%Y-%m-%d_%H-%M-%S}.log", fmt::localtime (std::chrono::system_clock::to_time_t (now)));
		auto const log_path = std::filesystem::absolute (*data_path / "log" / filename);
		std::cerr << "Logging to file: " << log_path.string () << std::endl;
		global_sinks.push_back (std::make_shared<spdlog::sinks::rotating_file_sink_mt> (log_path.string (), config.file.max_size, config.file.rotation_count));
	}
}

void tokens::logger::flush ()
{
	for (auto & sink : global_sinks)
	{
		sink->flush ();
	}
}

tokens::logger::logger (std::string identifier_a) :
	identifier{ std::move (identifier_a) }
{
}

tokens::logger::~logger ()
{
	flush ();
}

tokens::log::level tokens::logger::configured_level (tokens::log::type tag) const
{
	auto existing = global_config.levels.find (tag);
	return existing != global_config.levels.end () ? existing->second : global_config.default_level;
}

spdlog::logger & tokens::logger::get_logger (tokens::log::type tag)
{
	{
		std::shared_lock lock{ mutex };
		if (auto existing = spd_loggers.find (tag); existing != spd_loggers.end ())
		{
			return *existing->second;
		}
	}
	std::unique_lock lock{ mutex };
	auto name = global_qualified_names ? fmt::format ("{}::{}", identifier, to_string (tag)) : std::string{ to_string (tag) };
	auto spd_logger = std::make_shared<spdlog::logger> (std::move (name), global_sinks.begin (), global_sinks.end ());
	spd_logger->set_level (to_spdlog_level (configured_level (tag)));
	spd_logger->flush_on (to_spdlog_level (global_config.flush_level));
	// Another thread may have created it meanwhile, emplace keeps the first
	return *spd_loggers.emplace (tag, std::move (spd_logger)).first->second;
}

spdlog::level::level_enum tokens::logger::to_spdlog_level (tokens::log::level level)
{
	switch (level)
	{
		case tokens::log::level::trace:
			return spdlog::level::trace;
		case tokens::log::level::debug:
			return spdlog::level::debug;
		case tokens::log::level::info:
			return spdlog::level::info;
		case tokens::log::level::warn:
			return spdlog::level::warn;
		case tokens::log::level::error:
			return spdlog::level::err;
		case tokens::log::level::critical:
			return spdlog::level::critical;
		case tokens::log::level::off:
			return spdlog::level::off;
	}
	debug_assert (false, "Invalid log level");
	return spdlog::level::off;
}

tokens::logger & tokens::default_logger ()
{
	static tokens::logger logger{ "default" };
	if (!tokens::logger::is_initialized ())
	{
		tokens::logger::initialize_dummy ();
	}
	return logger;
}
