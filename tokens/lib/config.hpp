#pragma once

#include <tokens/lib/errors.hpp>
#include <tokens/lib/tomlconfig.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace tokens
{
/**
 * Parses the toml file at \p toml_config_path into \p toml, with \p config_overrides entries (one toml line each) taking precedence.
 * A missing file is not an error, only the overrides are parsed in that case.
 */
tokens::error read_toml_with_overrides (std::filesystem::path const & toml_config_path, std::vector<std::string> const & config_overrides, tokens::tomlconfig & toml);

/**
 * Loads a config object from `<data_path>/<config_filename>`, starting from \p fallback
 * @throws std::runtime_error if the file cannot be parsed or contains invalid values
 */
template <typename T>
T load_config_file (T fallback, std::filesystem::path const & config_filename, std::filesystem::path const & data_path, std::vector<std::string> const & config_overrides)
{
	tokens::tomlconfig toml;
	auto error = tokens::read_toml_with_overrides (data_path / config_filename, config_overrides, toml);
	if (error)
	{
		throw std::runtime_error (error.get_message ());
	}

	T config = fallback;
	error = config.deserialize_toml (toml);
	if (error)
	{
		throw std::runtime_error (error.get_message ());
	}
	return config;
}
}
