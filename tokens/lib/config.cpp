#include <tokens/lib/config.hpp>

#include <sstream>

tokens::error tokens::read_toml_with_overrides (std::filesystem::path const & toml_config_path, std::vector<std::string> const & config_overrides, tokens::tomlconfig & toml)
{
	if (std::filesystem::exists (toml_config_path))
	{
		return toml.read (toml_config_path, config_overrides);
	}
	std::stringstream empty;
	return toml.read (empty, config_overrides);
}
