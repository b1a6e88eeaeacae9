#pragma once

#include <tokens/lib/errors.hpp>
#include <tokens/lib/numbers.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace tokens
{
class tomlconfig;

/** Genesis parameters a ledger is created from, read from the [ledger] table */
class ledger_config final
{
public:
	tokens::error serialize_toml (tokens::tomlconfig &) const;
	tokens::error deserialize_toml (tokens::tomlconfig &);

	tokens::account genesis_account{ "genesis" };
	tokens::amount genesis_amount{ 0 };
};

std::filesystem::path get_ledger_toml_config_path (std::filesystem::path const & data_path);

/**
 * Reads config-ledger.toml from \p data_path_a into \p config_a. A missing file leaves the defaults in place.
 * Each entry of \p config_overrides is a toml line taking precedence over the file.
 */
tokens::error read_ledger_config_toml (std::filesystem::path const & data_path_a, tokens::ledger_config & config_a, std::vector<std::string> const & config_overrides = std::vector<std::string> ());
}
