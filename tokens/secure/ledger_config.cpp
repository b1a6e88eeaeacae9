#include <tokens/lib/config.hpp>
#include <tokens/lib/tomlconfig.hpp>
#include <tokens/secure/ledger_config.hpp>

tokens::error tokens::ledger_config::serialize_toml (tokens::tomlconfig & toml) const
{
	tokens::tomlconfig ledger_l;
	ledger_l.put ("genesis_account", genesis_account.to_string ());
	// Stored as a string, toml integers are signed 64 bit
	ledger_l.put ("genesis_amount", tokens::to_string_dec (genesis_amount));
	toml.put_child ("ledger", ledger_l);
	return toml.get_error ();
}

tokens::error tokens::ledger_config::deserialize_toml (tokens::tomlconfig & toml)
{
	auto ledger_l = toml.get_optional_child ("ledger");
	if (ledger_l)
	{
		auto account_l = genesis_account.to_string ();
		ledger_l->get ("genesis_account", account_l);
		if (account_l.empty ())
		{
			toml.get_error ().set ("genesis_account must not be empty", tokens::error_config::invalid_value);
		}
		else
		{
			genesis_account = tokens::account{ account_l };
		}
		ledger_l->get ("genesis_amount", genesis_amount);
	}
	return toml.get_error ();
}

std::filesystem::path tokens::get_ledger_toml_config_path (std::filesystem::path const & data_path)
{
	return data_path / "config-ledger.toml";
}

tokens::error tokens::read_ledger_config_toml (std::filesystem::path const & data_path_a, tokens::ledger_config & config_a, std::vector<std::string> const & config_overrides)
{
	tokens::tomlconfig toml;
	auto error = tokens::read_toml_with_overrides (tokens::get_ledger_toml_config_path (data_path_a), config_overrides, toml);

	if (!error)
	{
		error = config_a.deserialize_toml (toml);
	}

	return error;
}
