#include <tokens/lib/tomlconfig.hpp>
#include <tokens/lib/utility.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

tokens::tomlconfig::tomlconfig () :
	tree{ cpptoml::make_table () },
	error{ std::make_shared<tokens::error> () }
{
}

tokens::tomlconfig::tomlconfig (std::shared_ptr<cpptoml::table> tree_a, std::shared_ptr<tokens::error> error_a) :
	tree{ std::move (tree_a) },
	error{ std::move (error_a) }
{
	debug_assert (tree != nullptr && error != nullptr);
}

tokens::error & tokens::tomlconfig::read (std::istream & stream_a, std::vector<std::string> const & overrides)
{
	std::stringstream overrides_stream;
	for (auto const & line : overrides)
	{
		overrides_stream << line << '\n';
	}
	try
	{
		auto base = cpptoml::parser{ stream_a }.parse ();
		apply_overrides (base, cpptoml::parser{ overrides_stream }.parse ());
		tree = base;
	}
	// cpptoml::parse_exception
	catch (std::runtime_error const & ex)
	{
		*error = ex;
	}
	return *error;
}

tokens::error & tokens::tomlconfig::read (std::filesystem::path const & path_a, std::vector<std::string> const & overrides)
{
	std::ifstream stream{ path_a };
	if (stream.fail ())
	{
		return error->set ("Unable to open configuration file: " + path_a.string (), tokens::error_config::missing_value);
	}
	return read (stream, overrides);
}

void tokens::tomlconfig::write (std::ostream & stream_a) const
{
	cpptoml::toml_writer writer{ stream_a, "" };
	tree->accept (writer);
}

std::string tokens::tomlconfig::to_string () const
{
	std::stringstream ss;
	write (ss);
	return ss.str ();
}

tokens::error & tokens::tomlconfig::get_error ()
{
	return *error;
}

bool tokens::tomlconfig::has_key (std::string const & key) const
{
	return tree->contains (key);
}

boost::optional<tokens::tomlconfig> tokens::tomlconfig::get_optional_child (std::string const & key)
{
	boost::optional<tomlconfig> result;
	if (auto child = tree->get_table (key))
	{
		result = tomlconfig{ child, error };
	}
	else if (tree->contains (key) && !*error)
	{
		error->set (key + " must be a table", tokens::error_config::invalid_value);
	}
	return result;
}

tokens::tomlconfig & tokens::tomlconfig::put_child (std::string const & key, tokens::tomlconfig const & child)
{
	tree->insert (key, child.tree);
	return *this;
}

std::vector<std::pair<std::string, std::string>> tokens::tomlconfig::entries () const
{
	std::vector<std::pair<std::string, std::string>> result;
	for (auto const & [key, value] : *tree)
	{
		if (auto text = value_as_string (key))
		{
			result.emplace_back (key, *text);
		}
	}
	return result;
}

boost::optional<std::string> tokens::tomlconfig::value_as_string (std::string const & key) const
{
	if (auto string_l = tree->get_as<std::string> (key))
	{
		return *string_l;
	}
	if (auto integer_l = tree->get_as<int64_t> (key))
	{
		return std::to_string (*integer_l);
	}
	if (auto boolean_l = tree->get_as<bool> (key))
	{
		return std::string{ *boolean_l ? "true" : "false" };
	}
	return boost::none;
}

void tokens::tomlconfig::apply_overrides (std::shared_ptr<cpptoml::table> const & base, std::shared_ptr<cpptoml::table> const & overrides)
{
	for (auto const & [key, value] : *overrides)
	{
		auto base_child = base->get_table (key);
		if (value->is_table () && base_child)
		{
			apply_overrides (base_child, overrides->get_table (key));
		}
		else
		{
			base->insert (key, value);
		}
	}
}
