#include <tokens/lib/logging_enums.hpp>
#include <tokens/lib/utility.hpp>

#include <magic_enum.hpp>

#include <stdexcept>
#include <string>

std::string_view tokens::log::to_string (tokens::log::type tag)
{
	return magic_enum::enum_name (tag);
}

std::string_view tokens::log::to_string (tokens::log::level level)
{
	return magic_enum::enum_name (level);
}

std::vector<tokens::log::level> const & tokens::log::all_levels ()
{
	static std::vector<tokens::log::level> const all = [] () {
		auto const values = magic_enum::enum_values<tokens::log::level> ();
		return std::vector<tokens::log::level> (values.begin (), values.end ());
	}();
	return all;
}

tokens::log::level tokens::log::parse_level (std::string_view name)
{
	if (auto level = magic_enum::enum_cast<tokens::log::level> (name, magic_enum::case_insensitive))
	{
		return *level;
	}
	auto all_levels_str = tokens::util::join (all_levels (), ", ", [] (auto const & level) {
		return to_string (level);
	});
	throw std::invalid_argument ("Invalid log level: " + std::string (name) + ". Must be one of: " + all_levels_str);
}

tokens::log::type tokens::log::parse_type (std::string_view name)
{
	if (auto type = magic_enum::enum_cast<tokens::log::type> (name))
	{
		return *type;
	}
	throw std::invalid_argument ("Invalid log type: " + std::string (name));
}
