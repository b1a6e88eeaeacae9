#pragma once

#include <string_view>
#include <vector>

namespace tokens::log
{
enum class level
{
	trace,
	debug,
	info,
	warn,
	error,
	critical,
	off,
};

/** Tag of the logger a message goes through, per tag levels are set in [log.levels] */
enum class type
{
	ledger,
	test,
};

std::string_view to_string (tokens::log::type);
std::string_view to_string (tokens::log::level);

/// Case insensitive
/// @throw std::invalid_argument if the input string does not match a log::level
tokens::log::level parse_level (std::string_view);

/// @throw std::invalid_argument if the input string does not match a log::type
tokens::log::type parse_type (std::string_view);

std::vector<tokens::log::level> const & all_levels ();
}
