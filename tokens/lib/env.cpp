#include <tokens/lib/env.hpp>

#include <cstdlib>

std::optional<std::string> tokens::env::get (std::string_view name)
{
	std::string name_str{ name };
	if (auto value = std::getenv (name_str.c_str ()))
	{
		return std::string{ value };
	}
	return std::nullopt;
}
