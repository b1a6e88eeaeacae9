#include <tokens/lib/numbers.hpp>

#include <utility>

std::string tokens::to_string_dec (tokens::amount amount_a)
{
	return std::to_string (amount_a);
}

tokens::account::account (std::string name_a) :
	name (std::move (name_a))
{
}

tokens::account::account (char const * name_a) :
	name (name_a)
{
}

bool tokens::account::operator== (tokens::account const & other_a) const
{
	return name == other_a.name;
}

bool tokens::account::operator!= (tokens::account const & other_a) const
{
	return !(*this == other_a);
}

bool tokens::account::operator< (tokens::account const & other_a) const
{
	return name < other_a.name;
}

bool tokens::account::is_empty () const
{
	return name.empty ();
}

std::string const & tokens::account::to_string () const
{
	return name;
}
