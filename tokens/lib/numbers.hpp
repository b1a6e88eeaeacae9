#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>

namespace tokens
{
/** Token quantity. Balances, allowances and the total supply all use this width */
using amount = std::uint64_t;

amount constexpr amount_max = std::numeric_limits<amount>::max ();

/** Returns true if a + b does not fit in tokens::amount */
inline bool add_overflows (tokens::amount a, tokens::amount b)
{
	return a > amount_max - b;
}

std::string to_string_dec (tokens::amount);

/**
 * Opaque account identifier
 * Only equality, ordering and hashing are meaningful, the textual form carries no structure
 */
class account final
{
public:
	account () = default;
	explicit account (std::string);
	explicit account (char const *);

	bool operator== (tokens::account const &) const;
	bool operator!= (tokens::account const &) const;
	bool operator< (tokens::account const &) const;
	bool is_empty () const;
	std::string const & to_string () const;

	friend std::ostream & operator<< (std::ostream & os, tokens::account const & account_a)
	{
		return os << account_a.name;
	}

private:
	std::string name;
};
}

namespace std
{
template <>
struct hash<::tokens::account>
{
	size_t operator() (::tokens::account const & data_a) const
	{
		return hash<std::string>{}(data_a.to_string ());
	}
};
}
