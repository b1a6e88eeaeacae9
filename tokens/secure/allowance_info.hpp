#pragma once

#include <tokens/lib/numbers.hpp>

#include <boost/container_hash/hash.hpp>

#include <functional>
#include <ostream>

namespace tokens
{
// Key of the allowances table
// The pair is ordered: the owner grants, the spender draws down
class allowance_key final
{
public:
	allowance_key () = default;
	allowance_key (tokens::account const & owner, tokens::account const & spender);
	bool operator== (tokens::allowance_key const &) const;
	bool operator< (tokens::allowance_key const &) const;
	tokens::account owner{};
	tokens::account spender{};

	friend std::ostream & operator<< (std::ostream & os, tokens::allowance_key const & key)
	{
		os << "Owner: " << key.owner << ", Spender: " << key.spender;
		return os;
	}
};
}

namespace std
{
template <>
struct hash<::tokens::allowance_key>
{
	size_t operator() (::tokens::allowance_key const & data_a) const
	{
		size_t seed{ 0 };
		// Order dependent, (a, b) and (b, a) land in different buckets
		boost::hash_combine (seed, hash<::tokens::account>{}(data_a.owner));
		boost::hash_combine (seed, hash<::tokens::account>{}(data_a.spender));
		return seed;
	}
};
}
