#include <tokens/secure/allowance_info.hpp>

tokens::allowance_key::allowance_key (tokens::account const & owner_a, tokens::account const & spender_a) :
	owner (owner_a),
	spender (spender_a)
{
}

bool tokens::allowance_key::operator== (tokens::allowance_key const & other_a) const
{
	return owner == other_a.owner && spender == other_a.spender;
}

bool tokens::allowance_key::operator< (tokens::allowance_key const & other_a) const
{
	return owner == other_a.owner ? spender < other_a.spender : owner < other_a.owner;
}
