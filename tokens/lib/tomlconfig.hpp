#pragma once

#include <tokens/lib/errors.hpp>

#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/optional.hpp>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <cpptoml.h>

namespace tokens
{
/**
 * A table of a config-*.toml document
 * Child tables share the error of the document they belong to, the first failure is kept until cleared.
 */
class tomlconfig
{
public:
	tomlconfig ();

	/** Parses \p stream_a, then \p overrides (one toml line each) on top of it. Tables are merged key by key */
	tokens::error & read (std::istream & stream_a, std::vector<std::string> const & overrides = {});
	/** Same as reading the file's stream, a file that can't be opened is error_config::missing_value */
	tokens::error & read (std::filesystem::path const & path_a, std::vector<std::string> const & overrides = {});
	void write (std::ostream & stream_a) const;
	std::string to_string () const;

	tokens::error & get_error ();
	bool has_key (std::string const & key) const;
	/** None if \p key is missing. A key holding anything but a table is error_config::invalid_value */
	boost::optional<tomlconfig> get_optional_child (std::string const & key);
	tomlconfig & put_child (std::string const & key, tomlconfig const & child);

	template <typename T>
	tomlconfig & put (std::string const & key, T const & value)
	{
		tree->insert (key, value);
		return *this;
	}

	/**
	 * Reads \p key into \p target, a missing key leaves \p target unchanged.
	 * A value that doesn't convert to T sets error_config::invalid_value and leaves \p target unchanged.
	 */
	template <typename T>
	tomlconfig & get (std::string const & key, T & target)
	{
		if (tree->contains (key))
		{
			T result{};
			auto value = value_as_string (key);
			if (value && convert (*value, result))
			{
				target = std::move (result);
			}
			else if (!*error)
			{
				error->set (key + " is not " + type_desc<T> (), tokens::error_config::invalid_value);
			}
		}
		return *this;
	}

	/** Value of \p key, or a default constructed T if it is missing */
	template <typename T>
	T get (std::string const & key)
	{
		T target{};
		get (key, target);
		return target;
	}

	/** Scalar entries of this table in their textual form, nested tables and arrays are skipped */
	std::vector<std::pair<std::string, std::string>> entries () const;

private:
	tomlconfig (std::shared_ptr<cpptoml::table> tree_a, std::shared_ptr<tokens::error> error_a);

	/** Strings, integers and booleans, none for tables and arrays */
	boost::optional<std::string> value_as_string (std::string const & key) const;

	template <typename T>
	static bool convert (std::string const & value, T & target)
	{
		if constexpr (std::is_same_v<T, bool>)
		{
			target = value == "true";
			return target || value == "false";
		}
		else if constexpr (std::is_same_v<T, std::string>)
		{
			target = value;
			return true;
		}
		else
		{
			// lexical_cast wraps negative input for unsigned targets
			bool negative = std::is_unsigned_v<T> && !value.empty () && value.front () == '-';
			return !negative && boost::conversion::try_lexical_convert (value, target);
		}
	}

	template <typename T>
	static std::string type_desc ()
	{
		if constexpr (std::is_same_v<T, bool>)
		{
			return "a boolean";
		}
		else if constexpr (std::is_same_v<T, std::uint64_t>)
		{
			return "a 64-bit unsigned integer";
		}
		else
		{
			return "a string";
		}
	}

	static void apply_overrides (std::shared_ptr<cpptoml::table> const & base, std::shared_ptr<cpptoml::table> const & overrides);

	std::shared_ptr<cpptoml::table> tree;
	std::shared_ptr<tokens::error> error;
};
}
