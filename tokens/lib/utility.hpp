#pragma once

#include <boost/current_function.hpp>
#include <boost/preprocessor/facilities/overload.hpp>

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

/** Prints the failed check with a stacktrace to stderr and aborts */
[[noreturn]] void assert_internal (char const * check_expr, char const * func, char const * file, unsigned int line, bool is_release_assert, std::string_view error = "");

// release_assert (check) or release_assert (check, message), active in every build type
#define release_assert_1(check) check ? (void)0 : assert_internal (#check, BOOST_CURRENT_FUNCTION, __FILE__, __LINE__, true)
#define release_assert_2(check, error_msg) check ? (void)0 : assert_internal (#check, BOOST_CURRENT_FUNCTION, __FILE__, __LINE__, true, error_msg)
#define release_assert(...) BOOST_PP_OVERLOAD (release_assert_, __VA_ARGS__) (__VA_ARGS__)

// Same as release_assert, compiled out with NDEBUG
#ifdef NDEBUG
#define debug_assert(...) (void)0
#else
#define debug_assert_1(check) check ? (void)0 : assert_internal (#check, BOOST_CURRENT_FUNCTION, __FILE__, __LINE__, false)
#define debug_assert_2(check, error_msg) check ? (void)0 : assert_internal (#check, BOOST_CURRENT_FUNCTION, __FILE__, __LINE__, false, error_msg)
#define debug_assert(...) BOOST_PP_OVERLOAD (debug_assert_, __VA_ARGS__) (__VA_ARGS__)
#endif

namespace tokens::util
{
/** Streams transform (element) for each element of \p container, separated by \p delimiter */
template <class Container, class Func>
std::string join (Container const & container, std::string_view delimiter, Func transform)
{
	std::stringstream ss;
	std::string_view separator;
	for (auto const & element : container)
	{
		ss << separator << transform (element);
		separator = delimiter;
	}
	return ss.str ();
}

/** Splits \p input at every occurrence of \p delimiter. Empty parts are kept, so the result is never empty */
inline std::vector<std::string> split (std::string_view input, std::string_view delimiter)
{
	std::vector<std::string> result;
	for (auto pos = input.find (delimiter); pos != std::string_view::npos; pos = input.find (delimiter))
	{
		result.emplace_back (input.substr (0, pos));
		input.remove_prefix (pos + delimiter.size ());
	}
	result.emplace_back (input);
	return result;
}
}
