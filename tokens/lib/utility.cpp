#include <tokens/lib/utility.hpp>

#include <boost/stacktrace.hpp>

#include <cstdlib>
#include <iostream>

void assert_internal (char const * check_expr, char const * func, char const * file, unsigned int line, bool is_release_assert, std::string_view error_msg)
{
	std::cerr << (is_release_assert ? "Release assertion" : "Assertion") << " (" << check_expr << ") failed in " << func << "\n"
			  << file << ":" << line << "\n";
	if (!error_msg.empty ())
	{
		std::cerr << "Error: " << error_msg << "\n";
	}
	std::cerr << "\n"
			  << boost::stacktrace::stacktrace () << std::endl;
	std::abort ();
}
