#include "gtest/gtest.h"

#include <tokens/lib/logging.hpp>

#include <boost/stacktrace.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>

namespace
{
void segfault_handler (int signum)
{
	std::cerr << "SIGSEGV\n"
			  << boost::stacktrace::stacktrace () << std::endl;
	std::_Exit (signum);
}
}

GTEST_API_ int main (int argc, char ** argv)
{
	std::signal (SIGSEGV, segfault_handler);
	tokens::logger::initialize_for_tests (tokens::log_config::tests_default ());
	testing::InitGoogleTest (&argc, argv);
	return RUN_ALL_TESTS ();
}
