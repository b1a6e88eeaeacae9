#include <gtest/gtest.h>

// Logging stays uninitialized, tests here cover code running before any logging setup
int main (int argc, char ** argv)
{
	testing::InitGoogleTest (&argc, argv);
	return RUN_ALL_TESTS ();
}
