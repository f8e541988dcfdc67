// the module name defines main() and the master test suite, every other
// test source only includes boost-unit-test.hpp
#define BOOST_TEST_MODULE errata test suite
#include "boost-unit-test.hpp"
