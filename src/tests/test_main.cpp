#define BOOST_TEST_MODULE agentdesk_tests
#include <boost/test/unit_test.hpp>
