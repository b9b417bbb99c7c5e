#ifndef AGENTDESK_TESTINGMACROS_HPP
#define AGENTDESK_TESTINGMACROS_HPP

#ifdef BUILD_TESTS
#include <utility>

// NOLINTBEGIN
#define EXPOSE_PROPERTY_FOR_TESTING(term) public: auto get##term () { return &term; } auto set##term (decltype(term) value) { term = std::move(value); }
#define EXPOSE_PROPERTY_FOR_TESTING_READONLY(term) public: auto get##term () { return &term; }
// NOLINTEND
#else
// Noop
#define EXPOSE_PROPERTY_FOR_TESTING(x)
#define EXPOSE_PROPERTY_FOR_TESTING_READONLY(x)
#endif

#endif // AGENTDESK_TESTINGMACROS_HPP
