// Miscellaneous macros

#ifndef CROOKS_UTILS_H
#define CROOKS_UTILS_H

#include <exception>
#include <sstream>
#include <string>
#include <stdexcept>

// Convert 'x' to a string using arcane preprocessor tricks
#define STRINGIFY(x) #x
#define TO_STRING(x) STRINGIFY(x)

// Prints the file name and line number where it's expanded
#define LOCATION_IN_SOURCE __FILE__ ":" TO_STRING(__LINE__)

// Throws a std::runtime_error if 'test' fails
// - 'message' may be a chain of stream insertions, e.g. "got " << n << " values"
#define CROOKS_ASSERT(test,message) \
	if ( not (test) ) { \
		std::stringstream crooks_assert_ss; \
		crooks_assert_ss << "assertion failed in " << __func__ << "()" \
		                 << " (" << LOCATION_IN_SOURCE << ")\n" \
		                 << "  " << message << "\n" \
		                 << "  test: " << STRINGIFY(test) << "\n"; \
		throw std::runtime_error( crooks_assert_ss.str() ); \
	}

#endif // ifndef CROOKS_UTILS_H
