#ifndef OST_CHECK_HH
#define OST_CHECK_HH 1

#include <iostream>
#include <string>
#include "ostassert.hh"

template <typename T>
inline void check_true(const char* file, int line,
		       T test, const std::string& msg = "") {
    if (!test) {
	std::cerr << file << ":" << line << ": Check failed\n";
	if (!msg.empty())
	    std::cerr << "\t" << msg << std::endl;
	mandatory_assert(0);
    }
}

template <typename T1, typename T2>
inline void check_eq(const char* file, int line,
		     const T1& actual, const T2& expected,
		     const std::string& msg = "") {
    if (!(expected == actual)) {
	std::cerr << file << ":" << line << ": Check failed\n";
	if (!msg.empty())
	    std::cerr << "\t" << msg << std::endl;
	std::cerr <<   "\tActual:   " << actual
		  << "\n\tExpected: " << expected << std::endl;
	mandatory_assert(0);
    }
}

inline void check_threw(const char* file, int line, bool threw,
			const char* expr, const char* exception) {
    if (!threw) {
	std::cerr << file << ":" << line << ": Check failed\n"
		  << "\t" << expr << " did not throw " << exception << std::endl;
	mandatory_assert(0);
    }
}

#define CHECK_TRUE(test) check_true(__FILE__, __LINE__, (test), #test)
#define CHECK_EQ(actual, expected) check_eq(__FILE__, __LINE__, (actual), (expected), #actual " == " #expected)
#define CHECK_THROWS(expr, exception) do {                              \
	bool threw_ = false;                                            \
	try {                                                           \
	    (void) (expr);                                              \
	} catch (const exception&) {                                    \
	    threw_ = true;                                              \
	}                                                               \
	check_threw(__FILE__, __LINE__, threw_, #expr, #exception);     \
    } while (0)

#endif
