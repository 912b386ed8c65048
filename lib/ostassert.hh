#ifndef OST_ASSERT_HH
#define OST_ASSERT_HH 1
#include <assert.h>

void fail_mandatory_assert(const char* file, int line, const char* assertion,
			   const char* message = 0) __attribute__((noreturn));

// Checked in every build, unlike assert().
#define mandatory_assert(x, ...) \
    do { if (!(x)) fail_mandatory_assert(__FILE__, __LINE__, #x, ## __VA_ARGS__); } while (0)

#endif
