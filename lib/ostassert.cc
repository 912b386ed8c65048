#include "ostassert.hh"
#include <iostream>
#include <stdio.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

static void print_stacktrace() {
    char pid[32];
    snprintf(pid, sizeof(pid), "%ld", long(getpid()));
    char program[1024];
    ssize_t r = readlink("/proc/self/exe", program, sizeof(program) - 1);
    if (r > 0) {
	program[r] = 0;
	int child_pid = fork();
	if (!child_pid) {
	    dup2(2, 1);
	    execlp("gdb", "gdb", program, pid, "--batch", "-n",
		   "-ex", "bt", (char*) NULL);
	    _exit(1);
	} else if (child_pid > 0)
	    waitpid(child_pid, NULL, 0);
    }
}

void
fail_mandatory_assert(const char* file, int line, const char* assertion, const char* message)
{
    std::cerr.flush();
    if (message)
	fprintf(stderr, "assertion \"%s\" [%s] failed: file \"%s\", line %d\n",
		message, assertion, file, line);
    else
	fprintf(stderr, "assertion \"%s\" failed: file \"%s\", line %d\n",
		assertion, file, line);
    print_stacktrace();
    abort();
}
