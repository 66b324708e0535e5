#ifndef UTILS_HEADER
#define UTILS_HEADER

#include <stdio.h>
#include <stdlib.h>

extern bool verbose;
extern bool debug;

#define ASSERT(condition)                                                     \
	do {                                                                      \
		if (!(condition)) {                                                   \
			fprintf(stderr, "Assertion failed: %s, line %d, file \"%s\"\n",   \
			        #condition, __LINE__, __FILE__);                          \
			fflush(stderr);                                                   \
			exit(-1);                                                         \
		}                                                                     \
	} while (0)

#define DISALLOW_COPY_AND_ASSIGN(TypeName) 	\
	TypeName(const TypeName&); \
	void operator=(const TypeName&)

// printf-style, to stderr
void dlog(const char *format, ...);	// only with debug on
void vlog(const char *format, ...);	// only with verbose on
void panic(const char *format, ...);

#endif
