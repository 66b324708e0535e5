#include "utils.hpp"
#include <stdarg.h>

bool verbose = false;
bool debug = false;

void dlog(const char *format, ...)
{
	if (!debug)
		return;

	va_list args;
	va_start(args, format);
	vfprintf(stderr, format, args);
	va_end(args);
}

void vlog(const char *format, ...)
{
	if (!verbose)
		return;

	va_list args;
	va_start(args, format);
	vfprintf(stderr, format, args);
	va_end(args);
}

void panic(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	fprintf(stderr, "[Panic] ");
	vfprintf(stderr, format, args);
	va_end(args);
	fflush(stderr);
	exit(-1);
}
