#ifndef CLI_HEADER
#define CLI_HEADER

#include "config.hpp"
#include "paging_info.hpp"
#include <stdint.h>
#include <string>

typedef struct CliArgs_
{
	uint64_t v_addr;
	ARCH_FAMILY family;
	bool feature;			// --pae for x86, --five-level for x86_64
	bool color_given;
	COLOR_OPTION color;
	std::string config_file;
	bool help;
	bool version;
} CliArgs;

// Returns false on invalid input, the reason is printed to stderr. With
// --help or --version the respective flag is set and nothing else is
// required.
bool ParseArg(int argc, const char *const argv[], CliArgs &args);

#endif
