#include "vaddr.hpp"
#include "utils.hpp"

#include <ctype.h>
#include <errno.h>
#include <stdlib.h>

const char *vaddr_error_str[3] =
{
	"ok",
	"The virtual address must begin with the prefix 0x.",
	"The virtual address could not be parsed as 64-bit number."
};

VADDR_ERROR ParseVirtualAddress(const std::string &text, uint64_t &v_addr)
{
	size_t first = text.find_first_not_of(" \t\r\n");
	size_t last = text.find_last_not_of(" \t\r\n");
	if (first == std::string::npos)
		return VADDR_MISSING_PREFIX;

	std::string s;
	for (size_t i = first; i <= last; ++i)
	{
		char c = text[i];
		if (c == '_')
			continue;
		if (isspace((unsigned char)c))
		{
			vlog("vaddr: whitespace inside '%s'\n", text.c_str());
			return VADDR_PARSE_ERROR;
		}
		s += (char)tolower((unsigned char)c);
	}

	if (s.compare(0, 2, "0x") != 0)
		return VADDR_MISSING_PREFIX;

	std::string digits = s.substr(2);
	// one optional '+' sign
	if (!digits.empty() && digits[0] == '+')
		digits.erase(0, 1);
	if (digits.empty())
	{
		vlog("vaddr: no digits after prefix\n");
		return VADDR_PARSE_ERROR;
	}
	for (size_t i = 0; i < digits.size(); ++i)
	{
		if (!isxdigit((unsigned char)digits[i]))
		{
			vlog("vaddr: invalid digit '%c'\n", digits[i]);
			return VADDR_PARSE_ERROR;
		}
	}

	errno = 0;
	unsigned long long val = strtoull(digits.c_str(), NULL, 16);
	if (errno == ERANGE)
	{
		vlog("vaddr: '%s' does not fit into 64 bits\n", text.c_str());
		return VADDR_PARSE_ERROR;
	}

	v_addr = (uint64_t)val;
	return VADDR_OK;
}
