#ifndef VADDR_HEADER
#define VADDR_HEADER

#include <stdint.h>
#include <string>

enum VADDR_ERROR
{
	VADDR_OK,
	VADDR_MISSING_PREFIX,
	VADDR_PARSE_ERROR
};

extern const char *vaddr_error_str[3];

// Parses a hexadecimal virtual address like "0x123" or "0xdead_beef".
// The 0x prefix is required, case and underscores are ignored, surrounding
// whitespace is trimmed. The value must fit into 64 bits.
VADDR_ERROR ParseVirtualAddress(const std::string &text, uint64_t &v_addr);

#endif
