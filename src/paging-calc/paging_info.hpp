#ifndef PAGING_INFO_HEADER
#define PAGING_INFO_HEADER

#include "paging.hpp"
#include <stdint.h>
#include <vector>

enum ARCH_FAMILY
{
	ARCH_X86,
	ARCH_X86_64
};

extern const char *arch_family_str[2];

// Properties of one paging implementation. Assumes that every page-table
// level is indexed by the same number of bits, which holds for all x86
// paging modes.
typedef struct PagingImplInfo_
{
	const char *name;
	const char *description;
	ADDR_WIDTH addr_width;
	uint64_t page_offset_bits;		// 2^n == page size
	uint64_t page_table_index_bits;	// 2^n == entries per table
	uint64_t page_table_entry_size;	// bytes
	uint64_t levels;
} PagingImplInfo;

extern const PagingImplInfo X86Paging;
extern const PagingImplInfo X86PaePaging;
extern const PagingImplInfo X86_64Paging;
extern const PagingImplInfo X86_64FiveLevelPaging;

// feature is PAE for ARCH_X86 and 5-level paging for ARCH_X86_64
const PagingImplInfo &SelectPagingImpl(ARCH_FAMILY family, bool feature);

// One entry per level, result[0] is level 1 and the last one is the
// highest level.
std::vector<PageTableLookupMetaInfo> LookupAllLevels(const PagingImplInfo &info,
                                                     uint64_t v_addr);

#endif
