#ifndef PAGING_HEADER
#define PAGING_HEADER

#include <stdint.h>

enum ADDR_WIDTH
{
	ADDR_32BIT,
	ADDR_64BIT
};

extern const char *addr_width_str[2];

// 32 or 64
uint64_t AddrWidthBits(ADDR_WIDTH width);

// Lookup meta info of a virtual address for one page-table level. Only
// the data needed for the lookup, not the lookup itself.
class PageTableLookupMetaInfo
{
public:
	uint64_t v_addr;		// address as given by the caller
	uint64_t level;			// 1 = nearest the page
	uint64_t index;			// entry number, not the byte offset
	uint64_t shift;			// right shift that moves the index to bit 0
	uint64_t relevant_bits;	// v_addr with all bits outside the index zeroed
};

// Mask with the lowest `bits` bits set, bits in 0..64.
uint64_t CreateMask(uint64_t bits);

// Index into the page table of `level` for `v_addr`.
//
// index_bits:       bits indexing into each page table (10 on x86, 9 with
//                   PAE or on x86_64)
// page_offset_bits: bits indexing into the page (12 for 4 KiB pages)
// level:            page-table level, >= 1. Level 0 would be the page itself.
// addr_width:       on ADDR_32BIT the upper 32 bits of v_addr are ignored
//
// index_bits, page_offset_bits and level must be non-zero.
PageTableLookupMetaInfo CalcPageTableIndex(uint64_t index_bits,
                                           uint64_t page_offset_bits,
                                           uint64_t v_addr,
                                           uint64_t level,
                                           ADDR_WIDTH addr_width);

#endif
