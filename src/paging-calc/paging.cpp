#include "paging.hpp"
#include "utils.hpp"

const char *addr_width_str[2] =
{
	"32-bits", "64-bits"
};

uint64_t AddrWidthBits(ADDR_WIDTH width)
{
	switch (width)
	{
		case ADDR_32BIT:
			return 32;
		case ADDR_64BIT:
			return 64;
	}
	panic("unknown address width %d\n", (int)width);
	return 0;
}

uint64_t CreateMask(uint64_t bits)
{
	ASSERT(bits <= 64);

	// one bit at a time, a single shift by 64 is undefined
	uint64_t mask = 0;
	while (bits > 0)
	{
		mask <<= 1;
		mask |= 1;
		bits--;
	}
	return mask;
}

PageTableLookupMetaInfo CalcPageTableIndex(uint64_t index_bits,
                                           uint64_t page_offset_bits,
                                           uint64_t v_addr,
                                           uint64_t level,
                                           ADDR_WIDTH addr_width)
{
	ASSERT(index_bits > 0);
	ASSERT(page_offset_bits > 0);
	ASSERT(level > 0);

	uint64_t addr = v_addr;
	if (addr_width == ADDR_32BIT)
		addr &= 0xffffffffull;

	PageTableLookupMetaInfo info;
	info.v_addr = v_addr;
	info.level = level;
	info.shift = index_bits * (level - 1) + page_offset_bits;

	uint64_t mask = CreateMask(index_bits);

	// field lies completely above bit 63
	if (info.shift >= 64)
	{
		info.index = 0;
		info.relevant_bits = 0;
		return info;
	}

	info.index = (addr >> info.shift) & mask;
	info.relevant_bits = addr & (mask << info.shift);

	return info;
}
