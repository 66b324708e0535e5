#include "paging_info.hpp"
#include "utils.hpp"

const char *arch_family_str[2] =
{
	"x86", "x86_64"
};

const PagingImplInfo X86Paging =
{
	"x86 32-bit paging",
	"x86 paging uses a 2-level page table. The page is indexed by 12 bits,\n"
	"which results in a page-size of 4096 bytes. Each page table is indexed by 10\n"
	"bits and has 2^10 == 1024 entries. Each page-table entry is 32-bit in size.\n"
	"Hence, a page table occupies the size of a page. Huge pages have a size of\n"
	"2^22 == 4 MiB.",
	ADDR_32BIT,
	12,
	10,
	sizeof(uint32_t),
	2
};

const PagingImplInfo X86PaePaging =
{
	"x86 32-bit paging with PAE",
	"x86 with the Physical Address Extension (PAE) paging uses a 3-level page table,\n"
	"that enables to access more than 32-bit of physical address space. The page\n"
	"is indexed by 12 bits, which results in a page-size of 4096 bytes. Tables\n"
	"at level 1 and 2 are indexed by 9 bits and have 2^9 == 512 entries. The third-\n"
	"level page table is indexed by 2 bits and has 2^2 == 4 entries. Each page-table\n"
	"entry is 64-bit in size. Hence, a page table at levels 1 and 2 occupies the size\n"
	"of a page whereas the level 3 page table occupies 32 byte. Huge pages have a size\n"
	"of 2^21 == 2 MiB and are only valid on level 2.",
	ADDR_32BIT,
	12,
	9,
	sizeof(uint64_t),
	3
};

const PagingImplInfo X86_64Paging =
{
	"x86_64 paging",
	"x86_64 paging uses a 4-level page table. The page is indexed by 12 bits,\n"
	"which results in a page-size of 4096 bytes. Each page table is indexed by 9\n"
	"bits and has 2^9 == 512 entries. Each page-table entry is 64-bit in size. Hence,\n"
	"a page table occupies the size of a page. Huge pages have a size of\n"
	"2^21 == 2 MiB or 2^30 == 1 GiB. Huge pages are only valid on levels 2 or 3.",
	ADDR_64BIT,
	12,
	9,
	sizeof(uint64_t),
	4
};

const PagingImplInfo X86_64FiveLevelPaging =
{
	"x86_64 paging (5-level)",
	"x86_64 paging optionally uses a 5-level page table. The page is indexed\n"
	"by 12 bits, which results in a page-size of 4096 bytes. Each page table is\n"
	"indexed by 9 bits and has 2^9 == 512 entries. Each page-table entry is 64-bit in\n"
	"size. Hence, a page table occupies the size of a page. Huge pages have a size of\n"
	"2^21 == 2 MiB or 2^30 == 1 GiB. Huge pages are only valid on levels 2 or 3.",
	ADDR_64BIT,
	12,
	9,
	sizeof(uint64_t),
	5
};

const PagingImplInfo &SelectPagingImpl(ARCH_FAMILY family, bool feature)
{
	switch (family)
	{
		case ARCH_X86:
			return feature ? X86PaePaging : X86Paging;
		case ARCH_X86_64:
			return feature ? X86_64FiveLevelPaging : X86_64Paging;
	}
	panic("unknown architecture family %d\n", (int)family);
	return X86Paging;
}

std::vector<PageTableLookupMetaInfo> LookupAllLevels(const PagingImplInfo &info,
                                                     uint64_t v_addr)
{
	std::vector<PageTableLookupMetaInfo> result;
	result.reserve(info.levels);

	for (uint64_t level = 1; level <= info.levels; ++level)
	{
		PageTableLookupMetaInfo lookup = CalcPageTableIndex(info.page_table_index_bits,
		                                                    info.page_offset_bits,
		                                                    v_addr, level,
		                                                    info.addr_width);
		dlog("catalog: %s level %llu: index %llu, shift %llu\n", info.name,
		     (unsigned long long)level, (unsigned long long)lookup.index,
		     (unsigned long long)lookup.shift);
		result.push_back(lookup);
	}

	return result;
}
