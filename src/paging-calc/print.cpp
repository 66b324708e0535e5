#include "print.hpp"
#include "utils.hpp"

#include <unistd.h>

#define ANSI_RESET			"\x1b[0m"
#define ANSI_BOLD			"\x1b[1m"
#define ANSI_BOLD_RED		"\x1b[1;31m"
#define ANSI_LIGHT_GRAY		"\x1b[37m"

bool useAnsi = false;

bool DecideAnsi(COLOR_OPTION option, FILE *fout)
{
	switch (option)
	{
		case COLOR_NEVER:
			return false;
		case COLOR_ALWAYS:
			return true;
		case COLOR_AUTO:
			return isatty(fileno(fout)) != 0;
	}
	panic("unknown color option %d\n", (int)option);
	return false;
}

static std::string Paint(const char *style, const std::string &str)
{
	if (!useAnsi)
		return str;
	return std::string(style) + str + ANSI_RESET;
}

std::string PaintHeading(const std::string &str)
{
	return Paint(ANSI_BOLD, str);
}

std::string PaintHint(const std::string &str)
{
	return Paint(ANSI_LIGHT_GRAY, str);
}

std::string PaintHighlight(const std::string &str)
{
	return Paint(ANSI_BOLD_RED, str);
}

std::string FormatBinary(uint64_t value, unsigned digits)
{
	ASSERT(digits <= 64);

	std::string res(digits, '0');
	for (unsigned i = 0; i < digits; ++i)
	{
		if ((value >> i) & 1)
			res[digits - 1 - i] = '1';
	}
	return res;
}

std::string FormatRelevantBits(const PageTableLookupMetaInfo &lookup,
                               const PagingImplInfo &info)
{
	uint64_t width = AddrWidthBits(info.addr_width);

	uint64_t zeroes_right = info.page_offset_bits +
	                        (lookup.level - 1) * info.page_table_index_bits;
	if (zeroes_right > width)
		zeroes_right = width;

	// the top level table may be indexed by less bits (x86 PAE)
	uint64_t highlight = info.page_table_index_bits;
	if (zeroes_right + highlight > width)
		highlight = width - zeroes_right;

	uint64_t zeroes_left = width - zeroes_right - highlight;

	return "0b" + std::string(zeroes_left, '0') +
	       PaintHighlight(FormatBinary(lookup.index, highlight)) +
	       std::string(zeroes_right, '0');
}

void PrintHeader(FILE *fout, const PagingImplInfo &info, uint64_t v_addr)
{
	std::string heading = std::string("Page Table Calculator (v") +
	                      PAGING_CALC_VERSION + "): " + info.name;
	fprintf(fout, "%s\n", PaintHeading(heading).c_str());
	fprintf(fout, "%s\n\n", info.description);

	if (info.addr_width == ADDR_32BIT)
	{
		uint64_t addr32 = v_addr & 0xffffffffull;
		fprintf(fout, "address       : 0x%llx  %s\n", (unsigned long long)addr32,
		        PaintHint("(user input truncated to 32-bit)").c_str());
		fprintf(fout, "address (bits): 0b%s\n", FormatBinary(addr32, 32).c_str());
	}
	else
	{
		fprintf(fout, "address       : 0x%016llx\n", (unsigned long long)v_addr);
		fprintf(fout, "address (bits): 0b%s\n", FormatBinary(v_addr, 64).c_str());
	}
}

void PrintLookupInfo(FILE *fout, const PagingImplInfo &info,
                     const std::vector<PageTableLookupMetaInfo> &lookup,
                     Config &cfg)
{
	int index_width = (int)cfg.u32_cfg[INDEX_WIDTH];
	int offset_digits = (int)cfg.u32_cfg[OFFSET_DIGITS];

	// highest level first
	for (size_t i = lookup.size(); i > 0; --i)
	{
		const PageTableLookupMetaInfo &l = lookup[i - 1];
		fprintf(fout, "level %llu bits  : %s\n", (unsigned long long)l.level,
		        FormatRelevantBits(l, info).c_str());
	}

	for (size_t i = lookup.size(); i > 0; --i)
	{
		const PageTableLookupMetaInfo &l = lookup[i - 1];
		bool first = i == lookup.size();

		fprintf(fout, "level %llu entry index : %*llu", (unsigned long long)l.level,
		        index_width, (unsigned long long)l.index);
		if (first)
			fprintf(fout, "  %s", PaintHint("(number of entry)").c_str());
		fprintf(fout, "\n");

		fprintf(fout, "level %llu entry offset: 0x%0*llx", (unsigned long long)l.level,
		        offset_digits,
		        (unsigned long long)(l.index * info.page_table_entry_size));
		if (first)
			fprintf(fout, "  %s",
			        PaintHint("(offset into the page table for that entry)").c_str());
		fprintf(fout, "\n");
	}
}

void PrintReport(FILE *fout, const PagingImplInfo &info, uint64_t v_addr,
                 Config &cfg)
{
	PrintHeader(fout, info, v_addr);
	PrintLookupInfo(fout, info, LookupAllLevels(info, v_addr), cfg);
}
