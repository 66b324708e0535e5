#ifndef PRINT_HEADER
#define PRINT_HEADER

#include "config.hpp"
#include "paging_info.hpp"
#include <stdio.h>
#include <string>
#include <vector>

// Set once at start-up, false means plain text without escape sequences.
extern bool useAnsi;

bool DecideAnsi(COLOR_OPTION option, FILE *fout);

std::string PaintHeading(const std::string &str);
std::string PaintHint(const std::string &str);
std::string PaintHighlight(const std::string &str);

// `digits` binary digits of value, zero-padded on the left
std::string FormatBinary(uint64_t value, unsigned digits);

// Full-width binary string of the address in which only the index bits of
// the given level are shown (and highlighted), all others are zero.
std::string FormatRelevantBits(const PageTableLookupMetaInfo &lookup,
                               const PagingImplInfo &info);

void PrintHeader(FILE *fout, const PagingImplInfo &info, uint64_t v_addr);
void PrintLookupInfo(FILE *fout, const PagingImplInfo &info,
                     const std::vector<PageTableLookupMetaInfo> &lookup,
                     Config &cfg);
void PrintReport(FILE *fout, const PagingImplInfo &info, uint64_t v_addr,
                 Config &cfg);

#endif
