#ifndef CONFIG_HEADER
#define CONFIG_HEADER

#include "utils.hpp"
#include <stdio.h>

#define ConfigU32Num		3

enum CFG_U32
{
	COLOR_MODE,			// 0 never, 1 auto, 2 always
	INDEX_WIDTH,		// field width of the entry index
	OFFSET_DIGITS		// min. hex digits of the entry offset
};

enum COLOR_OPTION
{
	COLOR_NEVER,
	COLOR_AUTO,
	COLOR_ALWAYS
};

extern const char *valid_cfg_u32[ConfigU32Num];
extern const char *color_option_str[3];

class Config
{
public:
	unsigned u32_cfg[ConfigU32Num];

	Config();
	~Config();
	bool LoadConfig(const char *file);
	void Print(FILE *fout = NULL);
	bool GetConfig(const char *name, unsigned &val);
	bool SetConfig(CFG_U32 id, unsigned val);

private:
	DISALLOW_COPY_AND_ASSIGN(Config);
};

#endif
