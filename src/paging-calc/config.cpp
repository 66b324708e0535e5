#include "config.hpp"

#include <string.h>
#include <string>

#include <boost/lexical_cast.hpp>

const char *valid_cfg_u32[ConfigU32Num] =
{
	"COLOR_MODE",
	"INDEX_WIDTH",
	"OFFSET_DIGITS",
};

const char *color_option_str[3] =
{
	"never", "auto", "always"
};

static const unsigned cfg_u32_default[ConfigU32Num] = { COLOR_AUTO, 6, 4 };
static const unsigned cfg_u32_min[ConfigU32Num] = { 0, 1, 1 };
static const unsigned cfg_u32_max[ConfigU32Num] = { 2, 20, 16 };

static bool InConfigU32(const char *idf, int &id)
{
	for (int i = 0; i < ConfigU32Num; ++i)
	{
		if (strcmp(idf, valid_cfg_u32[i]) == 0)
		{
			id = i;
			return true;
		}
	}
	id = -1;
	return false;
}

static std::string Trim(const std::string &s)
{
	size_t first = s.find_first_not_of(" \t\r\n");
	if (first == std::string::npos)
		return std::string();
	size_t last = s.find_last_not_of(" \t\r\n");
	return s.substr(first, last - first + 1);
}

Config::Config()
{
	for (int i = 0; i < ConfigU32Num; ++i)
	{
		u32_cfg[i] = cfg_u32_default[i];
	}
}

Config::~Config()
{

}

bool
Config::LoadConfig(const char *file)
{
	FILE *fi = fopen(file, "r");

	if (fi == NULL)
	{
		fprintf(stderr, "[Error] config: Cannot open config file '%s'\n", file);
		return false;
	}

	char buf[256];
	int line_no = 0;
	while (fgets(buf, sizeof buf, fi))
	{
		line_no++;
		std::string line = Trim(buf);
		if (line.empty() || line[0] == '#' ||
			line.compare(0, 2, "//") == 0)
			continue;

		size_t colon = line.find(':');
		if (colon == std::string::npos)
		{
			fprintf(stderr, "[Warning] config: %s:%d: expected 'KEY: value'\n",
			        file, line_no);
			continue;
		}

		std::string idf = Trim(line.substr(0, colon));
		std::string str_val = Trim(line.substr(colon + 1));

		int id;
		if (!InConfigU32(idf.c_str(), id))
		{
			fprintf(stderr, "[Warning] config: %s:%d: unknown config '%s'\n",
			        file, line_no, idf.c_str());
			continue;
		}

		// lexical_cast<unsigned> would accept and wrap "-1"
		if (str_val.empty() ||
			str_val.find_first_not_of("0123456789") != std::string::npos)
		{
			fprintf(stderr, "[Warning] config: %s:%d: '%s' is not an unsigned number\n",
			        file, line_no, str_val.c_str());
			continue;
		}

		unsigned val;
		try
		{
			val = boost::lexical_cast<unsigned>(str_val);
		}
		catch (const boost::bad_lexical_cast &)
		{
			fprintf(stderr, "[Warning] config: %s:%d: '%s' is out of range\n",
			        file, line_no, str_val.c_str());
			continue;
		}

		if (SetConfig((CFG_U32)id, val))
			dlog("config: set u32 config '%s' to value %u\n", valid_cfg_u32[id], val);
	}

	fclose(fi);
	return true;
}

void
Config::Print(FILE *fout)
{
	if (fout == NULL)
		fout = stdout;
	fprintf(fout, "paging-calc settings:\n");
	for (int i = 0; i < ConfigU32Num; ++i)
	{
		if (i == COLOR_MODE)
			fprintf(fout, "  %-14s %s\n", valid_cfg_u32[i], color_option_str[u32_cfg[i]]);
		else
			fprintf(fout, "  %-14s %u\n", valid_cfg_u32[i], u32_cfg[i]);
	}
}

bool
Config::GetConfig(const char *name, unsigned &val)
{
	int id;
	if (!InConfigU32(name, id))
	{
		fprintf(stderr, "[Warning] config: Cannot find config '%s'.\n", name);
		return false;
	}

	val = u32_cfg[id];
	return true;
}

bool
Config::SetConfig(CFG_U32 id, unsigned val)
{
	if (val < cfg_u32_min[id] || val > cfg_u32_max[id])
	{
		fprintf(stderr, "[Warning] config: '%s' must be between %u and %u, keeping %u\n",
		        valid_cfg_u32[id], cfg_u32_min[id], cfg_u32_max[id], u32_cfg[id]);
		return false;
	}

	u32_cfg[id] = val;
	return true;
}
