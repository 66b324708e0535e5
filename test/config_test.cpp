#include "config.hpp"

#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <string>

class ConfigTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		char tmpl[] = "/tmp/paging-calc-cfg-XXXXXX";
		int fd = mkstemp(tmpl);
		ASSERT_NE(fd, -1);
		close(fd);
		path = tmpl;
	}

	void TearDown() override
	{
		remove(path.c_str());
	}

	void Write(const char *content)
	{
		FILE *f = fopen(path.c_str(), "w");
		ASSERT_TRUE(f != NULL);
		fputs(content, f);
		fclose(f);
	}

	std::string path;
};

TEST_F(ConfigTest, Defaults)
{
	Config cfg;
	EXPECT_EQ(cfg.u32_cfg[COLOR_MODE], (unsigned)COLOR_AUTO);
	EXPECT_EQ(cfg.u32_cfg[INDEX_WIDTH], 6u);
	EXPECT_EQ(cfg.u32_cfg[OFFSET_DIGITS], 4u);
}

TEST_F(ConfigTest, LoadValues)
{
	Write("# comment\n"
	      "// another comment\n"
	      "\n"
	      "COLOR_MODE: 0\n"
	      "  INDEX_WIDTH :  8  \n"
	      "OFFSET_DIGITS:16\n");

	Config cfg;
	ASSERT_TRUE(cfg.LoadConfig(path.c_str()));
	EXPECT_EQ(cfg.u32_cfg[COLOR_MODE], (unsigned)COLOR_NEVER);
	EXPECT_EQ(cfg.u32_cfg[INDEX_WIDTH], 8u);
	EXPECT_EQ(cfg.u32_cfg[OFFSET_DIGITS], 16u);
}

TEST_F(ConfigTest, SkipsBadLines)
{
	Write("UNKNOWN_KEY: 3\n"
	      "INDEX_WIDTH\n"
	      "INDEX_WIDTH: -1\n"
	      "INDEX_WIDTH: abc\n"
	      "OFFSET_DIGITS: 99999999999999999999\n"
	      "COLOR_MODE: 3\n"
	      "INDEX_WIDTH: 0\n");

	Config cfg;
	ASSERT_TRUE(cfg.LoadConfig(path.c_str()));
	EXPECT_EQ(cfg.u32_cfg[COLOR_MODE], (unsigned)COLOR_AUTO);
	EXPECT_EQ(cfg.u32_cfg[INDEX_WIDTH], 6u);
	EXPECT_EQ(cfg.u32_cfg[OFFSET_DIGITS], 4u);
}

TEST_F(ConfigTest, MissingFile)
{
	Config cfg;
	EXPECT_FALSE(cfg.LoadConfig("/nonexistent/paging-calc.cfg"));
	EXPECT_EQ(cfg.u32_cfg[INDEX_WIDTH], 6u);
}

TEST_F(ConfigTest, GetAndSet)
{
	Config cfg;
	unsigned val = 0;
	ASSERT_TRUE(cfg.GetConfig("OFFSET_DIGITS", val));
	EXPECT_EQ(val, 4u);
	EXPECT_FALSE(cfg.GetConfig("NO_SUCH_KEY", val));

	EXPECT_TRUE(cfg.SetConfig(COLOR_MODE, COLOR_ALWAYS));
	EXPECT_EQ(cfg.u32_cfg[COLOR_MODE], (unsigned)COLOR_ALWAYS);
	EXPECT_FALSE(cfg.SetConfig(INDEX_WIDTH, 21));
	EXPECT_EQ(cfg.u32_cfg[INDEX_WIDTH], 6u);
}

TEST_F(ConfigTest, Print)
{
	Config cfg;
	FILE *f = tmpfile();
	ASSERT_TRUE(f != NULL);
	cfg.Print(f);
	rewind(f);

	std::string out;
	char buf[256];
	while (fgets(buf, sizeof buf, f))
		out += buf;
	fclose(f);

	EXPECT_EQ(out,
	          "paging-calc settings:\n"
	          "  COLOR_MODE     auto\n"
	          "  INDEX_WIDTH    6\n"
	          "  OFFSET_DIGITS  4\n");

	ASSERT_TRUE(cfg.SetConfig(COLOR_MODE, COLOR_NEVER));
	f = tmpfile();
	ASSERT_TRUE(f != NULL);
	cfg.Print(f);
	rewind(f);
	out.clear();
	while (fgets(buf, sizeof buf, f))
		out += buf;
	fclose(f);
	EXPECT_NE(out.find("  COLOR_MODE     never\n"), std::string::npos);
}

TEST_F(ConfigTest, ShippedDefaultFile)
{
	Config cfg;
	ASSERT_TRUE(cfg.LoadConfig(PAGING_CALC_SOURCE_DIR "/cfg/default.cfg"));
	EXPECT_EQ(cfg.u32_cfg[COLOR_MODE], (unsigned)COLOR_AUTO);
	EXPECT_EQ(cfg.u32_cfg[INDEX_WIDTH], 6u);
	EXPECT_EQ(cfg.u32_cfg[OFFSET_DIGITS], 4u);
}
