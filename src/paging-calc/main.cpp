#include "cli.hpp"
#include "config.hpp"
#include "paging_info.hpp"
#include "print.hpp"
#include "utils.hpp"

#include <stdio.h>

int main(int argc, char *argv[])
{
	CliArgs args;

	// parse args
	if (!ParseArg(argc, argv, args))
	{
		fprintf(stderr, "try 'paging-calc --help' for more information.\n");
		return 1;
	}

	if (args.help)
		return 0;

	if (args.version)
	{
		printf("paging-calc %s\n", PAGING_CALC_VERSION);
		return 0;
	}

	// settings
	Config cfg;
	if (!args.config_file.empty() && !cfg.LoadConfig(args.config_file.c_str()))
		return 1;
	if (args.color_given && !cfg.SetConfig(COLOR_MODE, args.color))
		return 1;
	if (debug)
		cfg.Print(stderr);

	useAnsi = DecideAnsi((COLOR_OPTION)cfg.u32_cfg[COLOR_MODE], stdout);
	vlog("[color]    %s\n", useAnsi ? "on" : "off");

	const PagingImplInfo &info = SelectPagingImpl(args.family, args.feature);
	vlog("catalog: selected '%s' (%llu levels, %s)\n", info.name,
	     (unsigned long long)info.levels, addr_width_str[info.addr_width]);

	PrintReport(stdout, info, args.v_addr, cfg);

	return 0;
}
