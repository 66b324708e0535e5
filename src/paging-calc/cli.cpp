#include "cli.hpp"
#include "utils.hpp"
#include "vaddr.hpp"

#include <stdio.h>
#include <iostream>
using namespace std;

#include <boost/program_options.hpp>
using namespace boost::program_options;

static bool ParseColor(const string &str, COLOR_OPTION &color)
{
	for (int i = 0; i < 3; ++i)
	{
		if (str == color_option_str[i])
		{
			color = (COLOR_OPTION)i;
			return true;
		}
	}
	return false;
}

static bool ParseArch(const string &str, ARCH_FAMILY &family)
{
	for (int i = 0; i < 2; ++i)
	{
		if (str == arch_family_str[i])
		{
			family = (ARCH_FAMILY)i;
			return true;
		}
	}
	return false;
}

bool ParseArg(int argc, const char *const argv[], CliArgs &args)
{
	args.v_addr = 0;
	args.family = ARCH_X86;
	args.feature = false;
	args.color_given = false;
	args.color = COLOR_AUTO;
	args.config_file.clear();
	args.help = false;
	args.version = false;

	options_description opts("Page Table Calculator Options");

	opts.add_options()
		("pae", "x86 only: Physical Address Extension (3-level page table)")
		("five-level,5", "x86_64 only: 5-level page table")
		("color", value<string>(), "use ANSI colors: never, auto or always")
		("config,c", value<string>(), "set config file (format as 'cfg/default.cfg')")
		("verbose,v", "print more info")
		("debug,d", "print debug info")
		("version,V", "print version")
		("help,h", "print help info")
		;

	options_description hidden;
	hidden.add_options()
		("address", value<string>(), "virtual address")
		("arch", value<string>(), "architecture")
		;

	options_description all;
	all.add(opts).add(hidden);

	positional_options_description pos;
	pos.add("address", 1).add("arch", 1);

	variables_map vm;
	try
	{
		store(command_line_parser(argc, argv).options(all).positional(pos).run(), vm);
		notify(vm);
	}
	catch (const boost::program_options::error &e)
	{
		fprintf(stderr, "[Error] %s\n", e.what());
		return false;
	}

	if (vm.count("help"))
	{
		cout << "Usage: paging-calc [options] <virtual-address> <x86|x86_64>" << endl
		     << endl
		     << "Calculates the page-table indices of a virtual address." << endl
		     << "The address is hexadecimal with 0x prefix, e.g. 0xdead_beef." << endl
		     << endl
		     << opts << endl;
		args.help = true;
		return true;
	}

	if (vm.count("version"))
	{
		args.version = true;
		return true;
	}

	if (vm.count("debug"))
	{
		debug = true;
	}

	if (vm.count("verbose"))
	{
		verbose = true;
	}

	if (vm.count("config"))
	{
		args.config_file = vm["config"].as<string>();
	}

	if (vm.count("color"))
	{
		string c = vm["color"].as<string>();
		if (!ParseColor(c, args.color))
		{
			fprintf(stderr, "[Error] invalid --color '%s', use never, auto or always.\n",
			        c.c_str());
			return false;
		}
		args.color_given = true;
	}

	if (!vm.count("address"))
	{
		fprintf(stderr, "[Error] please specify a virtual address, e.g. 0xdeadbeef.\n");
		return false;
	}

	string addr = vm["address"].as<string>();
	VADDR_ERROR err = ParseVirtualAddress(addr, args.v_addr);
	if (err != VADDR_OK)
	{
		fprintf(stderr, "[Error] '%s': %s\n", addr.c_str(), vaddr_error_str[err]);
		return false;
	}

	if (!vm.count("arch"))
	{
		fprintf(stderr, "[Error] please specify the architecture, x86 or x86_64.\n");
		return false;
	}

	string arch = vm["arch"].as<string>();
	if (!ParseArch(arch, args.family))
	{
		fprintf(stderr, "[Error] unknown architecture '%s', use x86 or x86_64.\n",
		        arch.c_str());
		return false;
	}

	bool pae = vm.count("pae") != 0;
	bool five_level = vm.count("five-level") != 0;
	if (args.family == ARCH_X86 && five_level)
	{
		fprintf(stderr, "[Error] --five-level is only valid for x86_64.\n");
		return false;
	}
	if (args.family == ARCH_X86_64 && pae)
	{
		fprintf(stderr, "[Error] --pae is only valid for x86.\n");
		return false;
	}
	args.feature = args.family == ARCH_X86 ? pae : five_level;

	vlog("cli: address 0x%016llx, arch %s, feature %s\n",
	     (unsigned long long)args.v_addr, arch_family_str[args.family],
	     args.feature ? "on" : "off");

	return true;
}
