/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * hlescrow.cpp
*/

#include "hlclient.h"
#include "options.hpp"
#include "commands.hpp"

#include <apputil.h>

int main(int argc, char **argv)
{
	EscrowParams params;
	boost::program_options::variables_map config_options;

	set_trace_level(params.trace_level);

	try
	{
		auto rc = process_options(argc, argv, params, config_options);
		if (rc) return rc;
	}
	catch (const exception& e)
	{
		cerr << "ERROR: " << e.what() << endl;
		return -1;
	}

	if (config_options.count("show-config"))
		do_show_config(params, cerr);

	vector<string> args;
	if (config_options.count("command"))
		args = config_options.at("command").as<vector<string>>();

	if (args.empty() && config_options.count("show-config"))
		return 0;

	try
	{
		run_command(args, params, cout);
	}
	catch (const Hashlock::Escrow_Exception& e)
	{
		auto category = Hashlock::escrow_error_category(e.code);

		cerr << "ERROR: " << e.what() << " (" << Hashlock::escrow_category_string(category) << ")" << endl;
		return 1;
	}
	catch (const exception& e)
	{
		cerr << "ERROR: " << e.what() << endl;
		return -1;
	}

	return 0;
}
