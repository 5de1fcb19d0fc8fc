/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * options.cpp
*/

#include "options.hpp"

#include <apputil.h>
#include <address.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/errors.hpp>

#define MAX_POLL_INTERVAL_MS	(60*60*1000)
#define MAX_POLL_ATTEMPTS		1000000

namespace po = boost::program_options;

void do_show_config(const EscrowParams& params, ostream& os)
{
	os << endl;
	os << "Configuration settings:" << endl;
	os << "   escrow program id = " << params.escrow_program << endl;
	os << "   proof program id = " << params.proof_program << endl;
	os << "   image id = " << params.image_id << endl;
	os << "   claim tip = " << params.tip << endl;
	os << "   claim expiry slots = " << params.expiry << endl;
	os << "   poll interval milliseconds = " << params.poll_interval_ms << endl;
	os << "   poll attempts = " << params.poll_attempts << endl;
	os << endl;
	os << "Trace output settings:" << endl;
	os << "   trace level = " << params.trace_level << endl;
	os << "   trace client = " << yesno(params.trace_client) << endl;
	os << "   trace workflow = " << yesno(params.trace_workflow) << endl;
	os << "   trace polling = " << yesno(params.trace_polling) << endl;
	os << endl;
}

void check_config_values(const EscrowParams& params)
{
	Hashlock::Address address;

	if (Hashlock::Address::FromString(params.escrow_program, address))
		throw range_error("Invalid value for escrow-program");

	if (Hashlock::Address::FromString(params.proof_program, address))
		throw range_error("Invalid value for proof-program");

	if (params.image_id.empty())
		throw range_error("Invalid value for image-id");

	if (params.poll_interval_ms < 0 || params.poll_interval_ms > MAX_POLL_INTERVAL_MS)
		throw range_error("poll-interval-ms value not in valid range");

	if (params.poll_attempts < 1 || params.poll_attempts > MAX_POLL_ATTEMPTS)
		throw range_error("poll-attempts value not in valid range");

	if (params.trace_level < 0 || params.trace_level > 6)
		throw range_error("trace value not in valid range");
}

int process_options(int argc, char **argv, EscrowParams& params, po::variables_map& config_options)
{
	po::options_description basic_options("BASIC OPTIONS");
	basic_options.add_options()
		("help", "Display this message.")
		("config", po::value<string>(), "Path to file with additional configuration options.")
		("show-config", "Display the configuration settings.")
	;

	po::options_description advanced_options("ADVANCED OPTIONS", 99, 0);
	advanced_options.add_options()
		("escrow-program", po::value<string>(&params.escrow_program)->default_value(DEFAULT_ESCROW_PROGRAM_ID), "Address of the escrow program.")
		("proof-program", po::value<string>(&params.proof_program)->default_value(DEFAULT_PROOF_PROGRAM_ID), "Address of the proof computation program.")
		("image-id", po::value<string>(&params.image_id)->default_value(DEFAULT_IMAGE_ID), "Image id of the deployed hash verification program.")
		("tip", po::value<uint64_t>(&params.tip)->default_value(DEFAULT_CLAIM_TIP), "Lamports offered to the prover for each claim.")
		("expiry", po::value<uint64_t>(&params.expiry)->default_value(DEFAULT_CLAIM_EXPIRY), "Slots after submission before an unverified claim expires.")
		("poll-interval-ms", po::value<int>(&params.poll_interval_ms)->default_value(DEFAULT_POLL_INTERVAL_MS), "Milliseconds between reads of the escrow while waiting for a claim outcome.")
		("poll-attempts", po::value<int>(&params.poll_attempts)->default_value(DEFAULT_POLL_ATTEMPTS), "Maximum number of escrow reads while waiting for a claim outcome.")
		("trace", po::value<int>(&params.trace_level)->default_value(DEFAULT_TRACE_LEVEL), "Trace level; affects all trace settings (0=none, 1=fatal, 2=errors, 3=warnings, 4=info, 5=debug, 6=trace)")
		("trace-client", po::value<bool>(&params.trace_client)->default_value(0), "Trace escrow client operations")
		("trace-workflow", po::value<bool>(&params.trace_workflow)->default_value(0), "Trace claim workflow state changes")
		("trace-polling", po::value<bool>(&params.trace_polling)->default_value(0), "Trace claim outcome polling")
	;

	po::options_description hidden_options("");
	hidden_options.add_options()
		("command", po::value< vector<string> >())
	;

	po::positional_options_description positional_options;
	positional_options.add("command", -1);

	po::options_description all;
	all.add(basic_options).add(advanced_options).add(hidden_options);

	po::store(po::command_line_parser(argc, argv).options(all).positional(positional_options).run(), config_options);

	if (config_options.count("help"))
	{
		cerr << HLAPPNAME " v" HLVERSION << endl;
		cerr << "\nUsage: " << argv[0] << " [command] [params...] [options]" << endl;
		cerr <<

R"(
Commands:
   commit <secret>                                  Print the commitment of a secret.
   new-execution-id                                 Print a fresh execution id.
   derive-escrow <seed>                             Print the escrow address.
   derive-claim <seed> <execution-id> <payer>       Print every address a claim references.
   encode-open <seed> <commitment> <amount>         Print open instruction data as hex.
   encode-claim <seed> <execution-id> <preimage>    Print claim instruction data as hex.
   decode-instruction <hex|@file>                   Decode open or claim instruction data.
   decode-account <hex|@file>                       Decode escrow account data.
)" << endl;
		cerr << basic_options << endl;
		cerr << advanced_options << endl;

		return 1;
	}

	if (config_options.count("config"))
	{
		boost::filesystem::ifstream fs;
		auto fname = config_options.at("config").as<string>();
		fs.open(fname, fstream::in);
		if(!fs.is_open())
			throw runtime_error(string("Unable to open config file \"") + fname + "\"");

		po::store(po::parse_config_file(fs, all), config_options);
	}

	po::notify(config_options);

	set_trace_level(params.trace_level);

	check_config_values(params);

	return 0;
}
