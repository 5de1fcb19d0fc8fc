/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * commands.cpp
*/

#include "commands.hpp"

#include <apputil.h>
#include <address.hpp>
#include <commitment.hpp>
#include <instruction.hpp>
#include <escrow_account.hpp>

using namespace Hashlock;

#define ERROR_BUFSIZE	512

static void check_rc(HLRESULT rc, const char *output)
{
	if (rc)
		throw Escrow_Exception(rc, output);
}

static void check_args(const vector<string>& args, unsigned nargs, const char *usage)
{
	if (args.size() != nargs + 1)
		throw Escrow_Exception(ESCROW_INVALID_PARAMETER, string("usage: " HLEXENAME " ") + usage);
}

static string arg_or_file(const string& arg)
{
	if (arg.length() > 1 && arg[0] == '@')
		return read_text_file(arg.substr(1));

	return arg;
}

static vector<uint8_t> parse_hex_arg(const string& arg)
{
	vector<uint8_t> data;

	if (hex2buf(arg_or_file(arg), data))
		throw Escrow_Exception(ESCROW_INVALID_PARAMETER, "\"" + arg + "\" is not valid hex");

	return data;
}

static uint64_t parse_amount(const string& arg)
{
	auto amount = buf2uint64(arg.c_str());

	if (amount == (uint64_t)(-1) && arg != to_string(amount))
		throw Escrow_Exception(ESCROW_INVALID_PARAMETER, "\"" + arg + "\" is not a valid amount");

	return amount;
}

static Json::Value derived_to_json(const DerivedAddress& derived)
{
	Json::Value root(Json::objectValue);

	root["address"] = derived.address.ToString();
	root["bump"] = (unsigned)derived.bump;

	return root;
}

void write_json(const Json::Value& root, ostream& out)
{
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "  ";

	unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
	writer->write(root, &out);
	out << endl;
}

static void do_commit(const vector<string>& args, ostream& out)
{
	check_args(args, 1, "commit <secret>");

	string commitment;

	auto rc = commit(args[1], commitment);
	check_rc(rc, "commit failed");

	out << commitment << endl;
}

static void do_new_execution_id(const vector<string>& args, ostream& out)
{
	check_args(args, 0, "new-execution-id");

	execution_id_t id;
	auto rc = new_execution_id(id);
	check_rc(rc, "new-execution-id failed");

	out << execution_id_to_string(id) << endl;
}

static void parse_program_ids(const EscrowParams& params, Address& escrow_program, Address& proof_program)
{
	char output[ERROR_BUFSIZE];

	auto rc = Address::FromString(params.escrow_program, escrow_program, output, sizeof(output));
	check_rc(rc, output);

	rc = Address::FromString(params.proof_program, proof_program, output, sizeof(output));
	check_rc(rc, output);
}

static void do_derive_escrow(const vector<string>& args, const EscrowParams& params, ostream& out)
{
	check_args(args, 1, "derive-escrow <seed>");

	Address escrow_program, proof_program;
	parse_program_ids(params, escrow_program, proof_program);

	char output[ERROR_BUFSIZE];
	DerivedAddress escrow;

	auto rc = derive_escrow_address(args[1], escrow_program, escrow, output, sizeof(output));
	check_rc(rc, output);

	auto root = derived_to_json(escrow);
	root["seed"] = args[1];
	root["program"] = escrow_program.ToString();

	write_json(root, out);
}

static void do_derive_claim(const vector<string>& args, const EscrowParams& params, ostream& out)
{
	check_args(args, 3, "derive-claim <seed> <execution-id> <payer>");

	Address escrow_program, proof_program;
	parse_program_ids(params, escrow_program, proof_program);

	char output[ERROR_BUFSIZE];
	execution_id_t id;
	Address payer;
	DerivedAddress escrow, tracker, execution, image;

	auto rc = execution_id_from_string(args[2], id, output, sizeof(output));
	check_rc(rc, output);

	rc = Address::FromString(args[3], payer, output, sizeof(output));
	check_rc(rc, output);

	rc = derive_escrow_address(args[1], escrow_program, escrow, output, sizeof(output));
	check_rc(rc, output);

	rc = derive_tracker_address(id, escrow_program, tracker, output, sizeof(output));
	check_rc(rc, output);

	rc = derive_execution_address(payer, id, proof_program, execution, output, sizeof(output));
	check_rc(rc, output);

	rc = derive_image_address(params.image_id, proof_program, image, output, sizeof(output));
	check_rc(rc, output);

	Json::Value root(Json::objectValue);
	root["escrow"] = derived_to_json(escrow);
	root["tracker"] = derived_to_json(tracker);
	root["execution"] = derived_to_json(execution);
	root["image"] = derived_to_json(image);

	write_json(root, out);
}

static void do_encode_open(const vector<string>& args, ostream& out)
{
	check_args(args, 3, "encode-open <seed> <commitment> <amount>");

	char output[ERROR_BUFSIZE];

	OpenInstruction open;
	open.seed = args[1];
	open.commitment = args[2];
	open.amount = parse_amount(args[3]);

	auto rc = check_commitment_format("encode-open", open.commitment, output, sizeof(output));
	check_rc(rc, output);

	vector<uint8_t> data;

	rc = encode_open(open, data, output, sizeof(output));
	check_rc(rc, output);

	out << buf2hex(data.data(), data.size()) << endl;
}

static void do_encode_claim(const vector<string>& args, const EscrowParams& params, ostream& out)
{
	check_args(args, 3, "encode-claim <seed> <execution-id> <preimage>");

	Address escrow_program, proof_program;
	parse_program_ids(params, escrow_program, proof_program);

	char output[ERROR_BUFSIZE];

	ClaimInstruction claim;
	claim.seed = args[1];
	claim.preimage = arg_or_file(args[3]);
	claim.tip = params.tip;
	claim.expiry = params.expiry;

	auto rc = execution_id_from_string(args[2], claim.execution_id, output, sizeof(output));
	check_rc(rc, output);

	DerivedAddress tracker;

	rc = derive_tracker_address(claim.execution_id, escrow_program, tracker, output, sizeof(output));
	check_rc(rc, output);

	claim.bump = tracker.bump;

	vector<uint8_t> data;

	rc = encode_claim(claim, data, output, sizeof(output));
	check_rc(rc, output);

	out << buf2hex(data.data(), data.size()) << endl;
}

static void do_decode_instruction(const vector<string>& args, ostream& out)
{
	check_args(args, 1, "decode-instruction <hex|@file>");

	auto data = parse_hex_arg(args[1]);

	if (data.empty())
		throw Escrow_Exception(ESCROW_MALFORMED_INSTRUCTION, "instruction data is empty");

	char output[ERROR_BUFSIZE];
	Json::Value root(Json::objectValue);

	if (data[0] == ESCROW_OPCODE_OPEN)
	{
		OpenInstruction open;

		auto rc = decode_open(data, open, output, sizeof(output));
		check_rc(rc, output);

		root["instruction"] = "open";
		root["seed"] = open.seed;
		root["commitment"] = open.commitment;
		root["amount"] = Json::Value::UInt64(open.amount);
	}
	else if (data[0] == ESCROW_OPCODE_CLAIM)
	{
		ClaimInstruction claim;

		auto rc = decode_claim(data, claim, output, sizeof(output));
		check_rc(rc, output);

		root["instruction"] = "claim";
		root["execution_id"] = execution_id_to_string(claim.execution_id);
		root["bump"] = (unsigned)claim.bump;
		root["tip"] = Json::Value::UInt64(claim.tip);
		root["expiry"] = Json::Value::UInt64(claim.expiry);
		root["seed"] = claim.seed;
		root["preimage_bytes"] = (unsigned)claim.preimage.length();
	}
	else
		throw Escrow_Exception(ESCROW_MALFORMED_INSTRUCTION, "unknown opcode " + to_string(data[0]));

	write_json(root, out);
}

static void do_decode_account(const vector<string>& args, ostream& out)
{
	check_args(args, 1, "decode-account <hex|@file>");

	auto raw = parse_hex_arg(args[1]);

	char output[ERROR_BUFSIZE];
	EscrowAccount account;

	auto rc = decode_escrow_account(raw, account, output, sizeof(output));
	check_rc(rc, output);

	Json::Value root;
	escrow_account_to_json(account, root);

	write_json(root, out);
}

void run_command(const vector<string>& args, const EscrowParams& params, ostream& out)
{
	if (args.empty())
		throw Escrow_Exception(ESCROW_INVALID_PARAMETER, "no command; use --help for usage");

	auto& command = args[0];

	BOOST_LOG_TRIVIAL(debug) << "run_command " << command << " nargs " << args.size() - 1;

	if (command == "commit")
		do_commit(args, out);
	else if (command == "new-execution-id")
		do_new_execution_id(args, out);
	else if (command == "derive-escrow")
		do_derive_escrow(args, params, out);
	else if (command == "derive-claim")
		do_derive_claim(args, params, out);
	else if (command == "encode-open")
		do_encode_open(args, out);
	else if (command == "encode-claim")
		do_encode_claim(args, params, out);
	else if (command == "decode-instruction")
		do_decode_instruction(args, out);
	else if (command == "decode-account")
		do_decode_account(args, out);
	else
		throw Escrow_Exception(ESCROW_INVALID_PARAMETER, "unknown command \"" + command + "\"");
}
