/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * commands_tests.cpp
*/

#include <hlclient.h>
#include <commands.hpp>
#include <options.hpp>
#include <instruction.hpp>
#include <escrow_account.hpp>
#include <commitment.hpp>
#include <apputil.h>

#include <sstream>

#include <boost/test/unit_test.hpp>

using namespace Hashlock;

#define HELLO_COMMITMENT	"2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824"

static string run(const vector<string>& args, const EscrowParams& params = EscrowParams())
{
	ostringstream out;

	run_command(args, params, out);

	return out.str();
}

static Json::Value run_json(const vector<string>& args, const EscrowParams& params = EscrowParams())
{
	auto text = run(args, params);

	Json::CharReaderBuilder builder;
	Json::Value root;
	string errors;
	istringstream in(text);

	BOOST_REQUIRE(Json::parseFromStream(builder, in, &root, &errors));

	return root;
}

static HLRESULT command_error(const vector<string>& args)
{
	try
	{
		run(args);
	}
	catch (const Escrow_Exception& e)
	{
		return e.code;
	}

	return 0;
}

static int parse_options(vector<string> args, EscrowParams& params)
{
	vector<char*> argv;
	for (auto& arg : args)
		argv.push_back(&arg[0]);

	boost::program_options::variables_map config_options;

	auto rc = process_options(argv.size(), argv.data(), params, config_options);

	set_trace_level(0);

	return rc;
}

BOOST_AUTO_TEST_SUITE(commands_tests)

BOOST_AUTO_TEST_CASE(commit_command)
{
	BOOST_CHECK_EQUAL(run({"commit", "hello"}), HELLO_COMMITMENT "\n");
	BOOST_CHECK_EQUAL(command_error({"commit"}), ESCROW_INVALID_PARAMETER);
	BOOST_CHECK_EQUAL(command_error({}), ESCROW_INVALID_PARAMETER);
	BOOST_CHECK_EQUAL(command_error({"frobnicate"}), ESCROW_INVALID_PARAMETER);
}

BOOST_AUTO_TEST_CASE(new_execution_id_command)
{
	auto id = run({"new-execution-id"});

	BOOST_CHECK_EQUAL(id.length(), EXECUTION_ID_BYTES + 1);
	BOOST_CHECK_NE(id, run({"new-execution-id"}));
}

BOOST_AUTO_TEST_CASE(derive_commands)
{
	auto root = run_json({"derive-escrow", "s1"});

	Address escrow_program;
	BOOST_REQUIRE_EQUAL(Address::FromString(DEFAULT_ESCROW_PROGRAM_ID, escrow_program), 0);

	DerivedAddress escrow;
	BOOST_REQUIRE_EQUAL(derive_escrow_address("s1", escrow_program, escrow), 0);

	BOOST_CHECK_EQUAL(root["address"].asString(), escrow.address.ToString());
	BOOST_CHECK_EQUAL(root["bump"].asUInt(), escrow.bump);
	BOOST_CHECK_EQUAL(root["seed"].asString(), "s1");
	BOOST_CHECK_EQUAL(root["program"].asString(), DEFAULT_ESCROW_PROGRAM_ID);

	root = run_json({"derive-claim", "s1", "exec-1", DEFAULT_PROOF_PROGRAM_ID});
	BOOST_CHECK_EQUAL(root["escrow"]["address"].asString(), escrow.address.ToString());
	BOOST_CHECK(root["tracker"]["address"].isString());
	BOOST_CHECK(root["execution"]["address"].isString());
	BOOST_CHECK(root["image"]["address"].isString());

	BOOST_CHECK_EQUAL(command_error({"derive-escrow", string(33, 's')}), ESCROW_SEED_TOO_LONG);
	BOOST_CHECK_EQUAL(command_error({"derive-claim", "s1", string(17, 'x'), DEFAULT_PROOF_PROGRAM_ID}), ESCROW_INVALID_EXECUTION_ID);
	BOOST_CHECK_EQUAL(command_error({"derive-claim", "s1", "exec-1", "bad address"}), ESCROW_INVALID_ADDRESS);

	EscrowParams params;
	params.escrow_program = "0";
	BOOST_CHECK_THROW(run({"derive-escrow", "s1"}, params), Escrow_Exception);
}

BOOST_AUTO_TEST_CASE(encode_and_decode_open)
{
	auto hex = run({"encode-open", "s1", HELLO_COMMITMENT, "100000000"});
	BOOST_REQUIRE(hex.length() > 1);
	hex.pop_back();

	BOOST_CHECK_EQUAL(hex.substr(0, 10), "0002733140");
	BOOST_CHECK_EQUAL(hex.substr(hex.length() - 16), "00e1f50500000000");

	auto root = run_json({"decode-instruction", hex});
	BOOST_CHECK_EQUAL(root["instruction"].asString(), "open");
	BOOST_CHECK_EQUAL(root["seed"].asString(), "s1");
	BOOST_CHECK_EQUAL(root["commitment"].asString(), HELLO_COMMITMENT);
	BOOST_CHECK_EQUAL(root["amount"].asUInt64(), 100000000);

	BOOST_CHECK_EQUAL(command_error({"encode-open", "s1", "abc", "1"}), ESCROW_INVALID_COMMITMENT_FORMAT);
	BOOST_CHECK_EQUAL(command_error({"encode-open", "s1", HELLO_COMMITMENT, "lots"}), ESCROW_INVALID_PARAMETER);
}

BOOST_AUTO_TEST_CASE(encode_and_decode_claim)
{
	EscrowParams params;
	params.tip = 7;
	params.expiry = 9;

	auto hex = run({"encode-claim", "s1", "exec-1", "hello"}, params);
	hex.pop_back();

	auto root = run_json({"decode-instruction", hex});
	BOOST_CHECK_EQUAL(root["instruction"].asString(), "claim");
	BOOST_CHECK_EQUAL(root["execution_id"].asString(), "exec-1");
	BOOST_CHECK_EQUAL(root["tip"].asUInt64(), 7);
	BOOST_CHECK_EQUAL(root["expiry"].asUInt64(), 9);
	BOOST_CHECK_EQUAL(root["seed"].asString(), "s1");
	BOOST_CHECK_EQUAL(root["preimage_bytes"].asUInt(), 5);

	BOOST_CHECK_EQUAL(command_error({"decode-instruction", "02"}), ESCROW_MALFORMED_INSTRUCTION);
	BOOST_CHECK_EQUAL(command_error({"decode-instruction", hex + "00"}), ESCROW_MALFORMED_INSTRUCTION);
	BOOST_CHECK_EQUAL(command_error({"decode-instruction", "zz"}), ESCROW_INVALID_PARAMETER);
}

BOOST_AUTO_TEST_CASE(decode_account_command)
{
	EscrowAccount account;
	account.SetSeed("s1");
	account.amount = 42;
	account.commitment = HELLO_COMMITMENT;

	vector<uint8_t> raw;
	BOOST_REQUIRE_EQUAL(pack_escrow_account(account, raw), 0);

	auto hex = buf2hex(raw.data(), raw.size());

	auto root = run_json({"decode-account", hex});
	BOOST_CHECK_EQUAL(root["seed"].asString(), "s1");
	BOOST_CHECK_EQUAL(root["amount"].asUInt64(), 42);
	BOOST_CHECK_EQUAL(root["is_claimed"].asBool(), false);

	BOOST_CHECK_EQUAL(command_error({"decode-account", hex.substr(2)}), ESCROW_TRUNCATED_ACCOUNT);
}

BOOST_AUTO_TEST_CASE(option_values)
{
	EscrowParams params;

	BOOST_CHECK_EQUAL(parse_options({"hlescrow", "--tip", "5", "--expiry", "12", "--poll-attempts", "4", "commit", "x"}, params), 0);
	BOOST_CHECK_EQUAL(params.tip, 5);
	BOOST_CHECK_EQUAL(params.expiry, 12);
	BOOST_CHECK_EQUAL(params.poll_attempts, 4);
	BOOST_CHECK_EQUAL(params.poll_interval_ms, DEFAULT_POLL_INTERVAL_MS);
	BOOST_CHECK_EQUAL(params.escrow_program, DEFAULT_ESCROW_PROGRAM_ID);

	EscrowParams bad;
	BOOST_CHECK_THROW(parse_options({"hlescrow", "--poll-attempts", "0"}, bad), range_error);

	EscrowParams bad_program;
	BOOST_CHECK_THROW(parse_options({"hlescrow", "--escrow-program", "xyz0"}, bad_program), range_error);

	EscrowParams missing_config;
	BOOST_CHECK_THROW(parse_options({"hlescrow", "--config", "/nonexistent/hlescrow.conf"}, missing_config), runtime_error);

	ostringstream os;
	do_show_config(params, os);
	BOOST_CHECK(os.str().find("claim tip = 5") != string::npos);

	// a failed parse leaves the configured trace level in force
	set_trace_level(0);
}

BOOST_AUTO_TEST_SUITE_END()
