/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * escrow_context.cpp
*/

#include "escrow_context.hpp"

#define TRACE_CLIENT	(params.trace_client)

namespace Hashlock {

static Address parse_program_id(const char *name, const string& value)
{
	char output[256];

	Address address;

	if (Address::FromString(value, address, output, sizeof(output)))
		throw runtime_error(string("Invalid ") + name + ": " + output);

	return address;
}

EscrowContext::EscrowContext(const EscrowParams& p, LedgerConnection& l)
 :	params(p),
	ledger(l)
{
	escrow_program = parse_program_id("escrow program id", params.escrow_program);
	proof_program = parse_program_id("proof program id", params.proof_program);
	system_program = parse_program_id("system program id", SYSTEM_PROGRAM_ID);

	char output[256];

	if (derive_image_address(params.image_id, proof_program, image_account, output, sizeof(output)))
		throw runtime_error(string("Unable to derive image account: ") + output);

	if (TRACE_CLIENT) BOOST_LOG_TRIVIAL(debug) << "EscrowContext escrow program " << escrow_program << " proof program " << proof_program << " image account " << image_account.address;
}

} // namespace Hashlock
