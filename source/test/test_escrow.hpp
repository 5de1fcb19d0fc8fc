/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * test_escrow.hpp
*/

#pragma once

#include "sim_ledger.hpp"

#include <escrow_context.hpp>
#include <escrow_client.hpp>
#include <commitment.hpp>

#define TEST_FUNDS		10000000000ULL

// A funded simulated ledger with three parties and a client bound to it.

struct EscrowTestingSetup
{
	EscrowParams params;
	Hashlock::SimLedger ledger;
	Hashlock::EscrowContext context;
	Hashlock::EscrowClient client;

	Hashlock::SimSigner alice;		// opens escrows
	Hashlock::SimSigner bob;		// pays for claims
	Hashlock::SimSigner carol;

	char output[512];

	static EscrowParams TestParams()
	{
		EscrowParams p;
		p.poll_interval_ms = 0;
		p.poll_attempts = 50;
		p.expiry = 20;
		return p;
	}

	EscrowTestingSetup()
	 :	params(TestParams()),
		ledger(params),
		context(params, ledger),
		client(context),
		alice("alice"),
		bob("bob"),
		carol("carol")
	{
		output[0] = 0;

		ledger.Airdrop(alice.PublicAddress(), TEST_FUNDS);
		ledger.Airdrop(bob.PublicAddress(), TEST_FUNDS);
		ledger.Airdrop(carol.PublicAddress(), TEST_FUNDS);
	}

	HLRESULT Open(const string& seed, const string& secret, uint64_t amount)
	{
		string commitment;
		auto rc = Hashlock::commit(secret, commitment);
		if (rc) return rc;

		Hashlock::OpenResult result;

		return client.OpenEscrow(alice, seed, commitment, amount, result, output, sizeof(output));
	}
};
