/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * escrow_client.hpp
*/

#pragma once

#include "escrow_context.hpp"
#include "claim_workflow.hpp"

namespace Hashlock {

struct OpenResult
{
	DerivedAddress escrow;
	Instruction instruction;
	string signature;
	string error;		// ledger reason when the submission fails
};

class EscrowClient
{
	EscrowContext& m_context;
	ClaimWorkflow m_workflow;

public:
	explicit EscrowClient(EscrowContext& context)
	 :	m_context(context),
		m_workflow(context)
	{ }

	// locks amount lamports from the initializer under the commitment
	HLRESULT OpenEscrow(const Signer& initializer, const string& seed, const string& commitment, uint64_t amount, OpenResult& result, char *output = NULL, const uint32_t outsize = 0);

	// Builds and submits a claim. An empty execution_id generates a fresh one.
	// On a ledger rejection or an already claimed escrow, attempt.state is Rejected and the error is returned.
	HLRESULT ClaimEscrow(const Signer& payer, const string& seed, const string& preimage, const Address& receiver, const string& execution_id, ClaimAttempt& attempt, char *output = NULL, const uint32_t outsize = 0);

	// returns ESCROW_NOT_FOUND if the escrow does not exist
	HLRESULT ReadEscrow(const string& seed, EscrowAccount& account, char *output = NULL, const uint32_t outsize = 0);

	HLRESULT PollOutcome(const string& seed, EscrowAccount& account, char *output = NULL, const uint32_t outsize = 0)
	{
		return ReadEscrow(seed, account, output, outsize);
	}

	HLRESULT AwaitClaimOutcome(ClaimAttempt& attempt)
	{
		return m_workflow.AwaitOutcome(attempt);
	}

	const ClaimWorkflow& Workflow() const
	{
		return m_workflow;
	}
};

} // namespace Hashlock
