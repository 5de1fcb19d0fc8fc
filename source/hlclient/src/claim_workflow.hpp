/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * claim_workflow.hpp
*/

#pragma once

#include "escrow_context.hpp"

#include <escrow_account.hpp>
#include <instruction.hpp>

namespace Hashlock {

/*
	Built -> Submitted -> (Pending | Rejected) -> (Released | Expired)

	Rejected, Released and Expired are terminal.
*/

enum ClaimState
{
	CLAIM_BUILT = 0,
	CLAIM_SUBMITTED,
	CLAIM_PENDING,
	CLAIM_REJECTED,
	CLAIM_RELEASED,
	CLAIM_EXPIRED
};

const char* claim_state_string(ClaimState state);
bool claim_state_terminal(ClaimState state);

struct ClaimAddresses
{
	DerivedAddress escrow;
	DerivedAddress tracker;		// the requester account for the proof service
	DerivedAddress execution;
	DerivedAddress image;
};

class ClaimAttempt
{
public:
	ClaimState state;

	Address payer;
	Address receiver;
	ClaimAddresses addresses;
	ClaimInstruction claim;
	Instruction instruction;
	string preimage_commitment;	// commit(claim.preimage); released only if it matches the escrow

	uint64_t submit_slot;		// slot observed after the claim confirmed
	string signature;

	HLRESULT error_code;
	string error;

	bool have_account;
	EscrowAccount account;		// last escrow state read

	ClaimAttempt()
	{
		Clear();
	}

	void Clear();

	uint64_t ExpirySlot() const;
};

class ClaimWorkflow
{
	EscrowContext& m_context;

	static void SetError(ClaimAttempt& attempt, HLRESULT rc, const string& error);

public:
	explicit ClaimWorkflow(EscrowContext& context)
	 :	m_context(context)
	{ }

	// derives every address and assembles the claim instruction; no I/O
	HLRESULT Build(const string& seed, const string& preimage, const Address& payer, const Address& receiver, const execution_id_t& execution_id, ClaimAttempt& attempt, char *output = NULL, const uint32_t outsize = 0) const;

	// Reads the escrow, and if it is unclaimed submits the claim once. No retries: an execution id is single use.
	HLRESULT Submit(ClaimAttempt& attempt, const Signer& payer);

	// Released requires the escrow claimed to this receiver and holding the commitment of this preimage
	static ClaimState ClassifyOutcome(const ClaimAttempt& attempt, const EscrowAccount& account, uint64_t current_slot);

	// one read of the escrow; updates attempt.state
	HLRESULT PollOnce(ClaimAttempt& attempt);

	// polls until a terminal state or the configured number of attempts; may return with the state still Pending
	HLRESULT AwaitOutcome(ClaimAttempt& attempt);
};

} // namespace Hashlock
