/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * claim_workflow.cpp
*/

#include "claim_workflow.hpp"

#include <commitment.hpp>

#define TRACE_WORKFLOW	(m_context.params.trace_workflow)
#define TRACE_POLLING	(m_context.params.trace_polling)

namespace Hashlock {

const char* claim_state_string(ClaimState state)
{
	switch (state)
	{
	case CLAIM_BUILT:		return "Built";
	case CLAIM_SUBMITTED:	return "Submitted";
	case CLAIM_PENDING:		return "Pending";
	case CLAIM_REJECTED:	return "Rejected";
	case CLAIM_RELEASED:	return "Released";
	case CLAIM_EXPIRED:		return "Expired";
	}

	return "Unknown";
}

bool claim_state_terminal(ClaimState state)
{
	return state == CLAIM_REJECTED || state == CLAIM_RELEASED || state == CLAIM_EXPIRED;
}

void ClaimAttempt::Clear()
{
	state = CLAIM_BUILT;
	payer = Address();
	receiver = Address();
	addresses = ClaimAddresses();
	claim = ClaimInstruction();
	instruction = Instruction();
	preimage_commitment.clear();
	submit_slot = 0;
	signature.clear();
	error_code = 0;
	error.clear();
	have_account = false;
	account.Clear();
}

uint64_t ClaimAttempt::ExpirySlot() const
{
	auto slot = submit_slot + claim.expiry;

	if (slot < submit_slot)
		return (uint64_t)(-1);

	return slot;
}

void ClaimWorkflow::SetError(ClaimAttempt& attempt, HLRESULT rc, const string& error)
{
	attempt.error_code = rc;
	attempt.error = error;
}

HLRESULT ClaimWorkflow::Build(const string& seed, const string& preimage, const Address& payer, const Address& receiver, const execution_id_t& execution_id, ClaimAttempt& attempt, char *output, const uint32_t outsize) const
{
	attempt.Clear();

	attempt.payer = payer;
	attempt.receiver = receiver;

	auto& addresses = attempt.addresses;

	auto rc = derive_escrow_address(seed, m_context.escrow_program, addresses.escrow, output, outsize);
	if (rc) return rc;

	rc = derive_tracker_address(execution_id, m_context.escrow_program, addresses.tracker, output, outsize);
	if (rc) return rc;

	rc = derive_execution_address(payer, execution_id, m_context.proof_program, addresses.execution, output, outsize);
	if (rc) return rc;

	addresses.image = m_context.image_account;

	auto& claim = attempt.claim;
	claim.execution_id = execution_id;
	claim.bump = addresses.tracker.bump;
	claim.tip = m_context.params.tip;
	claim.expiry = m_context.params.expiry;
	claim.seed = seed;
	claim.preimage = preimage;

	rc = commit(preimage, attempt.preimage_commitment);
	if (rc) return escrow_error("ClaimWorkflow::Build", rc, "unable to hash the preimage", output, outsize);

	auto& instruction = attempt.instruction;
	instruction.program_id = m_context.escrow_program;

	rc = encode_claim(claim, instruction.data, output, outsize);
	if (rc) return rc;

	instruction.accounts.push_back(AccountMeta(payer, true, true));
	instruction.accounts.push_back(AccountMeta(receiver, false, true));
	instruction.accounts.push_back(AccountMeta(addresses.escrow.address, false, true));
	instruction.accounts.push_back(AccountMeta(addresses.tracker.address, false, true));
	instruction.accounts.push_back(AccountMeta(addresses.execution.address, false, true));
	instruction.accounts.push_back(AccountMeta(m_context.system_program, false, false));
	instruction.accounts.push_back(AccountMeta(m_context.proof_program, false, false));
	instruction.accounts.push_back(AccountMeta(addresses.image.address, false, false));
	instruction.accounts.push_back(AccountMeta(m_context.escrow_program, false, false));

	attempt.state = CLAIM_BUILT;

	if (TRACE_WORKFLOW) BOOST_LOG_TRIVIAL(debug) << "ClaimWorkflow::Build execution id " << execution_id_to_string(execution_id)
			<< " escrow " << addresses.escrow.address << " tracker " << addresses.tracker.address << " bump " << (unsigned)addresses.tracker.bump
			<< " execution " << addresses.execution.address << " image " << addresses.image.address << " data bytes " << instruction.data.size();

	return 0;
}

HLRESULT ClaimWorkflow::Submit(ClaimAttempt& attempt, const Signer& payer)
{
	static const string fn = "ClaimWorkflow::Submit";

	char output[256];

	if (attempt.state != CLAIM_BUILT)
		return escrow_error(fn, ESCROW_INVALID_PARAMETER, string("attempt is ") + claim_state_string(attempt.state) + ", not Built", NULL, 0);

	if (payer.PublicAddress() != attempt.payer)
		return escrow_error(fn, ESCROW_INVALID_PARAMETER, "signer " + payer.PublicAddress().ToString() + " is not the payer " + attempt.payer.ToString(), NULL, 0);

	vector<uint8_t> raw;

	auto rc = m_context.ledger.ReadAccount(attempt.addresses.escrow.address, raw);
	if (rc == ESCROW_NOT_FOUND)
		return escrow_error(fn, rc, "no escrow at " + attempt.addresses.escrow.address.ToString(), NULL, 0);
	if (rc) return rc;

	rc = decode_escrow_account(raw, attempt.account, output, sizeof(output));
	if (rc)
	{
		SetError(attempt, rc, output);

		return rc;
	}

	attempt.have_account = true;

	if (attempt.account.is_claimed)
	{
		attempt.state = CLAIM_REJECTED;
		SetError(attempt, ESCROW_ALREADY_CLAIMED, "escrow already claimed");

		if (TRACE_WORKFLOW) BOOST_LOG_TRIVIAL(info) << fn << " escrow " << attempt.addresses.escrow.address << " already claimed; not submitted";

		return ESCROW_ALREADY_CLAIMED;
	}

	// lower bound for the slot that executes the claim
	uint64_t slot = 0;
	rc = m_context.ledger.GetSlot(slot);
	if (rc) return rc;

	Transaction tx;
	tx.instructions.push_back(attempt.instruction);

	vector<const Signer*> signers;
	signers.push_back(&payer);

	attempt.state = CLAIM_SUBMITTED;

	if (TRACE_WORKFLOW) BOOST_LOG_TRIVIAL(debug) << fn << " submitting claim execution id " << execution_id_to_string(attempt.claim.execution_id);

	string error;

	rc = m_context.ledger.SubmitAndConfirm(tx, signers, attempt.signature, error);
	if (rc)
	{
		attempt.state = CLAIM_REJECTED;
		SetError(attempt, ESCROW_SUBMISSION_FAILED, error);

		BOOST_LOG_TRIVIAL(warning) << fn << " claim rejected: " << error;

		return ESCROW_SUBMISSION_FAILED;
	}

	attempt.state = CLAIM_PENDING;
	attempt.submit_slot = slot;

	rc = m_context.ledger.GetSlot(slot);
	if (rc)
		BOOST_LOG_TRIVIAL(warning) << fn << " unable to read the slot after confirmation; expiry measured from slot " << attempt.submit_slot;
	else
		attempt.submit_slot = slot;

	if (TRACE_WORKFLOW) BOOST_LOG_TRIVIAL(info) << fn << " claim confirmed signature " << attempt.signature << " slot " << attempt.submit_slot << " expires after slot " << attempt.ExpirySlot();

	return 0;
}

ClaimState ClaimWorkflow::ClassifyOutcome(const ClaimAttempt& attempt, const EscrowAccount& account, uint64_t current_slot)
{
	if (claim_state_terminal(attempt.state))
		return attempt.state;

	if (account.is_claimed)
	{
		// another claim won the race, unless it paid the same receiver with this same preimage
		if (account.has_receiver && account.receiver == attempt.receiver
				&& attempt.preimage_commitment.length() && boost::iequals(attempt.preimage_commitment, account.commitment))
			return CLAIM_RELEASED;
		else
			return CLAIM_REJECTED;
	}

	if (current_slot > attempt.ExpirySlot())
		return CLAIM_EXPIRED;

	return CLAIM_PENDING;
}

HLRESULT ClaimWorkflow::PollOnce(ClaimAttempt& attempt)
{
	static const string fn = "ClaimWorkflow::PollOnce";

	if (attempt.state == CLAIM_BUILT || attempt.state == CLAIM_SUBMITTED)
		return escrow_error(fn, ESCROW_INVALID_PARAMETER, string("attempt is ") + claim_state_string(attempt.state) + ", not confirmed", NULL, 0);

	if (claim_state_terminal(attempt.state))
		return 0;

	vector<uint8_t> raw;

	auto rc = m_context.ledger.ReadAccount(attempt.addresses.escrow.address, raw);
	if (rc == ESCROW_NOT_FOUND)
		return escrow_error(fn, rc, "no escrow at " + attempt.addresses.escrow.address.ToString(), NULL, 0);
	if (rc) return rc;

	EscrowAccount account;
	char output[256];

	rc = decode_escrow_account(raw, account, output, sizeof(output));
	if (rc)
	{
		if (escrow_error_category(rc) != ESCROW_CATEGORY_DECODING)
			return rc;

		uint64_t slot = 0;
		auto rc2 = m_context.ledger.GetSlot(slot);
		if (rc2) return rc2;

		if (slot <= attempt.ExpirySlot())
		{
			if (TRACE_POLLING) BOOST_LOG_TRIVIAL(debug) << fn << " slot " << slot << " escrow not yet readable: " << output;

			return 0;
		}

		// unreadable for the whole claim window
		attempt.state = CLAIM_EXPIRED;
		SetError(attempt, rc, output);

		BOOST_LOG_TRIVIAL(warning) << fn << " execution id " << execution_id_to_string(attempt.claim.execution_id) << " expired at slot " << slot << " with the escrow unreadable: " << output;

		return 0;
	}

	uint64_t slot = 0;
	rc = m_context.ledger.GetSlot(slot);
	if (rc) return rc;

	attempt.account = account;
	attempt.have_account = true;

	auto prior = attempt.state;
	attempt.state = ClassifyOutcome(attempt, account, slot);

	if (attempt.state == CLAIM_REJECTED)
		SetError(attempt, ESCROW_ALREADY_CLAIMED, "escrow claimed by " + account.receiver.ToString());

	if (TRACE_POLLING) BOOST_LOG_TRIVIAL(trace) << fn << " slot " << slot << " is_claimed " << account.is_claimed << " state " << claim_state_string(attempt.state);

	if (TRACE_WORKFLOW && attempt.state != prior) BOOST_LOG_TRIVIAL(info) << fn << " execution id " << execution_id_to_string(attempt.claim.execution_id) << " " << claim_state_string(prior) << " -> " << claim_state_string(attempt.state) << " at slot " << slot;

	return 0;
}

HLRESULT ClaimWorkflow::AwaitOutcome(ClaimAttempt& attempt)
{
	auto interval = m_context.params.poll_interval_ms;
	auto attempts = m_context.params.poll_attempts;

	if (TRACE_POLLING) BOOST_LOG_TRIVIAL(debug) << "ClaimWorkflow::AwaitOutcome interval " << interval << " ms attempts " << attempts;

	auto t0 = hlnow();

	for (int i = 0; i < attempts && !claim_state_terminal(attempt.state); ++i)
	{
		if (i)
			hlsleep_ms(interval);

		auto rc = PollOnce(attempt);
		if (rc) return rc;
	}

	if (TRACE_POLLING) BOOST_LOG_TRIVIAL(debug) << "ClaimWorkflow::AwaitOutcome done state " << claim_state_string(attempt.state) << " elapsed " << hlelapsed_ms(t0) << " ms";

	return 0;
}

} // namespace Hashlock
