/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * escrow_client.cpp
*/

#include "escrow_client.hpp"

#include <commitment.hpp>

#define TRACE_CLIENT	(m_context.params.trace_client)

namespace Hashlock {

HLRESULT EscrowClient::OpenEscrow(const Signer& initializer, const string& seed, const string& commitment, uint64_t amount, OpenResult& result, char *output, const uint32_t outsize)
{
	static const string fn = "EscrowClient::OpenEscrow";

	result = OpenResult();

	if (TRACE_CLIENT) BOOST_LOG_TRIVIAL(info) << fn << " seed \"" << seed << "\" commitment " << commitment << " amount " << amount << " initializer " << initializer.PublicAddress();

	auto rc = check_commitment_format(fn, commitment, output, outsize);
	if (rc) return rc;

	rc = derive_escrow_address(seed, m_context.escrow_program, result.escrow, output, outsize);
	if (rc) return rc;

	OpenInstruction open;
	open.seed = seed;
	open.commitment = commitment;
	open.amount = amount;

	auto& instruction = result.instruction;
	instruction.program_id = m_context.escrow_program;

	rc = encode_open(open, instruction.data, output, outsize);
	if (rc) return rc;

	instruction.accounts.push_back(AccountMeta(initializer.PublicAddress(), true, true));
	instruction.accounts.push_back(AccountMeta(result.escrow.address, false, true));
	instruction.accounts.push_back(AccountMeta(m_context.system_program, false, false));

	Transaction tx;
	tx.instructions.push_back(instruction);

	vector<const Signer*> signers;
	signers.push_back(&initializer);

	rc = m_context.ledger.SubmitAndConfirm(tx, signers, result.signature, result.error);
	if (rc)
		return escrow_error(fn, ESCROW_SUBMISSION_FAILED, result.error, output, outsize);

	if (TRACE_CLIENT) BOOST_LOG_TRIVIAL(info) << fn << " escrow " << result.escrow.address << " opened signature " << result.signature;

	return 0;
}

HLRESULT EscrowClient::ClaimEscrow(const Signer& payer, const string& seed, const string& preimage, const Address& receiver, const string& execution_id, ClaimAttempt& attempt, char *output, const uint32_t outsize)
{
	static const string fn = "EscrowClient::ClaimEscrow";

	attempt.Clear();

	execution_id_t id;

	{
		auto rc = execution_id.empty() ? new_execution_id(id, output, outsize) : execution_id_from_string(execution_id, id, output, outsize);
		if (rc) return rc;
	}

	if (TRACE_CLIENT) BOOST_LOG_TRIVIAL(info) << fn << " seed \"" << seed << "\" receiver " << receiver << " execution id " << execution_id_to_string(id);

	auto rc = m_workflow.Build(seed, preimage, payer.PublicAddress(), receiver, id, attempt, output, outsize);
	if (rc) return rc;

	rc = m_workflow.Submit(attempt, payer);
	if (rc)
	{
		string error = attempt.error.length() ? attempt.error : string(escrow_error_string(rc));

		return copy_error_to_output(fn, error, output, outsize, rc);
	}

	return 0;
}

HLRESULT EscrowClient::ReadEscrow(const string& seed, EscrowAccount& account, char *output, const uint32_t outsize)
{
	static const string fn = "EscrowClient::ReadEscrow";

	account.Clear();

	DerivedAddress escrow;

	auto rc = derive_escrow_address(seed, m_context.escrow_program, escrow, output, outsize);
	if (rc) return rc;

	vector<uint8_t> raw;

	rc = m_context.ledger.ReadAccount(escrow.address, raw);
	if (rc == ESCROW_NOT_FOUND)
		return escrow_error(fn, rc, "no escrow at " + escrow.address.ToString(), output, outsize);
	if (rc)
		return escrow_error(fn, rc, "read of " + escrow.address.ToString() + " failed", output, outsize);

	rc = decode_escrow_account(raw, account, output, outsize);
	if (rc) return rc;

	if (TRACE_CLIENT) BOOST_LOG_TRIVIAL(debug) << fn << " escrow " << escrow.address << " amount " << account.amount << " is_claimed " << account.is_claimed;

	return 0;
}

} // namespace Hashlock
