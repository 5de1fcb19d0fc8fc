/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * sim_ledger.cpp
*/

#include "sim_ledger.hpp"

#include <HLhash.hpp>
#include <encode.h>
#include <commitment.hpp>
#include <instruction.hpp>

#define TRACE_SIM	0

namespace Hashlock {

SimSigner::SimSigner(const string& name)
{
	hash256_t digest;

	auto rc = sha256(name.data(), name.length(), digest);
	HLASSERTZ(rc);

	m_address = Address(digest);
}

HLRESULT SimSigner::Sign(const vector<uint8_t>& message, vector<uint8_t>& signature) const
{
	Sha256Hasher hasher;
	hash256_t r, s;

	auto rc = hasher.Update(m_address.data(), m_address.size());
	if (!rc) rc = hasher.Update(message.data(), message.size());
	if (!rc) rc = hasher.Final(r);
	if (!rc) rc = hasher.Update(r.data(), r.size());
	if (!rc) rc = hasher.Final(s);
	if (rc) return rc;

	signature.assign(r.begin(), r.end());
	signature.insert(signature.end(), s.begin(), s.end());

	return 0;
}

SimLedger::SimLedger(const EscrowParams& params)
 :	m_slot(1000),
	m_signature_count(0),
	prover_delay_slots(2),
	slots_per_query(1),
	prover_online(true),
	submit_count(0)
{
	auto rc = Address::FromString(params.escrow_program, m_escrow_program);
	if (!rc) rc = Address::FromString(params.proof_program, m_proof_program);
	if (!rc) rc = Address::FromString(SYSTEM_PROGRAM_ID, m_system_program);
	HLASSERTZ(rc);

	DerivedAddress image;
	rc = derive_image_address(params.image_id, m_proof_program, image);
	HLASSERTZ(rc);

	m_image_account = image.address;
}

void SimLedger::Airdrop(const Address& address, uint64_t lamports)
{
	auto& account = m_accounts[address];

	account.lamports += lamports;
	account.owner = m_system_program;
}

uint64_t SimLedger::Balance(const Address& address) const
{
	auto it = m_accounts.find(address);

	if (it == m_accounts.end())
		return 0;

	return it->second.lamports;
}

bool SimLedger::AccountExists(const Address& address) const
{
	auto it = m_accounts.find(address);

	return it != m_accounts.end() && it->second.lamports;
}

void SimLedger::AdvanceSlots(uint64_t nslots)
{
	m_slot += nslots;

	RunProver();
}

HLRESULT SimLedger::Debit(const Address& address, uint64_t lamports, string& error)
{
	auto it = m_accounts.find(address);

	if (it == m_accounts.end() || it->second.lamports < lamports)
	{
		error = "insufficient funds in " + address.ToString();
		return -1;
	}

	it->second.lamports -= lamports;

	return 0;
}

void SimLedger::CreateAccount(const Address& address, const Address& owner, uint64_t lamports, size_t space)
{
	auto& account = m_accounts[address];

	account.lamports = lamports;
	account.owner = owner;
	account.data.assign(space, 0);
}

static bool has_signer(const Instruction& instruction, unsigned index, const set<Address>& signed_by)
{
	auto& meta = instruction.accounts[index];

	return meta.is_signer && signed_by.count(meta.address);
}

HLRESULT SimLedger::ExecuteOpen(const Instruction& instruction, const set<Address>& signed_by, string& error)
{
	OpenInstruction open;

	if (decode_open(instruction.data, open))
	{
		error = "invalid instruction data";
		return -1;
	}

	if (open.commitment.length() != COMMITMENT_HEX_CHARS)
	{
		error = "invalid instruction data: commitment length " + to_string(open.commitment.length());
		return -1;
	}

	if (instruction.accounts.size() < 3)
	{
		error = "not enough account keys";
		return -1;
	}

	if (!has_signer(instruction, 0, signed_by))
	{
		error = "missing required signature";
		return -1;
	}

	auto& initializer = instruction.accounts[0].address;
	auto& escrow = instruction.accounts[1].address;

	DerivedAddress expected;
	if (derive_escrow_address(open.seed, m_escrow_program, expected) || expected.address != escrow)
	{
		error = "invalid seeds";
		return -1;
	}

	if (AccountExists(escrow))
	{
		error = "account " + escrow.ToString() + " already in use";
		return -1;
	}

	auto total = RentExempt(ESCROW_ACCOUNT_ALLOC_BYTES) + open.amount;

	if (Debit(initializer, total, error))
		return -1;

	CreateAccount(escrow, m_escrow_program, total, ESCROW_ACCOUNT_ALLOC_BYTES);

	EscrowAccount state;
	state.SetSeed(open.seed);
	state.amount = open.amount;
	state.commitment = open.commitment;
	state.initializer = initializer;

	auto rc = pack_escrow_account(state, m_accounts[escrow].data);
	HLASSERTZ(rc);

	if (TRACE_SIM) cerr << "SimLedger::ExecuteOpen escrow " << escrow << " amount " << open.amount << " slot " << m_slot << endl;

	return 0;
}

HLRESULT SimLedger::ExecuteClaim(const Instruction& instruction, const set<Address>& signed_by, string& error)
{
	ClaimInstruction claim;

	if (decode_claim(instruction.data, claim))
	{
		error = "invalid instruction data";
		return -1;
	}

	if (instruction.accounts.size() < 9)
	{
		error = "not enough account keys";
		return -1;
	}

	if (!has_signer(instruction, 0, signed_by))
	{
		error = "missing required signature";
		return -1;
	}

	auto& payer = instruction.accounts[0].address;
	auto& receiver = instruction.accounts[1].address;
	auto& escrow = instruction.accounts[2].address;
	auto& tracker = instruction.accounts[3].address;
	auto& execution = instruction.accounts[4].address;

	DerivedAddress expected;
	if (derive_escrow_address(claim.seed, m_escrow_program, expected) || expected.address != escrow)
	{
		error = "invalid seeds";
		return -1;
	}

	EscrowAccount state;
	if (!AccountExists(escrow) || decode_escrow_account(m_accounts[escrow].data, state))
	{
		error = "account data too small";
		return -1;
	}

	if (state.is_claimed)
	{
		error = "custom program error: 0x1";
		return -1;
	}

	if (derive_tracker_address(claim.execution_id, m_escrow_program, expected) || expected.address != tracker)
	{
		error = "invalid seeds";
		return -1;
	}

	if (instruction.accounts[5].address != m_system_program
		|| instruction.accounts[6].address != m_proof_program
		|| instruction.accounts[7].address != m_image_account
		|| instruction.accounts[8].address != m_escrow_program)
	{
		error = "incorrect program id";
		return -1;
	}

	// the proof program owns the execution account and refuses a reused execution id
	if (derive_execution_address(payer, claim.execution_id, m_proof_program, expected) || expected.address != execution)
	{
		error = "proof program: invalid execution account";
		return -1;
	}

	if (AccountExists(execution))
	{
		error = "proof program: execution " + execution_id_to_string(claim.execution_id) + " already exists";
		return -1;
	}

	if (!AccountExists(tracker))
	{
		auto rent = RentExempt(EXECUTION_TRACKER_ALLOC_BYTES);

		if (Debit(payer, rent, error))
			return -1;

		CreateAccount(tracker, m_escrow_program, rent, EXECUTION_TRACKER_ALLOC_BYTES);
	}

	memcpy(m_accounts[tracker].data.data(), execution.data(), execution.size());

	auto rent = RentExempt(0);

	if (Debit(payer, rent + claim.tip, error))
		return -1;

	CreateAccount(execution, m_proof_program, rent, 0);

	SimExecution pending;
	pending.execution_id = claim.execution_id;
	pending.escrow = escrow;
	pending.receiver = receiver;
	pending.preimage = claim.preimage;
	pending.callback_slot = m_slot + prover_delay_slots;
	pending.expiration = m_slot + claim.expiry;
	pending.done = false;

	m_executions.push_back(pending);

	if (TRACE_SIM) cerr << "SimLedger::ExecuteClaim execution id " << execution_id_to_string(claim.execution_id) << " slot " << m_slot << " expiration " << pending.expiration << endl;

	return 0;
}

void SimLedger::RunProver()
{
	if (!prover_online)
		return;

	for (auto& execution : m_executions)
	{
		if (execution.done || execution.callback_slot > m_slot)
			continue;

		execution.done = true;

		if (execution.callback_slot > execution.expiration)
			continue;

		auto& account = m_accounts[execution.escrow];

		EscrowAccount state;
		if (decode_escrow_account(account.data, state) || state.is_claimed)
			continue;

		string computed;
		auto rc = sha256_hex(execution.preimage, computed);
		HLASSERTZ(rc);

		if (computed != state.commitment)
		{
			if (TRACE_SIM) cerr << "SimLedger::RunProver execution id " << execution_id_to_string(execution.execution_id) << " hash mismatch" << endl;

			continue;
		}

		account.lamports -= state.amount;
		m_accounts[execution.receiver].lamports += state.amount;

		state.is_claimed = true;
		state.has_receiver = true;
		state.receiver = execution.receiver;

		rc = pack_escrow_account(state, account.data);
		HLASSERTZ(rc);

		if (TRACE_SIM) cerr << "SimLedger::RunProver execution id " << execution_id_to_string(execution.execution_id) << " released " << state.amount << " to " << execution.receiver << endl;
	}
}

HLRESULT SimLedger::SubmitAndConfirm(const Transaction& tx, const vector<const Signer*>& signers, string& signature, string& error)
{
	signature.clear();
	error.clear();

	++submit_count;

	if (fail_next_submit.length())
	{
		error = fail_next_submit;
		fail_next_submit.clear();

		return ESCROW_SUBMISSION_FAILED;
	}

	if (tx.instructions.empty() || signers.empty())
	{
		error = "empty transaction";
		return ESCROW_SUBMISSION_FAILED;
	}

	vector<uint8_t> message;
	for (auto& instruction : tx.instructions)
		message.insert(message.end(), instruction.data.begin(), instruction.data.end());

	set<Address> signed_by;

	for (auto signer : signers)
	{
		vector<uint8_t> sig;

		if (signer->Sign(message, sig))
		{
			error = "signing failed";
			return ESCROW_SUBMISSION_FAILED;
		}

		if (signature.empty())
			signature = base58_encode(sig) + to_string(++m_signature_count);

		signed_by.insert(signer->PublicAddress());
	}

	auto saved_accounts = m_accounts;
	auto saved_executions = m_executions;

	for (auto& instruction : tx.instructions)
	{
		HLRESULT rc = -1;

		if (instruction.program_id != m_escrow_program || instruction.data.empty())
			error = "unsupported program";
		else if (instruction.data[0] == ESCROW_OPCODE_OPEN)
			rc = ExecuteOpen(instruction, signed_by, error);
		else if (instruction.data[0] == ESCROW_OPCODE_CLAIM)
			rc = ExecuteClaim(instruction, signed_by, error);
		else
			error = "invalid instruction data";

		if (rc)
		{
			m_accounts = saved_accounts;
			m_executions = saved_executions;
			signature.clear();

			if (TRACE_SIM) cerr << "SimLedger::SubmitAndConfirm rejected: " << error << endl;

			return ESCROW_SUBMISSION_FAILED;
		}
	}

	AdvanceSlots(1);

	return 0;
}

HLRESULT SimLedger::ReadAccount(const Address& address, vector<uint8_t>& data)
{
	data.clear();

	if (!AccountExists(address))
		return ESCROW_NOT_FOUND;

	data = m_accounts[address].data;

	return 0;
}

HLRESULT SimLedger::GetSlot(uint64_t& slot)
{
	AdvanceSlots(slots_per_query);

	slot = m_slot;

	return 0;
}

} // namespace Hashlock
