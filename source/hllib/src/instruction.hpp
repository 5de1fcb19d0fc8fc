/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * instruction.hpp
*/

#pragma once

#include "HLapi.h"
#include "address.hpp"
#include "execution_id.hpp"

#include <string>
#include <vector>

#define ESCROW_OPCODE_OPEN			0
#define ESCROW_OPCODE_CLAIM			1

#define OPEN_MAX_SEED_BYTES			255
#define OPEN_MAX_COMMITMENT_BYTES	255
#define CLAIM_MAX_SEED_BYTES		255
#define CLAIM_MAX_PREIMAGE_BYTES	65535

namespace Hashlock {

/*
	open:  [0][seed len:u8][seed][commitment len:u8][commitment][amount:u64 LE]
	claim: [1][execution id:16][bump:u8][tip:u64 LE][expiry:u64 LE][seed len:u8][seed][preimage len:u16 LE][preimage]
*/

struct OpenInstruction
{
	std::string seed;
	std::string commitment;
	uint64_t amount;

	OpenInstruction()
	 :	amount(0)
	{ }
};

struct ClaimInstruction
{
	execution_id_t execution_id;
	uint8_t bump;		// bump of the tracker address
	uint64_t tip;
	uint64_t expiry;	// in slots, relative to the slot that executes the claim
	std::string seed;
	std::string preimage;

	ClaimInstruction()
	 :	bump(0),
		tip(0),
		expiry(0)
	{
		execution_id.fill(0);
	}
};

HLRESULT encode_open(const OpenInstruction& open, std::vector<uint8_t>& data, char *output = NULL, const uint32_t outsize = 0);
HLRESULT encode_claim(const ClaimInstruction& claim, std::vector<uint8_t>& data, char *output = NULL, const uint32_t outsize = 0);

HLRESULT decode_open(const std::vector<uint8_t>& data, OpenInstruction& open, char *output = NULL, const uint32_t outsize = 0);
HLRESULT decode_claim(const std::vector<uint8_t>& data, ClaimInstruction& claim, char *output = NULL, const uint32_t outsize = 0);

struct AccountMeta
{
	Address address;
	bool is_signer;
	bool is_writable;

	AccountMeta(const Address& a, bool signer, bool writable)
	 :	address(a),
		is_signer(signer),
		is_writable(writable)
	{ }

	bool operator== (const AccountMeta& other) const
	{
		return address == other.address && is_signer == other.is_signer && is_writable == other.is_writable;
	}
};

struct Instruction
{
	Address program_id;
	std::vector<AccountMeta> accounts;
	std::vector<uint8_t> data;
};

struct Transaction
{
	std::vector<Instruction> instructions;
};

} // namespace Hashlock
