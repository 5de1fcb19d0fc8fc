/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * escrow_account.hpp
*/

#pragma once

#include "HLapi.h"
#include "address.hpp"

#include <array>
#include <string>
#include <vector>

#include <jsoncpp/json/json.h>

#define ESCROW_SEED_SLOT_BYTES			32
#define ESCROW_COMMITMENT_SLOT_BYTES	64

#define ESCROW_OFFSET_SEED				0
#define ESCROW_OFFSET_AMOUNT			32
#define ESCROW_OFFSET_COMMITMENT		40
#define ESCROW_OFFSET_IS_CLAIMED		104
#define ESCROW_OFFSET_HAS_RECEIVER		105
#define ESCROW_OFFSET_RECEIVER			106
#define ESCROW_OFFSET_INITIALIZER		138

#define ESCROW_ACCOUNT_BYTES			170
#define ESCROW_ACCOUNT_ALLOC_BYTES		(ESCROW_ACCOUNT_BYTES + 100)	// size the escrow program allocates

#define EXECUTION_TRACKER_BYTES			32
#define EXECUTION_TRACKER_ALLOC_BYTES	(EXECUTION_TRACKER_BYTES + 100)

namespace Hashlock {

struct EscrowAccount
{
	std::array<uint8_t, ESCROW_SEED_SLOT_BYTES> seed;
	uint64_t amount;
	std::string commitment;		// padding trimmed
	bool is_claimed;
	bool has_receiver;
	Address receiver;			// null unless has_receiver
	Address initializer;

	EscrowAccount()
	{
		Clear();
	}

	void Clear();

	// the program stores the seed zero-padded, truncated to 32 bytes
	void SetSeed(const std::string& s);
	std::string SeedString() const;

	bool operator== (const EscrowAccount& other) const;
	bool operator!= (const EscrowAccount& other) const
	{
		return !(*this == other);
	}
};

HLRESULT decode_escrow_account(const std::vector<uint8_t>& raw, EscrowAccount& account, char *output = NULL, const uint32_t outsize = 0);
HLRESULT pack_escrow_account(const EscrowAccount& account, std::vector<uint8_t>& raw, char *output = NULL, const uint32_t outsize = 0);

void escrow_account_to_json(const EscrowAccount& account, Json::Value& root);

} // namespace Hashlock
