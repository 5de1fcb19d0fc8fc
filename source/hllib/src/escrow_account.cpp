/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * escrow_account.cpp
*/

#include "hllib.h"
#include "escrow_account.hpp"
#include "commitment.hpp"

namespace Hashlock {

void EscrowAccount::Clear()
{
	seed.fill(0);
	amount = 0;
	commitment.clear();
	is_claimed = false;
	has_receiver = false;
	receiver = Address();
	initializer = Address();
}

void EscrowAccount::SetSeed(const string& s)
{
	seed.fill(0);
	memcpy(seed.data(), s.data(), min(s.length(), seed.size()));
}

string EscrowAccount::SeedString() const
{
	unsigned len = seed.size();
	while (len && !seed[len-1])
		--len;

	return string((const char*)seed.data(), len);
}

bool EscrowAccount::operator== (const EscrowAccount& other) const
{
	return seed == other.seed
		&& amount == other.amount
		&& commitment == other.commitment
		&& is_claimed == other.is_claimed
		&& has_receiver == other.has_receiver
		&& receiver == other.receiver
		&& initializer == other.initializer;
}

HLRESULT decode_escrow_account(const vector<uint8_t>& raw, EscrowAccount& account, char *output, const uint32_t outsize)
{
	static const string fn = "decode_escrow_account";

	account.Clear();

	if (raw.size() < ESCROW_ACCOUNT_BYTES)
		return escrow_error(fn, ESCROW_TRUNCATED_ACCOUNT, "account has " + to_string(raw.size()) + " bytes, need " STRINGIFY(ESCROW_ACCOUNT_BYTES), output, outsize);

	auto buf = raw.data();
	uint32_t bufsize = ESCROW_ACCOUNT_BYTES;
	uint32_t bufpos = ESCROW_OFFSET_SEED;

	copy_from_bufp(account.seed.data(), account.seed.size(), account.seed.size(), bufpos, buf, bufsize);
	copy_from_buf(account.amount, sizeof(account.amount), bufpos, buf, bufsize);

	HLASSERT(bufpos == ESCROW_OFFSET_COMMITMENT);

	auto commitment = trim_commitment_padding(buf + ESCROW_OFFSET_COMMITMENT, ESCROW_COMMITMENT_SLOT_BYTES);
	if (!commitment_format_valid(commitment))
	{
		account.Clear();

		return escrow_error(fn, ESCROW_MALFORMED_COMMITMENT, "stored commitment is not " STRINGIFY(COMMITMENT_HEX_CHARS) " hex characters", output, outsize);
	}

	account.commitment = commitment;
	account.is_claimed = (buf[ESCROW_OFFSET_IS_CLAIMED] != 0);
	account.has_receiver = (buf[ESCROW_OFFSET_HAS_RECEIVER] != 0);

	HLRESULT rc = 0;

	if (account.has_receiver)
	{
		rc = Address::FromBytes(buf + ESCROW_OFFSET_RECEIVER, ADDRESS_BYTES, account.receiver);
		HLASSERTZ(rc);
	}

	rc = Address::FromBytes(buf + ESCROW_OFFSET_INITIALIZER, ADDRESS_BYTES, account.initializer);
	HLASSERTZ(rc);

	return 0;
}

HLRESULT pack_escrow_account(const EscrowAccount& account, vector<uint8_t>& raw, char *output, const uint32_t outsize)
{
	static const string fn = "pack_escrow_account";

	if (account.commitment.length() > ESCROW_COMMITMENT_SLOT_BYTES)
		return escrow_error(fn, ESCROW_FIELD_TOO_LONG, "commitment length " + to_string(account.commitment.length()) + " exceeds " STRINGIFY(ESCROW_COMMITMENT_SLOT_BYTES), output, outsize);

	if (raw.size() < ESCROW_ACCOUNT_BYTES)
		raw.resize(ESCROW_ACCOUNT_BYTES);

	auto buf = raw.data();
	memset(buf, 0, ESCROW_ACCOUNT_BYTES);

	uint32_t bufsize = ESCROW_ACCOUNT_BYTES;
	uint32_t bufpos = ESCROW_OFFSET_SEED;

	copy_to_bufp(account.seed.data(), account.seed.size(), bufpos, buf, bufsize);
	copy_to_buf(account.amount, sizeof(account.amount), bufpos, buf, bufsize);
	copy_to_bufp(account.commitment.data(), account.commitment.length(), bufpos, buf, bufsize);

	buf[ESCROW_OFFSET_IS_CLAIMED] = account.is_claimed;
	buf[ESCROW_OFFSET_HAS_RECEIVER] = account.has_receiver;

	if (account.has_receiver)
		memcpy(buf + ESCROW_OFFSET_RECEIVER, account.receiver.data(), ADDRESS_BYTES);

	memcpy(buf + ESCROW_OFFSET_INITIALIZER, account.initializer.data(), ADDRESS_BYTES);

	return 0;
}

void escrow_account_to_json(const EscrowAccount& account, Json::Value& root)
{
	root = Json::Value(Json::objectValue);

	root["seed"] = account.SeedString();
	root["seed_hex"] = buf2hex(account.seed.data(), account.seed.size());
	root["amount"] = Json::Value::UInt64(account.amount);
	root["commitment"] = account.commitment;
	root["is_claimed"] = account.is_claimed;

	if (account.has_receiver)
		root["receiver"] = account.receiver.ToString();
	else
		root["receiver"] = Json::Value(Json::nullValue);

	root["initializer"] = account.initializer.ToString();
}

} // namespace Hashlock
