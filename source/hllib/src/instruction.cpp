/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * instruction.cpp
*/

#include "hllib.h"
#include "instruction.hpp"

namespace Hashlock {

static HLRESULT check_field_length(const string& fn, const char *name, size_t length, size_t limit, char *output, const uint32_t outsize)
{
	if (length > limit)
		return escrow_error(fn, ESCROW_FIELD_TOO_LONG, string(name) + " length " + to_string(length) + " exceeds " + to_string(limit), output, outsize);

	return 0;
}

HLRESULT encode_open(const OpenInstruction& open, vector<uint8_t>& data, char *output, const uint32_t outsize)
{
	static const string fn = "encode_open";

	data.clear();

	auto rc = check_field_length(fn, "seed", open.seed.length(), OPEN_MAX_SEED_BYTES, output, outsize);
	if (rc) return rc;

	rc = check_field_length(fn, "commitment", open.commitment.length(), OPEN_MAX_COMMITMENT_BYTES, output, outsize);
	if (rc) return rc;

	uint8_t opcode = ESCROW_OPCODE_OPEN;
	uint8_t seed_len = open.seed.length();
	uint8_t commitment_len = open.commitment.length();

	uint32_t bufsize = 1 + 1 + seed_len + 1 + commitment_len + sizeof(open.amount);
	data.resize(bufsize);

	uint32_t bufpos = 0;
	auto buf = data.data();

	copy_to_buf(opcode, sizeof(opcode), bufpos, buf, bufsize);
	copy_to_buf(seed_len, sizeof(seed_len), bufpos, buf, bufsize);
	copy_to_bufp(open.seed.data(), seed_len, bufpos, buf, bufsize);
	copy_to_buf(commitment_len, sizeof(commitment_len), bufpos, buf, bufsize);
	copy_to_bufp(open.commitment.data(), commitment_len, bufpos, buf, bufsize);
	copy_to_buf(open.amount, sizeof(open.amount), bufpos, buf, bufsize);

	HLASSERT(bufpos == bufsize);

	return 0;
}

HLRESULT encode_claim(const ClaimInstruction& claim, vector<uint8_t>& data, char *output, const uint32_t outsize)
{
	static const string fn = "encode_claim";

	data.clear();

	auto rc = check_field_length(fn, "seed", claim.seed.length(), CLAIM_MAX_SEED_BYTES, output, outsize);
	if (rc) return rc;

	rc = check_field_length(fn, "preimage", claim.preimage.length(), CLAIM_MAX_PREIMAGE_BYTES, output, outsize);
	if (rc) return rc;

	uint8_t opcode = ESCROW_OPCODE_CLAIM;
	uint8_t seed_len = claim.seed.length();
	uint16_t preimage_len = claim.preimage.length();

	uint32_t bufsize = 1 + claim.execution_id.size() + sizeof(claim.bump) + sizeof(claim.tip) + sizeof(claim.expiry)
						+ 1 + seed_len + sizeof(preimage_len) + preimage_len;
	data.resize(bufsize);

	uint32_t bufpos = 0;
	auto buf = data.data();

	copy_to_buf(opcode, sizeof(opcode), bufpos, buf, bufsize);
	copy_to_bufp(claim.execution_id.data(), claim.execution_id.size(), bufpos, buf, bufsize);
	copy_to_buf(claim.bump, sizeof(claim.bump), bufpos, buf, bufsize);
	copy_to_buf(claim.tip, sizeof(claim.tip), bufpos, buf, bufsize);
	copy_to_buf(claim.expiry, sizeof(claim.expiry), bufpos, buf, bufsize);
	copy_to_buf(seed_len, sizeof(seed_len), bufpos, buf, bufsize);
	copy_to_bufp(claim.seed.data(), seed_len, bufpos, buf, bufsize);
	copy_to_buf(preimage_len, sizeof(preimage_len), bufpos, buf, bufsize);
	copy_to_bufp(claim.preimage.data(), preimage_len, bufpos, buf, bufsize);

	HLASSERT(bufpos == bufsize);

	return 0;
}

static HLRESULT error_malformed(const string& fn, const string& detail, char *output, const uint32_t outsize)
{
	return escrow_error(fn, ESCROW_MALFORMED_INSTRUCTION, detail, output, outsize);
}

// reads a length-prefixed field; returns -1 if the buffer is too short

static int read_field(string& field, size_t nbytes, uint32_t& bufpos, const vector<uint8_t>& data)
{
	field.clear();

	if (bufpos > data.size() || nbytes > data.size() - bufpos)
		return -1;

	field.assign((const char*)data.data() + bufpos, nbytes);
	bufpos += nbytes;

	return 0;
}

HLRESULT decode_open(const vector<uint8_t>& data, OpenInstruction& open, char *output, const uint32_t outsize)
{
	static const string fn = "decode_open";

	open = OpenInstruction();

	uint32_t bufsize = data.size();
	uint32_t bufpos = 0;
	auto buf = data.data();

	uint8_t opcode = 0;
	copy_from_buf(opcode, sizeof(opcode), bufpos, buf, bufsize);
	if (bufpos > bufsize || opcode != ESCROW_OPCODE_OPEN)
		return error_malformed(fn, "not an open instruction", output, outsize);

	uint8_t seed_len = 0;
	copy_from_buf(seed_len, sizeof(seed_len), bufpos, buf, bufsize);
	if (bufpos > bufsize || read_field(open.seed, seed_len, bufpos, data))
		return error_malformed(fn, "truncated seed", output, outsize);

	uint8_t commitment_len = 0;
	copy_from_buf(commitment_len, sizeof(commitment_len), bufpos, buf, bufsize);
	if (bufpos > bufsize || read_field(open.commitment, commitment_len, bufpos, data))
		return error_malformed(fn, "truncated commitment", output, outsize);

	copy_from_buf(open.amount, sizeof(open.amount), bufpos, buf, bufsize);
	if (bufpos > bufsize)
		return error_malformed(fn, "truncated amount", output, outsize);

	if (bufpos != bufsize)
		return error_malformed(fn, to_string(bufsize - bufpos) + " trailing bytes", output, outsize);

	return 0;
}

HLRESULT decode_claim(const vector<uint8_t>& data, ClaimInstruction& claim, char *output, const uint32_t outsize)
{
	static const string fn = "decode_claim";

	claim = ClaimInstruction();

	uint32_t bufsize = data.size();
	uint32_t bufpos = 0;
	auto buf = data.data();

	uint8_t opcode = 0;
	copy_from_buf(opcode, sizeof(opcode), bufpos, buf, bufsize);
	if (bufpos > bufsize || opcode != ESCROW_OPCODE_CLAIM)
		return error_malformed(fn, "not a claim instruction", output, outsize);

	copy_from_bufp(claim.execution_id.data(), claim.execution_id.size(), claim.execution_id.size(), bufpos, buf, bufsize);
	copy_from_buf(claim.bump, sizeof(claim.bump), bufpos, buf, bufsize);
	copy_from_buf(claim.tip, sizeof(claim.tip), bufpos, buf, bufsize);
	copy_from_buf(claim.expiry, sizeof(claim.expiry), bufpos, buf, bufsize);
	if (bufpos > bufsize)
		return error_malformed(fn, "truncated header", output, outsize);

	uint8_t seed_len = 0;
	copy_from_buf(seed_len, sizeof(seed_len), bufpos, buf, bufsize);
	if (bufpos > bufsize || read_field(claim.seed, seed_len, bufpos, data))
		return error_malformed(fn, "truncated seed", output, outsize);

	uint16_t preimage_len = 0;
	copy_from_buf(preimage_len, sizeof(preimage_len), bufpos, buf, bufsize);
	if (bufpos > bufsize || read_field(claim.preimage, preimage_len, bufpos, data))
		return error_malformed(fn, "truncated preimage", output, outsize);

	if (bufpos != bufsize)
		return error_malformed(fn, to_string(bufsize - bufpos) + " trailing bytes", output, outsize);

	return 0;
}

} // namespace Hashlock
