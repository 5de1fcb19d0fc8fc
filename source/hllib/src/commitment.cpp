/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * commitment.cpp
*/

#include "hllib.h"
#include "commitment.hpp"
#include "HLhash.hpp"

namespace Hashlock {

HLRESULT commit(const string& secret, string& commitment)
{
	auto rc = sha256_hex(secret, commitment);

	if (rc)
		return escrow_error("commit", rc, "sha256 failed", NULL, 0);

	return 0;
}

bool commitment_format_valid(const string& commitment)
{
	return commitment.length() == COMMITMENT_HEX_CHARS && is_hex_string(commitment);
}

HLRESULT check_commitment_format(const string& fn, const string& commitment, char *output, const uint32_t outsize)
{
	if (!commitment_format_valid(commitment))
		return escrow_error(fn, ESCROW_INVALID_COMMITMENT_FORMAT, "commitment \"" + commitment + "\" is not " STRINGIFY(COMMITMENT_HEX_CHARS) " hex characters", output, outsize);

	return 0;
}

string trim_commitment_padding(const void *slot, unsigned nbytes)
{
	auto p = (const char*)slot;

	while (nbytes)
	{
		auto c = p[nbytes-1];

		if (c && !isspace((unsigned char)c))
			break;

		--nbytes;
	}

	return string(p, nbytes);
}

} // namespace Hashlock
