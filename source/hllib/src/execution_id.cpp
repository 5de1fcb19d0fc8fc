/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * execution_id.cpp
*/

#include "hllib.h"
#include "execution_id.hpp"

#include <openssl/rand.h>

namespace Hashlock {

HLRESULT execution_id_from_string(const string& str, execution_id_t& id, char *output, const uint32_t outsize)
{
	static const string fn = "execution_id_from_string";

	id.fill(0);

	if (str.empty())
		return escrow_error(fn, ESCROW_INVALID_EXECUTION_ID, "execution id is empty", output, outsize);

	if (str.length() > id.size())
		return escrow_error(fn, ESCROW_INVALID_EXECUTION_ID, "execution id \"" + str + "\" is longer than " STRINGIFY(EXECUTION_ID_BYTES) " bytes", output, outsize);

	memcpy(id.data(), str.data(), str.length());

	return 0;
}

string execution_id_to_string(const execution_id_t& id)
{
	unsigned len = id.size();
	while (len && !id[len-1])
		--len;

	return string((const char*)id.data(), len);
}

// a fresh id is 16 random letters drawn from A-Z and a-z

HLRESULT new_execution_id(execution_id_t& id, char *output, const uint32_t outsize)
{
	static const string fn = "new_execution_id";

	static const char letters[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

	id.fill(0);

	if (RAND_bytes(id.data(), id.size()) != 1)
		return escrow_error(fn, ESCROW_INTERNAL_ERROR, "RAND_bytes failed", output, outsize);

	for (auto& c : id)
		c = letters[c % (sizeof(letters) - 1)];

	return 0;
}

} // namespace Hashlock
