/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * encode.cpp
*/

#include "hllib.h"
#include "encode.h"

#include <gmp.h>

#define TRACE	0

namespace Hashlock {

const char* g_base58_alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static unsigned base58_destringify_char(char c)
{
	static uint8_t table[256];
	static once_flag table_once;

	call_once(table_once, []
	{
		memset(table, 255, sizeof(table));
		for (unsigned i = 0; i < 58; ++i)
			table[(uint8_t)g_base58_alphabet[i]] = i;
	});

	return table[(uint8_t)c];
}

// leading zero bytes encode as leading '1' characters; the remainder is a big-endian base 58 integer

void base58_encode(const void* data, unsigned nbytes, string& outs)
{
	outs.clear();

	auto p = (const uint8_t*)data;

	unsigned nzeros = 0;
	while (nzeros < nbytes && !p[nzeros])
		++nzeros;

	mpz_t val;
	mpz_init(val);

	if (nbytes > nzeros)
		mpz_import(val, nbytes - nzeros, 1, 1, 1, 0, p + nzeros);

	while (mpz_sgn(val))
	{
		auto digit = mpz_fdiv_q_ui(val, val, 58);
		outs.push_back(g_base58_alphabet[digit]);

		if (TRACE) cerr << "base58_encode digit " << digit << " symbol " << outs.back() << endl;
	}

	mpz_clear(val);

	outs.append(nzeros, g_base58_alphabet[0]);

	reverse(outs.begin(), outs.end());
}

// returns -1 on an invalid character

int base58_decode(const string& str, vector<uint8_t>& data)
{
	data.clear();

	unsigned nzeros = 0;
	while (nzeros < str.length() && str[nzeros] == g_base58_alphabet[0])
		++nzeros;

	mpz_t val;
	mpz_init(val);

	for (unsigned i = nzeros; i < str.length(); ++i)
	{
		auto digit = base58_destringify_char(str[i]);

		if (digit == 255)
		{
			mpz_clear(val);

			if (TRACE) cerr << "base58_decode invalid character at " << i << endl;

			return -1;
		}

		mpz_mul_ui(val, val, 58);
		mpz_add_ui(val, val, digit);
	}

	data.assign(nzeros, 0);

	if (mpz_sgn(val))
	{
		auto nbytes = (mpz_sizeinbase(val, 2) + 7) / 8;
		data.resize(nzeros + nbytes);

		size_t count = 0;
		mpz_export(data.data() + nzeros, &count, 1, 1, 1, 0, val);

		HLASSERT(count == nbytes);
	}

	mpz_clear(val);

	return 0;
}

} // namespace Hashlock
