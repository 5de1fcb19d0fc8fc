/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * HLhash.cpp
*/

#include "hllib.h"
#include "HLhash.hpp"

#define KECCAK_ROUNDS		24
#define KECCAK256_RATE		136

namespace Hashlock {

Sha256Hasher::Sha256Hasher()
 :	m_ctx(EVP_MD_CTX_new()),
	m_ok(false)
{
	HLASSERT(m_ctx);

	Reset();
}

Sha256Hasher::~Sha256Hasher()
{
	EVP_MD_CTX_free(m_ctx);
}

HLRESULT Sha256Hasher::Reset()
{
	m_ok = (EVP_DigestInit_ex(m_ctx, EVP_sha256(), NULL) == 1);

	if (!m_ok)
	{
		BOOST_LOG_TRIVIAL(error) << "Sha256Hasher::Reset EVP_DigestInit_ex failed";

		return ESCROW_INTERNAL_ERROR;
	}

	return 0;
}

HLRESULT Sha256Hasher::Update(const void *data, size_t nbytes)
{
	if (!m_ok)
		return ESCROW_INTERNAL_ERROR;

	if (!nbytes)
		return 0;

	if (EVP_DigestUpdate(m_ctx, data, nbytes) != 1)
	{
		BOOST_LOG_TRIVIAL(error) << "Sha256Hasher::Update EVP_DigestUpdate failed";

		m_ok = false;

		return ESCROW_INTERNAL_ERROR;
	}

	return 0;
}

HLRESULT Sha256Hasher::Final(hash256_t& digest)
{
	digest.fill(0);

	if (!m_ok)
		return ESCROW_INTERNAL_ERROR;

	unsigned size = 0;

	auto rc = EVP_DigestFinal_ex(m_ctx, digest.data(), &size);

	if (rc != 1 || size != digest.size())
	{
		BOOST_LOG_TRIVIAL(error) << "Sha256Hasher::Final EVP_DigestFinal_ex failed size " << size;

		digest.fill(0);
		m_ok = false;

		return ESCROW_INTERNAL_ERROR;
	}

	return Reset();
}

HLRESULT sha256(const void *data, size_t nbytes, hash256_t& digest)
{
	Sha256Hasher hasher;

	auto rc = hasher.Update(data, nbytes);
	if (rc) return rc;

	return hasher.Final(digest);
}

HLRESULT sha256_hex(const string& data, string& hex)
{
	hash256_t digest;

	hex.clear();

	auto rc = sha256(data.data(), data.length(), digest);
	if (rc) return rc;

	hex = buf2hex(digest.data(), digest.size());

	return 0;
}

static const uint64_t keccakf_rndc[KECCAK_ROUNDS] =
{
	0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL,
	0x000000000000808bULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
	0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
	0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
	0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800aULL, 0x800000008000000aULL,
	0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

static const unsigned keccakf_rotc[24] =
{
	1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
	27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44
};

static const unsigned keccakf_piln[24] =
{
	10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
	15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1
};

static inline uint64_t rotl64(uint64_t x, unsigned n)
{
	return (x << n) | (x >> (64 - n));
}

static void keccakf(uint64_t st[25])
{
	uint64_t bc[5];

	for (unsigned r = 0; r < KECCAK_ROUNDS; ++r)
	{
		// theta
		for (unsigned i = 0; i < 5; ++i)
			bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];

		for (unsigned i = 0; i < 5; ++i)
		{
			auto t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
			for (unsigned j = 0; j < 25; j += 5)
				st[j + i] ^= t;
		}

		// rho and pi
		auto t = st[1];
		for (unsigned i = 0; i < 24; ++i)
		{
			auto j = keccakf_piln[i];
			bc[0] = st[j];
			st[j] = rotl64(t, keccakf_rotc[i]);
			t = bc[0];
		}

		// chi
		for (unsigned j = 0; j < 25; j += 5)
		{
			for (unsigned i = 0; i < 5; ++i)
				bc[i] = st[j + i];
			for (unsigned i = 0; i < 5; ++i)
				st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
		}

		// iota
		st[0] ^= keccakf_rndc[r];
	}
}

static void keccak_absorb_block(uint64_t st[25], const uint8_t *block)
{
	for (unsigned i = 0; i < KECCAK256_RATE / 8; ++i)
	{
		uint64_t lane;
		memcpy(&lane, block + i * 8, sizeof(lane));	// lanes are little-endian
		st[i] ^= lane;
	}

	keccakf(st);
}

void keccak256(const void *data, size_t nbytes, hash256_t& digest)
{
	uint64_t st[25];
	memset(st, 0, sizeof(st));

	auto p = (const uint8_t*)data;

	while (nbytes >= KECCAK256_RATE)
	{
		keccak_absorb_block(st, p);
		p += KECCAK256_RATE;
		nbytes -= KECCAK256_RATE;
	}

	uint8_t block[KECCAK256_RATE];
	memset(block, 0, sizeof(block));
	if (nbytes)
		memcpy(block, p, nbytes);

	block[nbytes] ^= 0x01;
	block[KECCAK256_RATE - 1] ^= 0x80;

	keccak_absorb_block(st, block);

	memcpy(digest.data(), st, digest.size());
}

} // namespace Hashlock
