/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * HLhash.hpp
*/

#pragma once

#include "HLapi.h"

#include <array>
#include <string>
#include <cstdint>

#include <openssl/evp.h>

#define HL_HASH_BYTES		32

namespace Hashlock {

typedef std::array<uint8_t, HL_HASH_BYTES> hash256_t;

// incremental SHA-256 over an OpenSSL digest context

class Sha256Hasher
{
	EVP_MD_CTX *m_ctx;
	bool m_ok;

public:
	Sha256Hasher();
	~Sha256Hasher();

	Sha256Hasher(const Sha256Hasher&) = delete;
	Sha256Hasher& operator=(const Sha256Hasher&) = delete;

	HLRESULT Reset();
	HLRESULT Update(const void *data, size_t nbytes);
	HLRESULT Update(const std::string& data)
	{
		return Update(data.data(), data.length());
	}

	// Final resets the context, so the hasher can be reused
	HLRESULT Final(hash256_t& digest);
};

HLRESULT sha256(const void *data, size_t nbytes, hash256_t& digest);
HLRESULT sha256_hex(const std::string& data, std::string& hex);

// original Keccak padding (0x01), not the FIPS 202 SHA3-256 padding
void keccak256(const void *data, size_t nbytes, hash256_t& digest);

} // namespace Hashlock
