/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * address.cpp
*/

#include "hllib.h"
#include "address.hpp"
#include "encode.h"

#include <gmp.h>

#define TRACE	0

namespace Hashlock {

HLRESULT Address::FromString(const string& str, Address& address, char *output, const uint32_t outsize)
{
	static const string fn = "Address::FromString";

	address = Address();

	vector<uint8_t> data;

	if (base58_decode(str, data))
		return escrow_error(fn, ESCROW_INVALID_ADDRESS, "\"" + str + "\" is not base58", output, outsize);

	if (FromBytes(data.data(), data.size(), address))
		return escrow_error(fn, ESCROW_INVALID_ADDRESS, "\"" + str + "\" decodes to " + to_string(data.size()) + " bytes", output, outsize);

	return 0;
}

HLRESULT Address::FromBytes(const void *data, unsigned nbytes, Address& address)
{
	if (nbytes != ADDRESS_BYTES)
		return ESCROW_INVALID_ADDRESS;

	memcpy(address.m_bytes.data(), data, nbytes);

	return 0;
}

string Address::ToString() const
{
	string outs;
	base58_encode(m_bytes.data(), m_bytes.size(), outs);

	return outs;
}

bool Address::IsNull() const
{
	for (auto b : m_bytes)
	{
		if (b)
			return false;
	}

	return true;
}

ostream& operator<< (ostream& os, const Address& address)
{
	return os << address.ToString();
}

// edwards25519 field prime p = 2^255 - 19 and curve constant d = -121665/121666 mod p

class CurveConstants
{
public:
	mpz_t p;
	mpz_t d;

	CurveConstants()
	{
		mpz_init(p);
		mpz_ui_pow_ui(p, 2, 255);
		mpz_sub_ui(p, p, 19);

		mpz_t t;
		mpz_init_set_ui(t, 121666);
		mpz_init(d);
		auto rc = mpz_invert(d, t, p);
		HLASSERT(rc);
		mpz_mul_si(d, d, -121665);
		mpz_mod(d, d, p);
		mpz_clear(t);
	}

	~CurveConstants()
	{
		mpz_clear(p);
		mpz_clear(d);
	}

	CurveConstants(const CurveConstants&) = delete;
	CurveConstants& operator=(const CurveConstants&) = delete;
};

static const CurveConstants& curve_constants()
{
	static const CurveConstants constants;

	return constants;
}

// The encoding is a little-endian y coordinate with the x sign in the top bit.
// It decompresses iff x^2 = (y^2 - 1) / (d y^2 + 1) has a root, i.e. u = y^2 - 1 is zero or u*v is a quadratic residue.
// v = d y^2 + 1 is never zero because -1/d is not a square.

bool is_on_curve(const uint8_t *bytes)
{
	auto& cc = curve_constants();

	uint8_t buf[ADDRESS_BYTES];
	memcpy(buf, bytes, sizeof(buf));
	buf[ADDRESS_BYTES-1] &= 0x7F;

	mpz_t y, u, v;
	mpz_inits(y, u, v, NULL);

	mpz_import(y, sizeof(buf), -1, 1, 0, 0, buf);
	mpz_mod(y, y, cc.p);

	mpz_mul(y, y, y);
	mpz_mod(y, y, cc.p);		// y is now y^2

	mpz_sub_ui(u, y, 1);
	mpz_mod(u, u, cc.p);

	mpz_mul(v, cc.d, y);
	mpz_add_ui(v, v, 1);
	mpz_mod(v, v, cc.p);

	bool result;

	if (!mpz_sgn(u))
		result = true;
	else
	{
		mpz_mul(u, u, v);
		mpz_mod(u, u, cc.p);

		result = (mpz_legendre(u, cc.p) == 1);
	}

	mpz_clears(y, u, v, NULL);

	if (TRACE) cerr << "is_on_curve " << buf2hex(bytes, ADDRESS_BYTES) << " " << result << endl;

	return result;
}

static HLRESULT check_seeds(const string& fn, const address_seeds_t& seeds, unsigned extra, char *output, const uint32_t outsize)
{
	if (seeds.size() + extra > ADDRESS_MAX_SEEDS)
		return escrow_error(fn, ESCROW_SEED_TOO_LONG, to_string(seeds.size() + extra) + " seeds exceeds the limit of " STRINGIFY(ADDRESS_MAX_SEEDS), output, outsize);

	for (unsigned i = 0; i < seeds.size(); ++i)
	{
		if (seeds[i].size() > ADDRESS_MAX_SEED_BYTES)
			return escrow_error(fn, ESCROW_SEED_TOO_LONG, "seed " + to_string(i) + " length " + to_string(seeds[i].size()) + " exceeds the limit of " STRINGIFY(ADDRESS_MAX_SEED_BYTES), output, outsize);
	}

	return 0;
}

// returns 1 if the candidate is on the curve; the caller tries the next bump

static HLRESULT hash_program_address(const address_seeds_t& seeds, const Address& program_id, Address& address)
{
	Sha256Hasher hasher;
	HLRESULT rc = 0;

	for (auto& seed : seeds)
	{
		rc = hasher.Update(seed.data(), seed.size());
		if (rc) return rc;
	}

	rc = hasher.Update(program_id.data(), program_id.size());
	if (rc) return rc;

	rc = hasher.Update(ADDRESS_PDA_MARKER, strlen(ADDRESS_PDA_MARKER));
	if (rc) return rc;

	hash256_t digest;
	rc = hasher.Final(digest);
	if (rc) return rc;

	if (is_on_curve(digest.data()))
		return 1;

	address = Address(digest);

	return 0;
}

HLRESULT create_program_address(const address_seeds_t& seeds, const Address& program_id, Address& address, char *output, const uint32_t outsize)
{
	static const string fn = "create_program_address";

	address = Address();

	auto rc = check_seeds(fn, seeds, 0, output, outsize);
	if (rc) return rc;

	rc = hash_program_address(seeds, program_id, address);
	if (rc < 0)
		return escrow_error(fn, rc, "hash failed", output, outsize);

	if (rc)
		return escrow_error(fn, ESCROW_DERIVATION_EXHAUSTED, "address is on the curve", output, outsize);

	return 0;
}

HLRESULT find_program_address(const address_seeds_t& seeds, const Address& program_id, DerivedAddress& derived, char *output, const uint32_t outsize)
{
	static const string fn = "find_program_address";

	derived = DerivedAddress();

	auto rc = check_seeds(fn, seeds, 1, output, outsize);
	if (rc) return rc;

	auto bumped = seeds;
	bumped.push_back(vector<uint8_t>(1));

	for (int bump = 255; bump >= 0; --bump)
	{
		bumped.back()[0] = bump;

		rc = hash_program_address(bumped, program_id, derived.address);
		if (rc < 0)
			return escrow_error(fn, rc, "hash failed", output, outsize);

		if (!rc)
		{
			derived.bump = bump;

			if (TRACE) cerr << "find_program_address program " << program_id << " address " << derived.address << " bump " << bump << endl;

			return 0;
		}
	}

	return escrow_error(fn, ESCROW_DERIVATION_EXHAUSTED, "no off-curve address for program " + program_id.ToString(), output, outsize);
}

HLRESULT derive_escrow_address(const string& seed, const Address& escrow_program, DerivedAddress& derived, char *output, const uint32_t outsize)
{
	address_seeds_t seeds;
	seeds.push_back(vector<uint8_t>(seed.begin(), seed.end()));

	return find_program_address(seeds, escrow_program, derived, output, outsize);
}

HLRESULT derive_tracker_address(const execution_id_t& execution_id, const Address& escrow_program, DerivedAddress& derived, char *output, const uint32_t outsize)
{
	address_seeds_t seeds;
	seeds.push_back(vector<uint8_t>(execution_id.begin(), execution_id.end()));

	return find_program_address(seeds, escrow_program, derived, output, outsize);
}

HLRESULT derive_execution_address(const Address& payer, const execution_id_t& execution_id, const Address& proof_program, DerivedAddress& derived, char *output, const uint32_t outsize)
{
	static const string label = EXECUTION_ADDRESS_LABEL;

	address_seeds_t seeds;
	seeds.push_back(vector<uint8_t>(label.begin(), label.end()));
	seeds.push_back(vector<uint8_t>(payer.data(), payer.data() + payer.size()));
	seeds.push_back(vector<uint8_t>(execution_id.begin(), execution_id.end()));

	return find_program_address(seeds, proof_program, derived, output, outsize);
}

HLRESULT derive_image_address(const string& image_id, const Address& proof_program, DerivedAddress& derived, char *output, const uint32_t outsize)
{
	static const string label = IMAGE_ADDRESS_LABEL;

	hash256_t digest;
	keccak256(image_id.data(), image_id.length(), digest);

	address_seeds_t seeds;
	seeds.push_back(vector<uint8_t>(label.begin(), label.end()));
	seeds.push_back(vector<uint8_t>(digest.begin(), digest.end()));

	return find_program_address(seeds, proof_program, derived, output, outsize);
}

} // namespace Hashlock
