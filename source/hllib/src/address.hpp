/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * address.hpp
*/

#pragma once

#include "HLapi.h"
#include "HLhash.hpp"
#include "execution_id.hpp"

#include <array>
#include <string>
#include <vector>
#include <ostream>

#define ADDRESS_BYTES					32
#define ADDRESS_MAX_SEED_BYTES			32
#define ADDRESS_MAX_SEEDS				16
#define ADDRESS_PDA_MARKER				"ProgramDerivedAddress"

#define SYSTEM_PROGRAM_ID				"11111111111111111111111111111111"

#define EXECUTION_ADDRESS_LABEL			"execution"
#define IMAGE_ADDRESS_LABEL				"deployment"

namespace Hashlock {

class Address
{
	std::array<uint8_t, ADDRESS_BYTES> m_bytes;

public:
	Address()
	{
		m_bytes.fill(0);
	}

	explicit Address(const std::array<uint8_t, ADDRESS_BYTES>& bytes)
	 :	m_bytes(bytes)
	{ }

	static HLRESULT FromString(const std::string& str, Address& address, char *output = NULL, const uint32_t outsize = 0);
	static HLRESULT FromBytes(const void *data, unsigned nbytes, Address& address);

	std::string ToString() const;

	const uint8_t* data() const
	{
		return m_bytes.data();
	}

	static unsigned size()
	{
		return ADDRESS_BYTES;
	}

	const std::array<uint8_t, ADDRESS_BYTES>& Bytes() const
	{
		return m_bytes;
	}

	bool IsNull() const;

	bool operator== (const Address& other) const
	{
		return m_bytes == other.m_bytes;
	}

	bool operator!= (const Address& other) const
	{
		return m_bytes != other.m_bytes;
	}

	bool operator< (const Address& other) const
	{
		return m_bytes < other.m_bytes;
	}
};

std::ostream& operator<< (std::ostream& os, const Address& address);

typedef std::vector<std::vector<uint8_t>> address_seeds_t;

struct DerivedAddress
{
	Address address;
	uint8_t bump;

	DerivedAddress()
	 :	bump(0)
	{ }
};

// true if the bytes decompress to a point on the ed25519 curve
bool is_on_curve(const uint8_t *bytes);

HLRESULT create_program_address(const address_seeds_t& seeds, const Address& program_id, Address& address, char *output = NULL, const uint32_t outsize = 0);
HLRESULT find_program_address(const address_seeds_t& seeds, const Address& program_id, DerivedAddress& derived, char *output = NULL, const uint32_t outsize = 0);

HLRESULT derive_escrow_address(const std::string& seed, const Address& escrow_program, DerivedAddress& derived, char *output = NULL, const uint32_t outsize = 0);
HLRESULT derive_tracker_address(const execution_id_t& execution_id, const Address& escrow_program, DerivedAddress& derived, char *output = NULL, const uint32_t outsize = 0);
HLRESULT derive_execution_address(const Address& payer, const execution_id_t& execution_id, const Address& proof_program, DerivedAddress& derived, char *output = NULL, const uint32_t outsize = 0);
HLRESULT derive_image_address(const std::string& image_id, const Address& proof_program, DerivedAddress& derived, char *output = NULL, const uint32_t outsize = 0);

} // namespace Hashlock
