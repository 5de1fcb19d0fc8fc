/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * address_tests.cpp
*/

#include <hllib.h>
#include <hlclient.h>
#include <address.hpp>

#include <boost/test/unit_test.hpp>

using namespace Hashlock;

static Address escrow_program()
{
	Address address;
	auto rc = Address::FromString(DEFAULT_ESCROW_PROGRAM_ID, address);
	BOOST_REQUIRE_EQUAL(rc, 0);
	return address;
}

static vector<uint8_t> hex_bytes(const string& hex)
{
	vector<uint8_t> data;
	BOOST_REQUIRE_EQUAL(hex2buf(hex, data), 0);
	return data;
}

BOOST_AUTO_TEST_SUITE(address_tests)

BOOST_AUTO_TEST_CASE(curve_points)
{
	vector<uint8_t> point(32, 0);

	// y = 0 and y = 1 both decompress
	BOOST_CHECK(is_on_curve(point.data()));

	point[0] = 1;
	BOOST_CHECK(is_on_curve(point.data()));

	// the ed25519 base point
	auto base = hex_bytes("5866666666666666666666666666666666666666666666666666666666666666");
	BOOST_CHECK(is_on_curve(base.data()));

	// y = 2 has no x
	point[0] = 2;
	BOOST_CHECK(!is_on_curve(point.data()));
}

BOOST_AUTO_TEST_CASE(escrow_address_is_deterministic)
{
	auto program = escrow_program();

	DerivedAddress a, b, c;

	BOOST_CHECK_EQUAL(derive_escrow_address("s1", program, a), 0);
	BOOST_CHECK_EQUAL(derive_escrow_address("s1", program, b), 0);
	BOOST_CHECK_EQUAL(derive_escrow_address("s2", program, c), 0);

	BOOST_CHECK_EQUAL(a.address, b.address);
	BOOST_CHECK_EQUAL(a.bump, b.bump);
	BOOST_CHECK_NE(a.address, c.address);

	BOOST_CHECK(!is_on_curve(a.address.data()));
	BOOST_CHECK(!is_on_curve(c.address.data()));
}

BOOST_AUTO_TEST_CASE(bump_is_first_off_curve)
{
	auto program = escrow_program();

	DerivedAddress derived;
	BOOST_REQUIRE_EQUAL(derive_escrow_address("escrow seed", program, derived), 0);

	address_seeds_t seeds;
	seeds.push_back(vector<uint8_t>({'e', 's', 'c', 'r', 'o', 'w', ' ', 's', 'e', 'e', 'd'}));
	seeds.push_back(vector<uint8_t>(1, derived.bump));

	Address created;
	BOOST_CHECK_EQUAL(create_program_address(seeds, program, created), 0);
	BOOST_CHECK_EQUAL(created, derived.address);

	// every higher bump lands on the curve
	for (unsigned bump = 255; bump > derived.bump; --bump)
	{
		seeds.back()[0] = bump;
		BOOST_CHECK_EQUAL(create_program_address(seeds, program, created), ESCROW_DERIVATION_EXHAUSTED);
	}
}

BOOST_AUTO_TEST_CASE(claim_addresses_differ)
{
	auto program = escrow_program();

	Address proof;
	BOOST_REQUIRE_EQUAL(Address::FromString(DEFAULT_PROOF_PROGRAM_ID, proof), 0);

	execution_id_t id;
	BOOST_REQUIRE_EQUAL(execution_id_from_string("exec-1", id), 0);

	Address payer;
	BOOST_REQUIRE_EQUAL(Address::FromString(DEFAULT_PROOF_PROGRAM_ID, payer), 0);

	DerivedAddress tracker, execution, image, image2;

	BOOST_CHECK_EQUAL(derive_tracker_address(id, program, tracker), 0);
	BOOST_CHECK_EQUAL(derive_execution_address(payer, id, proof, execution), 0);
	BOOST_CHECK_EQUAL(derive_image_address(DEFAULT_IMAGE_ID, proof, image), 0);
	BOOST_CHECK_EQUAL(derive_image_address(DEFAULT_IMAGE_ID, proof, image2), 0);

	BOOST_CHECK_NE(tracker.address, execution.address);
	BOOST_CHECK_NE(execution.address, image.address);
	BOOST_CHECK_EQUAL(image.address, image2.address);

	execution_id_t other;
	BOOST_REQUIRE_EQUAL(execution_id_from_string("exec-2", other), 0);

	DerivedAddress tracker2;
	BOOST_CHECK_EQUAL(derive_tracker_address(other, program, tracker2), 0);
	BOOST_CHECK_NE(tracker.address, tracker2.address);
}

BOOST_AUTO_TEST_CASE(seed_limits)
{
	auto program = escrow_program();

	DerivedAddress derived;

	BOOST_CHECK_EQUAL(derive_escrow_address(string(32, 'a'), program, derived), 0);
	BOOST_CHECK_EQUAL(derive_escrow_address(string(33, 'a'), program, derived), ESCROW_SEED_TOO_LONG);

	// the bump counts against the seed limit
	address_seeds_t seeds(16, vector<uint8_t>(1, 'x'));
	BOOST_CHECK_EQUAL(find_program_address(seeds, program, derived), ESCROW_SEED_TOO_LONG);

	seeds.pop_back();
	BOOST_CHECK_EQUAL(find_program_address(seeds, program, derived), 0);

	char output[256];
	BOOST_CHECK_EQUAL(derive_escrow_address(string(40, 'a'), program, derived, output, sizeof(output)), ESCROW_SEED_TOO_LONG);
	BOOST_CHECK(string(output).find("seed too long") != string::npos);
}

BOOST_AUTO_TEST_CASE(address_from_string)
{
	Address address;

	BOOST_CHECK_EQUAL(Address::FromString(SYSTEM_PROGRAM_ID, address), 0);
	BOOST_CHECK(address.IsNull());
	BOOST_CHECK_EQUAL(address.ToString(), SYSTEM_PROGRAM_ID);

	BOOST_CHECK_EQUAL(Address::FromString("not base58!", address), ESCROW_INVALID_ADDRESS);
	BOOST_CHECK_EQUAL(Address::FromString("StV1DL6CwTryKyV", address), ESCROW_INVALID_ADDRESS);
	BOOST_CHECK(address.IsNull());

	BOOST_CHECK_EQUAL(Address::FromString(DEFAULT_ESCROW_PROGRAM_ID, address), 0);
	BOOST_CHECK(!address.IsNull());
	BOOST_CHECK_EQUAL(address.ToString(), DEFAULT_ESCROW_PROGRAM_ID);
}

BOOST_AUTO_TEST_SUITE_END()
