/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * test_main.cpp
*/

#define BOOST_TEST_MODULE hashlock_tests

#include <apputil.h>

#include <boost/test/unit_test.hpp>

struct QuietLogging
{
	QuietLogging()
	{
		set_trace_level(0);
	}
};

BOOST_GLOBAL_FIXTURE(QuietLogging);
