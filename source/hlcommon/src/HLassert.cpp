/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * HLassert.cpp
*/

#include "HLdef.h"
#include "HLboost.hpp"

void hlassert_failed(const char *expr, const char *expected, intptr_t value, const char *file, int line)
{
	ostringstream os;
	os << "check failed: " << expr << " expected " << expected;
	if (value)
		os << " got " << value;
	os << " at " << file << ":" << line;

	BOOST_LOG_TRIVIAL(fatal) << os.str();

	throw runtime_error(os.str());
}
