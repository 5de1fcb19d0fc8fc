/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * HLticks.cpp
*/

#include "HLdef.h"
#include "HLticks.hpp"

hltime_t hlnow()
{
	return chrono::steady_clock::now();
}

unsigned hlelapsed_ms(const hltime_t& t0)
{
	auto ms = chrono::duration_cast<chrono::milliseconds>(hlnow() - t0).count();

	return ms > 0 ? ms : 0;
}

void hlsleep_ms(unsigned ms)
{
	if (ms)
		this_thread::sleep_for(chrono::milliseconds(ms));
}
