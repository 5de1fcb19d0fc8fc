/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * HLticks.hpp
*/

#pragma once

#include <chrono>

typedef std::chrono::steady_clock::time_point hltime_t;

hltime_t hlnow();
unsigned hlelapsed_ms(const hltime_t& t0);
void hlsleep_ms(unsigned ms);
