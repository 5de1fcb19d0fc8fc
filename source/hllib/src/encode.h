/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * encode.h
*/

#pragma once

#include "HLapi.h"

#include <string>
#include <vector>
#include <cstdint>

namespace Hashlock {

extern const char* g_base58_alphabet;

void base58_encode(const void* data, unsigned nbytes, std::string& outs);
int base58_decode(const std::string& str, std::vector<uint8_t>& data);

inline std::string base58_encode(const std::vector<uint8_t>& data)
{
	std::string outs;
	base58_encode(data.data(), data.size(), outs);
	return outs;
}

} // namespace Hashlock
