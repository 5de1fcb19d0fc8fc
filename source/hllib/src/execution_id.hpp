/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * execution_id.hpp
*/

#pragma once

#include "HLapi.h"

#include <array>
#include <string>
#include <cstdint>

#define EXECUTION_ID_BYTES		16

namespace Hashlock {

// the proof service execution id, zero-padded to a fixed 16 bytes

typedef std::array<uint8_t, EXECUTION_ID_BYTES> execution_id_t;

HLRESULT execution_id_from_string(const std::string& str, execution_id_t& id, char *output = NULL, const uint32_t outsize = 0);
std::string execution_id_to_string(const execution_id_t& id);
HLRESULT new_execution_id(execution_id_t& id, char *output = NULL, const uint32_t outsize = 0);

} // namespace Hashlock
