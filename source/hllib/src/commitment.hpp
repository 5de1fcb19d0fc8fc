/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * commitment.hpp
*/

#pragma once

#include "HLapi.h"

#include <string>

#define COMMITMENT_HEX_CHARS	64

namespace Hashlock {

// commitment = lowercase hex SHA-256 of the secret's UTF-8 bytes
HLRESULT commit(const std::string& secret, std::string& commitment);

// true iff the string is exactly 64 hex characters, either case
bool commitment_format_valid(const std::string& commitment);

HLRESULT check_commitment_format(const std::string& fn, const std::string& commitment, char *output = NULL, const uint32_t outsize = 0);

// strips trailing NUL and whitespace padding from a stored commitment slot
std::string trim_commitment_padding(const void *slot, unsigned nbytes);

} // namespace Hashlock
