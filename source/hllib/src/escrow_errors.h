/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * escrow_errors.h
*/

#pragma once

#include "HLapi.h"

#include <string>

namespace Hashlock {

enum EscrowErrorCode
{
	ESCROW_OK                        = 0,

	//! Validation errors, detected before any I/O
	ESCROW_INVALID_COMMITMENT_FORMAT = -1,		// commitment is not 64 hex characters
	ESCROW_INVALID_EXECUTION_ID      = -2,		// execution id longer than 16 bytes
	ESCROW_INVALID_ADDRESS           = -3,		// not a base58 encoded 32-byte address
	ESCROW_INVALID_PARAMETER         = -4,
	ESCROW_ALREADY_CLAIMED           = -5,		// claim pre-check found the escrow already claimed

	//! Derivation errors
	ESCROW_DERIVATION_EXHAUSTED      = -10,		// no bump from 255 down to 0 gives an off-curve address
	ESCROW_SEED_TOO_LONG             = -11,		// seed over 32 bytes, or too many seeds

	//! Encoding errors
	ESCROW_FIELD_TOO_LONG            = -20,		// length prefix would overflow

	//! Submission errors
	ESCROW_SUBMISSION_FAILED         = -30,		// ledger rejected the transaction, or network failure

	//! Decoding errors
	ESCROW_TRUNCATED_ACCOUNT         = -40,
	ESCROW_MALFORMED_COMMITMENT      = -41,
	ESCROW_MALFORMED_INSTRUCTION     = -42,

	//! Lookup errors
	ESCROW_NOT_FOUND                 = -50,		// account does not exist

	ESCROW_INTERNAL_ERROR            = -90
};

enum EscrowErrorCategory
{
	ESCROW_CATEGORY_NONE = 0,
	ESCROW_CATEGORY_VALIDATION,
	ESCROW_CATEGORY_DERIVATION,
	ESCROW_CATEGORY_ENCODING,
	ESCROW_CATEGORY_SUBMISSION,
	ESCROW_CATEGORY_DECODING,
	ESCROW_CATEGORY_NOT_FOUND,
	ESCROW_CATEGORY_INTERNAL
};

const char* escrow_error_string(HLRESULT code);
EscrowErrorCategory escrow_error_category(HLRESULT code);
const char* escrow_category_string(EscrowErrorCategory category);

HLRESULT copy_error_to_output(const std::string& fn, const std::string& error, char *output, const uint32_t outsize, HLRESULT rc);
HLRESULT escrow_error(const std::string& fn, HLRESULT code, const std::string& detail, char *output, const uint32_t outsize);

} // namespace Hashlock
