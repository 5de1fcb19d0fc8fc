/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * escrow_errors.cpp
*/

#include "hllib.h"
#include "escrow_errors.h"

namespace Hashlock {

const char* escrow_error_string(HLRESULT code)
{
	switch (code)
	{
	case ESCROW_OK:							return "ok";
	case ESCROW_INVALID_COMMITMENT_FORMAT:	return "invalid commitment format";
	case ESCROW_INVALID_EXECUTION_ID:		return "invalid execution id";
	case ESCROW_INVALID_ADDRESS:			return "invalid address";
	case ESCROW_INVALID_PARAMETER:			return "invalid parameter";
	case ESCROW_ALREADY_CLAIMED:			return "escrow already claimed";
	case ESCROW_DERIVATION_EXHAUSTED:		return "address derivation exhausted";
	case ESCROW_SEED_TOO_LONG:				return "derivation seed too long";
	case ESCROW_FIELD_TOO_LONG:				return "field too long";
	case ESCROW_SUBMISSION_FAILED:			return "submission failed";
	case ESCROW_TRUNCATED_ACCOUNT:			return "truncated account";
	case ESCROW_MALFORMED_COMMITMENT:		return "malformed commitment";
	case ESCROW_MALFORMED_INSTRUCTION:		return "malformed instruction";
	case ESCROW_NOT_FOUND:					return "account not found";
	case ESCROW_INTERNAL_ERROR:				return "internal error";
	}

	return "unknown error";
}

EscrowErrorCategory escrow_error_category(HLRESULT code)
{
	switch (code)
	{
	case ESCROW_OK:
		return ESCROW_CATEGORY_NONE;

	case ESCROW_INVALID_COMMITMENT_FORMAT:
	case ESCROW_INVALID_EXECUTION_ID:
	case ESCROW_INVALID_ADDRESS:
	case ESCROW_INVALID_PARAMETER:
	case ESCROW_ALREADY_CLAIMED:
		return ESCROW_CATEGORY_VALIDATION;

	case ESCROW_DERIVATION_EXHAUSTED:
	case ESCROW_SEED_TOO_LONG:
		return ESCROW_CATEGORY_DERIVATION;

	case ESCROW_FIELD_TOO_LONG:
		return ESCROW_CATEGORY_ENCODING;

	case ESCROW_SUBMISSION_FAILED:
		return ESCROW_CATEGORY_SUBMISSION;

	case ESCROW_TRUNCATED_ACCOUNT:
	case ESCROW_MALFORMED_COMMITMENT:
	case ESCROW_MALFORMED_INSTRUCTION:
		return ESCROW_CATEGORY_DECODING;

	case ESCROW_NOT_FOUND:
		return ESCROW_CATEGORY_NOT_FOUND;
	}

	return ESCROW_CATEGORY_INTERNAL;
}

const char* escrow_category_string(EscrowErrorCategory category)
{
	switch (category)
	{
	case ESCROW_CATEGORY_NONE:			return "None";
	case ESCROW_CATEGORY_VALIDATION:	return "ValidationError";
	case ESCROW_CATEGORY_DERIVATION:	return "DerivationError";
	case ESCROW_CATEGORY_ENCODING:		return "EncodingError";
	case ESCROW_CATEGORY_SUBMISSION:	return "SubmissionError";
	case ESCROW_CATEGORY_DECODING:		return "DecodingError";
	case ESCROW_CATEGORY_NOT_FOUND:		return "NotFound";
	case ESCROW_CATEGORY_INTERNAL:		return "InternalError";
	}

	return "InternalError";
}

HLRESULT copy_error_to_output(const string& fn, const string& error, char *output, const uint32_t outsize, HLRESULT rc)
{
	if (output && outsize)
	{
		size_t eol = fn.copy(output, outsize - 1);

		if (eol)
		{
			eol += string(" ").copy(output + eol, outsize - eol - 1);
		}

		eol += error.copy(output + eol, outsize - eol - 1);

		output[eol] = 0;
	}

	return rc;
}

HLRESULT escrow_error(const string& fn, HLRESULT code, const string& detail, char *output, const uint32_t outsize)
{
	string error = "error: ";
	error += escrow_error_string(code);
	if (detail.length())
	{
		error += "; ";
		error += detail;
	}

	BOOST_LOG_TRIVIAL(debug) << fn << " " << error;

	return copy_error_to_output(fn, error, output, outsize, code);
}

} // namespace Hashlock
