/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * hlclient.h
*/

#pragma once

#define HLAPPNAME	"Hashlock Escrow Client"
#define HLVERSION	"1.00"
#define HLEXENAME	"hlescrow"

#define DEFAULT_ESCROW_PROGRAM_ID	"72bGikYM7J314fvAfBDvMGdqaewHaq7LpbJMNF5rJDb8"
#define DEFAULT_PROOF_PROGRAM_ID	"BoNsHRcyLLNdtnoDf8hiCNZpyehMC4FDMxs6NTxFi3ew"
#define DEFAULT_IMAGE_ID			"75029efa53432a9030e5e76d58fb34dfa786cd0f6182ed0741d635ff5e4f0341"	// SHA-256 guest program

#define DEFAULT_CLAIM_TIP			1000	// lamports
#define DEFAULT_CLAIM_EXPIRY		5000	// slots
#define DEFAULT_POLL_INTERVAL_MS	2000
#define DEFAULT_POLL_ATTEMPTS		300

#include <hllib.h>

struct EscrowParams
{
	string		escrow_program;
	string		proof_program;
	string		image_id;

	uint64_t	tip;
	uint64_t	expiry;

	int			poll_interval_ms;
	int			poll_attempts;

	int			trace_level;
	bool		trace_client;
	bool		trace_workflow;
	bool		trace_polling;

	EscrowParams()
	 :	escrow_program(DEFAULT_ESCROW_PROGRAM_ID),
		proof_program(DEFAULT_PROOF_PROGRAM_ID),
		image_id(DEFAULT_IMAGE_ID),
		tip(DEFAULT_CLAIM_TIP),
		expiry(DEFAULT_CLAIM_EXPIRY),
		poll_interval_ms(DEFAULT_POLL_INTERVAL_MS),
		poll_attempts(DEFAULT_POLL_ATTEMPTS),
		trace_level(DEFAULT_TRACE_LEVEL),
		trace_client(false),
		trace_workflow(false),
		trace_polling(false)
	{ }
};
