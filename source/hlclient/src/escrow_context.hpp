/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * escrow_context.hpp
*/

#pragma once

#include "hlclient.h"
#include "ledger.hpp"

namespace Hashlock {

// Everything an escrow operation needs, constructed once and passed to each operation.
// The constructor throws runtime_error if a configured program id is not a valid address.

class EscrowContext
{
public:
	const EscrowParams params;

	Address escrow_program;
	Address proof_program;
	Address system_program;
	DerivedAddress image_account;

	LedgerConnection& ledger;

	EscrowContext(const EscrowParams& p, LedgerConnection& l);

	EscrowContext(const EscrowContext&) = delete;
	EscrowContext& operator=(const EscrowContext&) = delete;
};

} // namespace Hashlock
