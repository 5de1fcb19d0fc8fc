/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * ledger.hpp
*/

#pragma once

#include <HLapi.h>
#include <address.hpp>
#include <instruction.hpp>

#include <string>
#include <vector>

namespace Hashlock {

class Signer
{
public:
	virtual ~Signer() = default;

	virtual const Address& PublicAddress() const = 0;
	virtual HLRESULT Sign(const std::vector<uint8_t>& message, std::vector<uint8_t>& signature) const = 0;
};

class LedgerConnection
{
public:
	virtual ~LedgerConnection() = default;

	// Signs the transaction with every signer, submits it and waits for confirmation.
	// Returns ESCROW_SUBMISSION_FAILED with the ledger's reason in error if the transaction is rejected or can't be sent.
	virtual HLRESULT SubmitAndConfirm(const Transaction& tx, const std::vector<const Signer*>& signers, std::string& signature, std::string& error) = 0;

	// Returns ESCROW_NOT_FOUND if no account exists at the address.
	virtual HLRESULT ReadAccount(const Address& address, std::vector<uint8_t>& data) = 0;

	virtual HLRESULT GetSlot(uint64_t& slot) = 0;
};

} // namespace Hashlock
