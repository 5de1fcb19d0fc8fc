/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * escrow_errors.hpp
*/

#pragma once

#include "escrow_errors.h"

namespace Hashlock {

class Escrow_Exception : public std::exception
{
public:
	HLRESULT code;
	const string msg;

	Escrow_Exception(HLRESULT c, const char *m)
	:	code(c),
		msg(m)
	{ }

	Escrow_Exception(HLRESULT c, const string& m)
	:	code(c),
		msg(m)
	{ }

	const char* what() const noexcept
	{
		return msg.c_str();
	}
};

} // namespace Hashlock
