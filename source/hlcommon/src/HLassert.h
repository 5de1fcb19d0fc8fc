/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * HLassert.h
*/

#pragma once

#include <cstdint>

// internal consistency checks; a failed check is logged and thrown as std::runtime_error

#define HLASSERT(x)		hlassert_true(!!(x), #x, __FILE__, __LINE__)
#define HLASSERTZ(x)	hlassert_zero((std::intptr_t)(x), #x, __FILE__, __LINE__)

void hlassert_failed(const char *expr, const char *expected, std::intptr_t value, const char *file, int line);

inline void hlassert_true(bool ok, const char *expr, const char *file, int line)
{
	if (!ok)
		hlassert_failed(expr, "true", 0, file, line);
}

inline void hlassert_zero(std::intptr_t value, const char *expr, const char *file, int line)
{
	if (value)
		hlassert_failed(expr, "zero", value, file, line);
}
