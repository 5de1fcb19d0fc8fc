/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * HLapi.h
*/

#ifndef HLAPI_H_
#define HLAPI_H_

#ifndef HLRESULT
#define HLRESULT std::int32_t
#endif

#endif
