/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * hllib.h
*/

#pragma once

#include <HLdef.h>
#include <HLboost.hpp>

#include "HLapi.h"
#include "escrow_errors.h"
