/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * commands.hpp
*/

#pragma once

#include "hlclient.h"

#include <escrow_errors.hpp>

#include <jsoncpp/json/json.h>

// runs one offline command; throws Escrow_Exception on failure
void run_command(const vector<string>& args, const EscrowParams& params, ostream& out);

void write_json(const Json::Value& root, ostream& out);
