/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * options.hpp
*/

#pragma once

#include "hlclient.h"

#include <boost/program_options/variables_map.hpp>

// returns 1 if help was shown; throws on an invalid option or config file
int process_options(int argc, char **argv, EscrowParams& params, boost::program_options::variables_map& config_options);

void check_config_values(const EscrowParams& params);
void do_show_config(const EscrowParams& params, std::ostream& os);
