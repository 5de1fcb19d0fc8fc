/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * apputil.h
*/

#pragma once

#include <string>

void set_trace_level(int level);
std::string read_text_file(const std::string& path);
