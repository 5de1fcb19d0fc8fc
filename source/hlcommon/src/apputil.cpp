/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * apputil.cpp
*/

#include "HLdef.h"
#include "HLboost.hpp"
#include "apputil.h"

void set_trace_level(int level)
{
	boost::log::core::get()->set_filter(boost::log::trivial::severity > (((int)(fatal)) - level));
}

// returns the trimmed contents of a text file; throws if the file can't be read

string read_text_file(const string& path)
{
	boost::filesystem::ifstream fs;
	fs.open(path, fstream::in);
	if (!fs.is_open())
		throw runtime_error(string("Unable to open file \"") + path + "\"");

	ostringstream os;
	os << fs.rdbuf();

	if (fs.bad())
		throw runtime_error(string("Error reading file \"") + path + "\"");

	auto s = os.str();
	boost::trim(s);

	return s;
}
