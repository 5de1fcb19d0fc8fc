/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * HLutil.cpp
*/

#include "HLdef.h"
#include "HLutil.h"

const char* g_hex_digits = "0123456789abcdef";

string buf2hex(const void *buf, unsigned nbytes, char separator)
{
	auto p = (const unsigned char *)buf;

	string o;
	for (unsigned i = 0; i < nbytes; ++i, ++p)
	{
		if (i && separator)
			o += separator;
		o += g_hex_digits[(*p >> 4) & 15];
		o += g_hex_digits[*p & 15];
	}

	return o;
}

static int hex_nibble(char c)
{
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;

	return -1;
}

bool is_hex_string(const string& str)
{
	for (auto c : str)
	{
		if (hex_nibble(c) < 0)
			return false;
	}

	return true;
}

// returns -1 if hex has an odd length or a non-hex character

int hex2buf(const string& hex, vector<uint8_t>& data)
{
	data.clear();

	if (hex.length() & 1)
		return -1;

	data.reserve(hex.length() / 2);

	for (unsigned i = 0; i < hex.length(); i += 2)
	{
		auto hi = hex_nibble(hex[i]);
		auto lo = hex_nibble(hex[i+1]);

		if (hi < 0 || lo < 0)
		{
			data.clear();
			return -1;
		}

		data.push_back((hi << 4) | lo);
	}

	return 0;
}

const char* yesno(int val)
{
	return val ? "yes" : "no";
}

// convert null or EOL terminated string to a uint64_t
// returns -1 if not a valid uint64_t

uint64_t buf2uint64(const void* bufp)
{
	const uint8_t* p = (uint8_t*)bufp;

	if (!p)
		return -1;

	bool started = false;
	bool done = false;

	uint64_t v = 0;

	while (true)
	{
		auto c = *p++;

		if (c == 0 || c == '\n' || c == '\r')
		{
			if (!started)
				return -1;

			return v;
		}

		if (c == ' ')
		{
			if (started)
				done = true;

			continue;
		}

		if (done)
			return -1;

		started = true;

		if (c < '0' || c > '9')
			return -1;

		auto n = v * 10 + c - '0';

		if (n / 10 != v)
			return -1;	// overflow

		v = n;
	}
}

// bufpos advances even when the copy would overflow, so the caller can check bufpos <= bufsize once at the end

void copy_to_bufl(unsigned line, const void* data, const size_t nbytes, uint32_t &bufpos, void *buffer, const uint32_t bufsize)
{
	auto buf = (char*)buffer;

	//cerr << "copy_to_buf buffer line " << line << " bufsize " << bufsize << " bufpos " << bufpos << " nbytes " << nbytes << endl;

	auto pos = bufpos;
	bufpos += nbytes;

	if (bufpos <= bufsize && bufpos >= pos && nbytes)
		memcpy(buf + pos, data, nbytes);
}

void copy_from_bufl(unsigned line, void* data, const size_t datasize, const size_t nbytes, uint32_t &bufpos, const void *buffer, const uint32_t bufsize)
{
	//cerr << "copy_from_buf buffer line " << line << " bufsize " << bufsize << " bufpos " << bufpos << " nbytes " << nbytes << endl;

	auto buf = (const char *)buffer;
	auto pos = bufpos;
	bufpos += nbytes;

	if (bufpos <= bufsize && bufpos >= pos && nbytes <= datasize)
	{
		if (nbytes)
			memcpy(data, buf + pos, nbytes);
		memset((char*)data + nbytes, 0, datasize - nbytes);
	}
	else
		memset((char*)data, 0, datasize);
}
