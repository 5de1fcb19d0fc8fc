/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * HLutil.h
*/

#pragma once

#include <string>
#include <vector>
#include <cstdint>

#if __BYTE_ORDER__ != __ORDER_LITTLE_ENDIAN__
#error wire formats are copied in host byte order and require a little-endian host
#endif

extern const char* g_hex_digits;

#define STRINGIFY_QUOTER(x) #x
#define STRINGIFY(x) STRINGIFY_QUOTER(x)

std::string buf2hex(const void *buf, unsigned nbytes, char separator = 0);
int hex2buf(const std::string& hex, std::vector<uint8_t>& data);
bool is_hex_string(const std::string& str);
const char* yesno(int val);

uint64_t buf2uint64(const void* bufp);

void copy_to_bufl(unsigned line, const void* data, const size_t nbytes, uint32_t &bufpos, void *buffer, const uint32_t bufsize);
void copy_from_bufl(unsigned line, void* data, const size_t datasize, const size_t nbytes, uint32_t &bufpos, const void *buffer, const uint32_t bufsize);

#define copy_to_bufp(...)		copy_to_bufl(__LINE__, __VA_ARGS__)
#define copy_to_buf(a, ...)		copy_to_bufl(__LINE__, &(a), __VA_ARGS__)
#define copy_from_bufp(...)		copy_from_bufl(__LINE__, __VA_ARGS__)
#define copy_from_buf(a, ...)	copy_from_bufl(__LINE__, &(a), sizeof(a), __VA_ARGS__)
