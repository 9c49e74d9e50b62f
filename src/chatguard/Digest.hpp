#pragma once

#include <cstddef>
#include <string>

// Lower-case hex SHA-256 of data. Used as the content hash and cache key.
std::string Sha256Hex(const std::string& data);

std::string HmacSha256Hex(const std::string& key, const std::string& data);

std::string HexEncode(const unsigned char* data, std::size_t length);
