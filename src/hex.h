/** \file hex.h
\brief Lowercase hex encoding of raw bytes, as used for the challenge prefix and the suffix.
*/
#pragma once
#include <cstddef>
#include <string>
#include <vector>

std::string to_hex(const unsigned char *data, size_t len);

std::string to_hex(const std::vector<unsigned char> &data);

/**
 * \brief Decode a hex string, upper or lower case.
 *
 * \throws std::invalid_argument on odd length or a non-hex character.
 */
std::vector<unsigned char> from_hex(const std::string &hex);
