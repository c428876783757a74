// hex.cpp
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "hex.h"

namespace
{
    int hex_value(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }
}

std::string to_hex(const unsigned char *data, size_t len)
{
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; i++)
    {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string to_hex(const std::vector<unsigned char> &data)
{
    return to_hex(data.data(), data.size());
}

std::vector<unsigned char> from_hex(const std::string &hex)
{
    if (hex.size() % 2 != 0)
        throw std::invalid_argument("Hex string has odd length.");

    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        const int hi = hex_value(hex[i]);
        const int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0)
            throw std::invalid_argument("Invalid hex character at offset " + std::to_string(hi < 0 ? i : i + 1) + ".");
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
}
