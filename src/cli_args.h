/** \file cli_args.h
\brief Command line parsing shared by upload_image and pow_benchmark.
*/
#pragma once
#include <string>
#include <vector>
#include "pow_core.h"

/**
 * \brief Parse a decimal count with no sign and nothing after the digits.
 *
 * \throws std::invalid_argument for "-1", "5abc", "" or a value above UINT_MAX.
 */
unsigned parse_non_negative(const std::string &text, const std::string &what);

struct UploadArgs
{
    std::string endpoint;
    std::vector<std::string> paths;
    PowOptions options;
};

/**
 * \brief Parse "<endpoint> <imagePath>... [--workers N] [--timeout SECONDS]".
 *
 * \param args argv without the program name.
 * \throws std::invalid_argument on a flag without value, a bad number, or
 *         fewer than one endpoint and one path.
 */
UploadArgs parse_upload_args(const std::vector<std::string> &args);
