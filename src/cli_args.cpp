// cli_args.cpp
#include <cctype>
#include <limits>
#include <stdexcept>
#include "cli_args.h"

unsigned parse_non_negative(const std::string &text, const std::string &what)
{
    // std::stoul alone wraps "-1" and ignores trailing garbage
    for (char c : text)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            throw std::invalid_argument(what + " must be a non-negative integer, got '" + text + "'");
    }
    if (text.empty())
        throw std::invalid_argument(what + " must be a non-negative integer, got ''");

    unsigned long long value = 0;
    try
    {
        value = std::stoull(text);
    }
    catch (const std::out_of_range &)
    {
        throw std::invalid_argument(what + " is out of range: " + text);
    }
    if (value > std::numeric_limits<unsigned>::max())
        throw std::invalid_argument(what + " is out of range: " + text);
    return static_cast<unsigned>(value);
}

UploadArgs parse_upload_args(const std::vector<std::string> &args)
{
    UploadArgs parsed;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        if (arg == "--workers" || arg == "--timeout")
        {
            if (i + 1 >= args.size())
                throw std::invalid_argument(arg + " needs a value");
            const unsigned value = parse_non_negative(args[++i], arg);
            if (arg == "--workers")
                parsed.options.workers = value;
            else
                parsed.options.timeout = std::chrono::seconds(value);
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2)
        throw std::invalid_argument("expected an endpoint and at least one image path");

    parsed.endpoint = positional[0];
    parsed.paths.assign(positional.begin() + 1, positional.end());
    return parsed;
}
