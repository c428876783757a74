/** \brief Find a suffix for the given hex prefix and difficulty bits.

This file is an entry to the POW functions, without any network access.
Syntax: pow_benchmark <prefix_hex> <difficulty_bits> [workers]
*/
#include <iostream>
#include <vector>
#include "cli_args.h"
#include "hex.h"
#include "pow_core.h"

int main(int argc, char *argv[])
{
    if (argc < 3)
    {
        std::cerr << "Usage: " << argv[0] << " <prefix_hex> <difficulty_bits> [workers]\n";
        return 1;
    }

    PowOptions options;
    PowResult outputs;
    try
    {
        std::vector<unsigned char> prefix = from_hex(argv[1]);
        unsigned difficulty_bits = parse_non_negative(argv[2], "difficulty_bits");
        if (argc > 3)
            options.workers = parse_non_negative(argv[3], "workers");

        outputs = run_pow(prefix, difficulty_bits, options);
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }

    if (!outputs.found)
    {
        std::cerr << "No result found.\n";
        return 1;
    }

    std::cout << "RESULT:" << outputs.suffix_hex << "\n";
    std::cout << "Time: " << outputs.seconds << " seconds\n";
    std::cout << "Attempts: " << outputs.attempts << " (worker " << outputs.worker_id << ")\n";

    return 0;
}
