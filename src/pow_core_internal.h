#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <random>

namespace pow_internal
{
    /** \brief SHA-256 digest size in bits.  No difficulty above this can be met.
        \see run_pow
         */
    constexpr unsigned MAX_DIFFICULTY_BITS = 256;

    constexpr size_t DEFAULT_SUFFIX_LENGTH = 64;
    constexpr unsigned DEFAULT_MAX_WORKERS = 32;
    constexpr uint64_t DEFAULT_PROGRESS_INTERVAL = 10000;

    /** \brief CPU count assumed when the hardware does not report one. */
    constexpr unsigned FALLBACK_CPU_COUNT = 5;

    /** \brief Attempts between two checks of the timeout and cancel token. */
    constexpr uint64_t POLL_INTERVAL = 1024;

    /** \brief Bytes of process entropy fed to every worker seed. */
    constexpr size_t SEED_BYTES = 32;

    using Seed = std::array<unsigned char, SEED_BYTES>;

    // One worker per hardware thread minus one for the caller, within [1, max_workers]
    unsigned determine_worker_count(unsigned hardware_hint, unsigned max_workers);

    Seed process_seed();

    std::mt19937_64 make_worker_rng(const Seed &seed, unsigned worker_id);

    void generate_random_suffix(std::mt19937_64 &rng, unsigned char *output, size_t output_length);

    bool has_leading_zeros(const unsigned char *digest, unsigned bits_required);
}
