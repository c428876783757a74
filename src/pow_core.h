/** \file pow_core.h
\brief Find the suffix whose SHA-256 digest has the indicated leading zero bits.

This set of functions finds a byte suffix such that SHA256(prefix + suffix) has
a number of leading zero bits at least equal to the required difficulty.  The
SHA-256 context is initialized with the prefix once, then a copy of this context
is updated with each random candidate suffix before finalizing.  Bits are read
most-significant-bit first within each byte.

Each worker thread owns its own random generator, seeded from OpenSSL entropy
mixed with the worker index.  The first worker to find a valid suffix publishes
it and every other worker stops at the top of its next attempt.

The run_pow function should be called to initiate calculations:
run_pow(prefix, difficulty_bits, options)
*/
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include "pow_core_internal.h"

/**
 * \brief Thrown when no digest can ever have the requested number of zero bits.
 */
class UnsatisfiableDifficulty : public std::domain_error
{
public:
    explicit UnsatisfiableDifficulty(unsigned difficulty_bits);

    unsigned difficulty_bits() const { return difficulty_bits_; }

private:
    unsigned difficulty_bits_;
};

/**
 * \brief Called by a worker every progress_interval attempts.
 *
 * Invoked concurrently from several worker threads.
 */
using PowProgress = std::function<void(int worker_id, uint64_t attempts)>;

/**
 * \brief Tuning knobs for run_pow.
 */
struct PowOptions
{
    /** Upper bound on the number of workers, explicit or derived. */
    unsigned max_workers = pow_internal::DEFAULT_MAX_WORKERS;
    /** Requested number of workers, 0 to derive it from the hardware. */
    unsigned workers = 0;
    /** Length in bytes of each candidate suffix. */
    size_t suffix_length = pow_internal::DEFAULT_SUFFIX_LENGTH;
    /** Attempts between two progress callbacks of one worker. */
    uint64_t progress_interval = pow_internal::DEFAULT_PROGRESS_INTERVAL;
    /** Give up after this long, 0 for no limit. */
    std::chrono::milliseconds timeout{0};
    /** Optional external stop request. */
    const std::atomic<bool> *cancel = nullptr;
    PowProgress on_progress;
};

/**
 * \brief Struct to return results.
 */
struct PowResult
{
    std::vector<unsigned char> suffix;
    std::string suffix_hex;
    std::string seconds;
    bool found = false;
    uint64_t attempts = 0;
    int worker_id = -1;
};

/**
 * \brief Run the parallel search and return the result and elapsed time.
 *
 * \post res.found ⇒ SHA256(prefix + res.suffix) has difficulty_bits leading zero bits
 *
 * \param prefix          Raw bytes concatenated before the suffix.
 * \param difficulty_bits Required leading zero bits.
 * \param options         Worker count, suffix length, progress and stop controls.
 * \return PowResult. If the search was stopped by timeout or cancellation,
 *         suffix is empty, found is false and seconds still reflects elapsed time.
 * \throws UnsatisfiableDifficulty if difficulty_bits exceeds the digest size.
 * \throws std::invalid_argument if suffix_length or progress_interval is zero.
 */
PowResult run_pow(const std::vector<unsigned char> &prefix, unsigned difficulty_bits,
                  const PowOptions &options = PowOptions());

/**
 * \brief Check a suffix against a prefix and difficulty without searching.
 */
bool verify_pow(const std::vector<unsigned char> &prefix, const std::vector<unsigned char> &suffix,
                unsigned difficulty_bits);
