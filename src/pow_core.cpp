// pow_core.cpp
#include <thread>
#include <vector>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <exception>
#include <mutex>
#include <random>
#include <string>
#include "hex.h"
#include "pow_core.h"
#include "pow_core_internal.h"

namespace
{
    using Clock = std::chrono::steady_clock;

    /** \brief State shared by every worker of one run_pow call. */
    struct SearchState
    {
        std::atomic<bool> stop{false};
        std::atomic<bool> found{false};
        std::atomic<uint64_t> attempts{0};
        std::vector<unsigned char> result;
        int winner = -1;

        std::mutex error_mutex;
        std::exception_ptr error;
    };

    bool stop_requested(const PowOptions &options, bool has_deadline, Clock::time_point deadline)
    {
        if (options.cancel != nullptr && options.cancel->load(std::memory_order_acquire))
            return true;
        return has_deadline && Clock::now() >= deadline;
    }

    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wdeprecated-declarations"
    void pow_worker(const SHA256_CTX &sha_context_base, unsigned difficulty_bits,
                    const PowOptions &options, const pow_internal::Seed &seed,
                    unsigned worker_id, bool has_deadline, Clock::time_point deadline,
                    SearchState &state)
    {
        uint64_t attempts = 0;
        try
        {
            unsigned char digest[SHA256_DIGEST_LENGTH]{};
            std::vector<unsigned char> suffix(options.suffix_length);
            std::mt19937_64 rng = pow_internal::make_worker_rng(seed, worker_id);

            while (!state.stop.load(std::memory_order_acquire))
            {
                pow_internal::generate_random_suffix(rng, suffix.data(), suffix.size());

                SHA256_CTX sha_context = sha_context_base;
                SHA256_Update(&sha_context, suffix.data(), suffix.size());
                SHA256_Final(digest, &sha_context);
                ++attempts;

                if (pow_internal::has_leading_zeros(digest, difficulty_bits))
                {
                    bool expected = false;
                    if (state.found.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
                    {
                        // This thread wins: it's the ONLY writer.
                        state.result = suffix;
                        state.winner = static_cast<int>(worker_id);
                        state.stop.store(true, std::memory_order_release);
                    }
                    break; // winner or loser, stop after a hit
                }

                if (options.on_progress && attempts % options.progress_interval == 0)
                    options.on_progress(static_cast<int>(worker_id), attempts);

                if (attempts % pow_internal::POLL_INTERVAL == 0 &&
                    stop_requested(options, has_deadline, deadline))
                {
                    state.stop.store(true, std::memory_order_release);
                    break;
                }
            }
        }
        catch (...)
        {
            {
                std::lock_guard<std::mutex> lock(state.error_mutex);
                if (!state.error)
                    state.error = std::current_exception();
            }
            state.stop.store(true, std::memory_order_release);
        }
        state.attempts.fetch_add(attempts, std::memory_order_relaxed);
    }
    #pragma GCC diagnostic pop

    void join_all(std::vector<std::thread> &threads)
    {
        for (auto &t : threads)
        {
            if (t.joinable())
                t.join();
        }
    }
}

UnsatisfiableDifficulty::UnsatisfiableDifficulty(unsigned difficulty_bits)
    : std::domain_error("Difficulty of " + std::to_string(difficulty_bits) +
                        " bits exceeds the " + std::to_string(pow_internal::MAX_DIFFICULTY_BITS) +
                        "-bit SHA-256 digest."),
      difficulty_bits_(difficulty_bits)
{
}

namespace pow_internal
{
    unsigned determine_worker_count(unsigned hardware_hint, unsigned max_workers)
    {
        if (hardware_hint == 0)
            hardware_hint = FALLBACK_CPU_COUNT;
        unsigned count = std::min(max_workers, hardware_hint - 1);
        return std::max(count, 1u);
    }

    Seed process_seed()
    {
        Seed seed{};
        if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1)
            throw std::runtime_error("Could not gather entropy for the worker seeds.");
        return seed;
    }

    std::mt19937_64 make_worker_rng(const Seed &seed, unsigned worker_id)
    {
        std::vector<uint32_t> words;
        words.reserve(seed.size() / 4 + 1);
        for (size_t i = 0; i + 4 <= seed.size(); i += 4)
        {
            uint32_t word;
            std::memcpy(&word, seed.data() + i, sizeof(word));
            words.push_back(word);
        }
        words.push_back(worker_id);

        std::seed_seq seq(words.begin(), words.end());
        return std::mt19937_64(seq);
    }

    void generate_random_suffix(std::mt19937_64 &rng, unsigned char *output, size_t output_length)
    {
        size_t i = 0;
        while (i < output_length)
        {
            uint64_t word = rng();
            const size_t n = std::min(sizeof(word), output_length - i);
            std::memcpy(output + i, &word, n);
            i += n;
        }
    }

    bool has_leading_zeros(const unsigned char *digest, unsigned bits_required)
    {
        if (bits_required == 0)
            return true;
        if (digest == nullptr || bits_required > MAX_DIFFICULTY_BITS)
            return false;

        const unsigned full_bytes = bits_required / 8;
        const unsigned remaining_bits = bits_required % 8;

        for (unsigned i = 0; i < full_bytes; ++i)
        {
            if (digest[i] != 0)
                return false;
        }

        if (remaining_bits)
        {
            // e.g. 3 bits -> 1110 0000
            const unsigned char mask = static_cast<unsigned char>(0xFF << (8 - remaining_bits));
            if ((digest[full_bytes] & mask) != 0)
                return false;
        }

        return true;
    }
}

PowResult run_pow(const std::vector<unsigned char> &prefix, unsigned difficulty_bits,
                  const PowOptions &options)
{
    if (difficulty_bits > pow_internal::MAX_DIFFICULTY_BITS)
        throw UnsatisfiableDifficulty(difficulty_bits);
    if (options.suffix_length == 0)
        throw std::invalid_argument("Suffix length must be positive.");
    if (options.progress_interval == 0)
        throw std::invalid_argument("Progress interval must be positive.");

    unsigned worker_count = 0;
    if (options.workers == 0)
        worker_count = pow_internal::determine_worker_count(std::thread::hardware_concurrency(),
                                                            options.max_workers);
    else
        worker_count = std::max(std::min(options.workers, options.max_workers), 1u);

    const pow_internal::Seed seed = pow_internal::process_seed();

    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wdeprecated-declarations"
    SHA256_CTX sha_context_base;
    SHA256_Init(&sha_context_base);
    SHA256_Update(&sha_context_base, prefix.data(), prefix.size());
    #pragma GCC diagnostic pop

    SearchState state;
    std::vector<std::thread> threads;
    threads.reserve(worker_count);

    auto start = Clock::now();
    const bool has_deadline = options.timeout.count() > 0;
    const Clock::time_point deadline = start + options.timeout;

    try
    {
        for (unsigned i = 0; i < worker_count; ++i)
        {
            threads.emplace_back(pow_worker, std::cref(sha_context_base), difficulty_bits,
                                 std::cref(options), std::cref(seed), i, has_deadline, deadline,
                                 std::ref(state));
        }
    }
    catch (...)
    {
        state.stop.store(true, std::memory_order_release);
        join_all(threads);
        throw;
    }

    join_all(threads);

    if (state.error)
        std::rethrow_exception(state.error);

    auto end = Clock::now();
    std::chrono::duration<double> elapsed = end - start;
    std::string elapsed_time = std::to_string(elapsed.count());

    const uint64_t attempts = state.attempts.load(std::memory_order_relaxed);

    if (state.found)
    {
        return PowResult{
            state.result, to_hex(state.result), elapsed_time, true, attempts, state.winner};
    }
    else
    {
        return PowResult{
            {}, "", elapsed_time, false, attempts, -1};
    }
}

bool verify_pow(const std::vector<unsigned char> &prefix, const std::vector<unsigned char> &suffix,
                unsigned difficulty_bits)
{
    std::vector<unsigned char> input(prefix);
    input.insert(input.end(), suffix.begin(), suffix.end());

    unsigned char digest[SHA256_DIGEST_LENGTH]{};
    SHA256(input.data(), input.size(), digest);

    return pow_internal::has_leading_zeros(digest, difficulty_bits);
}
