// pow_core_test.cpp
#include "../pow_core.h"
#include <gtest/gtest.h>
#include <openssl/sha.h>
#include "../pow_core_internal.h"
using ::testing::Range;
#include <array>
#include <atomic>
#include <chrono>
#include <cstring>
#include <span>
#include <stdexcept>
#include <vector>

namespace
{
    std::array<unsigned char, 32> digest_with_leading_zeros(unsigned zeros)
    {
        std::array<unsigned char, 32> digest;
        digest.fill(0xFF);
        for (unsigned bit = 0; bit < zeros; ++bit)
            digest[bit / 8] &= static_cast<unsigned char>(~(0x80u >> (bit % 8)));
        return digest;
    }

    int leading_zero_bits(const unsigned char *d, size_t n = SHA256_DIGEST_LENGTH)
    {
        int count = 0;
        for (size_t i = 0; i < n; ++i)
        {
            unsigned char byte = d[i];
            if (byte == 0)
            {
                count += 8;
                continue;
            }

            while ((byte & 0x80u) == 0u)
            {
                byte <<= 1;
                ++count;
            }
            return count; // stop at first non-zero byte
        }
        return count; // all zero
    }

    std::array<unsigned char, 32> sha256(std::span<const unsigned char> data)
    {
        std::array<unsigned char, SHA256_DIGEST_LENGTH> output;
        SHA256(data.data(), data.size(), output.data());
        return output;
    }

    int solution_zero_bits(const std::vector<unsigned char> &prefix, const std::vector<unsigned char> &suffix)
    {
        std::vector<unsigned char> input(prefix);
        input.insert(input.end(), suffix.begin(), suffix.end());
        std::array<unsigned char, 32> output_hash = sha256(input);
        return leading_zero_bits(output_hash.data());
    }

    const std::vector<unsigned char> prefix{'b', 'l', 'a', 'h'};
}

class LeadingZerosTest : public ::testing::TestWithParam<unsigned>
{
};

class OneZeroShortTest : public ::testing::TestWithParam<unsigned>
{
};

INSTANTIATE_TEST_SUITE_P(UpTo32Bits, LeadingZerosTest, Range(0u, 33u));
INSTANTIATE_TEST_SUITE_P(OneTo32Bits, OneZeroShortTest, Range(1u, 33u));

TEST_P(LeadingZerosTest, ExactZerosAccepted)
{
    const unsigned d = GetParam();
    auto digest = digest_with_leading_zeros(d);
    EXPECT_TRUE(pow_internal::has_leading_zeros(digest.data(), d));
}

TEST_P(OneZeroShortTest, Rejected)
{
    const unsigned d = GetParam();
    auto digest = digest_with_leading_zeros(d - 1);
    EXPECT_FALSE(pow_internal::has_leading_zeros(digest.data(), d));
}

TEST(HasLeadingZeros, EightBitsIgnoresSecondByte)
{
    std::array<unsigned char, 32> digest{};
    digest.fill(0xFF);
    digest[0] = 0x00;
    EXPECT_TRUE(pow_internal::has_leading_zeros(digest.data(), 8));

    digest[1] = 0x00;
    EXPECT_TRUE(pow_internal::has_leading_zeros(digest.data(), 8));

    digest[0] = 0x01;
    EXPECT_FALSE(pow_internal::has_leading_zeros(digest.data(), 8));
}

TEST(HasLeadingZeros, ElevenBitsChecksTopThreeOfSecondByte)
{
    std::array<unsigned char, 32> digest{};
    digest.fill(0xFF);
    digest[0] = 0x00;
    digest[1] = 0x1F; // 0001 1111
    EXPECT_TRUE(pow_internal::has_leading_zeros(digest.data(), 11));

    digest[1] = 0x00;
    EXPECT_TRUE(pow_internal::has_leading_zeros(digest.data(), 11));

    digest[1] = 0x20; // 0010 0000
    EXPECT_FALSE(pow_internal::has_leading_zeros(digest.data(), 11));

    digest[0] = 0x80;
    digest[1] = 0x00;
    EXPECT_FALSE(pow_internal::has_leading_zeros(digest.data(), 11));
}

TEST(HasLeadingZeros, FullDigest)
{
    std::array<unsigned char, 32> digest{};
    EXPECT_TRUE(pow_internal::has_leading_zeros(digest.data(), 256));
    EXPECT_FALSE(pow_internal::has_leading_zeros(digest.data(), 257));

    digest[31] = 0x01;
    EXPECT_FALSE(pow_internal::has_leading_zeros(digest.data(), 256));
    EXPECT_TRUE(pow_internal::has_leading_zeros(digest.data(), 255));
}

TEST(DetermineWorkerCount, ReservesOneForCaller)
{
    EXPECT_EQ(7u, pow_internal::determine_worker_count(8, 32));
}

TEST(DetermineWorkerCount, CappedAtMaximum)
{
    EXPECT_EQ(32u, pow_internal::determine_worker_count(128, 32));
    EXPECT_EQ(4u, pow_internal::determine_worker_count(128, 4));
}

TEST(DetermineWorkerCount, FloorOfOne)
{
    EXPECT_EQ(1u, pow_internal::determine_worker_count(1, 32));
    EXPECT_EQ(1u, pow_internal::determine_worker_count(2, 32));
    EXPECT_EQ(1u, pow_internal::determine_worker_count(16, 0));
}

TEST(DetermineWorkerCount, UnknownHardwareUsesFallback)
{
    EXPECT_EQ(pow_internal::FALLBACK_CPU_COUNT - 1, pow_internal::determine_worker_count(0, 32));
}

TEST(WorkerRng, DistinctPerWorker)
{
    const pow_internal::Seed seed = pow_internal::process_seed();
    auto rng0 = pow_internal::make_worker_rng(seed, 0);
    auto rng1 = pow_internal::make_worker_rng(seed, 1);

    std::vector<unsigned char> a(64), b(64);
    pow_internal::generate_random_suffix(rng0, a.data(), a.size());
    pow_internal::generate_random_suffix(rng1, b.data(), b.size());
    EXPECT_NE(a, b);
}

TEST(WorkerRng, SameSeedSameStream)
{
    const pow_internal::Seed seed = pow_internal::process_seed();
    auto rng_a = pow_internal::make_worker_rng(seed, 3);
    auto rng_b = pow_internal::make_worker_rng(seed, 3);
    EXPECT_EQ(rng_a(), rng_b());
}

TEST(WorkerRng, DistinctPerProcessSeed)
{
    auto rng_a = pow_internal::make_worker_rng(pow_internal::process_seed(), 0);
    auto rng_b = pow_internal::make_worker_rng(pow_internal::process_seed(), 0);
    EXPECT_NE(rng_a(), rng_b());
}

TEST(GenerateRandomSuffix, ZeroLength_NoWrite)
{
    auto rng = pow_internal::make_worker_rng(pow_internal::Seed{}, 0);
    unsigned char dummy = 0xAB;
    pow_internal::generate_random_suffix(rng, &dummy, 0); // must not touch memory
    EXPECT_EQ(dummy, 0xAB);
}

TEST(GenerateRandomSuffix, PartialWordWritesExactLength)
{
    auto rng = pow_internal::make_worker_rng(pow_internal::Seed{}, 0);
    unsigned char output[12];
    std::memset(output, 0xCD, sizeof(output));
    pow_internal::generate_random_suffix(rng, output, 11);
    EXPECT_EQ(output[11], 0xCD);
}

TEST(RunPow, EmptyPrefixZeroDifficulty_ReturnsImmediately)
{
    PowResult result = run_pow({}, 0);
    ASSERT_TRUE(result.found);
    EXPECT_EQ(pow_internal::DEFAULT_SUFFIX_LENGTH, result.suffix.size());
    EXPECT_EQ(2 * pow_internal::DEFAULT_SUFFIX_LENGTH, result.suffix_hex.size());
    EXPECT_GE(result.attempts, 1u);
}

TEST(RunPow, NormalPrefixNormalDifficulty_ProducesValidSuffix)
{
    const int difficulty_bits = 16;
    PowResult result = run_pow(prefix, difficulty_bits);

    ASSERT_TRUE(result.found);
    EXPECT_LE(difficulty_bits, solution_zero_bits(prefix, result.suffix));
    EXPECT_TRUE(verify_pow(prefix, result.suffix, difficulty_bits));
}

TEST(RunPow, SeveralWorkers_OneWinner)
{
    PowOptions options;
    options.workers = 4;
    const int difficulty_bits = 20;
    PowResult result = run_pow(prefix, difficulty_bits, options);

    ASSERT_TRUE(result.found);
    EXPECT_GE(result.worker_id, 0);
    EXPECT_LT(result.worker_id, 4);
    EXPECT_LE(difficulty_bits, solution_zero_bits(prefix, result.suffix));
}

TEST(RunPow, ZeroDifficultyManyWorkers_SingleSuffix)
{
    // every worker hits on its first attempt, only one may publish
    PowOptions options;
    options.workers = 8;
    PowResult result = run_pow(prefix, 0, options);

    ASSERT_TRUE(result.found);
    EXPECT_EQ(64u, result.suffix.size());
    EXPECT_GE(result.worker_id, 0);
    EXPECT_LT(result.worker_id, 8);
}

TEST(RunPow, ExplicitWorkersCappedAtMaximum)
{
    std::atomic<int> highest{-1};

    PowOptions options;
    options.workers = 64;
    options.max_workers = 4;
    options.progress_interval = 1;
    options.timeout = std::chrono::milliseconds(200);
    options.on_progress = [&](int worker_id, uint64_t)
    {
        int seen = highest.load();
        while (worker_id > seen && !highest.compare_exchange_weak(seen, worker_id))
        {
        }
    };
    PowResult result = run_pow(prefix, 256, options);

    EXPECT_FALSE(result.found);
    EXPECT_GE(highest.load(), 0);
    EXPECT_LT(highest.load(), 4);
}

TEST(RunPow, DefaultOptionsMatchConstants)
{
    PowOptions options;
    EXPECT_EQ(pow_internal::DEFAULT_MAX_WORKERS, options.max_workers);
    EXPECT_EQ(pow_internal::DEFAULT_SUFFIX_LENGTH, options.suffix_length);
    EXPECT_EQ(pow_internal::DEFAULT_PROGRESS_INTERVAL, options.progress_interval);

    PowResult result;
    EXPECT_FALSE(result.found);
    EXPECT_EQ(0u, result.attempts);
    EXPECT_EQ(-1, result.worker_id);
}

TEST(RunPow, CustomSuffixLength)
{
    PowOptions options;
    options.suffix_length = 8;
    PowResult result = run_pow(prefix, 12, options);

    ASSERT_TRUE(result.found);
    EXPECT_EQ(8u, result.suffix.size());
    EXPECT_TRUE(verify_pow(prefix, result.suffix, 12));
}

TEST(RunPow, DifficultyAboveDigest_Throws)
{
    EXPECT_THROW(run_pow(prefix, 257), UnsatisfiableDifficulty);
    EXPECT_THROW(run_pow({}, 1000), UnsatisfiableDifficulty);

    try
    {
        run_pow(prefix, 300);
        FAIL() << "expected UnsatisfiableDifficulty";
    }
    catch (const UnsatisfiableDifficulty &e)
    {
        EXPECT_EQ(300u, e.difficulty_bits());
    }
}

TEST(RunPow, ZeroSuffixLength_Throws)
{
    PowOptions options;
    options.suffix_length = 0;
    EXPECT_THROW(run_pow(prefix, 4, options), std::invalid_argument);
}

TEST(RunPow, Timeout_StopsWithoutResult)
{
    PowOptions options;
    options.workers = 2;
    options.timeout = std::chrono::milliseconds(100);
    PowResult result = run_pow(prefix, 256, options);

    EXPECT_FALSE(result.found);
    EXPECT_TRUE(result.suffix.empty());
    EXPECT_TRUE(result.suffix_hex.empty());
    EXPECT_EQ(-1, result.worker_id);
    EXPECT_GT(result.attempts, 0u);
}

TEST(RunPow, Cancelled_StopsWithoutResult)
{
    std::atomic<bool> cancel{true};
    PowOptions options;
    options.workers = 2;
    options.cancel = &cancel;
    PowResult result = run_pow(prefix, 256, options);

    EXPECT_FALSE(result.found);
    EXPECT_LE(result.attempts, 2 * pow_internal::POLL_INTERVAL);
}

TEST(RunPow, ProgressReportedOnInterval)
{
    std::atomic<int> calls{0};
    std::atomic<bool> misaligned{false};

    PowOptions options;
    options.workers = 2;
    options.progress_interval = 100;
    options.timeout = std::chrono::milliseconds(100);
    options.on_progress = [&](int worker_id, uint64_t attempts)
    {
        if (attempts % 100 != 0 || worker_id < 0 || worker_id >= 2)
            misaligned = true;
        ++calls;
    };
    run_pow(prefix, 256, options);

    EXPECT_GT(calls.load(), 0);
    EXPECT_FALSE(misaligned.load());
}

TEST(RunPow, ProgressCallbackError_Propagates)
{
    PowOptions options;
    options.workers = 2;
    options.progress_interval = 1;
    options.on_progress = [](int, uint64_t)
    {
        throw std::runtime_error("progress sink closed");
    };
    EXPECT_THROW(run_pow(prefix, 256, options), std::runtime_error);
}

TEST(VerifyPow, Deterministic)
{
    const std::vector<unsigned char> suffix{0x01, 0x02, 0x03};
    for (unsigned d = 0; d <= 8; ++d)
        EXPECT_EQ(verify_pow(prefix, suffix, d), verify_pow(prefix, suffix, d));
}

TEST(VerifyPow, EmptyInput)
{
    // SHA256("") starts with 0xe3
    EXPECT_TRUE(verify_pow({}, {}, 0));
    EXPECT_FALSE(verify_pow({}, {}, 1));
    EXPECT_FALSE(verify_pow({}, {}, 257));
}
