#ifndef PPAGG_RANDOM_H
#define PPAGG_RANDOM_H

#include "common.h"
#include <NTL/ZZ.h>
#include <array>
#include <memory>
#include <mutex>

namespace ppagg {

/**
 * Cryptographically strong random source.
 *
 * Wraps an NTL::RandomStream (ChaCha-based PRG) keyed with NTL_PRG_KEYLEN
 * bytes. The default constructor takes the key from the operating system
 * entropy pool; the seeded constructors give reproducible streams.
 *
 * Each analytics session owns its own instance. Calls are serialized by an
 * internal mutex; worker threads should use Fork() to get an independent
 * stream instead of contending on a shared one.
 */
class SecureRandom {
public:
    static constexpr size_t KEY_LEN = NTL_PRG_KEYLEN;
    using Key = std::array<unsigned char, KEY_LEN>;

    // Key drawn from std::random_device
    SecureRandom();

    // Reproducible stream (tests, benchmarks)
    explicit SecureRandom(uint64_t seed);

    explicit SecureRandom(const Key& key);

    SecureRandom(const SecureRandom&) = delete;
    SecureRandom& operator=(const SecureRandom&) = delete;

    /**
     * Fill a buffer with random bytes.
     */
    void GetBytes(unsigned char* buf, size_t len);

    /**
     * Uniform integer in [0, bound) by rejection sampling.
     * @throws std::invalid_argument if bound <= 0
     */
    BigInt UniformBelow(const BigInt& bound);

    /**
     * Uniform unit of Z_N: r in [1, N-1] with gcd(r, N) = 1.
     */
    BigInt UniformUnit(const BigInt& N);

    /**
     * Derive an independent child stream keyed from this one.
     */
    std::unique_ptr<SecureRandom> Fork();

private:
    static Key EntropyKey();
    static Key SeedKey(uint64_t seed);

    std::mutex mutex_;
    NTL::RandomStream stream_;
};

/**
 * Routes NTL's thread-local random stream through a SecureRandom for the
 * lifetime of the guard, so NTL routines such as GenPrime draw from it.
 * The previous stream is restored on destruction.
 */
class NtlStreamGuard {
public:
    explicit NtlStreamGuard(SecureRandom& rng);

    NtlStreamGuard(const NtlStreamGuard&) = delete;
    NtlStreamGuard& operator=(const NtlStreamGuard&) = delete;

private:
    NTL::RandomStreamPush push_;
};

} // namespace ppagg

#endif // PPAGG_RANDOM_H
