#include "crypto/random.h"
#include <random>
#include <stdexcept>
#include <vector>

namespace ppagg {

using namespace NTL;

SecureRandom::Key SecureRandom::EntropyKey() {
    Key key;
    std::random_device rd;
    for (size_t i = 0; i < KEY_LEN; i += 4) {
        unsigned int word = rd();
        for (size_t j = 0; j < 4 && i + j < KEY_LEN; j++) {
            key[i + j] = static_cast<unsigned char>(word >> (8 * j));
        }
    }
    return key;
}

SecureRandom::Key SecureRandom::SeedKey(uint64_t seed) {
    Key key{};
    for (size_t j = 0; j < sizeof(seed); j++) {
        key[j] = static_cast<unsigned char>(seed >> (8 * j));
    }
    return key;
}

SecureRandom::SecureRandom() : stream_(EntropyKey().data()) {}

SecureRandom::SecureRandom(uint64_t seed) : stream_(SeedKey(seed).data()) {}

SecureRandom::SecureRandom(const Key& key) : stream_(key.data()) {}

void SecureRandom::GetBytes(unsigned char* buf, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_.get(buf, static_cast<long>(len));
}

BigInt SecureRandom::UniformBelow(const BigInt& bound) {
    if (bound <= 0) {
        throw std::invalid_argument("UniformBelow requires a positive bound");
    }

    long bits = NumBits(bound);
    long nbytes = (bits + 7) / 8;
    unsigned char top_mask = static_cast<unsigned char>(0xFF >> (8 * nbytes - bits));
    std::vector<unsigned char> buf(nbytes);

    // Draw exactly NumBits(bound) bits and reject values >= bound
    BigInt x;
    do {
        GetBytes(buf.data(), buf.size());
        buf[nbytes - 1] &= top_mask;  // ZZFromBytes is little-endian
        ZZFromBytes(x, buf.data(), nbytes);
    } while (x >= bound);

    return x;
}

BigInt SecureRandom::UniformUnit(const BigInt& N) {
    if (N <= 1) {
        throw std::invalid_argument("UniformUnit requires N > 1");
    }

    BigInt r;
    do {
        r = UniformBelow(N);
    } while (IsZero(r) || !IsOne(GCD(r, N)));
    return r;
}

std::unique_ptr<SecureRandom> SecureRandom::Fork() {
    Key child;
    GetBytes(child.data(), child.size());
    return std::unique_ptr<SecureRandom>(new SecureRandom(child));
}

NtlStreamGuard::NtlStreamGuard(SecureRandom& rng) {
    SecureRandom::Key key;
    rng.GetBytes(key.data(), key.size());
    SetSeed(key.data(), static_cast<long>(key.size()));
}

} // namespace ppagg
