#include "crypto/paillier.h"
#include "crypto/modular.h"
#include "errors.h"
#include <NTL/ZZ.h>
#include <vector>
#include <stdexcept>

#ifdef USE_OPENSSL
#include <openssl/sha.h>
#else
#include <cryptopp/sha.h>
#endif

namespace ppagg {

using namespace NTL;

PaillierKeyPair Paillier::KeyGen(size_t bits, SecureRandom& rng) {
    if (bits < MIN_MODULUS_BITS) {
        throw KeyGenerationError("Paillier modulus must have at least "
                                 + std::to_string(MIN_MODULUS_BITS) + " bits, got "
                                 + std::to_string(bits));
    }

    // Two primes whose product has exactly `bits` bits
    long p_bits = static_cast<long>(bits / 2);
    long q_bits = static_cast<long>(bits) - p_bits;

    // GenPrime draws from NTL's current stream
    NtlStreamGuard guard(rng);

    for (size_t attempt = 0; attempt < MAX_KEYGEN_ATTEMPTS; attempt++) {
        BigInt p, q;
        GenPrime(p, p_bits);
        GenPrime(q, q_bits);
        if (p == q) {
            continue;
        }

        BigInt N = p * q;
        if (NumBits(N) != static_cast<long>(bits)) {
            continue;
        }

        // g = 1 + N needs gcd(N, (p-1)(q-1)) = 1; only fails for tiny moduli
        BigInt p1 = p - 1;
        BigInt q1 = q - 1;
        if (!IsOne(ModArith::Gcd(N, p1 * q1))) {
            continue;
        }

        PaillierKeyPair kp;
        kp.pk.N = N;
        kp.pk.N2 = N * N;

        // g = 1 + N (simplified generator)
        kp.pk.g = 1 + N;

        // lambda = lcm(p-1, q-1)
        kp.sk.lambda = ModArith::Lcm(p1, q1);

        // mu = L(g^lambda mod N^2)^{-1} mod N
        BigInt g_lambda = PowerMod(kp.pk.g, kp.sk.lambda, kp.pk.N2);
        BigInt L_val = ModArith::L(g_lambda, kp.pk.N);
        kp.sk.mu = ModArith::ModInverse(L_val, kp.pk.N);

        return kp;
    }

    throw KeyGenerationError("No usable prime pair for a " + std::to_string(bits)
                             + "-bit modulus after "
                             + std::to_string(MAX_KEYGEN_ATTEMPTS) + " attempts");
}

void Paillier::CheckPlaintext(const PaillierPublicKey& pk, const BigInt& m) {
    if (m < 0 || m >= pk.N) {
        throw InvalidPlaintextError("Plaintext outside [0, N)");
    }
}

void Paillier::CheckCiphertext(const PaillierPublicKey& pk, const BigInt& c) {
    if (!IsValidCiphertext(pk, c)) {
        throw InvalidCiphertextError("Ciphertext outside [0, N^2)");
    }
}

BigInt Paillier::ReduceConstant(const PaillierPublicKey& pk, const BigInt& k) {
    // g has order N in Z_{N^2}^*, so constants act modulo N
    return k % pk.N;
}

bool Paillier::IsValidCiphertext(const PaillierPublicKey& pk, const BigInt& c) {
    return c >= 0 && c < pk.N2;
}

BigInt Paillier::Encrypt(const PaillierPublicKey& pk, const BigInt& m, SecureRandom& rng) {
    CheckPlaintext(pk, m);
    // Random r in Z_N^*
    BigInt r = rng.UniformUnit(pk.N);
    return Encrypt(pk, m, r);
}

BigInt Paillier::Encrypt(const PaillierPublicKey& pk, const BigInt& m, const BigInt& r) {
    CheckPlaintext(pk, m);
    if (r < 1 || r >= pk.N || !IsOne(ModArith::Gcd(r, pk.N))) {
        throw std::invalid_argument("Encryption randomness must be a unit of Z_N");
    }

    // c = (1 + mN) * r^N mod N^2
    // Using g = 1 + N: g^m = (1 + N)^m = 1 + mN mod N^2 (by binomial theorem)
    BigInt gm = (1 + m * pk.N) % pk.N2;
    BigInt rN = PowerMod(r, pk.N, pk.N2);
    return MulMod(gm, rN, pk.N2);
}

BigInt Paillier::Decrypt(const PaillierSecretKey& sk, const PaillierPublicKey& pk,
                         const BigInt& c) {
    CheckCiphertext(pk, c);

    // m = L(c^lambda mod N^2) * mu mod N
    BigInt c_lambda = PowerMod(c, sk.lambda, pk.N2);
    BigInt L_val = ModArith::L(c_lambda, pk.N) % pk.N;
    return MulMod(L_val, sk.mu, pk.N);
}

BigInt Paillier::Add(const PaillierPublicKey& pk, const BigInt& c1, const BigInt& c2) {
    CheckCiphertext(pk, c1);
    CheckCiphertext(pk, c2);
    // Enc(m1 + m2) = Enc(m1) * Enc(m2) mod N^2
    return MulMod(c1, c2, pk.N2);
}

BigInt Paillier::AddConstant(const PaillierPublicKey& pk, const BigInt& c, const BigInt& k) {
    CheckCiphertext(pk, c);
    // Enc(m + k) = Enc(m) * g^k, with g^k = 1 + kN mod N^2
    BigInt gk = (1 + ReduceConstant(pk, k) * pk.N) % pk.N2;
    return MulMod(c, gk, pk.N2);
}

BigInt Paillier::ScalarMul(const PaillierPublicKey& pk, const BigInt& c, const BigInt& k) {
    CheckCiphertext(pk, c);
    // Enc(k * m) = Enc(m)^k mod N^2
    return PowerMod(c, ReduceConstant(pk, k), pk.N2);
}

BigInt Paillier::Rerandomize(const PaillierPublicKey& pk, const BigInt& c, SecureRandom& rng) {
    CheckCiphertext(pk, c);
    // c' = c * Enc(0) = c * r^N mod N^2
    BigInt r = rng.UniformUnit(pk.N);
    BigInt rN = PowerMod(r, pk.N, pk.N2);
    return MulMod(c, rN, pk.N2);
}

std::string Paillier::Fingerprint(const PaillierPublicKey& pk) {
    long len = NumBytes(pk.N);
    std::vector<unsigned char> bytes(len);
    BytesFromZZ(bytes.data(), pk.N, len);

    uint8_t digest[32];  // SHA-256 produces 32 bytes

#ifdef USE_OPENSSL
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, bytes.data(), bytes.size());
    SHA256_Final(digest, &ctx);
#else
    CryptoPP::SHA256 hash;
    hash.Update(bytes.data(), bytes.size());
    hash.Final(digest);
#endif

    static const char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(2 * sizeof(digest));
    for (uint8_t b : digest) {
        hex.push_back(hex_chars[(b >> 4) & 0x0F]);
        hex.push_back(hex_chars[b & 0x0F]);
    }
    return hex;
}

} // namespace ppagg
