#ifndef PPAGG_PAILLIER_H
#define PPAGG_PAILLIER_H

#include "common.h"
#include "crypto/random.h"
#include <string>

namespace ppagg {

/**
 * Paillier cryptosystem for additively homomorphic encryption.
 *
 * Based on: Paillier, P. "Public-Key Cryptosystems Based on Composite
 * Degree Residuosity Classes." EUROCRYPT 1999.
 *
 * Message space: Z_N
 * Ciphertext space: Z_{N^2}
 *
 * Homomorphic properties:
 *   Enc(m1) * Enc(m2) = Enc(m1 + m2)
 *   Enc(m) * g^k      = Enc(m + k)
 *   Enc(m)^k          = Enc(k * m)
 *
 * Combining ciphertexts from different key pairs is not detected here; the
 * analytics layer tags ciphertexts with Fingerprint(pk) for that.
 */

struct PaillierPublicKey {
    BigInt N;       // RSA modulus N = p*q
    BigInt N2;      // N^2 (ciphertext space modulus)
    BigInt g;       // Generator, always 1 + N
};

struct PaillierSecretKey {
    BigInt lambda;  // lcm(p-1, q-1)
    BigInt mu;      // L(g^lambda mod N^2)^{-1} mod N
};

struct PaillierKeyPair {
    PaillierPublicKey pk;
    PaillierSecretKey sk;
};

class Paillier {
public:
    static constexpr size_t MIN_MODULUS_BITS = 16;
    static constexpr size_t MAX_KEYGEN_ATTEMPTS = 64;

    /**
     * Generate a Paillier key pair.
     * @param bits Number of bits for N (should be >= 2048 for security)
     * @param rng Random source for the prime search
     * @throws KeyGenerationError if bits is too small or no usable prime
     *         pair is found within MAX_KEYGEN_ATTEMPTS
     */
    static PaillierKeyPair KeyGen(size_t bits, SecureRandom& rng);

    /**
     * Encrypt a plaintext message.
     * @param pk Public key
     * @param m Plaintext in [0, N)
     * @param rng Source of the blinding factor r
     * @return Ciphertext in Z_{N^2}
     * @throws InvalidPlaintextError if m is outside [0, N)
     */
    static BigInt Encrypt(const PaillierPublicKey& pk, const BigInt& m, SecureRandom& rng);

    /**
     * Encrypt with specified randomness (for testing/verification).
     * @throws std::invalid_argument if r is not a unit of Z_N
     */
    static BigInt Encrypt(const PaillierPublicKey& pk, const BigInt& m, const BigInt& r);

    /**
     * Decrypt a ciphertext.
     * @param sk Secret key
     * @param pk Public key
     * @param c Ciphertext in Z_{N^2}
     * @return Plaintext in Z_N
     */
    static BigInt Decrypt(const PaillierSecretKey& sk, const PaillierPublicKey& pk, const BigInt& c);

    /**
     * Homomorphic addition: Enc(m1 + m2) = Enc(m1) * Enc(m2)
     */
    static BigInt Add(const PaillierPublicKey& pk, const BigInt& c1, const BigInt& c2);

    /**
     * Add a plaintext constant: Enc(m + k) = Enc(m) * g^k
     */
    static BigInt AddConstant(const PaillierPublicKey& pk, const BigInt& c, const BigInt& k);

    /**
     * Homomorphic scalar multiplication: Enc(k * m) = Enc(m)^k
     */
    static BigInt ScalarMul(const PaillierPublicKey& pk, const BigInt& c, const BigInt& k);

    /**
     * Re-randomize a ciphertext (produces fresh randomness).
     */
    static BigInt Rerandomize(const PaillierPublicKey& pk, const BigInt& c, SecureRandom& rng);

    static bool IsValidCiphertext(const PaillierPublicKey& pk, const BigInt& c);

    /**
     * Key identity: hex SHA-256 of N.
     */
    static std::string Fingerprint(const PaillierPublicKey& pk);

private:
    static void CheckPlaintext(const PaillierPublicKey& pk, const BigInt& m);
    static void CheckCiphertext(const PaillierPublicKey& pk, const BigInt& c);
    static BigInt ReduceConstant(const PaillierPublicKey& pk, const BigInt& k);
};

} // namespace ppagg

#endif // PPAGG_PAILLIER_H
