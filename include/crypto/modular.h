#ifndef PPAGG_MODULAR_H
#define PPAGG_MODULAR_H

#include "common.h"

namespace ppagg {

/**
 * Number-theoretic helpers used by key generation and decryption.
 *
 * All inputs are non-negative. Results are exact (arbitrary precision).
 */

// Result of the extended Euclidean algorithm: a*x + b*y = g
struct XGCDResult {
    BigInt g;
    BigInt x;
    BigInt y;
};

class ModArith {
public:
    static BigInt Gcd(const BigInt& a, const BigInt& b);

    /**
     * Least common multiple, lcm(a, b) = a*b / gcd(a, b).
     * lcm(0, b) = 0.
     */
    static BigInt Lcm(const BigInt& a, const BigInt& b);

    /**
     * Extended Euclidean algorithm (iterative).
     * @return (g, x, y) with a*x + b*y = g = gcd(a, b)
     */
    static XGCDResult ExtendedGcd(const BigInt& a, const BigInt& b);

    /**
     * Modular inverse.
     * @param a Value to invert
     * @param m Modulus (> 1)
     * @return x in [0, m) with a*x = 1 mod m
     * @throws NoInverseError if gcd(a, m) != 1
     */
    static BigInt ModInverse(const BigInt& a, const BigInt& m);

    /**
     * Paillier L function: L(x) = (x - 1) / N.
     * Callers guarantee x = 1 mod N, so the division is exact.
     */
    static BigInt L(const BigInt& x, const BigInt& N);
};

} // namespace ppagg

#endif // PPAGG_MODULAR_H
