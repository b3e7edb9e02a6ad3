#include "crypto/modular.h"
#include "errors.h"
#include <NTL/ZZ.h>

namespace ppagg {

using namespace NTL;

BigInt ModArith::Gcd(const BigInt& a, const BigInt& b) {
    BigInt d;
    GCD(d, a, b);
    return d;
}

BigInt ModArith::Lcm(const BigInt& a, const BigInt& b) {
    if (IsZero(a) || IsZero(b)) {
        return BigInt(0);
    }
    // Divide first to keep the intermediate small
    return (a / Gcd(a, b)) * b;
}

XGCDResult ModArith::ExtendedGcd(const BigInt& a, const BigInt& b) {
    // Invariants: old_r = a*old_x + b*old_y, r = a*x + b*y
    BigInt old_r = a, r = b;
    BigInt old_x(1), x(0);
    BigInt old_y(0), y(1);

    while (!IsZero(r)) {
        BigInt q = old_r / r;
        BigInt tmp;

        tmp = r;
        r = old_r - q * r;
        old_r = tmp;

        tmp = x;
        x = old_x - q * x;
        old_x = tmp;

        tmp = y;
        y = old_y - q * y;
        old_y = tmp;
    }

    return {old_r, old_x, old_y};
}

BigInt ModArith::ModInverse(const BigInt& a, const BigInt& m) {
    if (m <= 1) {
        throw NoInverseError("Modular inverse requires a modulus > 1");
    }

    // NTL's % takes the sign of the divisor, so a_mod is in [0, m)
    BigInt a_mod = a % m;
    XGCDResult res = ExtendedGcd(a_mod, m);
    if (!IsOne(res.g)) {
        throw NoInverseError("Modular inverse does not exist (gcd != 1)");
    }
    return res.x % m;
}

BigInt ModArith::L(const BigInt& x, const BigInt& N) {
    return (x - 1) / N;
}

} // namespace ppagg
