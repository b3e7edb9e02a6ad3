#ifndef PPAGG_ERRORS_H
#define PPAGG_ERRORS_H

#include <stdexcept>
#include <string>

namespace ppagg {

// Plaintext outside [0, N)
class InvalidPlaintextError : public std::out_of_range {
public:
    explicit InvalidPlaintextError(const std::string& what) : std::out_of_range(what) {}
};

// Ciphertext outside [0, N^2)
class InvalidCiphertextError : public std::out_of_range {
public:
    explicit InvalidCiphertextError(const std::string& what) : std::out_of_range(what) {}
};

// Prime search exhausted or unusable modulus size
class KeyGenerationError : public std::runtime_error {
public:
    explicit KeyGenerationError(const std::string& what) : std::runtime_error(what) {}
};

// gcd(a, m) != 1 in a modular inverse
class NoInverseError : public std::domain_error {
public:
    explicit NoInverseError(const std::string& what) : std::domain_error(what) {}
};

// Ciphertexts produced under different key pairs
class KeyMismatchError : public std::invalid_argument {
public:
    explicit KeyMismatchError(const std::string& what) : std::invalid_argument(what) {}
};

// Aggregation or decryption over zero users
class EmptyAggregateError : public std::logic_error {
public:
    explicit EmptyAggregateError(const std::string& what) : std::logic_error(what) {}
};

} // namespace ppagg

#endif // PPAGG_ERRORS_H
