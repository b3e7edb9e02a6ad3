#ifndef PPAGG_COMMON_H
#define PPAGG_COMMON_H

#include <NTL/ZZ.h>
#include <vector>
#include <string>
#include <cstdint>

namespace ppagg {

// Type aliases
using BigInt = NTL::ZZ;
using Count = uint64_t;

// Security parameters
struct SecurityParams {
    size_t N_bits = 1024;       // Paillier modulus size
};

// Analysis parameters
struct AnalysisParams {
    size_t sample_size = 1000;       // Users drawn from the population
    size_t num_threads = 1;          // Workers for extract + encrypt
    double primary_threshold = 0.5;  // Share of category A visits for "primarily A"
    uint64_t sample_seed = 0;        // Sampler seed (0 = use random device)
    bool verbose = false;            // Print per-phase timings
};

/**
 * Site markers for the two tracked categories.
 *
 * A site belongs to a category when it contains one of the category's
 * markers as a substring. The two lists may overlap: a site can be in
 * both categories at once.
 */
struct CategoryConfig {
    std::vector<std::string> category_a;  // short-form video
    std::vector<std::string> category_b;  // commerce

    /**
     * Default marker lists (short-form video and e-commerce domains).
     */
    static CategoryConfig Defaults();
};

inline BigInt ToBigInt(Count v) {
    return NTL::conv<BigInt>(static_cast<unsigned long>(v));
}

} // namespace ppagg

#endif // PPAGG_COMMON_H
