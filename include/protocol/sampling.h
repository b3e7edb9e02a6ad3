#ifndef PPAGG_SAMPLING_H
#define PPAGG_SAMPLING_H

#include "common.h"
#include "analytics/aggregator.h"
#include "analytics/features.h"
#include "analytics/population.h"
#include <random>
#include <string>
#include <vector>

namespace ppagg {

/**
 * Sampled population analysis.
 *
 * Flow:
 *   1. Draw a uniform sample of user ids without replacement
 *      (clamped to the population size).
 *   2. Per user: fetch events, extract features, encrypt, fold into an
 *      accumulator. Workers own local accumulators; they are merged once
 *      each, in worker order, after all workers joined.
 *   3. Decrypt only the aggregate.
 *
 * Cohort percentages ("primarily category A", "shows the A -> B pattern")
 * are evaluated on each user's plaintext features, outside the encrypted
 * path. The coordinator therefore sees per-user flags, which the encrypted
 * aggregate alone would not reveal. Reported cohort numbers depend on it.
 */

struct AnalysisReport {
    AggregateStats aggregate;                  // Decrypted sums and percentages
    size_t users_primarily_a = 0;
    double users_primarily_a_percentage = 0.0;
    size_t users_with_pattern = 0;
    double users_with_pattern_percentage = 0.0;
    size_t sample_size = 0;                    // Users actually analyzed
    size_t population_size = 0;
    double encrypted_phase_ms = 0.0;           // Extract + encrypt + aggregate
};

class SamplingOrchestrator {
public:
    /**
     * @param analytics Session that owns the key pair
     * @param extractor Feature extractor (category configuration)
     * @param params Sample size, thread count, thresholds, sampler seed
     */
    SamplingOrchestrator(const PrivacyAnalytics& analytics,
                         FeatureExtractor extractor,
                         const AnalysisParams& params = AnalysisParams());

    /**
     * Uniform sample of min(k, ids.size()) distinct ids (partial
     * Fisher-Yates shuffle).
     */
    static std::vector<std::string> DrawSample(std::vector<std::string> ids, size_t k,
                                               std::mt19937_64& rng);

    /**
     * Run the full analysis on a sample of the population.
     * @param population User index and event source
     * @param sample_size Requested sample size (clamped to the population)
     * @throws EmptyAggregateError if the sample is empty
     */
    AnalysisReport RunSampledAnalysis(const PopulationIndex& population, size_t sample_size);

    // Uses params.sample_size
    AnalysisReport RunSampledAnalysis(const PopulationIndex& population);

    const AnalysisParams& GetParams() const { return params_; }

private:
    // One worker's share of the sample
    struct PartialResult {
        AggregateAccumulator acc;
        size_t users_primarily_a = 0;
        size_t users_with_pattern = 0;
    };

    PartialResult ProcessRange(const PopulationIndex& population,
                               const std::vector<std::string>& ids,
                               size_t begin, size_t end,
                               SecureRandom& rng) const;

    const PrivacyAnalytics& analytics_;
    FeatureExtractor extractor_;
    AnalysisParams params_;
    std::mt19937_64 sampler_;
};

} // namespace ppagg

#endif // PPAGG_SAMPLING_H
