#ifndef PPAGG_FEATURES_H
#define PPAGG_FEATURES_H

#include "common.h"
#include <string>
#include <vector>

namespace ppagg {

// One page visit
struct Event {
    uint64_t timestamp = 0;   // Unix seconds
    std::string site;
};

// A user's visits, ordered by timestamp
using EventLog = std::vector<Event>;

/**
 * Per-user behavioral counts. Every field is a plaintext for encryption.
 */
struct FeatureVector {
    Count total_visits = 0;
    Count category_a_visits = 0;
    Count category_b_visits = 0;
    Count a_to_b_transitions = 0;   // B visits immediately preceded by an A visit
};

/**
 * Turns an ordered event log into a FeatureVector in one forward pass.
 *
 * Membership is substring containment against the configured markers.
 * An event may match both categories; matches are counted independently.
 *
 * Transition tracking carries a single "previous event was A" flag. It is
 * cleared by every event that is not itself an A match, so A, A, B counts
 * one transition and A, (neither), B counts none.
 */
class FeatureExtractor {
public:
    explicit FeatureExtractor(CategoryConfig config = CategoryConfig::Defaults());

    FeatureVector Extract(const EventLog& events) const;

    bool IsCategoryA(const std::string& site) const;
    bool IsCategoryB(const std::string& site) const;

    /**
     * Cohort test: category A share of visits strictly above threshold.
     * False for a user with no visits.
     */
    static bool IsPrimarilyCategoryA(const FeatureVector& fv, double threshold);

    /**
     * Cohort test: at least one A -> B transition.
     */
    static bool ExhibitsTransition(const FeatureVector& fv);

    const CategoryConfig& GetConfig() const { return config_; }

private:
    static bool MatchesAny(const std::string& site, const std::vector<std::string>& markers);

    CategoryConfig config_;
};

} // namespace ppagg

#endif // PPAGG_FEATURES_H
