#ifndef PPAGG_AGGREGATOR_H
#define PPAGG_AGGREGATOR_H

#include "common.h"
#include "crypto/paillier.h"
#include "analytics/features.h"
#include <memory>
#include <string>
#include <vector>

namespace ppagg {

/**
 * Privacy-preserving analytics over encrypted feature vectors.
 *
 * Each user's FeatureVector is encrypted lane by lane under the session's
 * Paillier key. Vectors are summed homomorphically and only the aggregate
 * is ever decrypted.
 *
 * Lanes: total visits, category A visits, category B visits, A -> B
 * transitions.
 */

// One ciphertext per feature, tagged with the key it was produced under
struct EncryptedFeatureVector {
    std::string key_id;
    BigInt total_visits;
    BigInt category_a_visits;
    BigInt category_b_visits;
    BigInt a_to_b_transitions;
};

/**
 * Running homomorphic sum. Empty until the first vector is folded in; an
 * empty accumulator has no ciphertext and cannot be decrypted.
 */
struct AggregateAccumulator {
    size_t num_users = 0;
    EncryptedFeatureVector sum;

    bool IsEmpty() const { return num_users == 0; }
};

// Decrypted aggregate and derived percentages
struct AggregateStats {
    size_t num_users = 0;
    BigInt total_visits;
    BigInt category_a_visits;
    BigInt category_b_visits;
    BigInt a_to_b_transitions;
    double category_a_percentage = 0.0;   // A visits / total visits
    double transition_percentage = 0.0;   // transitions / A visits
};

/**
 * One analytics session. Owns its key pair and random source; nothing is
 * shared between sessions.
 *
 * Key material is read-only after construction, so concurrent calls are
 * safe. Accumulators are plain values: build partial accumulators per
 * worker and combine them with Merge().
 */
class PrivacyAnalytics {
public:
    /**
     * Start a session with a freshly generated key pair.
     * @param sec_params Modulus size
     * @param rng Session random source (defaults to an OS-seeded one)
     */
    explicit PrivacyAnalytics(const SecurityParams& sec_params = SecurityParams(),
                              std::unique_ptr<SecureRandom> rng = nullptr);

    /**
     * Start a session around an existing key pair.
     */
    PrivacyAnalytics(PaillierKeyPair kp, std::unique_ptr<SecureRandom> rng);

    /**
     * Encrypt the four features independently.
     * @throws InvalidPlaintextError if a count does not fit below N
     */
    EncryptedFeatureVector EncryptUser(const FeatureVector& fv) const;
    EncryptedFeatureVector EncryptUser(const FeatureVector& fv, SecureRandom& rng) const;

    /**
     * Sum a sequence of encrypted vectors lane by lane.
     * @return Empty accumulator for an empty sequence
     * @throws KeyMismatchError if a vector was made under another key
     */
    AggregateAccumulator Aggregate(const std::vector<EncryptedFeatureVector>& vectors) const;

    /**
     * Add one encrypted vector into an accumulator.
     */
    void Fold(AggregateAccumulator& acc, const EncryptedFeatureVector& vec) const;

    /**
     * Combine two partial accumulators. An empty side is the identity.
     */
    AggregateAccumulator Merge(const AggregateAccumulator& a,
                               const AggregateAccumulator& b) const;

    /**
     * Decrypt all lanes and compute percentages.
     * @throws EmptyAggregateError if no user was aggregated
     * @throws KeyMismatchError if the accumulator belongs to another key
     */
    AggregateStats DecryptAndAnalyze(const AggregateAccumulator& acc) const;

    /**
     * num / den * 100, or 0 when den is 0.
     */
    static double Percentage(const BigInt& num, const BigInt& den);

    const PaillierPublicKey& GetPublicKey() const { return kp_.pk; }
    const std::string& GetKeyId() const { return key_id_; }
    SecureRandom& GetRandom() const { return *rng_; }

private:
    void CheckKey(const std::string& key_id) const;

    std::unique_ptr<SecureRandom> rng_;
    PaillierKeyPair kp_;
    std::string key_id_;
};

} // namespace ppagg

#endif // PPAGG_AGGREGATOR_H
