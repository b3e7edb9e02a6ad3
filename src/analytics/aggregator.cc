#include "analytics/aggregator.h"
#include "errors.h"
#include <utility>

namespace ppagg {

using namespace NTL;

namespace {

std::unique_ptr<SecureRandom> OrDefault(std::unique_ptr<SecureRandom> rng) {
    if (!rng) {
        rng.reset(new SecureRandom());
    }
    return rng;
}

} // namespace

PrivacyAnalytics::PrivacyAnalytics(const SecurityParams& sec_params,
                                   std::unique_ptr<SecureRandom> rng)
    : rng_(OrDefault(std::move(rng))),
      kp_(Paillier::KeyGen(sec_params.N_bits, *rng_)),
      key_id_(Paillier::Fingerprint(kp_.pk)) {}

PrivacyAnalytics::PrivacyAnalytics(PaillierKeyPair kp, std::unique_ptr<SecureRandom> rng)
    : rng_(OrDefault(std::move(rng))),
      kp_(std::move(kp)),
      key_id_(Paillier::Fingerprint(kp_.pk)) {}

void PrivacyAnalytics::CheckKey(const std::string& key_id) const {
    if (key_id != key_id_) {
        throw KeyMismatchError("Ciphertext key " + key_id.substr(0, 16)
                               + " does not match session key " + key_id_.substr(0, 16));
    }
}

double PrivacyAnalytics::Percentage(const BigInt& num, const BigInt& den) {
    if (IsZero(den)) {
        return 0.0;
    }
    return conv<double>(num) / conv<double>(den) * 100.0;
}

EncryptedFeatureVector PrivacyAnalytics::EncryptUser(const FeatureVector& fv) const {
    return EncryptUser(fv, *rng_);
}

EncryptedFeatureVector PrivacyAnalytics::EncryptUser(const FeatureVector& fv,
                                                     SecureRandom& rng) const {
    EncryptedFeatureVector enc;
    enc.key_id = key_id_;
    enc.total_visits = Paillier::Encrypt(kp_.pk, ToBigInt(fv.total_visits), rng);
    enc.category_a_visits = Paillier::Encrypt(kp_.pk, ToBigInt(fv.category_a_visits), rng);
    enc.category_b_visits = Paillier::Encrypt(kp_.pk, ToBigInt(fv.category_b_visits), rng);
    enc.a_to_b_transitions = Paillier::Encrypt(kp_.pk, ToBigInt(fv.a_to_b_transitions), rng);
    return enc;
}

void PrivacyAnalytics::Fold(AggregateAccumulator& acc, const EncryptedFeatureVector& vec) const {
    CheckKey(vec.key_id);

    if (acc.IsEmpty()) {
        acc.sum = vec;
        acc.num_users = 1;
        return;
    }

    const PaillierPublicKey& pk = kp_.pk;
    acc.sum.total_visits = Paillier::Add(pk, acc.sum.total_visits, vec.total_visits);
    acc.sum.category_a_visits = Paillier::Add(pk, acc.sum.category_a_visits, vec.category_a_visits);
    acc.sum.category_b_visits = Paillier::Add(pk, acc.sum.category_b_visits, vec.category_b_visits);
    acc.sum.a_to_b_transitions = Paillier::Add(pk, acc.sum.a_to_b_transitions, vec.a_to_b_transitions);
    acc.num_users++;
}

AggregateAccumulator
PrivacyAnalytics::Aggregate(const std::vector<EncryptedFeatureVector>& vectors) const {
    // Validate every tag before folding so a mismatch never leaves a partial sum
    for (const auto& vec : vectors) {
        CheckKey(vec.key_id);
    }

    AggregateAccumulator acc;
    for (const auto& vec : vectors) {
        Fold(acc, vec);
    }
    return acc;
}

AggregateAccumulator PrivacyAnalytics::Merge(const AggregateAccumulator& a,
                                             const AggregateAccumulator& b) const {
    if (a.IsEmpty()) {
        if (!b.IsEmpty()) CheckKey(b.sum.key_id);
        return b;
    }
    if (b.IsEmpty()) {
        CheckKey(a.sum.key_id);
        return a;
    }

    CheckKey(b.sum.key_id);
    AggregateAccumulator merged = a;
    Fold(merged, b.sum);
    merged.num_users = a.num_users + b.num_users;
    return merged;
}

AggregateStats PrivacyAnalytics::DecryptAndAnalyze(const AggregateAccumulator& acc) const {
    if (acc.IsEmpty()) {
        throw EmptyAggregateError("Cannot decrypt an aggregate of zero users");
    }
    CheckKey(acc.sum.key_id);

    const PaillierPublicKey& pk = kp_.pk;
    const PaillierSecretKey& sk = kp_.sk;

    AggregateStats stats;
    stats.num_users = acc.num_users;
    stats.total_visits = Paillier::Decrypt(sk, pk, acc.sum.total_visits);
    stats.category_a_visits = Paillier::Decrypt(sk, pk, acc.sum.category_a_visits);
    stats.category_b_visits = Paillier::Decrypt(sk, pk, acc.sum.category_b_visits);
    stats.a_to_b_transitions = Paillier::Decrypt(sk, pk, acc.sum.a_to_b_transitions);

    stats.category_a_percentage = Percentage(stats.category_a_visits, stats.total_visits);
    stats.transition_percentage = Percentage(stats.a_to_b_transitions, stats.category_a_visits);

    return stats;
}

} // namespace ppagg
