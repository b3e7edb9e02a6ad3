#ifndef PPAGG_POPULATION_H
#define PPAGG_POPULATION_H

#include "common.h"
#include "analytics/features.h"
#include <map>
#include <random>
#include <string>
#include <vector>

namespace ppagg {

/**
 * Source of user event logs.
 *
 * Implementations must allow concurrent FetchEvents calls; the sampled
 * analysis fetches from several worker threads.
 */
class PopulationIndex {
public:
    virtual ~PopulationIndex() = default;

    virtual std::vector<std::string> UserIds() const = 0;

    /**
     * @throws std::out_of_range for an unknown user
     */
    virtual EventLog FetchEvents(const std::string& user_id) const = 0;

    virtual size_t Size() const { return UserIds().size(); }
};

/**
 * Map-backed population. User ids keep insertion order.
 */
class InMemoryPopulation : public PopulationIndex {
public:
    /**
     * Add a user, replacing the log if the id already exists.
     */
    void AddUser(const std::string& user_id, EventLog events);

    std::vector<std::string> UserIds() const override { return ids_; }
    EventLog FetchEvents(const std::string& user_id) const override;
    size_t Size() const override { return ids_.size(); }

    size_t TotalEvents() const;

private:
    std::vector<std::string> ids_;
    std::map<std::string, EventLog> logs_;
};

/**
 * Synthetic browsing-history generator for simulation and benchmarking.
 *
 * Every user gets a category A preference ~ Beta(2, 2) and an A-then-B
 * preference ~ Beta(2, 3). Visits are produced in sessions of 5 to 20:
 *   - with probability pref_a, a category A site;
 *   - else, right after an A visit and with probability pref_ab, a
 *     category B site;
 *   - else a uniformly random site from the whole catalogue.
 * Timestamps are uniform over 2024-01-01 .. 2025-03-31 and each log is
 * sorted by time.
 */
class RandomPopulationGenerator {
public:
    /**
     * @param seed Random seed (0 = use random device)
     */
    explicit RandomPopulationGenerator(uint64_t seed = 0);

    /**
     * Generate a population with ids "user_000000", "user_000001", ...
     * @param num_users Number of users
     * @param min_events Minimum events per user
     * @param max_events Maximum events per user
     */
    InMemoryPopulation Generate(size_t num_users, size_t min_events, size_t max_events);

    /**
     * Generate one user's time-ordered log of exactly num_events visits.
     */
    EventLog GenerateUserLog(double pref_a, double pref_ab, size_t num_events);

    /**
     * Every site the generator can emit.
     */
    static const std::vector<std::string>& Catalogue();

    std::mt19937_64& GetRng() { return rng_; }

private:
    double Beta(double alpha, double beta);
    const std::string& Pick(const std::vector<std::string>& sites);

    static constexpr uint64_t START_TIME = 1704067200;  // 2024-01-01 00:00:00 UTC
    static constexpr uint64_t END_TIME = 1743379200;    // 2025-03-31 00:00:00 UTC

    std::mt19937_64 rng_;
    CategoryConfig categories_;
};

} // namespace ppagg

#endif // PPAGG_POPULATION_H
