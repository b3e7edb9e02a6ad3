#include "protocol/sampling.h"
#include "errors.h"
#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

namespace ppagg {

SamplingOrchestrator::SamplingOrchestrator(const PrivacyAnalytics& analytics,
                                           FeatureExtractor extractor,
                                           const AnalysisParams& params)
    : analytics_(analytics), extractor_(std::move(extractor)), params_(params) {
    uint64_t seed = params_.sample_seed;
    if (seed == 0) {
        std::random_device rd;
        seed = (static_cast<uint64_t>(rd()) << 32) | rd();
    }
    sampler_.seed(seed);
}

std::vector<std::string> SamplingOrchestrator::DrawSample(std::vector<std::string> ids,
                                                          size_t k,
                                                          std::mt19937_64& rng) {
    k = std::min(k, ids.size());
    for (size_t i = 0; i < k; i++) {
        std::uniform_int_distribution<size_t> dist(i, ids.size() - 1);
        std::swap(ids[i], ids[dist(rng)]);
    }
    ids.resize(k);
    return ids;
}

SamplingOrchestrator::PartialResult
SamplingOrchestrator::ProcessRange(const PopulationIndex& population,
                                   const std::vector<std::string>& ids,
                                   size_t begin, size_t end,
                                   SecureRandom& rng) const {
    PartialResult part;
    for (size_t i = begin; i < end; i++) {
        EventLog events = population.FetchEvents(ids[i]);
        FeatureVector fv = extractor_.Extract(events);

        analytics_.Fold(part.acc, analytics_.EncryptUser(fv, rng));

        // Plaintext cohort flags
        if (FeatureExtractor::IsPrimarilyCategoryA(fv, params_.primary_threshold)) {
            part.users_primarily_a++;
        }
        if (FeatureExtractor::ExhibitsTransition(fv)) {
            part.users_with_pattern++;
        }
    }
    return part;
}

AnalysisReport SamplingOrchestrator::RunSampledAnalysis(const PopulationIndex& population) {
    return RunSampledAnalysis(population, params_.sample_size);
}

AnalysisReport SamplingOrchestrator::RunSampledAnalysis(const PopulationIndex& population,
                                                        size_t sample_size) {
    using Clock = std::chrono::high_resolution_clock;
    using Ms = std::chrono::milliseconds;

    std::vector<std::string> all_ids = population.UserIds();

    AnalysisReport report;
    report.population_size = all_ids.size();

    std::vector<std::string> sample = DrawSample(std::move(all_ids), sample_size, sampler_);
    report.sample_size = sample.size();

    if (sample.empty()) {
        throw EmptyAggregateError("Sample is empty (population of "
                                  + std::to_string(report.population_size)
                                  + " users, requested " + std::to_string(sample_size) + ")");
    }

    if (params_.verbose) {
        std::cout << "  Sampled " << report.sample_size << " of "
                  << report.population_size << " users" << std::endl;
    }

    size_t num_workers = std::max<size_t>(1, std::min(params_.num_threads, sample.size()));

    // Fork worker streams up front so the assignment does not depend on scheduling
    std::vector<std::unique_ptr<SecureRandom>> streams;
    for (size_t w = 0; w < num_workers; w++) {
        streams.push_back(analytics_.GetRandom().Fork());
    }

    std::vector<PartialResult> partials(num_workers);
    std::vector<std::exception_ptr> errors(num_workers);

    size_t chunk = (sample.size() + num_workers - 1) / num_workers;
    auto t0 = Clock::now();

    auto run = [&](size_t w) {
        size_t begin = std::min(w * chunk, sample.size());
        size_t end = std::min(begin + chunk, sample.size());
        try {
            partials[w] = ProcessRange(population, sample, begin, end, *streams[w]);
        } catch (...) {
            errors[w] = std::current_exception();
        }
    };

    if (num_workers == 1) {
        run(0);
    } else {
        std::vector<std::thread> workers;
        for (size_t w = 0; w < num_workers; w++) {
            workers.emplace_back(run, w);
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    // Join point: each partial is merged exactly once
    AggregateAccumulator total;
    for (const auto& part : partials) {
        total = analytics_.Merge(total, part.acc);
        report.users_primarily_a += part.users_primarily_a;
        report.users_with_pattern += part.users_with_pattern;
    }

    auto t1 = Clock::now();
    report.encrypted_phase_ms =
        std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    if (params_.verbose) {
        std::cout << "  Extract + encrypt + aggregate (" << num_workers << " threads): "
                  << std::chrono::duration_cast<Ms>(t1 - t0).count() << " ms" << std::endl;
    }

    report.aggregate = analytics_.DecryptAndAnalyze(total);

    auto t2 = Clock::now();
    if (params_.verbose) {
        std::cout << "  Decrypt aggregate: "
                  << std::chrono::duration_cast<Ms>(t2 - t1).count() << " ms" << std::endl;
    }

    double sampled = static_cast<double>(report.sample_size);
    report.users_primarily_a_percentage = report.users_primarily_a / sampled * 100.0;
    report.users_with_pattern_percentage = report.users_with_pattern / sampled * 100.0;

    return report;
}

} // namespace ppagg
