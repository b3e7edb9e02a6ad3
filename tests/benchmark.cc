#include <iostream>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <string>
#include <thread>
#include <vector>
#include "protocol/sampling.h"

using namespace ppagg;
using namespace std::chrono;

struct BenchmarkResult {
    size_t key_bits;
    size_t sample_size;
    size_t threads;
    double keygen_ms;       // Key generation
    double encrypt_us;      // One Paillier encryption (average)
    double decrypt_us;      // One Paillier decryption (average)
    double analysis_ms;     // Extract + encrypt + aggregate over the sample
    bool correct;           // Encrypted total equals plaintext total
};

static double ElapsedMs(high_resolution_clock::time_point t0,
                        high_resolution_clock::time_point t1) {
    return duration_cast<microseconds>(t1 - t0).count() / 1000.0;
}

BenchmarkResult run_benchmark(const InMemoryPopulation& population,
                              size_t key_bits, size_t sample_size, size_t threads) {
    BenchmarkResult result = {};
    result.key_bits = key_bits;
    result.sample_size = sample_size;
    result.threads = threads;

    SecurityParams sec_params;
    sec_params.N_bits = key_bits;

    auto t0 = high_resolution_clock::now();
    PrivacyAnalytics analytics(sec_params);
    auto t1 = high_resolution_clock::now();
    result.keygen_ms = ElapsedMs(t0, t1);

    // Raw encrypt / decrypt cost
    const size_t reps = 20;
    const PaillierPublicKey& pk = analytics.GetPublicKey();
    std::vector<BigInt> cts(reps);
    auto t2 = high_resolution_clock::now();
    for (size_t i = 0; i < reps; i++) {
        cts[i] = Paillier::Encrypt(pk, BigInt(static_cast<long>(i)), analytics.GetRandom());
    }
    auto t3 = high_resolution_clock::now();
    AggregateAccumulator acc;
    for (size_t i = 0; i < reps; i++) {
        FeatureVector fv;
        fv.total_visits = i;
        analytics.Fold(acc, analytics.EncryptUser(fv));
    }
    auto t4 = high_resolution_clock::now();
    analytics.DecryptAndAnalyze(acc);
    auto t5 = high_resolution_clock::now();
    result.encrypt_us = ElapsedMs(t2, t3) * 1000.0 / reps;
    result.decrypt_us = ElapsedMs(t4, t5) * 1000.0 / 4;  // four lanes

    // Sampled analysis
    AnalysisParams params;
    params.num_threads = threads;
    params.sample_seed = 7;
    SamplingOrchestrator orchestrator(analytics, FeatureExtractor(), params);
    AnalysisReport report = orchestrator.RunSampledAnalysis(population, sample_size);
    result.analysis_ms = report.encrypted_phase_ms;

    // With the whole population sampled, the total is known in plaintext
    if (report.sample_size == population.Size()) {
        result.correct = (report.aggregate.total_visits == ToBigInt(population.TotalEvents()));
    } else {
        result.correct = (report.aggregate.num_users == report.sample_size);
    }

    return result;
}

void print_header() {
    std::cout << std::setw(6) << "bits"
              << std::setw(8) << "sample"
              << std::setw(8) << "threads"
              << " | " << std::setw(12) << "KeyGen"
              << " | " << std::setw(12) << "Enc/op"
              << " | " << std::setw(12) << "Dec/op"
              << " | " << std::setw(12) << "Analysis"
              << " | " << std::setw(7) << "Correct"
              << std::endl;
    std::cout << std::string(95, '-') << std::endl;
}

void print_result(const BenchmarkResult& r) {
    std::cout << std::setw(6) << r.key_bits
              << std::setw(8) << r.sample_size
              << std::setw(8) << r.threads
              << " | " << std::setw(9) << std::fixed << std::setprecision(1)
              << r.keygen_ms << " ms"
              << " | " << std::setw(9) << r.encrypt_us << " us"
              << " | " << std::setw(9) << r.decrypt_us << " us"
              << " | " << std::setw(9) << r.analysis_ms << " ms"
              << " | " << std::setw(7) << (r.correct ? "ok" : "FAIL")
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::cout << "=== ppagg Benchmark ===" << std::endl;
    std::cout << "Synthetic population, 100 events per user" << std::endl;
    std::cout << std::endl;

    // Configurable sample sizes
    std::vector<size_t> sample_sizes = {100, 500};
    if (argc > 1) {
        sample_sizes.clear();
        for (int i = 1; i < argc; i++) {
            sample_sizes.push_back(std::stoull(argv[i]));
        }
    }

    size_t population_size = 0;
    for (size_t s : sample_sizes) population_size = std::max(population_size, s);

    RandomPopulationGenerator gen(42);
    InMemoryPopulation population = gen.Generate(population_size, 100, 100);

    std::vector<size_t> key_sizes = {1024, 2048};
    size_t hw = std::max<size_t>(1, std::thread::hardware_concurrency());
    std::vector<size_t> thread_counts = {1, hw};

    bool all_correct = true;
    for (size_t bits : key_sizes) {
        std::cout << "=== " << bits << "-bit modulus ===" << std::endl;
        print_header();

        for (size_t sample : sample_sizes) {
            for (size_t threads : thread_counts) {
                try {
                    auto result = run_benchmark(population, bits, sample, threads);
                    print_result(result);
                    all_correct = all_correct && result.correct;
                } catch (const std::exception& e) {
                    std::cerr << "Benchmark failed: " << e.what() << std::endl;
                    return 1;
                }
            }
        }
        std::cout << std::endl;
    }

    return all_correct ? 0 : 1;
}
