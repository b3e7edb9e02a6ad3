#include <iostream>
#include <iomanip>
#include <chrono>
#include <string>
#include <sys/stat.h>
#include "protocol/sampling.h"
#include "io/eventio.h"

using namespace ppagg;
using namespace std::chrono;

// Check if file exists
bool FileExists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

static void PrintReport(const AnalysisReport& report) {
    const AggregateStats& agg = report.aggregate;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Dataset: " << report.population_size << " users, sampled "
              << report.sample_size << std::endl;
    std::cout << std::endl;

    std::cout << "Category A (short video) analysis:" << std::endl;
    std::cout << "  Total visits:      " << agg.total_visits << std::endl;
    std::cout << "  Category A visits: " << agg.category_a_visits
              << " (" << agg.category_a_percentage << "%)" << std::endl;
    std::cout << "  Users primarily A: " << report.users_primarily_a
              << " (" << report.users_primarily_a_percentage << "%)" << std::endl;
    std::cout << std::endl;

    std::cout << "A -> B (video -> e-commerce) analysis:" << std::endl;
    std::cout << "  Category B visits: " << agg.category_b_visits << std::endl;
    std::cout << "  A -> B transitions: " << agg.a_to_b_transitions
              << " (" << agg.transition_percentage << "% of A visits)" << std::endl;
    std::cout << "  Users with pattern: " << report.users_with_pattern
              << " (" << report.users_with_pattern_percentage << "%)" << std::endl;
}

int main(int argc, char* argv[]) {
    std::cout << "=== Privacy-Preserving Aggregation (Paillier) ===" << std::endl;
    std::cout << std::endl;

    // Default parameters
    size_t num_users = 1000;
    size_t events_per_user = 1000;
    SecurityParams sec_params;
    AnalysisParams params;
    params.verbose = true;
    std::string categories_file;

    try {
        if (argc > 1) num_users = std::stoull(argv[1]);
        if (argc > 2) params.sample_size = std::stoull(argv[2]);
        if (argc > 3) sec_params.N_bits = std::stoull(argv[3]);
        if (argc > 4) params.num_threads = std::stoull(argv[4]);
        if (argc > 5) categories_file = argv[5];
    } catch (const std::exception&) {
        std::cerr << "Usage: " << argv[0]
                  << " [num_users] [sample_size] [key_bits] [threads] [categories_file]"
                  << std::endl;
        return 1;
    }

    std::cout << "Parameters:" << std::endl;
    std::cout << "  Population (users): " << num_users << std::endl;
    std::cout << "  Sample size:        " << params.sample_size << std::endl;
    std::cout << "  Modulus bits:       " << sec_params.N_bits << std::endl;
    std::cout << "  Threads:            " << params.num_threads << std::endl;
    std::cout << std::endl;

    try {
        CategoryConfig categories = CategoryConfig::Defaults();
        if (!categories_file.empty()) {
            categories = EventLogIO::ReadCategories(categories_file);
            std::cout << "Loaded " << categories.category_a.size() << " category A and "
                      << categories.category_b.size() << " category B markers from "
                      << categories_file << std::endl;
        }

        // File path for storing/loading the population
        std::string data_dir = "data";
        std::string pop_file = data_dir + "/population_u" + std::to_string(num_users)
                             + "_e" + std::to_string(events_per_user) + ".txt";

        InMemoryPopulation population;
        if (FileExists(pop_file)) {
            std::cout << "Loading existing population from " << pop_file << "..." << std::endl;
            population = EventLogIO::ReadPopulation(pop_file);
            if (population.Size() != num_users) {
                std::cerr << "Warning: Loaded population size (" << population.Size()
                          << ") doesn't match num_users (" << num_users
                          << "). Regenerating..." << std::endl;
                population = InMemoryPopulation();
            }
        }

        if (population.Size() == 0) {
            std::cout << "Generating synthetic browsing history..." << std::endl;
            RandomPopulationGenerator gen(42);
            population = gen.Generate(num_users, events_per_user, events_per_user);

            mkdir(data_dir.c_str(), 0755);
            EventLogIO::WritePopulation(pop_file, population);
            std::cout << "  Population saved to: " << pop_file << std::endl;
        }
        std::cout << std::endl;

        std::cout << "Generating " << sec_params.N_bits << "-bit Paillier key..." << std::endl;
        auto t0 = high_resolution_clock::now();
        PrivacyAnalytics analytics(sec_params);
        auto t1 = high_resolution_clock::now();
        std::cout << "  KeyGen completed in "
                  << duration_cast<milliseconds>(t1 - t0).count() << " ms" << std::endl;
        std::cout << "  Key id: " << analytics.GetKeyId().substr(0, 16) << std::endl;
        std::cout << std::endl;

        std::cout << "Running sampled analysis..." << std::endl;
        SamplingOrchestrator orchestrator(analytics, FeatureExtractor(categories), params);
        AnalysisReport report = orchestrator.RunSampledAnalysis(population);
        auto t2 = high_resolution_clock::now();
        std::cout << "Analysis completed in "
                  << duration_cast<milliseconds>(t2 - t1).count() << " ms" << std::endl;
        std::cout << std::endl;

        PrintReport(report);

        std::string report_file = data_dir + "/analysis_results.txt";
        EventLogIO::WriteReport(report_file, report);
        std::cout << std::endl << "Results saved to " << report_file << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Analysis failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
