#include "io/eventio.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace ppagg {

std::string EventLogIO::Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::runtime_error EventLogIO::ParseError(const std::string& filename, size_t line_no,
                                          const std::string& what) {
    return std::runtime_error(filename + ":" + std::to_string(line_no) + ": " + what);
}

void EventLogIO::WritePopulation(const std::string& filename,
                                 const InMemoryPopulation& population) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    out << "# Population: " << population.Size() << " users, "
        << population.TotalEvents() << " events\n";

    for (const auto& user_id : population.UserIds()) {
        out << "@user " << user_id << "\n";
        for (const Event& e : population.FetchEvents(user_id)) {
            out << e.timestamp << " " << e.site << "\n";
        }
    }

    if (!out) {
        throw std::runtime_error("Failed to write population: " + filename);
    }
}

InMemoryPopulation EventLogIO::ReadPopulation(const std::string& filename) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    InMemoryPopulation population;
    std::string current_user;
    EventLog current_events;
    bool in_user = false;

    auto flush = [&]() {
        if (in_user) {
            std::stable_sort(current_events.begin(), current_events.end(),
                             [](const Event& a, const Event& b) {
                                 return a.timestamp < b.timestamp;
                             });
            population.AddUser(current_user, std::move(current_events));
            current_events.clear();
        }
    };

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        line = Trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        if (line.compare(0, 6, "@user ") == 0) {
            flush();
            current_user = Trim(line.substr(6));
            if (current_user.empty()) {
                throw ParseError(filename, line_no, "missing user id");
            }
            in_user = true;
            continue;
        }

        if (!in_user) {
            throw ParseError(filename, line_no, "event before any @user line");
        }

        // Data line: timestamp and site
        Event e;
        std::istringstream iss(line);
        if (!(iss >> e.timestamp)) {
            throw ParseError(filename, line_no, "bad timestamp");
        }
        std::getline(iss >> std::ws, e.site);
        if (e.site.empty()) {
            throw ParseError(filename, line_no, "missing site");
        }
        current_events.push_back(std::move(e));
    }

    flush();
    return population;
}

CategoryConfig EventLogIO::ReadCategories(const std::string& filename) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    CategoryConfig config;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        line = Trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string tag, marker;
        iss >> tag;
        std::getline(iss >> std::ws, marker);
        marker = Trim(marker);

        // An empty marker would match every site
        if (marker.empty()) {
            throw ParseError(filename, line_no, "missing marker");
        }

        if (tag == "a") {
            config.category_a.push_back(marker);
        } else if (tag == "b") {
            config.category_b.push_back(marker);
        } else {
            throw ParseError(filename, line_no, "unknown category '" + tag + "'");
        }
    }

    return config;
}

void EventLogIO::WriteCategories(const std::string& filename, const CategoryConfig& config) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    out << "# Category markers: " << config.category_a.size() << " a, "
        << config.category_b.size() << " b\n";
    for (const auto& m : config.category_a) out << "a " << m << "\n";
    for (const auto& m : config.category_b) out << "b " << m << "\n";
}

void EventLogIO::WriteReport(const std::string& filename, const AnalysisReport& report) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    const AggregateStats& agg = report.aggregate;
    out << std::fixed << std::setprecision(2);
    out << "population_size: " << report.population_size << "\n";
    out << "sample_size: " << report.sample_size << "\n";
    out << "total_visits: " << agg.total_visits << "\n";
    out << "category_a_visits: " << agg.category_a_visits << "\n";
    out << "category_b_visits: " << agg.category_b_visits << "\n";
    out << "a_to_b_transitions: " << agg.a_to_b_transitions << "\n";
    out << "category_a_percentage: " << agg.category_a_percentage << "\n";
    out << "transition_percentage: " << agg.transition_percentage << "\n";
    out << "users_primarily_a: " << report.users_primarily_a << "\n";
    out << "users_primarily_a_percentage: " << report.users_primarily_a_percentage << "\n";
    out << "users_with_pattern: " << report.users_with_pattern << "\n";
    out << "users_with_pattern_percentage: " << report.users_with_pattern_percentage << "\n";
    out << "encrypted_phase_ms: " << report.encrypted_phase_ms << "\n";
}

} // namespace ppagg
