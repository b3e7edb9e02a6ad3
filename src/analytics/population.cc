#include "analytics/population.h"
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace ppagg {

void InMemoryPopulation::AddUser(const std::string& user_id, EventLog events) {
    auto it = logs_.find(user_id);
    if (it == logs_.end()) {
        ids_.push_back(user_id);
        logs_.emplace(user_id, std::move(events));
    } else {
        it->second = std::move(events);
    }
}

EventLog InMemoryPopulation::FetchEvents(const std::string& user_id) const {
    auto it = logs_.find(user_id);
    if (it == logs_.end()) {
        throw std::out_of_range("Unknown user: " + user_id);
    }
    return it->second;
}

size_t InMemoryPopulation::TotalEvents() const {
    size_t total = 0;
    for (const auto& entry : logs_) {
        total += entry.second.size();
    }
    return total;
}

RandomPopulationGenerator::RandomPopulationGenerator(uint64_t seed)
    : categories_(CategoryConfig::Defaults()) {
    if (seed == 0) {
        std::random_device rd;
        seed = rd();
    }
    rng_.seed(seed);
}

const std::vector<std::string>& RandomPopulationGenerator::Catalogue() {
    static const std::vector<std::string> catalogue = [] {
        CategoryConfig defaults = CategoryConfig::Defaults();
        std::vector<std::string> sites = defaults.category_a;
        sites.insert(sites.end(), defaults.category_b.begin(), defaults.category_b.end());

        const std::vector<std::string> others = {
            // social media
            "facebook.com", "twitter.com", "instagram.com", "linkedin.com",
            "pinterest.com", "reddit.com", "tumblr.com", "quora.com",
            "discord.com", "telegram.org", "whatsapp.com", "signal.org",
            // news
            "cnn.com", "bbc.com", "nytimes.com", "reuters.com",
            "apnews.com", "washingtonpost.com", "theguardian.com",
            "bloomberg.com", "wsj.com", "economist.com", "time.com",
            // entertainment
            "netflix.com", "hulu.com", "disneyplus.com", "hbomax.com",
            "primevideo.com", "spotify.com", "pandora.com", "twitch.tv",
            "crunchyroll.com", "funimation.com", "imdb.com", "rottentomatoes.com",
            // education
            "coursera.org", "udemy.com", "edx.org", "khanacademy.org",
            "duolingo.com", "brilliant.org", "skillshare.com", "codecademy.com",
            "udacity.com", "pluralsight.com", "lynda.com", "masterclass.com",
            // productivity
            "google.com/docs", "office.com", "notion.so", "evernote.com",
            "trello.com", "asana.com", "monday.com", "slack.com",
            "zoom.us", "dropbox.com", "box.com", "drive.google.com",
            // technology
            "github.com", "stackoverflow.com", "medium.com", "dev.to",
            "techcrunch.com", "wired.com", "theverge.com", "cnet.com",
            "engadget.com", "arstechnica.com", "hackernoon.com", "slashdot.org"
        };
        sites.insert(sites.end(), others.begin(), others.end());
        return sites;
    }();
    return catalogue;
}

double RandomPopulationGenerator::Beta(double alpha, double beta) {
    // Beta(a, b) = X / (X + Y) with X ~ Gamma(a), Y ~ Gamma(b)
    std::gamma_distribution<double> gx(alpha, 1.0);
    std::gamma_distribution<double> gy(beta, 1.0);
    double x = gx(rng_);
    double y = gy(rng_);
    return x / (x + y);
}

const std::string& RandomPopulationGenerator::Pick(const std::vector<std::string>& sites) {
    std::uniform_int_distribution<size_t> dist(0, sites.size() - 1);
    return sites[dist(rng_)];
}

EventLog RandomPopulationGenerator::GenerateUserLog(double pref_a, double pref_ab,
                                                    size_t num_events) {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<uint64_t> when(START_TIME, END_TIME - 1);
    std::uniform_int_distribution<size_t> session_len(5, 20);

    const auto& catalogue = Catalogue();
    EventLog events;
    events.reserve(num_events);

    while (events.size() < num_events) {
        size_t len = session_len(rng_);
        bool last_was_a = false;

        for (size_t i = 0; i < len && events.size() < num_events; i++) {
            Event event;
            event.timestamp = when(rng_);

            if (coin(rng_) < pref_a) {
                event.site = Pick(categories_.category_a);
                last_was_a = true;
            } else if (last_was_a && coin(rng_) < pref_ab) {
                event.site = Pick(categories_.category_b);
                last_was_a = false;
            } else {
                event.site = Pick(catalogue);
                last_was_a = std::find(categories_.category_a.begin(),
                                       categories_.category_a.end(),
                                       event.site) != categories_.category_a.end();
            }

            events.push_back(std::move(event));
        }
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const Event& a, const Event& b) { return a.timestamp < b.timestamp; });
    return events;
}

InMemoryPopulation RandomPopulationGenerator::Generate(size_t num_users,
                                                       size_t min_events,
                                                       size_t max_events) {
    if (min_events > max_events) {
        throw std::invalid_argument("min_events must not exceed max_events");
    }

    InMemoryPopulation population;
    std::uniform_int_distribution<size_t> event_count(min_events, max_events);

    for (size_t u = 0; u < num_users; u++) {
        double pref_a = Beta(2.0, 2.0);
        double pref_ab = Beta(2.0, 3.0);
        size_t num_events = event_count(rng_);

        char user_id[32];
        std::snprintf(user_id, sizeof(user_id), "user_%06zu", u);
        population.AddUser(user_id, GenerateUserLog(pref_a, pref_ab, num_events));
    }

    return population;
}

} // namespace ppagg
