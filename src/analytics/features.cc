#include "analytics/features.h"
#include <utility>

namespace ppagg {

CategoryConfig CategoryConfig::Defaults() {
    CategoryConfig config;
    config.category_a = {
        "tiktok.com", "youtube.com/shorts", "instagram.com/reels",
        "snapchat.com", "vimeo.com/shorts", "triller.co", "byte.co",
        "dubsmash.com", "likee.com", "funimate.com"
    };
    config.category_b = {
        "amazon.com", "ebay.com", "walmart.com", "aliexpress.com",
        "etsy.com", "shopify.com", "bestbuy.com", "target.com",
        "newegg.com", "wayfair.com", "overstock.com", "homedepot.com"
    };
    return config;
}

FeatureExtractor::FeatureExtractor(CategoryConfig config)
    : config_(std::move(config)) {}

bool FeatureExtractor::MatchesAny(const std::string& site,
                                  const std::vector<std::string>& markers) {
    for (const auto& marker : markers) {
        if (site.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool FeatureExtractor::IsCategoryA(const std::string& site) const {
    return MatchesAny(site, config_.category_a);
}

bool FeatureExtractor::IsCategoryB(const std::string& site) const {
    return MatchesAny(site, config_.category_b);
}

FeatureVector FeatureExtractor::Extract(const EventLog& events) const {
    FeatureVector fv;
    fv.total_visits = events.size();

    bool last_was_a = false;
    for (const Event& event : events) {
        bool is_a = IsCategoryA(event.site);
        bool is_b = IsCategoryB(event.site);

        if (is_a) {
            fv.category_a_visits++;
        }
        if (is_b) {
            fv.category_b_visits++;
            if (last_was_a) {
                fv.a_to_b_transitions++;
            }
        }

        last_was_a = is_a;
    }

    return fv;
}

bool FeatureExtractor::IsPrimarilyCategoryA(const FeatureVector& fv, double threshold) {
    if (fv.total_visits == 0) {
        return false;
    }
    double share = static_cast<double>(fv.category_a_visits)
                 / static_cast<double>(fv.total_visits);
    return share > threshold;
}

bool FeatureExtractor::ExhibitsTransition(const FeatureVector& fv) {
    return fv.a_to_b_transitions > 0;
}

} // namespace ppagg
