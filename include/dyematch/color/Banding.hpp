#pragma once

#include <string_view>

namespace DM::Color {

enum class MatchQuality {
    Perfect,
    Excellent,
    Good,
    Fair,
    Approximate
};

enum class DistanceBand {
    VerySimilar,
    Similar,
    Different,
    VeryDifferent
};

enum class ContrastRating {
    AAA,
    AA,
    AALarge,
    Fail
};

// Cut points shared by the palette grid, the comparison panel and the text summaries.
// Distance thresholds are inclusive upper bounds for match quality and exclusive upper
// bounds for the comparison bands; contrast thresholds are inclusive lower bounds (WCAG 2.x).
struct BandingPolicy {
    double perfect_max   = 0.0;
    double excellent_max = 10.0;
    double good_max      = 25.0;
    double fair_max      = 50.0;

    double very_similar_below = 30.0;
    double similar_below      = 80.0;
    double different_below    = 150.0;

    double aaa_min      = 7.0;
    double aa_min       = 4.5;
    double aa_large_min = 3.0;
};

inline constexpr BandingPolicy kDefaultBanding{};

auto match_quality(double distance, BandingPolicy const& policy = kDefaultBanding) -> MatchQuality;
auto distance_band(double distance, BandingPolicy const& policy = kDefaultBanding) -> DistanceBand;
auto contrast_rating(double ratio, BandingPolicy const& policy = kDefaultBanding) -> ContrastRating;

// "Excellent Match" / "EXCELLENT"
auto match_quality_label(MatchQuality quality) -> std::string_view;
auto match_quality_short_label(MatchQuality quality) -> std::string_view;
auto distance_band_label(DistanceBand band) -> std::string_view;
auto contrast_rating_label(ContrastRating rating) -> std::string_view;

} // namespace DM::Color
