#include <dyematch/color/Banding.hpp>

namespace DM::Color {

auto match_quality(double distance, BandingPolicy const& policy) -> MatchQuality {
    if (distance <= policy.perfect_max)
        return MatchQuality::Perfect;
    if (distance <= policy.excellent_max)
        return MatchQuality::Excellent;
    if (distance <= policy.good_max)
        return MatchQuality::Good;
    if (distance <= policy.fair_max)
        return MatchQuality::Fair;
    return MatchQuality::Approximate;
}

auto distance_band(double distance, BandingPolicy const& policy) -> DistanceBand {
    if (distance < policy.very_similar_below)
        return DistanceBand::VerySimilar;
    if (distance < policy.similar_below)
        return DistanceBand::Similar;
    if (distance < policy.different_below)
        return DistanceBand::Different;
    return DistanceBand::VeryDifferent;
}

auto contrast_rating(double ratio, BandingPolicy const& policy) -> ContrastRating {
    if (ratio >= policy.aaa_min)
        return ContrastRating::AAA;
    if (ratio >= policy.aa_min)
        return ContrastRating::AA;
    if (ratio >= policy.aa_large_min)
        return ContrastRating::AALarge;
    return ContrastRating::Fail;
}

auto match_quality_label(MatchQuality quality) -> std::string_view {
    switch (quality) {
    case MatchQuality::Perfect:
        return "Perfect Match";
    case MatchQuality::Excellent:
        return "Excellent Match";
    case MatchQuality::Good:
        return "Good Match";
    case MatchQuality::Fair:
        return "Fair Match";
    case MatchQuality::Approximate:
        return "Approximate Match";
    }
    return "Approximate Match";
}

auto match_quality_short_label(MatchQuality quality) -> std::string_view {
    switch (quality) {
    case MatchQuality::Perfect:
        return "PERFECT";
    case MatchQuality::Excellent:
        return "EXCELLENT";
    case MatchQuality::Good:
        return "GOOD";
    case MatchQuality::Fair:
        return "FAIR";
    case MatchQuality::Approximate:
        return "APPROX";
    }
    return "APPROX";
}

auto distance_band_label(DistanceBand band) -> std::string_view {
    switch (band) {
    case DistanceBand::VerySimilar:
        return "Very Similar";
    case DistanceBand::Similar:
        return "Similar";
    case DistanceBand::Different:
        return "Different";
    case DistanceBand::VeryDifferent:
        return "Very Different";
    }
    return "Very Different";
}

auto contrast_rating_label(ContrastRating rating) -> std::string_view {
    switch (rating) {
    case ContrastRating::AAA:
        return "AAA";
    case ContrastRating::AA:
        return "AA";
    case ContrastRating::AALarge:
        return "AA Large";
    case ContrastRating::Fail:
        return "Fail";
    }
    return "Fail";
}

} // namespace DM::Color
