#include <dyematch/catalog/CatalogMatcher.hpp>

namespace DM::Catalog {

CatalogMatcher::CatalogMatcher(ColorCatalog const& catalog, LogSink& log, MatcherOptions options)
    : catalog_(catalog), log_(log), options_(options) {}

auto CatalogMatcher::next_match(Color::Rgb target, std::vector<CatalogId>& excluded,
                                std::optional<std::string> const& exclude_category) const -> std::optional<CatalogMatch> {
    for (int attempt = 0; attempt < options_.max_attempts; ++attempt) {
        auto candidate = catalog_.find_closest(target, excluded);
        if (!candidate) {
            return std::nullopt;
        }
        excluded.push_back(candidate->id);
        if (exclude_category && candidate->category == *exclude_category) {
            continue;
        }
        auto const distance = Color::color_distance(target, candidate->rgb());
        return CatalogMatch{std::move(*candidate), distance};
    }
    log_.warn("Match", "no acceptable catalog entry for " + Color::rgb_to_hex(target, Color::HexCase::Upper) + " after "
                               + std::to_string(options_.max_attempts) + " attempts");
    return std::nullopt;
}

auto CatalogMatcher::match_one(Color::Rgb target, std::span<CatalogId const> exclude_ids,
                               std::optional<std::string> const& exclude_category) const -> std::optional<CatalogMatch> {
    std::vector<CatalogId> excluded(exclude_ids.begin(), exclude_ids.end());
    return next_match(target, excluded, exclude_category);
}

auto CatalogMatcher::match_many(Color::Rgb target, int count, std::optional<std::string> const& exclude_category) const
        -> std::vector<CatalogMatch> {
    std::vector<CatalogMatch> matches;
    std::vector<CatalogId>    excluded;
    for (int slot = 0; slot < count; ++slot) {
        auto match = next_match(target, excluded, exclude_category);
        if (!match) {
            continue;
        }
        matches.push_back(std::move(*match));
    }
    return matches;
}

auto CatalogMatcher::match_palette(std::span<ExtractedColor const> colors, std::optional<std::string> const& exclude_category,
                                   bool unique) const -> std::vector<PaletteEntry> {
    std::vector<PaletteEntry> entries;
    std::vector<CatalogId>    used;
    for (auto const& color : colors) {
        std::vector<CatalogId> excluded = unique ? used : std::vector<CatalogId>{};
        auto                   match    = next_match(color.color, excluded, exclude_category);
        if (!match) {
            continue;
        }
        used.push_back(match->entry.id);
        entries.push_back(PaletteEntry{color.color, std::move(match->entry), match->distance, color.dominance});
    }
    return entries;
}

} // namespace DM::Catalog
