#pragma once
#include "dyematch/catalog/ColorCatalog.hpp"
#include "dyematch/catalog/PaletteExtractor.hpp"
#include "dyematch/log/LogSink.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace DM::Catalog {

struct MatcherOptions {
    // Catalog lookups per slot before the slot is given up.
    int max_attempts = 20;
};

struct CatalogMatch {
    CatalogEntry entry;
    double       distance{0.0};
};

struct PaletteEntry {
    Color::Rgb   extracted{};
    CatalogEntry matched;
    double       distance{0.0};
    double       dominance{0.0};
};

class CatalogMatcher {
public:
    explicit CatalogMatcher(ColorCatalog const& catalog, LogSink& log = default_log_sink(), MatcherOptions options = {});

    auto match_one(Color::Rgb target,
                   std::span<CatalogId const> exclude_ids = {},
                   std::optional<std::string> const& exclude_category = std::nullopt) const -> std::optional<CatalogMatch>;

    // Up to `count` distinct entries, closest first. Fewer when the catalog runs out.
    auto match_many(Color::Rgb target, int count, std::optional<std::string> const& exclude_category = std::nullopt) const
            -> std::vector<CatalogMatch>;

    // One entry per extracted color that found a match. With `unique`, no catalog entry repeats.
    auto match_palette(std::span<ExtractedColor const> colors,
                       std::optional<std::string> const& exclude_category = std::nullopt,
                       bool unique = true) const -> std::vector<PaletteEntry>;

private:
    // Appends every id it skips or accepts to `excluded`.
    auto next_match(Color::Rgb target, std::vector<CatalogId>& excluded, std::optional<std::string> const& exclude_category) const
            -> std::optional<CatalogMatch>;

    ColorCatalog const& catalog_;
    LogSink&            log_;
    MatcherOptions      options_;
};

} // namespace DM::Catalog
