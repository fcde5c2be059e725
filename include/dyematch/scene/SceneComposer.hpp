#pragma once
#include "dyematch/catalog/CatalogMatcher.hpp"
#include "dyematch/catalog/ColorCatalog.hpp"
#include "dyematch/color/Banding.hpp"
#include "dyematch/scene/Scene.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace DM::Scene {

struct PaletteGridOptions {
    int                        width         = 800;
    bool                       show_distance = true;
    std::optional<std::string> title;
};

struct ComparisonGridOptions {
    int  width    = 800;
    bool show_hsv = true;
};

struct ContrastMatrixOptions {
    std::optional<std::string> title;
};

inline constexpr std::size_t kMinComparisonEntries = 2;
inline constexpr std::size_t kMaxComparisonEntries = 4;

// Indices are zero-based positions in ComparisonAnalysis::entries, index1 < index2.
struct DyePair {
    std::size_t index1{0};
    std::size_t index2{0};
    double      distance{0.0};
    double      contrast_ratio{1.0};
};

struct ComparisonAnalysis {
    std::vector<Catalog::CatalogEntry> entries;
    std::vector<DyePair>               pairs;
    DyePair                            most_similar;
    DyePair                            most_different;

    // Order of i and j does not matter; nullopt for i == j or out of range.
    [[nodiscard]] auto pair(std::size_t i, std::size_t j) const -> std::optional<DyePair>;
};

// Pairwise distances and contrasts over the first four entries. Ties keep the earliest pair.
auto analyze_comparison(std::span<Catalog::CatalogEntry const> entries) -> std::optional<ComparisonAnalysis>;

auto compose_palette_grid(std::span<Catalog::PaletteEntry const> entries, PaletteGridOptions const& options = {}) -> Scene;
auto compose_comparison_grid(std::span<Catalog::CatalogEntry const> entries, ComparisonGridOptions const& options = {}) -> Scene;
auto compose_contrast_matrix(std::span<Catalog::CatalogEntry const> entries, ContrastMatrixOptions const& options = {}) -> Scene;

// Counts UTF-8 code points. Longer than `budget` becomes the first budget-1 code points plus "...".
auto truncate_label(std::string_view text, std::size_t budget) -> std::string;
auto escape_markup(std::string_view text) -> std::string;

auto badge_color(Color::MatchQuality quality) -> Color::Rgb;
auto distance_band_color(Color::DistanceBand band) -> Color::Rgb;
auto contrast_rating_color(Color::ContrastRating rating) -> Color::Rgb;

} // namespace DM::Scene
