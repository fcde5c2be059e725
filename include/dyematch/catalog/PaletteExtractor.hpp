#pragma once
#include "dyematch/color/ColorMath.hpp"
#include "dyematch/core/Error.hpp"

#include <span>
#include <vector>

namespace DM::Catalog {

struct ExtractedColor {
    Color::Rgb color{};
    double     dominance{0.0}; // percent of sampled pixels, 0-100
};

// Clustering lives outside this library; hosts plug their extractor in here.
class PaletteExtractor {
public:
    virtual ~PaletteExtractor() = default;

    virtual auto extract(std::span<Color::Rgb const> samples, int color_count) -> Expected<std::vector<ExtractedColor>> = 0;
};

} // namespace DM::Catalog
