#pragma once
#include "dyematch/scene/GlyphFont.hpp"
#include "dyematch/scene/Rasterizer.hpp"

#include <optional>

namespace DM::Scene {

// CPU fill of every scene element into an RGBA8 canvas, encoded as PNG. Labels need a
// GlyphFont; a rasterizer built without one skips text elements and draws the rest.
class SoftwareRasterizer final : public Rasterizer {
public:
    SoftwareRasterizer() = default;
    explicit SoftwareRasterizer(GlyphFont font);

    auto rasterize(Scene const& scene, RasterizeOptions const& options) -> Expected<std::vector<std::uint8_t>> override;

private:
    std::optional<GlyphFont> font_;
};

} // namespace DM::Scene
