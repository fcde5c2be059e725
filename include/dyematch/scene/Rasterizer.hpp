#pragma once
#include "dyematch/color/ColorMath.hpp"
#include "dyematch/core/Error.hpp"
#include "dyematch/scene/Scene.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace DM::Scene {

struct RasterizeOptions {
    int                       scale = 2;
    std::optional<Color::Rgb> background;
    std::chrono::milliseconds timeout{5000};
};

class Rasterizer {
public:
    virtual ~Rasterizer() = default;

    // PNG bytes.
    virtual auto rasterize(Scene const& scene, RasterizeOptions const& options) -> Expected<std::vector<std::uint8_t>> = 0;
};

// Runs the rasterizer on a worker thread and gives up after options.timeout. The worker keeps
// the rasterizer and its own copy of the scene alive, so a late finish touches nothing of the caller's.
auto rasterize_with_deadline(std::shared_ptr<Rasterizer> rasterizer, Scene scene, RasterizeOptions const& options)
        -> Expected<std::vector<std::uint8_t>>;

} // namespace DM::Scene
