#pragma once
#include "dyematch/scene/Scene.hpp"

#include <string>

namespace DM::Scene {

// SVG 1.1 document for vector renderers. Text markup is inserted as-is (it is escaped at composition).
auto to_svg(Scene const& scene) -> std::string;

} // namespace DM::Scene
