#pragma once
#include "dyematch/color/ColorMath.hpp"
#include "dyematch/scene/SceneTheme.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace DM::Scene {

struct Point {
    double x{0.0};
    double y{0.0};
};

struct RectElement {
    double                    x{0.0};
    double                    y{0.0};
    double                    width{0.0};
    double                    height{0.0};
    Color::Rgb                fill{};
    double                    corner_radius{0.0};
    std::optional<Color::Rgb> stroke;
    double                    stroke_width{0.0};
    double                    opacity{1.0};
};

struct CircleElement {
    double     cx{0.0};
    double     cy{0.0};
    double     radius{0.0};
    Color::Rgb fill{};
};

struct LineElement {
    Point      from;
    Point      to;
    Color::Rgb stroke{};
    double     stroke_width{1.0};
};

struct PolygonElement {
    std::vector<Point> points;
    Color::Rgb         fill{};
};

enum class TextAnchor {
    Start,
    Middle,
    End
};

enum class TextBaseline {
    Alphabetic,
    Middle
};

struct TextElement {
    double       x{0.0};
    double       y{0.0};
    std::string  markup; // already escaped for XML
    Color::Rgb   fill{};
    double       font_size{12.0};
    FontRole     font{FontRole::Primary};
    int          font_weight{400};
    TextAnchor   anchor{TextAnchor::Start};
    TextBaseline baseline{TextBaseline::Alphabetic};
};

struct Element;

struct GroupElement {
    std::vector<Element> children;
};

struct Element {
    std::variant<RectElement, CircleElement, LineElement, PolygonElement, TextElement, GroupElement> value;
};

// Renderer-agnostic drawing in logical pixels. Immutable once composed.
struct Scene {
    int                  width{0};
    int                  height{0};
    std::vector<Element> elements;
};

} // namespace DM::Scene
