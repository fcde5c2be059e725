#include <dyematch/scene/SvgWriter.hpp>

#include <sstream>

namespace DM::Scene {

namespace {

auto number(double value) -> std::string {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

auto color(Color::Rgb rgb) -> std::string {
    return Color::rgb_to_hex(rgb);
}

auto anchor_name(TextAnchor anchor) -> char const* {
    switch (anchor) {
    case TextAnchor::Start:
        return "start";
    case TextAnchor::Middle:
        return "middle";
    case TextAnchor::End:
        return "end";
    }
    return "start";
}

class SvgEmitter {
public:
    explicit SvgEmitter(std::ostringstream& out)
        : out_(out) {}

    void operator()(RectElement const& rect) const {
        out_ << "<rect x=\"" << number(rect.x) << "\" y=\"" << number(rect.y) << "\" width=\"" << number(rect.width)
             << "\" height=\"" << number(rect.height) << "\" fill=\"" << color(rect.fill) << '"';
        if (rect.corner_radius > 0.0) {
            out_ << " rx=\"" << number(rect.corner_radius) << "\" ry=\"" << number(rect.corner_radius) << '"';
        }
        if (rect.stroke) {
            out_ << " stroke=\"" << color(*rect.stroke) << "\" stroke-width=\"" << number(rect.stroke_width) << '"';
        }
        if (rect.opacity < 1.0) {
            out_ << " opacity=\"" << number(rect.opacity) << '"';
        }
        out_ << "/>\n";
    }

    void operator()(CircleElement const& circle) const {
        out_ << "<circle cx=\"" << number(circle.cx) << "\" cy=\"" << number(circle.cy) << "\" r=\"" << number(circle.radius)
             << "\" fill=\"" << color(circle.fill) << "\"/>\n";
    }

    void operator()(LineElement const& line) const {
        out_ << "<line x1=\"" << number(line.from.x) << "\" y1=\"" << number(line.from.y) << "\" x2=\"" << number(line.to.x)
             << "\" y2=\"" << number(line.to.y) << "\" stroke=\"" << color(line.stroke) << "\" stroke-width=\""
             << number(line.stroke_width) << "\"/>\n";
    }

    void operator()(PolygonElement const& polygon) const {
        out_ << "<polygon points=\"";
        bool first = true;
        for (auto const& point : polygon.points) {
            if (!first)
                out_ << ' ';
            out_ << number(point.x) << ',' << number(point.y);
            first = false;
        }
        out_ << "\" fill=\"" << color(polygon.fill) << "\"/>\n";
    }

    void operator()(TextElement const& text) const {
        out_ << "<text x=\"" << number(text.x) << "\" y=\"" << number(text.y) << "\" fill=\"" << color(text.fill)
             << "\" font-size=\"" << number(text.font_size) << "\" font-family=\"" << font_family(text.font)
             << "\" font-weight=\"" << text.font_weight << "\" text-anchor=\"" << anchor_name(text.anchor) << '"';
        if (text.baseline == TextBaseline::Middle) {
            out_ << " dominant-baseline=\"middle\"";
        }
        out_ << '>' << text.markup << "</text>\n";
    }

    void operator()(GroupElement const& group) const {
        out_ << "<g>\n";
        for (auto const& child : group.children) {
            std::visit(*this, child.value);
        }
        out_ << "</g>\n";
    }

private:
    std::ostringstream& out_;
};

} // namespace

auto to_svg(Scene const& scene) -> std::string {
    std::ostringstream out;
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << scene.width << "\" height=\"" << scene.height
        << "\" viewBox=\"0 0 " << scene.width << ' ' << scene.height << "\">\n";
    SvgEmitter emitter{out};
    for (auto const& element : scene.elements) {
        std::visit(emitter, element.value);
    }
    out << "</svg>\n";
    return out.str();
}

} // namespace DM::Scene
