#include <dyematch/scene/SoftwareRasterizer.hpp>

#include "log/TaggedLogger.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STBI_WRITE_NO_STDIO
#include <stb/stb_image_write.h>
#undef STB_IMAGE_WRITE_IMPLEMENTATION

#include <algorithm>
#include <cmath>
#include <ranges>
#include <utility>
#include <variant>

namespace DM::Scene {

namespace {

constexpr int kMaxCanvasSide = 16384;

class Canvas {
public:
    Canvas(int width, int height, double scale)
        : width_(width), height_(height), scale_(scale), pixels_(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u, 0) {}

    void clear(Color::Rgb color) {
        for (std::size_t i = 0; i < pixels_.size(); i += 4) {
            pixels_[i]     = color.r;
            pixels_[i + 1] = color.g;
            pixels_[i + 2] = color.b;
            pixels_[i + 3] = 255;
        }
    }

    // Visits every device pixel whose centre lies in [x0,x1)x[y0,y1) (logical units) and
    // blends `color` where `inside(px, py)` holds for the centre in logical units.
    template <typename Inside>
    void fill(double x0, double y0, double x1, double y1, Color::Rgb color, double opacity, Inside&& inside) {
        int const left   = std::clamp(static_cast<int>(std::floor(x0 * scale_)), 0, width_);
        int const top    = std::clamp(static_cast<int>(std::floor(y0 * scale_)), 0, height_);
        int const right  = std::clamp(static_cast<int>(std::ceil(x1 * scale_)), 0, width_);
        int const bottom = std::clamp(static_cast<int>(std::ceil(y1 * scale_)), 0, height_);
        for (int py = top; py < bottom; ++py) {
            double const ly = (py + 0.5) / scale_;
            for (int px = left; px < right; ++px) {
                double const lx = (px + 0.5) / scale_;
                if (inside(lx, ly)) {
                    blend(px, py, color, opacity);
                }
            }
        }
    }

    // Glyph coverage is in device pixels, relative to the pen position on the baseline.
    void draw_glyphs(TextLayout const& layout, double pen_x, double baseline_y, Color::Rgb color) {
        auto const origin_x = static_cast<int>(std::lround(pen_x));
        auto const origin_y = static_cast<int>(std::lround(baseline_y));
        for (auto const& glyph : layout.glyphs) {
            for (int gy = 0; gy < glyph.height; ++gy) {
                int const py = origin_y + glyph.top + gy;
                if (py < 0 || py >= height_) {
                    continue;
                }
                for (int gx = 0; gx < glyph.width; ++gx) {
                    int const  px       = origin_x + glyph.left + gx;
                    auto const coverage = glyph.coverage[static_cast<std::size_t>(gy) * static_cast<std::size_t>(glyph.width)
                                                         + static_cast<std::size_t>(gx)];
                    if (px < 0 || px >= width_ || coverage == 0) {
                        continue;
                    }
                    blend(px, py, color, coverage / 255.0);
                }
            }
        }
    }

    [[nodiscard]] auto width() const -> int { return width_; }
    [[nodiscard]] auto height() const -> int { return height_; }
    [[nodiscard]] auto scale() const -> double { return scale_; }
    [[nodiscard]] auto data() const -> std::uint8_t const* { return pixels_.data(); }

private:
    // Straight-alpha source-over.
    void blend(int x, int y, Color::Rgb color, double opacity) {
        auto* dst = &pixels_[(static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x)) * 4u];
        double const src_a = std::clamp(opacity, 0.0, 1.0);
        double const dst_a = dst[3] / 255.0;
        double const out_a = src_a + dst_a * (1.0 - src_a);
        if (out_a <= 0.0) {
            return;
        }
        auto channel = [&](std::uint8_t src, std::uint8_t current) {
            double const value = (src * src_a + current * dst_a * (1.0 - src_a)) / out_a;
            return static_cast<std::uint8_t>(std::clamp(std::lround(value), 0L, 255L));
        };
        dst[0] = channel(color.r, dst[0]);
        dst[1] = channel(color.g, dst[1]);
        dst[2] = channel(color.b, dst[2]);
        dst[3] = static_cast<std::uint8_t>(std::clamp(std::lround(out_a * 255.0), 0L, 255L));
    }

    int                       width_;
    int                       height_;
    double                    scale_;
    std::vector<std::uint8_t> pixels_;
};

auto inside_rounded_rect(double px, double py, double x, double y, double w, double h, double r) -> bool {
    if (px < x || py < y || px >= x + w || py >= y + h) {
        return false;
    }
    r = std::min({r, w / 2, h / 2});
    if (r <= 0.0) {
        return true;
    }
    double const cx = std::clamp(px, x + r, x + w - r);
    double const cy = std::clamp(py, y + r, y + h - r);
    double const dx = px - cx;
    double const dy = py - cy;
    return dx * dx + dy * dy <= r * r;
}

auto distance_to_segment(double px, double py, Point a, Point b) -> double {
    double const vx = b.x - a.x;
    double const vy = b.y - a.y;
    double const length_sq = vx * vx + vy * vy;
    double t = length_sq > 0.0 ? ((px - a.x) * vx + (py - a.y) * vy) / length_sq : 0.0;
    t = std::clamp(t, 0.0, 1.0);
    double const dx = px - (a.x + t * vx);
    double const dy = py - (a.y + t * vy);
    return std::sqrt(dx * dx + dy * dy);
}

// Even-odd rule.
auto inside_polygon(double px, double py, std::vector<Point> const& points) -> bool {
    bool inside = false;
    for (std::size_t i = 0, j = points.size() - 1; i < points.size(); j = i++) {
        auto const& a = points[i];
        auto const& b = points[j];
        if ((a.y > py) != (b.y > py) && px < (b.x - a.x) * (py - a.y) / (b.y - a.y) + a.x) {
            inside = !inside;
        }
    }
    return inside;
}

class CanvasPainter {
public:
    CanvasPainter(Canvas& canvas, GlyphFont const* font, std::size_t& skipped_text)
        : canvas_(canvas), font_(font), skipped_text_(skipped_text) {}

    void operator()(RectElement const& rect) const {
        if (rect.stroke && rect.stroke_width > 0.0) {
            double const half = rect.stroke_width / 2;
            double const ox = rect.x - half, oy = rect.y - half, ow = rect.width + rect.stroke_width, oh = rect.height + rect.stroke_width;
            double const ix = rect.x + half, iy = rect.y + half, iw = rect.width - rect.stroke_width, ih = rect.height - rect.stroke_width;
            canvas_.fill(ix, iy, ix + iw, iy + ih, rect.fill, rect.opacity, [&](double px, double py) {
                return inside_rounded_rect(px, py, ix, iy, iw, ih, std::max(rect.corner_radius - half, 0.0));
            });
            canvas_.fill(ox, oy, ox + ow, oy + oh, *rect.stroke, rect.opacity, [&](double px, double py) {
                return inside_rounded_rect(px, py, ox, oy, ow, oh, rect.corner_radius + half)
                       && !inside_rounded_rect(px, py, ix, iy, iw, ih, std::max(rect.corner_radius - half, 0.0));
            });
            return;
        }
        canvas_.fill(rect.x, rect.y, rect.x + rect.width, rect.y + rect.height, rect.fill, rect.opacity, [&](double px, double py) {
            return inside_rounded_rect(px, py, rect.x, rect.y, rect.width, rect.height, rect.corner_radius);
        });
    }

    void operator()(CircleElement const& circle) const {
        double const r = circle.radius;
        canvas_.fill(circle.cx - r, circle.cy - r, circle.cx + r, circle.cy + r, circle.fill, 1.0, [&](double px, double py) {
            double const dx = px - circle.cx;
            double const dy = py - circle.cy;
            return dx * dx + dy * dy <= r * r;
        });
    }

    void operator()(LineElement const& line) const {
        double const half = std::max(line.stroke_width / 2, 0.5);
        canvas_.fill(std::min(line.from.x, line.to.x) - half, std::min(line.from.y, line.to.y) - half,
                     std::max(line.from.x, line.to.x) + half, std::max(line.from.y, line.to.y) + half, line.stroke, 1.0,
                     [&](double px, double py) { return distance_to_segment(px, py, line.from, line.to) <= half; });
    }

    void operator()(PolygonElement const& polygon) const {
        if (polygon.points.size() < 3) {
            return;
        }
        auto [min_x, max_x] = std::ranges::minmax(polygon.points | std::views::transform(&Point::x));
        auto [min_y, max_y] = std::ranges::minmax(polygon.points | std::views::transform(&Point::y));
        canvas_.fill(min_x, min_y, max_x, max_y, polygon.fill, 1.0,
                     [&](double px, double py) { return inside_polygon(px, py, polygon.points); });
    }

    void operator()(TextElement const& text) const {
        if (font_ == nullptr) {
            ++skipped_text_;
            return;
        }
        double const scale  = canvas_.scale();
        auto const   layout = font_->layout(unescape_markup(text.markup), text.font_size * scale);

        double pen_x = text.x * scale;
        switch (text.anchor) {
        case TextAnchor::Start:
            break;
        case TextAnchor::Middle:
            pen_x -= layout.width / 2;
            break;
        case TextAnchor::End:
            pen_x -= layout.width;
            break;
        }
        double baseline_y = text.y * scale;
        if (text.baseline == TextBaseline::Middle) {
            baseline_y += (layout.ascent + layout.descent) / 2;
        }
        canvas_.draw_glyphs(layout, pen_x, baseline_y, text.fill);
    }

    void operator()(GroupElement const& group) const {
        for (auto const& child : group.children) {
            std::visit(*this, child.value);
        }
    }

private:
    Canvas&          canvas_;
    GlyphFont const* font_;
    std::size_t&     skipped_text_;
};

void append_png_bytes(void* context, void* data, int size) {
    auto* out   = static_cast<std::vector<std::uint8_t>*>(context);
    auto* bytes = static_cast<std::uint8_t const*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

SoftwareRasterizer::SoftwareRasterizer(GlyphFont font)
    : font_(std::move(font)) {}

auto SoftwareRasterizer::rasterize(Scene const& scene, RasterizeOptions const& options) -> Expected<std::vector<std::uint8_t>> {
    if (options.scale <= 0) {
        return std::unexpected(Error{Error::Code::RasterizeFailed, "scale must be positive"});
    }
    auto const device_width  = static_cast<long long>(scene.width) * options.scale;
    auto const device_height = static_cast<long long>(scene.height) * options.scale;
    if (device_width <= 0 || device_height <= 0 || device_width > kMaxCanvasSide || device_height > kMaxCanvasSide) {
        return std::unexpected(Error{Error::Code::RasterizeFailed,
                                     "invalid canvas " + std::to_string(device_width) + "x" + std::to_string(device_height)});
    }

    Canvas canvas(static_cast<int>(device_width), static_cast<int>(device_height), static_cast<double>(options.scale));
    if (options.background) {
        canvas.clear(*options.background);
    }

    std::size_t   skipped_text = 0;
    CanvasPainter painter{canvas, font_ ? &*font_ : nullptr, skipped_text};
    for (auto const& element : scene.elements) {
        std::visit(painter, element.value);
    }
    if (skipped_text > 0) {
        dm_log("no font loaded, skipped " + std::to_string(skipped_text) + " text elements", "Rasterize", "DEBUG");
    }

    std::vector<std::uint8_t> png;
    if (stbi_write_png_to_func(append_png_bytes, &png, canvas.width(), canvas.height(), 4, canvas.data(), canvas.width() * 4) == 0
        || png.empty()) {
        return std::unexpected(Error{Error::Code::RasterizeFailed, "PNG encoding failed"});
    }
    return png;
}

} // namespace DM::Scene
