#include <dyematch/scene/SceneComposer.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace DM::Scene {

namespace {

constexpr double kPadding      = 24.0;
constexpr double kTitleHeight  = 50.0;
constexpr double kEmptyHeight  = 120.0;
constexpr double kCanvasRadius = 12.0;

// Palette grid
constexpr double kRowHeight         = 100.0;
constexpr double kRowSwatchSize     = 60.0;
constexpr double kArrowWidth        = 40.0;
constexpr double kQualityBadgeWidth = 100.0;

// Comparison grid
constexpr double      kColumnSwatchSize    = 100.0;
constexpr double      kDyeSectionHeight    = 200.0;
constexpr double      kMatrixSectionHeight = 120.0;
constexpr std::size_t kSwatchLabelBudget   = 12;

// Contrast matrix
constexpr double      kMatrixPadding      = 20.0;
constexpr double      kMatrixHeaderHeight = 60.0;
constexpr double      kCellSize           = 120.0;
constexpr double      kRowHeaderWidth     = 140.0;
constexpr double      kHeaderSwatchSize   = 24.0;
constexpr double      kLegendHeight       = 50.0;
constexpr double      kErrorMatrixWidth   = 400.0;
constexpr double      kErrorMatrixHeight  = 100.0;
constexpr std::size_t kColumnNameBudget   = 12;
constexpr std::size_t kRowNameBudget      = 10;

constexpr Color::Rgb kCellTintPass{0x1a, 0x2e, 0x1a};
constexpr Color::Rgb kCellTintPartial{0x2e, 0x2a, 0x1a};
constexpr Color::Rgb kCellTintFail{0x2e, 0x1a, 0x1a};

struct TextStyle {
    Color::Rgb   fill{Theme::kText};
    double       size{12.0};
    FontRole     font{FontRole::Primary};
    int          weight{400};
    TextAnchor   anchor{TextAnchor::Start};
    TextBaseline baseline{TextBaseline::Alphabetic};
};

auto text(double x, double y, std::string_view content, TextStyle const& style) -> Element {
    TextElement element;
    element.x           = x;
    element.y           = y;
    element.markup      = escape_markup(content);
    element.fill        = style.fill;
    element.font_size   = style.size;
    element.font        = style.font;
    element.font_weight = style.weight;
    element.anchor      = style.anchor;
    element.baseline    = style.baseline;
    return Element{std::move(element)};
}

auto rect(double x, double y, double width, double height, Color::Rgb fill, double radius = 0.0) -> RectElement {
    RectElement element;
    element.x             = x;
    element.y             = y;
    element.width         = width;
    element.height        = height;
    element.fill          = fill;
    element.corner_radius = radius;
    return element;
}

auto bordered(RectElement element, double stroke_width) -> Element {
    element.stroke       = Theme::kBorder;
    element.stroke_width = stroke_width;
    return Element{std::move(element)};
}

auto line(double x1, double y1, double x2, double y2, Color::Rgb stroke, double width) -> Element {
    return Element{LineElement{{x1, y1}, {x2, y2}, stroke, width}};
}

auto fixed(double value, int precision) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

auto format_dominance(double dominance) -> std::string {
    if (std::abs(dominance - std::round(dominance)) < 1e-9) {
        return std::to_string(static_cast<long long>(std::llround(dominance)));
    }
    return fixed(dominance, 1);
}

auto upper_hex(Color::Rgb color) -> std::string {
    return Color::rgb_to_hex(color, Color::HexCase::Upper);
}

auto placeholder(double width, double height, std::string_view message, double font_size) -> Scene {
    Scene scene;
    scene.width  = static_cast<int>(width);
    scene.height = static_cast<int>(height);
    scene.elements.push_back(Element{rect(0, 0, width, height, Theme::kBackground, kCanvasRadius)});
    scene.elements.push_back(text(width / 2, height / 2, message,
                                  {.fill = Theme::kTextMuted, .size = font_size, .anchor = TextAnchor::Middle,
                                   .baseline = TextBaseline::Middle}));
    return scene;
}

auto arrow(double x, double y, double width, Color::Rgb color) -> Element {
    constexpr double kArrowHeight = 12.0;
    double const     line_end     = x + width - 8;

    GroupElement group;
    group.children.push_back(line(x, y, line_end, y, color, 2));
    group.children.push_back(Element{PolygonElement{
            {{line_end, y - kArrowHeight / 2}, {line_end + 8, y}, {line_end, y + kArrowHeight / 2}}, color}});
    return Element{std::move(group)};
}

auto quality_badge(Color::MatchQuality quality, double x, double y) -> Element {
    auto const background = badge_color(quality);

    GroupElement group;
    group.children.push_back(Element{rect(x, y, kQualityBadgeWidth, 28, background, 4)});
    group.children.push_back(text(x + kQualityBadgeWidth / 2, y + 18, Color::match_quality_short_label(quality),
                                  {.fill = Color::contrast_text_color(background), .size = 11, .weight = 600,
                                   .anchor = TextAnchor::Middle}));
    return Element{std::move(group)};
}

auto palette_row(Catalog::PaletteEntry const& entry, double x, double y, double width, bool show_distance) -> Element {
    GroupElement row;
    auto&        out = row.children;

    auto row_background    = rect(x, y + 4, width, kRowHeight - 8, Theme::kBackgroundLight, 8);
    row_background.opacity = 0.5;
    out.push_back(Element{row_background});

    double const swatch_y = y + (kRowHeight - kRowSwatchSize) / 2;

    double const extracted_x = x + 16;
    out.push_back(bordered(rect(extracted_x, swatch_y, kRowSwatchSize, kRowSwatchSize, entry.extracted, 6), 2));
    double const extracted_info_x = extracted_x + kRowSwatchSize + 12;
    out.push_back(text(extracted_info_x, y + 36, "EXTRACTED", {.fill = Theme::kTextMuted, .size = 10, .weight = 500}));
    out.push_back(text(extracted_info_x, y + 55, upper_hex(entry.extracted),
                       {.fill = Theme::kText, .size = 14, .font = FontRole::Mono, .weight = 600}));
    out.push_back(text(extracted_info_x, y + 75, format_dominance(entry.dominance) + "% of image",
                       {.fill = Theme::kTextDim, .size = 11}));

    out.push_back(arrow(x + width / 2 - kArrowWidth / 2, y + kRowHeight / 2, kArrowWidth, Theme::kTextMuted));

    double const matched_x = x + width - 16 - kRowSwatchSize - kQualityBadgeWidth - 16;
    out.push_back(bordered(rect(matched_x, swatch_y, kRowSwatchSize, kRowSwatchSize, entry.matched.rgb(), 6), 2));
    double const matched_info_x = matched_x + kRowSwatchSize + 12;
    out.push_back(text(matched_info_x, y + 36, "MATCHED DYE", {.fill = Theme::kTextMuted, .size = 10, .weight = 500}));
    out.push_back(text(matched_info_x, y + 55, entry.matched.name, {.fill = Theme::kText, .size = 14, .weight = 600}));

    std::string detail = upper_hex(entry.matched.rgb());
    if (show_distance) {
        detail += "  Δ" + fixed(entry.distance, 1);
    }
    out.push_back(text(matched_info_x, y + 75, detail, {.fill = Theme::kTextDim, .size = 11, .font = FontRole::Mono}));

    out.push_back(quality_badge(Color::match_quality(entry.distance), x + width - kQualityBadgeWidth - 8, y + (kRowHeight - 28) / 2));
    return Element{std::move(row)};
}

auto comparison_column(Catalog::CatalogEntry const& entry, std::size_t index, double center_x, double start_y, bool show_hsv)
        -> Element {
    GroupElement column;
    auto&        out = column.children;

    out.push_back(Element{CircleElement{center_x, start_y + 10, 12, Theme::kAccent}});
    out.push_back(text(center_x, start_y + 14, std::to_string(index + 1),
                       {.fill = Color::kWhite, .size = 12, .weight = 600, .anchor = TextAnchor::Middle}));

    double const swatch_x = center_x - kColumnSwatchSize / 2;
    double const swatch_y = start_y + 28;
    out.push_back(bordered(rect(swatch_x, swatch_y, kColumnSwatchSize, kColumnSwatchSize, entry.rgb(), 8), 2));
    out.push_back(text(center_x, swatch_y + kColumnSwatchSize / 2 + 4, truncate_label(entry.name, kSwatchLabelBudget),
                       {.fill = Color::contrast_text_color(entry.rgb()), .size = 11, .weight = 600, .anchor = TextAnchor::Middle}));

    double info_y = swatch_y + kColumnSwatchSize + 20;
    out.push_back(text(center_x, info_y, entry.name, {.fill = Theme::kText, .size = 13, .weight = 600, .anchor = TextAnchor::Middle}));
    info_y += 16;
    out.push_back(text(center_x, info_y, entry.category, {.fill = Theme::kTextMuted, .size = 11, .anchor = TextAnchor::Middle}));
    info_y += 18;
    out.push_back(text(center_x, info_y, upper_hex(entry.rgb()),
                       {.fill = Theme::kText, .size = 12, .font = FontRole::Mono, .weight = 500, .anchor = TextAnchor::Middle}));
    info_y += 16;
    out.push_back(text(center_x, info_y, Color::format_rgb(entry.rgb()),
                       {.fill = Theme::kTextMuted, .size = 11, .font = FontRole::Mono, .anchor = TextAnchor::Middle}));
    if (show_hsv) {
        info_y += 14;
        out.push_back(text(center_x, info_y, Color::format_hsv(Color::rgb_to_hsv(entry.rgb())),
                           {.fill = Theme::kTextDim, .size = 10, .font = FontRole::Mono, .anchor = TextAnchor::Middle}));
    }
    return Element{std::move(column)};
}

auto pair_summary(DyePair const& pair, std::string_view heading, double center_x, double info_y) -> std::vector<Element> {
    auto const band   = Color::distance_band(pair.distance);
    auto const rating = Color::contrast_rating(pair.contrast_ratio);

    std::vector<Element> out;
    out.push_back(text(center_x, info_y, heading, {.fill = Theme::kTextMuted, .size = 11, .anchor = TextAnchor::Middle}));
    out.push_back(text(center_x, info_y + 18, std::to_string(pair.index1 + 1) + " ↔ " + std::to_string(pair.index2 + 1),
                       {.fill = Theme::kText, .size = 16, .weight = 600, .anchor = TextAnchor::Middle}));
    out.push_back(text(center_x, info_y + 36,
                       "Distance: " + fixed(pair.distance, 1) + " (" + std::string{Color::distance_band_label(band)} + ")",
                       {.fill = distance_band_color(band), .size = 12, .font = FontRole::Mono, .anchor = TextAnchor::Middle}));
    out.push_back(text(center_x, info_y + 52,
                       "Contrast: " + fixed(pair.contrast_ratio, 2) + ":1 (" + std::string{Color::contrast_rating_label(rating)} + ")",
                       {.fill = contrast_rating_color(rating), .size = 11, .font = FontRole::Mono, .anchor = TextAnchor::Middle}));
    return out;
}

auto analysis_section(ComparisonAnalysis const& analysis, double x, double y, double width) -> Element {
    GroupElement section;
    auto&        out = section.children;

    out.push_back(text(x + width / 2, y + 20, "Color Analysis", {.fill = Theme::kText, .size = 14, .weight = 600, .anchor = TextAnchor::Middle}));

    double const column_width = width / 2;
    double const info_y       = y + 45;
    for (auto& element : pair_summary(analysis.most_similar, "Most Similar", x + column_width / 2, info_y)) {
        out.push_back(std::move(element));
    }
    out.push_back(line(x + column_width, y + 35, x + column_width, y + 100, Theme::kBorder, 1));
    for (auto& element : pair_summary(analysis.most_different, "Most Different", x + column_width + column_width / 2, info_y)) {
        out.push_back(std::move(element));
    }
    return Element{std::move(section)};
}

auto cell_tint(Color::ContrastRating rating) -> Color::Rgb {
    switch (rating) {
    case Color::ContrastRating::AAA:
        return kCellTintPass;
    case Color::ContrastRating::AA:
    case Color::ContrastRating::AALarge:
        return kCellTintPartial;
    case Color::ContrastRating::Fail:
        return kCellTintFail;
    }
    return kCellTintFail;
}

auto contrast_cell(double x, double y, double ratio) -> Element {
    constexpr double kBadgeWidth  = 64.0;
    constexpr double kBadgeHeight = 22.0;

    auto const rating = Color::contrast_rating(ratio);
    auto const badge  = contrast_rating_color(rating);

    GroupElement cell;
    cell.children.push_back(Element{rect(x + 2, y + 2, kCellSize - 4, kCellSize - 4, cell_tint(rating), 6)});
    cell.children.push_back(text(x + kCellSize / 2, y + kCellSize / 2 - 8, fixed(ratio, 2) + ":1",
                                 {.fill = Theme::kText, .size = 14, .font = FontRole::Mono, .weight = 600, .anchor = TextAnchor::Middle}));
    double const badge_x = x + (kCellSize - kBadgeWidth) / 2;
    double const badge_y = y + kCellSize / 2 + 6;
    cell.children.push_back(Element{rect(badge_x, badge_y, kBadgeWidth, kBadgeHeight, badge, 4)});
    cell.children.push_back(text(badge_x + kBadgeWidth / 2, badge_y + 15, Color::contrast_rating_label(rating),
                                 {.fill = Color::contrast_text_color(badge), .size = 11, .weight = 700, .anchor = TextAnchor::Middle}));
    return Element{std::move(cell)};
}

auto diagonal_cell(double x, double y) -> Element {
    GroupElement cell;
    cell.children.push_back(Element{rect(x + 2, y + 2, kCellSize - 4, kCellSize - 4, Theme::kBackgroundLight, 6)});
    cell.children.push_back(text(x + kCellSize / 2, y + kCellSize / 2 + 4, "—",
                                 {.fill = Theme::kTextDim, .size = 24, .anchor = TextAnchor::Middle}));
    return Element{std::move(cell)};
}

auto contrast_legend(double x, double y, double width) -> Element {
    struct LegendItem {
        Color::ContrastRating rating;
        std::string_view      description;
    };
    constexpr LegendItem kItems[] = {
            {Color::ContrastRating::AAA, "7:1+"},
            {Color::ContrastRating::AA, "4.5:1+"},
            {Color::ContrastRating::AALarge, "3:1+"},
            {Color::ContrastRating::Fail, "<3:1"},
    };
    constexpr double kBadgeWidth  = 56.0;
    constexpr double kBadgeHeight = 18.0;

    GroupElement legend;
    double const item_width = width / static_cast<double>(std::size(kItems));
    for (std::size_t i = 0; i < std::size(kItems); ++i) {
        auto const& item   = kItems[i];
        double const item_x = x + static_cast<double>(i) * item_width + item_width / 2;
        auto const   badge  = contrast_rating_color(item.rating);
        legend.children.push_back(Element{rect(item_x - 50, y, kBadgeWidth, kBadgeHeight, badge, 3)});
        legend.children.push_back(text(item_x - 50 + kBadgeWidth / 2, y + 13, Color::contrast_rating_label(item.rating),
                                       {.fill = Color::contrast_text_color(badge), .size = 10, .weight = 700, .anchor = TextAnchor::Middle}));
        legend.children.push_back(text(item_x + 10, y + 13, item.description,
                                       {.fill = Theme::kTextMuted, .size = 11, .font = FontRole::Mono}));
    }
    return Element{std::move(legend)};
}

auto utf8_sequence_length(unsigned char lead) -> std::size_t {
    if (lead < 0x80)
        return 1;
    if ((lead >> 5) == 0x6)
        return 2;
    if ((lead >> 4) == 0xE)
        return 3;
    if ((lead >> 3) == 0x1E)
        return 4;
    return 1; // stray continuation or invalid lead byte
}

} // namespace

auto ComparisonAnalysis::pair(std::size_t i, std::size_t j) const -> std::optional<DyePair> {
    if (i == j) {
        return std::nullopt;
    }
    auto const low  = std::min(i, j);
    auto const high = std::max(i, j);
    for (auto const& candidate : pairs) {
        if (candidate.index1 == low && candidate.index2 == high) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto analyze_comparison(std::span<Catalog::CatalogEntry const> entries) -> std::optional<ComparisonAnalysis> {
    if (entries.size() < kMinComparisonEntries) {
        return std::nullopt;
    }
    auto const used = entries.first(std::min(entries.size(), kMaxComparisonEntries));

    ComparisonAnalysis analysis;
    analysis.entries.assign(used.begin(), used.end());
    for (std::size_t i = 0; i < used.size(); ++i) {
        for (std::size_t j = i + 1; j < used.size(); ++j) {
            analysis.pairs.push_back(DyePair{i, j, Color::color_distance(used[i].rgb(), used[j].rgb()),
                                             Color::contrast_ratio(used[i].rgb(), used[j].rgb())});
        }
    }

    analysis.most_similar   = analysis.pairs.front();
    analysis.most_different = analysis.pairs.front();
    for (auto const& candidate : analysis.pairs) {
        if (candidate.distance < analysis.most_similar.distance) {
            analysis.most_similar = candidate;
        }
        if (candidate.distance > analysis.most_different.distance) {
            analysis.most_different = candidate;
        }
    }
    return analysis;
}

auto compose_palette_grid(std::span<Catalog::PaletteEntry const> entries, PaletteGridOptions const& options) -> Scene {
    double const width = options.width;
    if (entries.empty()) {
        return placeholder(width, kEmptyHeight, "No colors extracted from image", 16);
    }

    double const title_space = options.title ? kTitleHeight : 0.0;
    double const height      = kPadding * 2 + title_space + static_cast<double>(entries.size()) * kRowHeight;

    Scene scene;
    scene.width  = options.width;
    scene.height = static_cast<int>(height);
    scene.elements.push_back(Element{rect(0, 0, width, height, Theme::kBackground, kCanvasRadius)});
    if (options.title) {
        scene.elements.push_back(text(width / 2, kPadding + 20, *options.title,
                                      {.fill = Theme::kText, .size = 20, .weight = 600, .anchor = TextAnchor::Middle}));
    }

    double const start_y = kPadding + title_space;
    for (std::size_t index = 0; index < entries.size(); ++index) {
        double const row_y = start_y + static_cast<double>(index) * kRowHeight;
        scene.elements.push_back(palette_row(entries[index], kPadding, row_y, width - kPadding * 2, options.show_distance));
        if (index + 1 < entries.size()) {
            scene.elements.push_back(line(kPadding, row_y + kRowHeight, width - kPadding, row_y + kRowHeight, Theme::kBorder, 1));
        }
    }
    return scene;
}

auto compose_comparison_grid(std::span<Catalog::CatalogEntry const> entries, ComparisonGridOptions const& options) -> Scene {
    double const width    = options.width;
    auto         analysis = analyze_comparison(entries);
    if (!analysis) {
        return placeholder(width, kEmptyHeight, "Please provide at least 2 dyes to compare", 16);
    }

    double const height = kPadding * 2 + kTitleHeight + kDyeSectionHeight + kMatrixSectionHeight;

    Scene scene;
    scene.width  = options.width;
    scene.height = static_cast<int>(height);
    scene.elements.push_back(Element{rect(0, 0, width, height, Theme::kBackground, kCanvasRadius)});
    scene.elements.push_back(text(width / 2, kPadding + 24, "Dye Comparison",
                                  {.fill = Theme::kText, .size = 22, .weight = 600, .anchor = TextAnchor::Middle}));

    auto const&  shown        = analysis->entries;
    double const column_width = (width - kPadding * 2) / static_cast<double>(shown.size());
    double const dye_start_y  = kPadding + kTitleHeight;
    for (std::size_t index = 0; index < shown.size(); ++index) {
        double const center_x = kPadding + static_cast<double>(index) * column_width + column_width / 2;
        scene.elements.push_back(comparison_column(shown[index], index, center_x, dye_start_y, options.show_hsv));
    }

    double const matrix_y = dye_start_y + kDyeSectionHeight;
    scene.elements.push_back(line(kPadding, matrix_y, width - kPadding, matrix_y, Theme::kBorder, 1));
    scene.elements.push_back(analysis_section(*analysis, kPadding, matrix_y + 10, width - kPadding * 2));
    return scene;
}

auto compose_contrast_matrix(std::span<Catalog::CatalogEntry const> entries, ContrastMatrixOptions const& options) -> Scene {
    if (entries.size() < kMinComparisonEntries) {
        return placeholder(kErrorMatrixWidth, kErrorMatrixHeight, "Need at least 2 dyes for contrast comparison", 14);
    }
    if (entries.size() > kMaxComparisonEntries) {
        return placeholder(kErrorMatrixWidth, kErrorMatrixHeight, "Maximum 4 dyes for contrast comparison", 14);
    }

    double const count       = static_cast<double>(entries.size());
    double const grid_size   = count * kCellSize;
    double const width       = kMatrixPadding * 2 + kRowHeaderWidth + grid_size;
    double const title_space = options.title ? kTitleHeight : 0.0;
    double const height      = kMatrixPadding * 2 + title_space + kMatrixHeaderHeight + grid_size + kLegendHeight;

    Scene scene;
    scene.width  = static_cast<int>(width);
    scene.height = static_cast<int>(height);
    scene.elements.push_back(Element{rect(0, 0, width, height, Theme::kBackground, kCanvasRadius)});
    if (options.title) {
        scene.elements.push_back(text(width / 2, kMatrixPadding + 24, *options.title,
                                      {.fill = Theme::kText, .size = 20, .font = FontRole::Header, .weight = 600,
                                       .anchor = TextAnchor::Middle}));
    }

    double const grid_x = kMatrixPadding + kRowHeaderWidth;
    double const grid_y = kMatrixPadding + title_space + kMatrixHeaderHeight;

    for (std::size_t col = 0; col < entries.size(); ++col) {
        double const x = grid_x + static_cast<double>(col) * kCellSize + kCellSize / 2;
        double const y = kMatrixPadding + title_space + kMatrixHeaderHeight / 2;
        scene.elements.push_back(bordered(rect(x - kHeaderSwatchSize / 2, y - 20, kHeaderSwatchSize, kHeaderSwatchSize, entries[col].rgb(), 4), 1));
        scene.elements.push_back(text(x, y + 16, truncate_label(entries[col].name, kColumnNameBudget),
                                      {.fill = Theme::kText, .size = 11, .weight = 500, .anchor = TextAnchor::Middle}));
    }

    for (std::size_t row = 0; row < entries.size(); ++row) {
        double const row_y    = grid_y + static_cast<double>(row) * kCellSize;
        double const header_x = kMatrixPadding + kRowHeaderWidth / 2;
        double const header_y = row_y + kCellSize / 2;
        scene.elements.push_back(
                bordered(rect(header_x - 40, header_y - kHeaderSwatchSize / 2, kHeaderSwatchSize, kHeaderSwatchSize, entries[row].rgb(), 4), 1));
        scene.elements.push_back(text(header_x + 10, header_y + 4, truncate_label(entries[row].name, kRowNameBudget),
                                      {.fill = Theme::kText, .size = 11, .weight = 500}));

        for (std::size_t col = 0; col < entries.size(); ++col) {
            double const cell_x = grid_x + static_cast<double>(col) * kCellSize;
            if (row == col) {
                scene.elements.push_back(diagonal_cell(cell_x, row_y));
            } else {
                scene.elements.push_back(contrast_cell(cell_x, row_y, Color::contrast_ratio(entries[row].rgb(), entries[col].rgb())));
            }
        }
    }

    scene.elements.push_back(contrast_legend(kMatrixPadding, grid_y + grid_size + 20, width - kMatrixPadding * 2));
    return scene;
}

auto truncate_label(std::string_view text, std::size_t budget) -> std::string {
    std::vector<std::size_t> boundaries; // byte offset where each code point starts
    for (std::size_t offset = 0; offset < text.size();) {
        boundaries.push_back(offset);
        offset += utf8_sequence_length(static_cast<unsigned char>(text[offset]));
    }
    if (boundaries.size() <= budget) {
        return std::string{text};
    }
    auto const keep = budget == 0 ? 0 : budget - 1;
    auto const cut  = keep < boundaries.size() ? boundaries[keep] : text.size();
    return std::string{text.substr(0, cut)} + "...";
}

auto escape_markup(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&':
            escaped.append("&amp;");
            break;
        case '<':
            escaped.append("&lt;");
            break;
        case '>':
            escaped.append("&gt;");
            break;
        case '"':
            escaped.append("&quot;");
            break;
        case '\'':
            escaped.append("&apos;");
            break;
        default:
            escaped.push_back(ch);
        }
    }
    return escaped;
}

auto badge_color(Color::MatchQuality quality) -> Color::Rgb {
    switch (quality) {
    case Color::MatchQuality::Perfect:
        return Theme::kSuccess;
    case Color::MatchQuality::Excellent:
        return Theme::kBlue;
    case Color::MatchQuality::Good:
        return Theme::kGreen;
    case Color::MatchQuality::Fair:
        return Theme::kWarning;
    case Color::MatchQuality::Approximate:
        return Theme::kTextDim;
    }
    return Theme::kTextDim;
}

auto distance_band_color(Color::DistanceBand band) -> Color::Rgb {
    switch (band) {
    case Color::DistanceBand::VerySimilar:
        return Theme::kSuccess;
    case Color::DistanceBand::Similar:
        return Theme::kGreen;
    case Color::DistanceBand::Different:
        return Theme::kAmber;
    case Color::DistanceBand::VeryDifferent:
        return Theme::kError;
    }
    return Theme::kError;
}

auto contrast_rating_color(Color::ContrastRating rating) -> Color::Rgb {
    switch (rating) {
    case Color::ContrastRating::AAA:
        return Theme::kSuccess;
    case Color::ContrastRating::AA:
        return Theme::kBlue;
    case Color::ContrastRating::AALarge:
        return Theme::kGreen;
    case Color::ContrastRating::Fail:
        return Theme::kError;
    }
    return Theme::kError;
}

} // namespace DM::Scene
