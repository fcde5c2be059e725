#include "../DyeMatchTestHelper.hpp"
#include "SceneTestHelper.hpp"

#include "dyematch/scene/SceneComposer.hpp"

#include <ranges>

using namespace DM;
using namespace DM::Scene;
using DM::Test::has_rect_fill;
using DM::Test::has_text;
using DM::Test::make_catalog;
using DM::Test::make_entry;
using DM::Test::texts_of;

namespace {

auto catalog_entry(Catalog::CatalogId id, std::string name, std::string hex, std::string category = "General") -> Catalog::CatalogEntry {
    auto entry = make_entry(id, std::move(name), hex, std::move(category));
    entry.hex  = *Color::normalize_hex(hex);
    return entry;
}

auto palette_entry(Color::Rgb extracted, Catalog::CatalogEntry matched, double dominance) -> Catalog::PaletteEntry {
    auto const distance = Color::color_distance(extracted, matched.rgb());
    return Catalog::PaletteEntry{extracted, std::move(matched), distance, dominance};
}

} // namespace

TEST_SUITE("scene.composer") {

TEST_CASE("an empty palette renders a placeholder") {
    auto scene = compose_palette_grid({});
    CHECK(scene.width == 800);
    CHECK(scene.height == 120);
    CHECK(texts_of(scene) == std::vector<std::string>{"No colors extracted from image"});
}

TEST_CASE("palette rows show extracted and matched colors") {
    auto const red = catalog_entry(5729, "Dalamud Red Dye", "#B01515");
    std::vector<Catalog::PaletteEntry> entries{palette_entry(Color::Rgb{0xB0, 0x15, 0x15}, red, 100.0)};

    PaletteGridOptions options{};
    options.title = "Color Match";
    auto scene    = compose_palette_grid(entries, options);

    CHECK(scene.width == 800);
    CHECK(scene.height == 24 * 2 + 50 + 100);
    CHECK(has_text(scene, "Color Match"));
    CHECK(has_text(scene, "EXTRACTED"));
    CHECK(has_text(scene, "#B01515"));
    CHECK(has_text(scene, "100% of image"));
    CHECK(has_text(scene, "MATCHED DYE"));
    CHECK(has_text(scene, "Dalamud Red Dye"));
    CHECK(has_text(scene, "#B01515  Δ0.0"));
    CHECK(has_text(scene, "PERFECT"));
    CHECK(has_rect_fill(scene, badge_color(Color::MatchQuality::Perfect)));
}

TEST_CASE("matched swatches take their color from the entry hex") {
    auto const green = make_entry(77, "Moss Green Dye", "#12ab34");
    std::vector<Catalog::PaletteEntry> entries{Catalog::PaletteEntry{Color::kBlack, green, 0.0, 100.0}};

    auto scene = compose_palette_grid(entries);
    CHECK(has_rect_fill(scene, Color::Rgb{0x12, 0xAB, 0x34}));
    CHECK(has_text(scene, "#12AB34  Δ0.0"));
}

TEST_CASE("palette rows scale with the entry count and can hide the distance") {
    auto catalog = make_catalog();
    std::vector<Catalog::PaletteEntry> entries{
            palette_entry(Color::Rgb{0xB0, 0x20, 0x20}, *catalog.find_by_id(5729), 55.5),
            palette_entry(Color::Rgb{0x30, 0x30, 0x30}, *catalog.find_by_id(5732), 44.5),
    };

    PaletteGridOptions options{};
    options.show_distance = false;
    auto scene            = compose_palette_grid(entries, options);
    CHECK(scene.height == 24 * 2 + 2 * 100);
    CHECK(has_text(scene, "55.5% of image"));
    CHECK(has_text(scene, "#2E2E2E"));
    for (auto const& text : texts_of(scene)) {
        CHECK(text.find("Δ") == std::string::npos);
    }
}

TEST_CASE("names are escaped before they reach the scene") {
    auto const odd = catalog_entry(1, "Red & <Blue> \"Dye\"", "#FF0000");
    std::vector<Catalog::PaletteEntry> entries{palette_entry(Color::Rgb{255, 0, 0}, odd, 100.0)};
    auto scene = compose_palette_grid(entries);
    CHECK(has_text(scene, "Red &amp; &lt;Blue&gt; &quot;Dye&quot;"));
}

TEST_CASE("comparison analysis finds the closest and farthest pairs") {
    std::vector<Catalog::CatalogEntry> dyes{
            catalog_entry(1, "White", "#FFFFFF"),
            catalog_entry(2, "Black", "#000000"),
            catalog_entry(3, "Off White", "#F0F0F0"),
    };
    auto analysis = analyze_comparison(dyes);
    REQUIRE(analysis.has_value());
    CHECK(analysis->pairs.size() == 3);
    CHECK(analysis->most_similar.index1 == 0);
    CHECK(analysis->most_similar.index2 == 2);
    CHECK(analysis->most_different.index1 == 0);
    CHECK(analysis->most_different.index2 == 1);
    CHECK(analysis->most_different.contrast_ratio == doctest::Approx(21.0));

    auto pair = analysis->pair(2, 0);
    REQUIRE(pair.has_value());
    CHECK(pair->distance == doctest::Approx(analysis->most_similar.distance));
    CHECK_FALSE(analysis->pair(1, 1).has_value());
    CHECK_FALSE(analysis->pair(0, 7).has_value());
}

TEST_CASE("comparison analysis needs two entries and uses at most four") {
    std::vector<Catalog::CatalogEntry> one{catalog_entry(1, "White", "#FFFFFF")};
    CHECK_FALSE(analyze_comparison(one).has_value());

    std::vector<Catalog::CatalogEntry> five;
    for (int i = 0; i < 5; ++i) {
        five.push_back(catalog_entry(i, "Grey " + std::to_string(i), Color::rgb_to_hex(Color::Rgb{static_cast<std::uint8_t>(i * 40), 0, 0})));
    }
    auto analysis = analyze_comparison(five);
    REQUIRE(analysis.has_value());
    CHECK(analysis->entries.size() == 4);
    CHECK(analysis->pairs.size() == 6);
}

TEST_CASE("ties keep the earliest pair") {
    std::vector<Catalog::CatalogEntry> dyes{
            catalog_entry(1, "A", "#000000"),
            catalog_entry(2, "B", "#0A0000"),
            catalog_entry(3, "C", "#140000"),
    };
    auto analysis = analyze_comparison(dyes);
    REQUIRE(analysis.has_value());
    CHECK(analysis->most_similar.index1 == 0);
    CHECK(analysis->most_similar.index2 == 1);
}

TEST_CASE("comparison grid") {
    std::vector<Catalog::CatalogEntry> dyes{
            catalog_entry(1, "Snow White Dye", "#E4DFD0", "White"),
            catalog_entry(2, "Soot Black Dye", "#2E2E2E", "Black"),
    };
    auto scene = compose_comparison_grid(dyes);
    CHECK(scene.width == 800);
    CHECK(scene.height == 24 * 2 + 50 + 200 + 120);
    CHECK(has_text(scene, "Dye Comparison"));
    CHECK(has_text(scene, "Color Analysis"));
    CHECK(has_text(scene, "Most Similar"));
    CHECK(has_text(scene, "Most Different"));
    CHECK(has_text(scene, "1 ↔ 2"));
    CHECK(has_text(scene, "Snow White ..."));
    CHECK(has_text(scene, "RGB(46, 46, 46)"));
    CHECK(has_text(scene, "White"));

    auto placeholder = compose_comparison_grid(std::span<Catalog::CatalogEntry const>{dyes}.first(1));
    CHECK(texts_of(placeholder) == std::vector<std::string>{"Please provide at least 2 dyes to compare"});
}

TEST_CASE("contrast matrix") {
    std::vector<Catalog::CatalogEntry> dyes{
            catalog_entry(1, "Pure White", "#FFFFFF"),
            catalog_entry(2, "Jet Black", "#000000"),
    };

    auto scene = compose_contrast_matrix(dyes);
    CHECK(scene.width == 20 * 2 + 140 + 2 * 120);
    CHECK(scene.height == 20 * 2 + 60 + 2 * 120 + 50);

    auto texts = texts_of(scene);
    CHECK(std::ranges::count(texts, std::string{"21.00:1"}) == 2);
    CHECK(std::ranges::count(texts, std::string{"—"}) == 2);
    CHECK(std::ranges::count(texts, std::string{"AAA"}) == 3);
    CHECK(has_text(scene, "AA Large"));
    CHECK(has_text(scene, "&lt;3:1"));

    ContrastMatrixOptions titled{};
    titled.title = "Contrast";
    CHECK(compose_contrast_matrix(dyes, titled).height == scene.height + 50);
}

TEST_CASE("contrast matrix guards its entry count") {
    std::vector<Catalog::CatalogEntry> dyes;
    auto too_few = compose_contrast_matrix(dyes);
    CHECK(too_few.width == 400);
    CHECK(too_few.height == 100);
    CHECK(has_text(too_few, "Need at least 2 dyes for contrast comparison"));

    for (int i = 0; i < 5; ++i) {
        dyes.push_back(catalog_entry(i, "Dye", "#123456"));
    }
    auto too_many = compose_contrast_matrix(dyes);
    CHECK(has_text(too_many, "Maximum 4 dyes for contrast comparison"));
}

TEST_CASE("label truncation counts code points") {
    CHECK(truncate_label("Short", 12) == "Short");
    CHECK(truncate_label("Dalamud Red Dye", 12) == "Dalamud Red...");
    CHECK(truncate_label("Exactly Ten", 11) == "Exactly Ten");
    CHECK(truncate_label("Ünïcödé Dye", 5) == "Ünïc...");
    CHECK(truncate_label("abc", 0) == "...");
}

TEST_CASE("markup escaping") {
    CHECK(escape_markup("a<b>&\"'") == "a&lt;b&gt;&amp;&quot;&apos;");
    CHECK(escape_markup("plain") == "plain");
}

}
