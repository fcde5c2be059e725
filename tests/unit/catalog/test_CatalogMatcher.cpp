#include "../DyeMatchTestHelper.hpp"

#include "dyematch/catalog/CatalogMatcher.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <span>
#include <string>
#include <vector>

using namespace DM;
using namespace DM::Catalog;
using DM::Test::make_catalog;
using DM::Test::make_entry;
using DM::Test::RecordingLogSink;

namespace {

// Every lookup lands in the same category, so an exclusion never resolves.
auto facewear_only() -> JsonColorCatalog {
    std::vector<CatalogEntry> entries;
    for (int i = 0; i < 30; ++i) {
        entries.push_back(make_entry(100 + i, "Mask " + std::to_string(i), "#B01515", "Facewear"));
    }
    auto catalog = JsonColorCatalog::from_entries(std::move(entries));
    REQUIRE(catalog.has_value());
    return std::move(*catalog);
}

// Host-supplied catalog that only carries hex strings.
class HexOnlyCatalog final : public ColorCatalog {
public:
    explicit HexOnlyCatalog(std::vector<CatalogEntry> entries) : entries_(std::move(entries)) {}

    auto find_closest(Color::Rgb target, std::span<CatalogId const> exclude_ids) const -> std::optional<CatalogEntry> override {
        std::optional<CatalogEntry> best;
        double                      best_distance = 0.0;
        for (auto const& entry : entries_) {
            if (std::ranges::find(exclude_ids, entry.id) != exclude_ids.end()) continue;
            auto const distance = Color::color_distance(target, entry.rgb());
            if (!best || distance < best_distance) {
                best          = entry;
                best_distance = distance;
            }
        }
        return best;
    }
    auto find_by_id(CatalogId id) const -> std::optional<CatalogEntry> override {
        auto it = std::ranges::find(entries_, id, &CatalogEntry::id);
        if (it == entries_.end()) return std::nullopt;
        return *it;
    }
    auto size() const -> std::size_t override { return entries_.size(); }

private:
    std::vector<CatalogEntry> entries_;
};

} // namespace

TEST_SUITE("catalog.matcher") {

TEST_CASE("match_one returns the closest entry and its distance") {
    auto           catalog = make_catalog();
    CatalogMatcher matcher{catalog};

    auto match = matcher.match_one(Color::Rgb{0xB0, 0x15, 0x15});
    REQUIRE(match.has_value());
    CHECK(match->entry.name == "Dalamud Red Dye");
    CHECK(match->distance == doctest::Approx(0.0));
}

TEST_CASE("an excluded category is skipped") {
    auto           catalog = make_catalog();
    CatalogMatcher matcher{catalog};

    std::vector<CatalogId> taken{5729};
    auto                   with_masks = matcher.match_one(Color::Rgb{0xB0, 0x15, 0x15}, taken);
    REQUIRE(with_masks.has_value());
    CHECK(with_masks->entry.id == 5734);

    auto without_masks = matcher.match_one(Color::Rgb{0xB0, 0x15, 0x15}, taken, std::string{"Facewear"});
    REQUIRE(without_masks.has_value());
    CHECK(without_masks->entry.id == 5730);
    CHECK(without_masks->distance == doctest::Approx(std::sqrt(146.0)));
}

TEST_CASE("match_many returns distinct entries closest first") {
    auto           catalog = make_catalog();
    CatalogMatcher matcher{catalog};

    auto matches = matcher.match_many(Color::Rgb{0xB0, 0x15, 0x15}, 3, std::string{"Facewear"});
    REQUIRE(matches.size() == 3);
    CHECK(matches[0].entry.id == 5729);
    CHECK(matches[1].entry.id == 5730);
    CHECK(matches[0].distance <= matches[1].distance);
    CHECK(matches[1].distance <= matches[2].distance);

    auto everything = matcher.match_many(Color::kWhite, 10);
    CHECK(everything.size() == catalog.size());
}

TEST_CASE("palette matching keeps entries unique across slots") {
    auto           catalog = make_catalog();
    CatalogMatcher matcher{catalog};

    std::vector<ExtractedColor> colors{
            {Color::Rgb{0xB0, 0x15, 0x15}, 60.0},
            {Color::Rgb{0xB1, 0x16, 0x14}, 30.0},
            {Color::Rgb{0xE0, 0xE0, 0xD0}, 10.0},
    };

    auto entries = matcher.match_palette(colors, std::string{"Facewear"});
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].matched.id == 5729);
    CHECK(entries[1].matched.id == 5730);
    CHECK(entries[2].matched.id == 5731);
    CHECK(entries[0].dominance == doctest::Approx(60.0));
    CHECK(entries[1].extracted == Color::Rgb{0xB1, 0x16, 0x14});

    auto repeated = matcher.match_palette(colors, std::string{"Facewear"}, false);
    REQUIRE(repeated.size() == 3);
    CHECK(repeated[1].matched.id == 5729);
}

TEST_CASE("the attempt budget bounds lookups and reports exhaustion") {
    auto             catalog = facewear_only();
    RecordingLogSink log;
    CatalogMatcher   matcher{catalog, log, MatcherOptions{.max_attempts = 5}};

    auto match = matcher.match_one(Color::Rgb{0xB0, 0x15, 0x15}, {}, std::string{"Facewear"});
    CHECK_FALSE(match.has_value());
    CHECK(log.count("warn", "Match") == 1);

    std::vector<ExtractedColor> colors{{Color::Rgb{0xB0, 0x15, 0x15}, 100.0}};
    CHECK(matcher.match_palette(colors, std::string{"Facewear"}).empty());
}

TEST_CASE("entries built from hex alone match by their hex color") {
    HexOnlyCatalog catalog{{make_entry(7, "Pure White Dye", "#FFFFFF"), make_entry(8, "Jet Black Dye", "#000000")}};
    CatalogMatcher matcher{catalog};

    auto match = matcher.match_one(Color::kWhite);
    REQUIRE(match.has_value());
    CHECK(match->entry.id == 7);
    CHECK(match->distance == doctest::Approx(0.0));
    CHECK(match->entry.rgb() == Color::kWhite);

    auto palette = matcher.match_palette(std::vector<ExtractedColor>{{Color::kBlack, 100.0}});
    REQUIRE(palette.size() == 1);
    CHECK(palette[0].matched.id == 8);
    CHECK(palette[0].distance == doctest::Approx(0.0));
}

TEST_CASE("an exhausted catalog ends the slot without a warning") {
    auto catalog = JsonColorCatalog::from_entries({make_entry(1, "Only", "#808080")});
    REQUIRE(catalog.has_value());
    RecordingLogSink log;
    CatalogMatcher   matcher{*catalog, log};

    auto matches = matcher.match_many(Color::kBlack, 3);
    CHECK(matches.size() == 1);
    CHECK(log.count("warn", "Match") == 0);
}

}
