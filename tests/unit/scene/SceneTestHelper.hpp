#pragma once
#include "dyematch/scene/GlyphFont.hpp"
#include "dyematch/scene/Scene.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace DM::Test {

// The face named by DYEMATCH_TEST_FONT, when the build found one.
inline auto test_font() -> std::optional<Scene::GlyphFont> {
    char const* path = std::getenv("DYEMATCH_TEST_FONT");
    if (path == nullptr || *path == '\0') {
        return std::nullopt;
    }
    auto font = Scene::GlyphFont::from_file(path);
    if (!font) {
        return std::nullopt;
    }
    return std::move(*font);
}

inline void collect_texts(std::vector<Scene::Element> const& elements, std::vector<std::string>& out) {
    for (auto const& element : elements) {
        if (auto const* text = std::get_if<Scene::TextElement>(&element.value)) {
            out.push_back(text->markup);
        } else if (auto const* group = std::get_if<Scene::GroupElement>(&element.value)) {
            collect_texts(group->children, out);
        }
    }
}

// Every text markup in draw order, groups flattened.
inline auto texts_of(Scene::Scene const& scene) -> std::vector<std::string> {
    std::vector<std::string> out;
    collect_texts(scene.elements, out);
    return out;
}

inline auto has_text(Scene::Scene const& scene, std::string const& markup) -> bool {
    auto texts = texts_of(scene);
    return std::ranges::find(texts, markup) != texts.end();
}

inline void collect_rect_fills(std::vector<Scene::Element> const& elements, std::vector<Color::Rgb>& out) {
    for (auto const& element : elements) {
        if (auto const* rect = std::get_if<Scene::RectElement>(&element.value)) {
            out.push_back(rect->fill);
        } else if (auto const* group = std::get_if<Scene::GroupElement>(&element.value)) {
            collect_rect_fills(group->children, out);
        }
    }
}

inline auto has_rect_fill(Scene::Scene const& scene, Color::Rgb fill) -> bool {
    std::vector<Color::Rgb> fills;
    collect_rect_fills(scene.elements, fills);
    return std::ranges::find(fills, fill) != fills.end();
}

} // namespace DM::Test
