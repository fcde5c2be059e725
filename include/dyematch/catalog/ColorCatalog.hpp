#pragma once
#include "dyematch/color/ColorMath.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace DM::Catalog {

using CatalogId = std::int64_t;

// Read-only reference color. `hex` is the only stored color; `rgb()` parses it on demand
// and yields black when `hex` is not a six-digit color.
struct CatalogEntry {
    CatalogId   id{0};
    std::string name;
    std::string hex;
    std::string category;

    [[nodiscard]] auto rgb() const -> Color::Rgb { return Color::hex_to_rgb(hex).value_or(Color::kBlack); }
};

// Externally owned reference color set. Constructed once by the host and injected.
class ColorCatalog {
public:
    virtual ~ColorCatalog() = default;

    virtual auto find_closest(Color::Rgb target, std::span<CatalogId const> exclude_ids) const -> std::optional<CatalogEntry> = 0;
    virtual auto find_by_id(CatalogId id) const -> std::optional<CatalogEntry>                                             = 0;
    virtual auto size() const -> std::size_t                                                                                = 0;
};

} // namespace DM::Catalog
