#pragma once
#include "dyematch/catalog/ColorCatalog.hpp"
#include "dyematch/core/Error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <vector>

namespace DM::Catalog {

// Linear nearest-neighbour catalog loaded from JSON. Accepts either a top-level array of
// {"id", "name", "hex", "category"} objects or an object with a "dyes" array.
class JsonColorCatalog final : public ColorCatalog {
public:
    static auto from_entries(std::vector<CatalogEntry> entries) -> Expected<JsonColorCatalog>;
    static auto from_json(nlohmann::json const& document) -> Expected<JsonColorCatalog>;
    static auto load_file(std::filesystem::path const& path) -> Expected<JsonColorCatalog>;

    auto find_closest(Color::Rgb target, std::span<CatalogId const> exclude_ids) const -> std::optional<CatalogEntry> override;
    auto find_by_id(CatalogId id) const -> std::optional<CatalogEntry> override;
    auto size() const -> std::size_t override { return entries_.size(); }

    [[nodiscard]] auto entries() const -> std::span<CatalogEntry const> { return entries_; }

private:
    explicit JsonColorCatalog(std::vector<CatalogEntry> entries)
        : entries_(std::move(entries)) {}

    std::vector<CatalogEntry> entries_;
};

} // namespace DM::Catalog
