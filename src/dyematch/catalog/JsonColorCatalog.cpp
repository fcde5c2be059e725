#include <dyematch/catalog/JsonColorCatalog.hpp>

#include <algorithm>
#include <fstream>
#include <limits>
#include <unordered_set>

namespace DM::Catalog {

using json = nlohmann::json;

namespace {

auto malformed(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{Error::Code::MalformedInput, std::move(message)});
}

auto read_string(json const& object, char const* key) -> std::optional<std::string> {
    if (auto it = object.find(key); it != object.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

auto read_id(json const& object) -> std::optional<CatalogId> {
    for (auto const* key : {"id", "itemID"}) {
        if (auto it = object.find(key); it != object.end() && it->is_number_integer()) {
            return it->get<CatalogId>();
        }
    }
    return std::nullopt;
}

} // namespace

auto JsonColorCatalog::from_entries(std::vector<CatalogEntry> entries) -> Expected<JsonColorCatalog> {
    std::unordered_set<CatalogId> seen;
    for (auto& entry : entries) {
        if (!seen.insert(entry.id).second) {
            return malformed("duplicate catalog id " + std::to_string(entry.id));
        }
        auto normalized = Color::normalize_hex(entry.hex);
        if (!normalized) {
            return malformed("invalid hex '" + entry.hex + "' for catalog id " + std::to_string(entry.id));
        }
        entry.hex = *normalized;
    }
    return JsonColorCatalog{std::move(entries)};
}

auto JsonColorCatalog::from_json(json const& document) -> Expected<JsonColorCatalog> {
    json const* list = &document;
    if (document.is_object()) {
        auto it = document.find("dyes");
        if (it == document.end()) {
            return malformed("catalog object has no \"dyes\" array");
        }
        list = &*it;
    }
    if (!list->is_array()) {
        return malformed("catalog must be a JSON array");
    }

    std::vector<CatalogEntry> entries;
    entries.reserve(list->size());
    std::size_t index = 0;
    for (auto const& item : *list) {
        if (!item.is_object()) {
            return malformed("catalog entry " + std::to_string(index) + " is not an object");
        }
        auto id   = read_id(item);
        auto name = read_string(item, "name");
        auto hex  = read_string(item, "hex");
        if (!id || !name || !hex) {
            return malformed("catalog entry " + std::to_string(index) + " needs id, name and hex");
        }
        CatalogEntry entry;
        entry.id       = *id;
        entry.name     = std::move(*name);
        entry.hex      = std::move(*hex);
        entry.category = read_string(item, "category").value_or("");
        entries.push_back(std::move(entry));
        ++index;
    }
    return from_entries(std::move(entries));
}

auto JsonColorCatalog::load_file(std::filesystem::path const& path) -> Expected<JsonColorCatalog> {
    std::ifstream input(path);
    if (!input) {
        return malformed("cannot open catalog file " + path.string());
    }
    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return malformed("catalog file " + path.string() + " is not valid JSON");
    }
    return from_json(document);
}

auto JsonColorCatalog::find_closest(Color::Rgb target, std::span<CatalogId const> exclude_ids) const -> std::optional<CatalogEntry> {
    CatalogEntry const* best          = nullptr;
    double              best_distance = std::numeric_limits<double>::infinity();
    for (auto const& entry : entries_) {
        if (std::ranges::find(exclude_ids, entry.id) != exclude_ids.end()) {
            continue;
        }
        auto const distance = Color::color_distance(target, entry.rgb());
        if (distance < best_distance) {
            best          = &entry;
            best_distance = distance;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

auto JsonColorCatalog::find_by_id(CatalogId id) const -> std::optional<CatalogEntry> {
    auto it = std::ranges::find(entries_, id, &CatalogEntry::id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace DM::Catalog
