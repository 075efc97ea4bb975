#pragma once

#include <stash/inventory/grid_inventory.hpp>
#include <stash/inventory/item.hpp>
#include <stash/core/log.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stash::inventory {

// One initial item: placed at `position` if given, otherwise auto-placed
struct SeedEntry {
    std::string item_id;
    std::optional<GridPosition> position;
};

struct InventorySettings {
    int width = 10;
    int height = 6;
    core::LogLevel log_level = core::LogLevel::Info;

    // Catalog file, resolved relative to the settings file when loaded from disk
    std::string catalog_path;

    // Definitions embedded directly in the settings file ("items" array)
    std::vector<ItemDefinition> items;

    std::vector<SeedEntry> seed;

    // Load settings from a JSON file. Missing keys keep their defaults.
    bool load(const std::string& path);
    bool load_from_json(const std::string& text);

    void reset();
};

// Registers embedded definitions and the referenced catalog file into `catalog`.
bool load_catalog(const InventorySettings& settings, ItemCatalog& catalog);

// Builds an inventory of the configured size and places the seed entries.
// Unknown ids and entries that do not fit are skipped with a warning.
// Throws InventoryError{InvalidDimension} for non-positive dimensions.
GridInventory create_inventory(const InventorySettings& settings, const ItemCatalog& catalog);

} // namespace stash::inventory
