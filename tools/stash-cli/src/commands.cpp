#include "commands.hpp"
#include <stash/inventory/inventory.hpp>
#include <stash/core/log.hpp>
#include <iostream>
#include <optional>

namespace stash::cli {

using namespace stash::inventory;

namespace {

struct LoadedInventory {
    ItemCatalog catalog;
    GridInventory inventory;
};

// Loads settings and catalog, applies the log level, and seeds the inventory
std::optional<LoadedInventory> load_inventory(const std::string& settings_path) {
    InventorySettings settings;
    if (!settings.load(settings_path)) {
        std::cerr << "Error: failed to load settings from " << settings_path << "\n";
        return std::nullopt;
    }
    core::set_log_level(settings.log_level);

    ItemCatalog catalog;
    if (!load_catalog(settings, catalog)) {
        core::log_warning("cli", "Item catalog loaded with errors");
    }

    try {
        GridInventory inventory = create_inventory(settings, catalog);
        return LoadedInventory{std::move(catalog), std::move(inventory)};
    } catch (const InventoryError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return std::nullopt;
    }
}

void print_inventory(const GridInventory& inventory) {
    std::cout << "Inventory " << inventory.width() << "x" << inventory.height()
              << " (" << inventory.count() << " items, "
              << inventory.free_cell_count() << " free cells)\n";
    std::cout << format_grid(inventory) << "\n";

    std::string placements = format_placements(inventory);
    if (!placements.empty()) {
        std::cout << placements << "\n";
    }
}

} // namespace

Result cmd_show(const std::string& settings_path) {
    auto loaded = load_inventory(settings_path);
    if (!loaded) {
        return Result::LoadFailed;
    }

    print_inventory(loaded->inventory);
    return Result::Success;
}

Result cmd_reorganize(const std::string& settings_path) {
    auto loaded = load_inventory(settings_path);
    if (!loaded) {
        return Result::LoadFailed;
    }

    GridInventory& inventory = loaded->inventory;

    std::cout << "Before:\n";
    print_inventory(inventory);

    ReorganizeResult result;
    try {
        result = inventory.reorganize_space();
    } catch (const InventoryError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return Result::RuntimeError;
    }

    std::cout << "\nAfter:\n";
    print_inventory(inventory);

    if (!result.lossless()) {
        std::cout << "\nDropped " << result.dropped.size() << " item(s):\n";
        for (const auto& item : result.dropped) {
            std::cout << "  " << item->name() << " (" << item->width() << "x" << item->height() << ")\n";
        }
    }
    return Result::Success;
}

Result cmd_find(const std::string& settings_path, int width, int height) {
    if (width <= 0 || height <= 0) {
        std::cerr << "Error: item size must be positive\n";
        return Result::InvalidArgs;
    }

    auto loaded = load_inventory(settings_path);
    if (!loaded) {
        return Result::LoadFailed;
    }

    auto position = loaded->inventory.find_free_position({width, height});
    if (!position) {
        std::cout << "No free position for a " << width << "x" << height << " item\n";
        return Result::NotFound;
    }

    std::cout << position->x << " " << position->y << "\n";
    return Result::Success;
}

void cmd_help() {
    std::cout << R"(Stash CLI - Grid Inventory Tool

Usage: stash <command> [arguments]

Commands:
  show <settings.json>             Seed an inventory and print its grid

  reorganize <settings.json>       Seed, compact largest-first, print before/after
                                   and any items that no longer fit

  find <settings.json> <w> <h>     Print the first free anchor for a w x h item

  help                             Show this help message

Settings file:
  {
    "width": 10, "height": 6, "log_level": "info",
    "catalog": "items.json",
    "items": [ { "id": "sword", "name": "Sword", "size": [1, 3] } ],
    "seed": [ { "item": "sword", "position": [0, 0] }, { "item": "sword" } ]
  }

Examples:
  stash show bag.json
  stash find bag.json 2 2
)";
}

} // namespace stash::cli
