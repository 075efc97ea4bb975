#pragma once

// ============================================================================
// Stash Inventory - Umbrella Header
// ============================================================================
//
// Bounded 2D grid inventory for rectangular items.
//
// Quick Start:
// ------------
// 1. Create items (directly or from a catalog):
//    auto sword = Item::create("Sword", {1, 3});
//    auto potion = catalog.create("health_potion");
//
// 2. Place them:
//    GridInventory bag(10, 6);
//    bag.place(sword, 0, 0);
//    bag.place_anywhere(potion);     // first free anchor, row-major
//
// 3. Listen for changes:
//    auto conn = bag.on_added([](const ItemAddedEvent& e) { ... });
//
// 4. Compact:
//    auto result = bag.reorganize_space();
//    for (const auto& lost : result.dropped) { ... }
//
// ============================================================================

#include <stash/inventory/item.hpp>
#include <stash/inventory/item_matrix.hpp>
#include <stash/inventory/inventory_error.hpp>
#include <stash/inventory/inventory_events.hpp>
#include <stash/inventory/grid_inventory.hpp>
#include <stash/inventory/grid_format.hpp>
#include <stash/inventory/inventory_settings.hpp>
