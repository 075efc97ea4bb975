#pragma once

#include <stash/inventory/item.hpp>
#include <vector>

namespace stash::inventory {

// Events are dispatched synchronously by the GridInventory that raised them,
// after the grid has reached its new consistent state.

// ============================================================================
// Item Added Event
// ============================================================================

struct ItemAddedEvent {
    ItemPtr item;
    GridPosition position;
};

// ============================================================================
// Item Removed Event
// ============================================================================

struct ItemRemovedEvent {
    ItemPtr item;
    GridPosition position;          // Anchor the item occupied before removal
};

// ============================================================================
// Item Moved Event
// ============================================================================

struct ItemMovedEvent {
    ItemPtr item;
    GridPosition position;          // New anchor
    GridPosition previous_position;
};

// ============================================================================
// Inventory Cleared Event
// ============================================================================

struct InventoryClearedEvent {
    size_t removed_count = 0;
};

// ============================================================================
// Inventory Reorganized Event
// ============================================================================

struct InventoryReorganizedEvent {
    size_t placed_count = 0;
    std::vector<ItemPtr> dropped;   // Items that no longer fit and were removed
};

} // namespace stash::inventory
