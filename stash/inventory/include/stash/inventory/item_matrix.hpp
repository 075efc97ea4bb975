#pragma once

#include <stash/inventory/item.hpp>
#include <vector>

namespace stash::inventory {

// ============================================================================
// ItemMatrix - Caller-owned occupancy snapshot
// ============================================================================
//
// Width x Height cells, each holding the covering item or null. Produced by
// GridInventory::copy_to / snapshot; holds shared references, never owns the
// inventory's placements.

class ItemMatrix {
public:
    ItemMatrix() = default;
    ItemMatrix(int width, int height);

    int width() const { return m_width; }
    int height() const { return m_height; }
    bool empty() const { return m_cells.empty(); }

    // Unchecked access; x in [0, width), y in [0, height)
    const ItemPtr& at(int x, int y) const { return m_cells[index(x, y)]; }
    ItemPtr& at(int x, int y) { return m_cells[index(x, y)]; }

    void fill(const ItemPtr& value);

private:
    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x);
    }

    int m_width = 0;
    int m_height = 0;
    std::vector<ItemPtr> m_cells;
};

} // namespace stash::inventory
