#pragma once

#include <stash/inventory/item.hpp>
#include <stash/inventory/item_matrix.hpp>
#include <stash/inventory/inventory_events.hpp>
#include <stash/core/event_dispatcher.hpp>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stash::inventory {

// ============================================================================
// Reorganize Result
// ============================================================================

struct ReorganizeResult {
    size_t placed_count = 0;
    std::vector<ItemPtr> dropped;

    bool lossless() const { return dropped.empty(); }
};

// ============================================================================
// GridInventory - Bounded 2D grid of non-overlapping rectangular items
// ============================================================================
//
// Every placed item covers a w x h block of cells anchored at its top-left
// position. The cell grid and the placement index are updated together by
// each mutating call, so between calls:
// - every cell of a placed item's footprint refers to that item,
// - no two footprints intersect,
// - an item is indexed iff its full footprint is stamped.
//
// Not thread-safe. Share an instance across threads only behind one external
// mutex.

class GridInventory {
public:
    using ItemList = std::vector<ItemPtr>;
    using PlacementList = std::vector<std::pair<ItemPtr, GridPosition>>;

    GridInventory(int width, int height);

    // Seeded construction. Entries that are null, duplicated or do not fit are
    // skipped with a warning.
    GridInventory(int width, int height, const ItemList& items);
    GridInventory(int width, int height, const PlacementList& placements);

    GridInventory(const GridInventory&) = delete;
    GridInventory& operator=(const GridInventory&) = delete;
    // The moved-from inventory is left empty, with its dimensions and a fresh
    // dispatcher; its old connections follow the moved contents.
    GridInventory(GridInventory&& other);
    GridInventory& operator=(GridInventory&& other);
    ~GridInventory() = default;

    // ========================================================================
    // Dimensions
    // ========================================================================

    int width() const { return m_width; }
    int height() const { return m_height; }
    GridSize size() const { return {m_width, m_height}; }

    size_t count() const { return m_order.size(); }
    bool empty() const { return m_order.empty(); }

    // ========================================================================
    // Placement
    // ========================================================================

    // Throws InventoryError{InvalidSize} for a non-null item with a
    // non-positive size.
    bool can_place(const ItemPtr& item, int x, int y) const;
    bool can_place(const ItemPtr& item, GridPosition position) const;

    bool place(const ItemPtr& item, int x, int y);
    bool place(const ItemPtr& item, GridPosition position);

    bool can_place_anywhere(const ItemPtr& item) const;
    bool place_anywhere(const ItemPtr& item);

    // First anchor in row-major order (y outer, x inner) whose footprint is
    // in-bounds and empty.
    std::optional<GridPosition> find_free_position(GridSize size) const;

    // ========================================================================
    // Queries
    // ========================================================================

    bool contains(const ItemPtr& item) const;
    bool contains(ItemHandle handle) const;

    // Out-of-bounds cells are never free.
    bool is_free(int x, int y) const;
    bool is_free(GridPosition position) const { return is_free(position.x, position.y); }
    bool is_occupied(int x, int y) const { return !is_free(x, y); }
    bool is_occupied(GridPosition position) const { return !is_free(position); }

    bool in_bounds(int x, int y) const;

    // Asserting lookup: throws OutOfBounds or NotFound
    const ItemPtr& get_item(int x, int y) const;
    const ItemPtr& get_item(GridPosition position) const { return get_item(position.x, position.y); }

    // Returns null for an empty or out-of-bounds cell
    ItemPtr try_get_item(int x, int y) const;
    ItemPtr try_get_item(GridPosition position) const { return try_get_item(position.x, position.y); }

    // Anchor of a placed item. Asserting variant throws NullItem or NotFound.
    GridPosition get_position(const ItemPtr& item) const;
    std::optional<GridPosition> try_get_position(const ItemPtr& item) const;

    // Covered cells in row-major order. Asserting variant throws NullItem or NotFound.
    std::vector<GridPosition> get_footprint(const ItemPtr& item) const;
    std::optional<std::vector<GridPosition>> try_get_footprint(const ItemPtr& item) const;

    int count_by_name(const std::string& name) const;
    int free_cell_count() const;

    // ========================================================================
    // Modification
    // ========================================================================

    bool remove(const ItemPtr& item);
    bool remove(const ItemPtr& item, GridPosition& out_position);

    // Fails without touching the grid if the item is absent or the target
    // footprint leaves bounds or overlaps a different item.
    bool move_item(const ItemPtr& item, GridPosition new_position);

    void clear();

    // Repacks items largest-first (area, then longest side; ties keep
    // insertion order) with place_anywhere. Items that no longer fit are
    // removed and returned in ReorganizeResult::dropped.
    ReorganizeResult reorganize_space();

    // ========================================================================
    // Snapshots
    // ========================================================================

    // Throws InvalidDimension if the matrix size differs from the grid.
    void copy_to(ItemMatrix& matrix) const;
    ItemMatrix snapshot() const;

    // ========================================================================
    // Notifications
    // ========================================================================

    core::EventDispatcher& events() { return *m_events; }

    core::ScopedConnection on_added(std::function<void(const ItemAddedEvent&)> callback);
    core::ScopedConnection on_removed(std::function<void(const ItemRemovedEvent&)> callback);
    core::ScopedConnection on_moved(std::function<void(const ItemMovedEvent&)> callback);
    core::ScopedConnection on_cleared(std::function<void(const InventoryClearedEvent&)> callback);
    core::ScopedConnection on_reorganized(std::function<void(const InventoryReorganizedEvent&)> callback);

    // ========================================================================
    // Iteration (insertion order)
    // ========================================================================

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = ItemPtr;
        using difference_type = std::ptrdiff_t;
        using pointer = const ItemPtr*;
        using reference = const ItemPtr&;

        const_iterator() = default;

        reference operator*() const;
        pointer operator->() const { return &**this; }

        const_iterator& operator++() { ++m_it; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++m_it; return tmp; }

        bool operator==(const const_iterator& other) const { return m_it == other.m_it; }
        bool operator!=(const const_iterator& other) const { return m_it != other.m_it; }

    private:
        friend class GridInventory;
        const_iterator(const GridInventory* owner, std::vector<ItemHandle>::const_iterator it)
            : m_owner(owner), m_it(it) {}

        const GridInventory* m_owner = nullptr;
        std::vector<ItemHandle>::const_iterator m_it;
    };

    const_iterator begin() const { return const_iterator(this, m_order.begin()); }
    const_iterator end() const { return const_iterator(this, m_order.end()); }

private:
    struct Placement {
        ItemPtr item;
        GridPosition position;
    };

    size_t cell_index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x);
    }

    void reset_after_move();
    static void validate_size(GridSize size);
    bool is_area_free(GridPosition position, GridSize size, ItemHandle ignore = {}) const;
    void stamp(GridPosition position, GridSize size, ItemHandle handle);
    const Placement* find_placement(const ItemPtr& item) const;
    const Placement& require_placement(const ItemPtr& item) const;
    void erase_placement(ItemHandle handle);

    int m_width = 0;
    int m_height = 0;
    std::vector<ItemHandle> m_cells;                        // Invalid handle = empty
    std::unordered_map<ItemHandle, Placement> m_placements;
    std::vector<ItemHandle> m_order;                        // Insertion order
    std::unique_ptr<core::EventDispatcher> m_events;
};

} // namespace stash::inventory
