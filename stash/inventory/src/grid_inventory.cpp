#include <stash/inventory/grid_inventory.hpp>
#include <stash/inventory/inventory_error.hpp>
#include <stash/core/log.hpp>
#include <stash/core/math.hpp>
#include <algorithm>

namespace stash::inventory {

// ============================================================================
// Construction
// ============================================================================

GridInventory::GridInventory(int width, int height)
    : m_width(width)
    , m_height(height)
    , m_events(std::make_unique<core::EventDispatcher>()) {
    if (width <= 0 || height <= 0) {
        throw InventoryError(InventoryErrorCode::InvalidDimension,
            "inventory dimensions must be positive, got " +
            std::to_string(width) + "x" + std::to_string(height));
    }
    m_cells.assign(static_cast<size_t>(width) * static_cast<size_t>(height), ItemHandle{});
}

GridInventory::GridInventory(int width, int height, const ItemList& items)
    : GridInventory(width, height) {
    for (const auto& item : items) {
        if (!place_anywhere(item)) {
            core::log_warning("inventory", "Skipped initial item '{}': no free position or duplicate",
                              item ? item->name() : std::string("<null>"));
        }
    }
}

GridInventory::GridInventory(int width, int height, const PlacementList& placements)
    : GridInventory(width, height) {
    for (const auto& [item, position] : placements) {
        if (!place(item, position)) {
            core::log_warning("inventory", "Skipped initial item '{}' at ({}, {})",
                              item ? item->name() : std::string("<null>"), position.x, position.y);
        }
    }
}

GridInventory::GridInventory(GridInventory&& other)
    : m_width(other.m_width)
    , m_height(other.m_height)
    , m_cells(std::move(other.m_cells))
    , m_placements(std::move(other.m_placements))
    , m_order(std::move(other.m_order))
    , m_events(std::move(other.m_events)) {
    other.reset_after_move();
}

GridInventory& GridInventory::operator=(GridInventory&& other) {
    if (this != &other) {
        m_width = other.m_width;
        m_height = other.m_height;
        m_cells = std::move(other.m_cells);
        m_placements = std::move(other.m_placements);
        m_order = std::move(other.m_order);
        m_events = std::move(other.m_events);
        other.reset_after_move();
    }
    return *this;
}

void GridInventory::reset_after_move() {
    m_cells.assign(static_cast<size_t>(m_width) * static_cast<size_t>(m_height), ItemHandle{});
    m_placements.clear();
    m_order.clear();
    m_events = std::make_unique<core::EventDispatcher>();
}

// ============================================================================
// Placement
// ============================================================================

void GridInventory::validate_size(GridSize size) {
    if (size.x <= 0 || size.y <= 0) {
        throw InventoryError(InventoryErrorCode::InvalidSize,
            "item size must be positive, got " +
            std::to_string(size.x) + "x" + std::to_string(size.y));
    }
}

bool GridInventory::can_place(const ItemPtr& item, int x, int y) const {
    if (!item || !item->handle().valid()) return false;
    validate_size(item->size());
    if (contains(item)) return false;
    return is_area_free({x, y}, item->size());
}

bool GridInventory::can_place(const ItemPtr& item, GridPosition position) const {
    return can_place(item, position.x, position.y);
}

bool GridInventory::place(const ItemPtr& item, int x, int y) {
    if (!can_place(item, x, y)) return false;

    GridPosition position{x, y};
    stamp(position, item->size(), item->handle());
    m_placements.emplace(item->handle(), Placement{item, position});
    m_order.push_back(item->handle());

    m_events->dispatch(ItemAddedEvent{item, position});
    return true;
}

bool GridInventory::place(const ItemPtr& item, GridPosition position) {
    return place(item, position.x, position.y);
}

bool GridInventory::can_place_anywhere(const ItemPtr& item) const {
    if (!item || !item->handle().valid()) return false;
    validate_size(item->size());
    if (contains(item)) return false;
    return find_free_position(item->size()).has_value();
}

bool GridInventory::place_anywhere(const ItemPtr& item) {
    if (!item || !item->handle().valid()) return false;
    validate_size(item->size());
    if (contains(item)) return false;

    auto position = find_free_position(item->size());
    if (!position) return false;
    return place(item, *position);
}

std::optional<GridPosition> GridInventory::find_free_position(GridSize size) const {
    validate_size(size);
    if (size.x > m_width || size.y > m_height) {
        return std::nullopt;
    }

    for (int y = 0; y + size.y <= m_height; ++y) {
        for (int x = 0; x + size.x <= m_width; ++x) {
            if (is_area_free({x, y}, size)) {
                return GridPosition{x, y};
            }
        }
    }
    return std::nullopt;
}

// ============================================================================
// Queries
// ============================================================================

bool GridInventory::contains(const ItemPtr& item) const {
    return item && contains(item->handle());
}

bool GridInventory::contains(ItemHandle handle) const {
    return m_placements.contains(handle);
}

bool GridInventory::in_bounds(int x, int y) const {
    return core::is_in_range(x, 0, m_width - 1) && core::is_in_range(y, 0, m_height - 1);
}

bool GridInventory::is_free(int x, int y) const {
    if (!in_bounds(x, y)) return false;
    return !m_cells[cell_index(x, y)].valid();
}

const ItemPtr& GridInventory::get_item(int x, int y) const {
    if (!in_bounds(x, y)) {
        throw InventoryError(InventoryErrorCode::OutOfBounds,
            "cell (" + std::to_string(x) + ", " + std::to_string(y) + ") is outside the grid");
    }

    ItemHandle handle = m_cells[cell_index(x, y)];
    if (!handle.valid()) {
        throw InventoryError(InventoryErrorCode::NotFound,
            "no item at (" + std::to_string(x) + ", " + std::to_string(y) + ")");
    }
    return m_placements.at(handle).item;
}

ItemPtr GridInventory::try_get_item(int x, int y) const {
    if (!in_bounds(x, y)) return nullptr;

    ItemHandle handle = m_cells[cell_index(x, y)];
    if (!handle.valid()) return nullptr;
    return m_placements.at(handle).item;
}

GridPosition GridInventory::get_position(const ItemPtr& item) const {
    return require_placement(item).position;
}

std::optional<GridPosition> GridInventory::try_get_position(const ItemPtr& item) const {
    const auto* placement = find_placement(item);
    if (!placement) return std::nullopt;
    return placement->position;
}

std::vector<GridPosition> GridInventory::get_footprint(const ItemPtr& item) const {
    const auto& placement = require_placement(item);
    const GridSize size = item->size();

    std::vector<GridPosition> result;
    result.reserve(static_cast<size_t>(size.x) * static_cast<size_t>(size.y));
    for (int y = placement.position.y; y < placement.position.y + size.y; ++y) {
        for (int x = placement.position.x; x < placement.position.x + size.x; ++x) {
            result.emplace_back(x, y);
        }
    }
    return result;
}

std::optional<std::vector<GridPosition>> GridInventory::try_get_footprint(const ItemPtr& item) const {
    if (!contains(item)) return std::nullopt;
    return get_footprint(item);
}

int GridInventory::count_by_name(const std::string& name) const {
    int count = 0;
    for (const auto& [handle, placement] : m_placements) {
        if (placement.item->name() == name) {
            ++count;
        }
    }
    return count;
}

int GridInventory::free_cell_count() const {
    return static_cast<int>(std::count_if(m_cells.begin(), m_cells.end(),
        [](const ItemHandle& handle) { return !handle.valid(); }));
}

// ============================================================================
// Modification
// ============================================================================

bool GridInventory::remove(const ItemPtr& item) {
    GridPosition unused;
    return remove(item, unused);
}

bool GridInventory::remove(const ItemPtr& item, GridPosition& out_position) {
    const auto* placement = find_placement(item);
    if (!placement) return false;

    // Copy before erase; the placement entry is destroyed below
    const ItemPtr removed = placement->item;
    const GridPosition position = placement->position;

    stamp(position, removed->size(), ItemHandle{});
    erase_placement(removed->handle());

    out_position = position;
    m_events->dispatch(ItemRemovedEvent{removed, position});
    return true;
}

bool GridInventory::move_item(const ItemPtr& item, GridPosition new_position) {
    const auto* found = find_placement(item);
    if (!found) return false;

    const GridPosition old_position = found->position;
    if (old_position == new_position) return true;

    // Check the whole target before writing anything
    if (!is_area_free(new_position, item->size(), item->handle())) {
        return false;
    }

    stamp(old_position, item->size(), ItemHandle{});
    stamp(new_position, item->size(), item->handle());
    m_placements.at(item->handle()).position = new_position;

    m_events->dispatch(ItemMovedEvent{found->item, new_position, old_position});
    return true;
}

void GridInventory::clear() {
    if (m_order.empty()) return;

    const size_t removed_count = m_order.size();
    std::fill(m_cells.begin(), m_cells.end(), ItemHandle{});
    m_placements.clear();
    m_order.clear();

    m_events->dispatch(InventoryClearedEvent{removed_count});
}

ReorganizeResult GridInventory::reorganize_space() {
    ReorganizeResult result;
    if (m_order.empty()) return result;

    std::vector<Placement> sorted;
    sorted.reserve(m_order.size());
    for (const auto& handle : m_order) {
        sorted.push_back(m_placements.at(handle));
    }

    std::stable_sort(sorted.begin(), sorted.end(),
        [](const Placement& a, const Placement& b) {
            if (a.item->area() != b.item->area()) {
                return a.item->area() > b.item->area();
            }
            return a.item->longest_side() > b.item->longest_side();
        });

    std::fill(m_cells.begin(), m_cells.end(), ItemHandle{});
    m_placements.clear();
    m_order.clear();

    for (const auto& placement : sorted) {
        if (place_anywhere(placement.item)) {
            ++result.placed_count;
            continue;
        }

        core::log_warning("inventory", "Reorganize dropped '{}' ({}x{}): no free position left",
                          placement.item->name(), placement.item->width(), placement.item->height());
        result.dropped.push_back(placement.item);
        m_events->dispatch(ItemRemovedEvent{placement.item, placement.position});
    }

    core::log_debug("inventory", "Reorganized {} items ({} dropped)",
                    result.placed_count, result.dropped.size());
    m_events->dispatch(InventoryReorganizedEvent{result.placed_count, result.dropped});
    return result;
}

// ============================================================================
// Snapshots
// ============================================================================

void GridInventory::copy_to(ItemMatrix& matrix) const {
    if (matrix.width() != m_width || matrix.height() != m_height) {
        throw InventoryError(InventoryErrorCode::InvalidDimension,
            "matrix is " + std::to_string(matrix.width()) + "x" + std::to_string(matrix.height()) +
            ", inventory is " + std::to_string(m_width) + "x" + std::to_string(m_height));
    }

    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            ItemHandle handle = m_cells[cell_index(x, y)];
            matrix.at(x, y) = handle.valid() ? m_placements.at(handle).item : nullptr;
        }
    }
}

ItemMatrix GridInventory::snapshot() const {
    ItemMatrix matrix(m_width, m_height);
    copy_to(matrix);
    return matrix;
}

// ============================================================================
// Notifications
// ============================================================================

core::ScopedConnection GridInventory::on_added(std::function<void(const ItemAddedEvent&)> callback) {
    return m_events->subscribe<ItemAddedEvent>(std::move(callback));
}

core::ScopedConnection GridInventory::on_removed(std::function<void(const ItemRemovedEvent&)> callback) {
    return m_events->subscribe<ItemRemovedEvent>(std::move(callback));
}

core::ScopedConnection GridInventory::on_moved(std::function<void(const ItemMovedEvent&)> callback) {
    return m_events->subscribe<ItemMovedEvent>(std::move(callback));
}

core::ScopedConnection GridInventory::on_cleared(std::function<void(const InventoryClearedEvent&)> callback) {
    return m_events->subscribe<InventoryClearedEvent>(std::move(callback));
}

core::ScopedConnection GridInventory::on_reorganized(std::function<void(const InventoryReorganizedEvent&)> callback) {
    return m_events->subscribe<InventoryReorganizedEvent>(std::move(callback));
}

// ============================================================================
// Internals
// ============================================================================

GridInventory::const_iterator::reference GridInventory::const_iterator::operator*() const {
    return m_owner->m_placements.at(*m_it).item;
}

bool GridInventory::is_area_free(GridPosition position, GridSize size, ItemHandle ignore) const {
    if (position.x < 0 || position.y < 0) return false;
    if (size.x > m_width - position.x || size.y > m_height - position.y) return false;

    for (int y = position.y; y < position.y + size.y; ++y) {
        for (int x = position.x; x < position.x + size.x; ++x) {
            ItemHandle occupant = m_cells[cell_index(x, y)];
            if (occupant.valid() && occupant != ignore) {
                return false;
            }
        }
    }
    return true;
}

void GridInventory::stamp(GridPosition position, GridSize size, ItemHandle handle) {
    for (int y = position.y; y < position.y + size.y; ++y) {
        for (int x = position.x; x < position.x + size.x; ++x) {
            m_cells[cell_index(x, y)] = handle;
        }
    }
}

const GridInventory::Placement* GridInventory::find_placement(const ItemPtr& item) const {
    if (!item) return nullptr;
    auto it = m_placements.find(item->handle());
    return it != m_placements.end() ? &it->second : nullptr;
}

const GridInventory::Placement& GridInventory::require_placement(const ItemPtr& item) const {
    if (!item) {
        throw InventoryError(InventoryErrorCode::NullItem, "item must not be null");
    }
    const auto* placement = find_placement(item);
    if (!placement) {
        throw InventoryError(InventoryErrorCode::NotFound,
            "item '" + item->name() + "' is not in the inventory");
    }
    return *placement;
}

void GridInventory::erase_placement(ItemHandle handle) {
    m_placements.erase(handle);
    m_order.erase(std::remove(m_order.begin(), m_order.end(), handle), m_order.end());
}

} // namespace stash::inventory
