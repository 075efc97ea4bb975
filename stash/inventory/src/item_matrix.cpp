#include <stash/inventory/item_matrix.hpp>
#include <stash/inventory/inventory_error.hpp>
#include <algorithm>

namespace stash::inventory {

ItemMatrix::ItemMatrix(int width, int height)
    : m_width(width), m_height(height) {
    if (width <= 0 || height <= 0) {
        throw InventoryError(InventoryErrorCode::InvalidDimension,
            "matrix dimensions must be positive, got " +
            std::to_string(width) + "x" + std::to_string(height));
    }
    m_cells.resize(static_cast<size_t>(width) * static_cast<size_t>(height));
}

void ItemMatrix::fill(const ItemPtr& value) {
    std::fill(m_cells.begin(), m_cells.end(), value);
}

} // namespace stash::inventory
