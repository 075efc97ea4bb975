#pragma once

#include <stash/inventory/item_matrix.hpp>
#include <string>

namespace stash::inventory {

class GridInventory;

// Renders one line per row, each cell as "[name]" or "[]".
// Rows are joined with '\n'; there is no trailing newline.
std::string format_grid(const ItemMatrix& matrix);
std::string format_grid(const GridInventory& inventory);

// "name (w x h) at (x, y)" per placed item, one per line, insertion order
std::string format_placements(const GridInventory& inventory);

} // namespace stash::inventory
