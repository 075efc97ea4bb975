#include <stash/inventory/grid_format.hpp>
#include <stash/inventory/grid_inventory.hpp>
#include <format>

namespace stash::inventory {

std::string format_grid(const ItemMatrix& matrix) {
    std::string out;

    for (int y = 0; y < matrix.height(); ++y) {
        if (y > 0) {
            out += '\n';
        }
        for (int x = 0; x < matrix.width(); ++x) {
            const ItemPtr& item = matrix.at(x, y);
            out += '[';
            if (item) {
                out += item->name();
            }
            out += ']';
        }
    }

    return out;
}

std::string format_grid(const GridInventory& inventory) {
    return format_grid(inventory.snapshot());
}

std::string format_placements(const GridInventory& inventory) {
    std::string out;
    for (const auto& item : inventory) {
        GridPosition pos = inventory.get_position(item);
        if (!out.empty()) {
            out += '\n';
        }
        out += std::format("{} ({}x{}) at ({}, {})",
                           item->name(), item->width(), item->height(), pos.x, pos.y);
    }
    return out;
}

} // namespace stash::inventory
