// Example: Packing a backpack with GridInventory
// Places a few items, listens for changes, moves one around and then
// compacts the grid largest-first.

#include <stash/inventory/inventory.hpp>
#include <stash/core/log.hpp>
#include <iostream>

using namespace stash;
using namespace stash::inventory;

int main() {
    core::set_log_level(core::LogLevel::Debug);

    GridInventory backpack(6, 4);

    // Observers stay connected while their ScopedConnection lives
    auto added = backpack.on_added([](const ItemAddedEvent& e) {
        std::cout << "+ " << e.item->name() << " at (" << e.position.x << ", " << e.position.y << ")" << std::endl;
    });
    auto moved = backpack.on_moved([](const ItemMovedEvent& e) {
        std::cout << "~ " << e.item->name() << " (" << e.previous_position.x << ", " << e.previous_position.y
                  << ") -> (" << e.position.x << ", " << e.position.y << ")" << std::endl;
    });

    auto sword = Item::create("Sword", {1, 4});
    auto shield = Item::create("Shield", {2, 2});
    auto potion = Item::create("Potion", {1, 1});
    auto bow = Item::create("Bow", {3, 1});

    bool packed = backpack.place(potion, 5, 3)
               && backpack.place(shield, 2, 1)
               && backpack.place_anywhere(sword)
               && backpack.place_anywhere(bow);
    if (!packed) {
        std::cerr << "Backpack is too small" << std::endl;
        return 1;
    }

    std::cout << std::endl << format_grid(backpack) << std::endl << std::endl;

    // Blocked by the shield, nothing changes
    if (!backpack.move_item(potion, {3, 2})) {
        std::cout << "Potion cannot move onto the shield" << std::endl;
    }
    if (backpack.move_item(potion, {5, 0})) {
        std::cout << "Potion moved to the top right corner" << std::endl;
    }

    // Where would a 2x2 chest fit right now?
    if (auto spot = backpack.find_free_position({2, 2})) {
        std::cout << "A 2x2 chest fits at (" << spot->x << ", " << spot->y << ")" << std::endl;
    }

    ReorganizeResult result = backpack.reorganize_space();
    std::cout << std::endl << "After reorganize (" << result.placed_count << " placed, "
              << result.dropped.size() << " dropped):" << std::endl;
    std::cout << format_grid(backpack) << std::endl;
    std::cout << format_placements(backpack) << std::endl;

    return 0;
}
