#include <catch2/catch_test_macros.hpp>
#include <stash/inventory/grid_inventory.hpp>
#include <stash/inventory/inventory_error.hpp>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <vector>

using namespace stash::inventory;

namespace {

ItemPtr make_item(const std::string& name, int w, int h) {
    return Item::create(name, {w, h});
}

template<typename Fn>
std::optional<InventoryErrorCode> thrown_code(Fn&& fn) {
    try {
        fn();
    } catch (const InventoryError& e) {
        return e.code();
    }
    return std::nullopt;
}

// Every placed footprint is fully stamped with its own item and nothing else
// is stamped anywhere.
void require_consistent(const GridInventory& inv) {
    ItemMatrix snap = inv.snapshot();

    int covered = 0;
    for (const auto& item : inv) {
        for (const auto& cell : inv.get_footprint(item)) {
            REQUIRE(snap.at(cell.x, cell.y) == item);
            ++covered;
        }
    }

    int stamped = 0;
    for (int y = 0; y < snap.height(); ++y) {
        for (int x = 0; x < snap.width(); ++x) {
            if (snap.at(x, y)) {
                ++stamped;
                REQUIRE(inv.contains(snap.at(x, y)));
            }
        }
    }

    REQUIRE(stamped == covered);
    REQUIRE(inv.free_cell_count() == inv.width() * inv.height() - covered);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("GridInventory construction", "[inventory][grid]") {
    SECTION("Valid dimensions") {
        GridInventory inv(5, 3);
        REQUIRE(inv.width() == 5);
        REQUIRE(inv.height() == 3);
        REQUIRE(inv.empty());
        REQUIRE(inv.count() == 0);
        REQUIRE(inv.free_cell_count() == 15);
    }

    SECTION("Non-positive dimensions are rejected") {
        REQUIRE(thrown_code([] { GridInventory inv(0, 3); }) == InventoryErrorCode::InvalidDimension);
        REQUIRE(thrown_code([] { GridInventory inv(3, 0); }) == InventoryErrorCode::InvalidDimension);
        REQUIRE(thrown_code([] { GridInventory inv(-2, 4); }) == InventoryErrorCode::InvalidDimension);
    }

    SECTION("Seeded with bare items") {
        auto big = make_item("Chest", 2, 2);
        auto a = make_item("Gem", 1, 1);
        auto b = make_item("Gem", 1, 1);
        auto huge = make_item("Boulder", 4, 4);

        GridInventory inv(3, 2, GridInventory::ItemList{big, a, big, huge, nullptr, b});

        REQUIRE(inv.count() == 3);
        REQUIRE(inv.get_position(big) == GridPosition(0, 0));
        REQUIRE(inv.get_position(a) == GridPosition(2, 0));
        REQUIRE(inv.get_position(b) == GridPosition(2, 1));
        REQUIRE_FALSE(inv.contains(huge));
        require_consistent(inv);
    }

    SECTION("Seeded with explicit positions") {
        auto a = make_item("Sword", 1, 3);
        auto b = make_item("Shield", 2, 2);
        auto c = make_item("Dagger", 1, 2);

        GridInventory inv(4, 3, GridInventory::PlacementList{
            {a, {0, 0}},
            {b, {1, 0}},
            {c, {2, 1}},     // Overlaps the shield, skipped
        });

        REQUIRE(inv.count() == 2);
        REQUIRE(inv.contains(a));
        REQUIRE(inv.contains(b));
        REQUIRE_FALSE(inv.contains(c));
        require_consistent(inv);
    }

    SECTION("Seeding with an invalid size still throws") {
        auto flat = make_item("Paper", 0, 1);
        REQUIRE(thrown_code([&] { GridInventory inv(3, 3, GridInventory::ItemList{flat}); })
                == InventoryErrorCode::InvalidSize);
    }
}

// ============================================================================
// can_place / place
// ============================================================================

TEST_CASE("GridInventory can_place", "[inventory][grid]") {
    GridInventory inv(4, 3);
    auto blocker = make_item("Blocker", 2, 1);
    REQUIRE(inv.place(blocker, 1, 1));

    auto item = make_item("Item", 2, 2);

    SECTION("Null item") {
        REQUIRE_FALSE(inv.can_place(nullptr, 0, 0));
    }

    SECTION("Fits on empty cells") {
        auto small = make_item("Small", 1, 1);
        REQUIRE(inv.can_place(small, 0, 0));
        REQUIRE(inv.can_place(small, GridPosition(3, 2)));
    }

    SECTION("Footprint over an occupied cell") {
        REQUIRE_FALSE(inv.can_place(item, 0, 0));
        REQUIRE_FALSE(inv.can_place(item, 2, 1));
    }

    SECTION("Anchor or footprint out of bounds") {
        REQUIRE_FALSE(inv.can_place(item, -1, 0));
        REQUIRE_FALSE(inv.can_place(item, 0, -1));
        REQUIRE_FALSE(inv.can_place(item, 3, 0));   // Anchor in bounds, footprint is not
        REQUIRE_FALSE(inv.can_place(item, 0, 2));
        REQUIRE_FALSE(inv.can_place(item, 4, 0));
    }

    SECTION("Already placed item") {
        REQUIRE_FALSE(inv.can_place(blocker, 0, 0));
    }

    SECTION("Non-positive size is a contract violation") {
        auto zero = make_item("Zero", 0, 2);
        auto negative = make_item("Negative", 1, -1);
        REQUIRE(thrown_code([&] { (void)inv.can_place(zero, 0, 0); }) == InventoryErrorCode::InvalidSize);
        REQUIRE(thrown_code([&] { (void)inv.can_place(negative, 0, 0); }) == InventoryErrorCode::InvalidSize);
        REQUIRE(thrown_code([&] { (void)inv.place(zero, 0, 0); }) == InventoryErrorCode::InvalidSize);
    }

    SECTION("Query has no side effects") {
        REQUIRE(inv.can_place(make_item("Probe", 1, 1), 0, 0));
        REQUIRE(inv.count() == 1);
        REQUIRE(inv.free_cell_count() == 10);
    }
}

TEST_CASE("GridInventory place stamps the full footprint", "[inventory][grid]") {
    GridInventory inv(5, 4);
    auto item = make_item("Armor", 2, 3);

    REQUIRE(inv.place(item, 1, 1));
    REQUIRE(inv.contains(item));
    REQUIRE(inv.count() == 1);

    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 5; ++x) {
            bool inside = x >= 1 && x <= 2 && y >= 1 && y <= 3;
            REQUIRE(inv.is_occupied(x, y) == inside);
            REQUIRE((inv.try_get_item(x, y) == item) == inside);
        }
    }

    SECTION("Second placement of the same item fails") {
        REQUIRE_FALSE(inv.place(item, 3, 0));
        REQUIRE(inv.get_position(item) == GridPosition(1, 1));
    }

    SECTION("Failed placement leaves the grid unchanged") {
        auto other = make_item("Bow", 3, 1);
        REQUIRE_FALSE(inv.place(other, 0, 1));
        REQUIRE_FALSE(inv.contains(other));
        REQUIRE(inv.free_cell_count() == 14);
    }

    require_consistent(inv);
}

// ============================================================================
// Free-space search
// ============================================================================

TEST_CASE("GridInventory find_free_position is row-major first fit", "[inventory][grid]") {
    GridInventory inv(5, 5);

    REQUIRE(inv.find_free_position({2, 2}) == GridPosition(0, 0));

    auto bar = make_item("Bar", 5, 1);
    REQUIRE(inv.place(bar, 0, 0));
    REQUIRE(inv.find_free_position({2, 2}) == GridPosition(0, 1));

    SECTION("Scans x before moving to the next row") {
        auto left = make_item("Left", 1, 4);
        REQUIRE(inv.place(left, 0, 1));
        REQUIRE(inv.find_free_position({2, 2}) == GridPosition(1, 1));
        REQUIRE(inv.find_free_position({4, 1}) == GridPosition(1, 1));
    }

    SECTION("Sizes larger than the grid are never found") {
        REQUIRE_FALSE(inv.find_free_position({6, 1}).has_value());
        REQUIRE_FALSE(inv.find_free_position({1, 6}).has_value());
    }

    SECTION("No qualifying anchor") {
        REQUIRE_FALSE(inv.find_free_position({5, 5}).has_value());
        REQUIRE(inv.find_free_position({5, 4}) == GridPosition(0, 1));
    }

    SECTION("Non-positive size throws") {
        REQUIRE(thrown_code([&] { (void)inv.find_free_position({0, 1}); }) == InventoryErrorCode::InvalidSize);
    }
}

TEST_CASE("GridInventory place_anywhere", "[inventory][grid]") {
    GridInventory inv(3, 2);
    auto a = make_item("A", 2, 2);
    auto b = make_item("B", 1, 2);
    auto c = make_item("C", 1, 1);

    REQUIRE(inv.can_place_anywhere(a));
    REQUIRE(inv.place_anywhere(a));
    REQUIRE(inv.get_position(a) == GridPosition(0, 0));

    SECTION("Already present") {
        REQUIRE_FALSE(inv.can_place_anywhere(a));
        REQUIRE_FALSE(inv.place_anywhere(a));
    }

    SECTION("Fills the remaining column then reports full") {
        REQUIRE(inv.place_anywhere(b));
        REQUIRE(inv.get_position(b) == GridPosition(2, 0));
        REQUIRE_FALSE(inv.can_place_anywhere(c));
        REQUIRE_FALSE(inv.place_anywhere(c));
        REQUIRE(inv.free_cell_count() == 0);
    }

    SECTION("Null item") {
        REQUIRE_FALSE(inv.can_place_anywhere(nullptr));
        REQUIRE_FALSE(inv.place_anywhere(nullptr));
    }
}

// ============================================================================
// Point queries
// ============================================================================

TEST_CASE("GridInventory point queries", "[inventory][grid]") {
    GridInventory inv(4, 4);
    auto item = make_item("Helm", 2, 2);
    REQUIRE(inv.place(item, 2, 2));

    SECTION("Out-of-bounds coordinates are never free") {
        REQUIRE_FALSE(inv.is_free(-1, 0));
        REQUIRE_FALSE(inv.is_free(0, 4));
        REQUIRE_FALSE(inv.is_free(GridPosition(4, 4)));
        REQUIRE(inv.is_occupied(-1, -1));
        REQUIRE(inv.is_free(0, 0));
    }

    SECTION("Bounds") {
        REQUIRE(inv.in_bounds(0, 0));
        REQUIRE(inv.in_bounds(3, 3));
        REQUIRE_FALSE(inv.in_bounds(4, 3));
        REQUIRE_FALSE(inv.in_bounds(0, -1));
    }

    SECTION("Any covered cell finds the item") {
        REQUIRE(inv.get_item(2, 2) == item);
        REQUIRE(inv.get_item(3, 3) == item);
        REQUIRE(inv.get_item(GridPosition(3, 2)) == item);
        REQUIRE(inv.try_get_item(2, 3) == item);
    }

    SECTION("Try variant returns null without throwing") {
        REQUIRE(inv.try_get_item(0, 0) == nullptr);
        REQUIRE(inv.try_get_item(10, 10) == nullptr);
        REQUIRE(inv.try_get_item(-1, 2) == nullptr);
    }

    SECTION("Asserting variant throws") {
        REQUIRE(thrown_code([&] { (void)inv.get_item(0, 0); }) == InventoryErrorCode::NotFound);
        REQUIRE(thrown_code([&] { (void)inv.get_item(4, 0); }) == InventoryErrorCode::OutOfBounds);
    }
}

TEST_CASE("GridInventory footprint and position lookups", "[inventory][grid]") {
    GridInventory inv(4, 4);
    auto item = make_item("Cloak", 2, 2);
    auto absent = make_item("Ghost", 1, 1);
    REQUIRE(inv.place(item, 1, 1));

    SECTION("Footprint is row-major within the item bounds") {
        std::vector<GridPosition> expected{{1, 1}, {2, 1}, {1, 2}, {2, 2}};
        REQUIRE(inv.get_footprint(item) == expected);
        REQUIRE(inv.try_get_footprint(item) == expected);
    }

    SECTION("Anchor lookup") {
        REQUIRE(inv.get_position(item) == GridPosition(1, 1));
        REQUIRE(inv.try_get_position(item) == GridPosition(1, 1));
    }

    SECTION("Absent items") {
        REQUIRE_FALSE(inv.try_get_footprint(absent).has_value());
        REQUIRE_FALSE(inv.try_get_position(absent).has_value());
        REQUIRE(thrown_code([&] { (void)inv.get_footprint(absent); }) == InventoryErrorCode::NotFound);
        REQUIRE(thrown_code([&] { (void)inv.get_position(absent); }) == InventoryErrorCode::NotFound);
    }

    SECTION("Null items") {
        REQUIRE_FALSE(inv.try_get_footprint(nullptr).has_value());
        REQUIRE(thrown_code([&] { (void)inv.get_footprint(nullptr); }) == InventoryErrorCode::NullItem);
        REQUIRE_FALSE(inv.contains(nullptr));
    }
}

TEST_CASE("GridInventory count_by_name", "[inventory][grid]") {
    GridInventory inv(6, 2);
    REQUIRE(inv.place_anywhere(make_item("Potion", 1, 1)));
    REQUIRE(inv.place_anywhere(make_item("Potion", 1, 1)));
    REQUIRE(inv.place_anywhere(make_item("potion", 1, 1)));
    REQUIRE(inv.place_anywhere(make_item("Sword", 1, 2)));

    REQUIRE(inv.count_by_name("Potion") == 2);
    REQUIRE(inv.count_by_name("potion") == 1);
    REQUIRE(inv.count_by_name("Sword") == 1);
    REQUIRE(inv.count_by_name("Shield") == 0);
}

// ============================================================================
// Removal
// ============================================================================

TEST_CASE("GridInventory remove", "[inventory][grid]") {
    GridInventory inv(4, 3);
    auto keep = make_item("Keep", 1, 1);
    REQUIRE(inv.place(keep, 0, 0));

    auto item = make_item("Axe", 2, 3);

    SECTION("Place then remove restores the grid") {
        ItemMatrix before = inv.snapshot();

        REQUIRE(inv.place(item, 2, 0));
        REQUIRE(inv.remove(item));

        ItemMatrix after = inv.snapshot();
        for (int y = 0; y < inv.height(); ++y) {
            for (int x = 0; x < inv.width(); ++x) {
                REQUIRE(after.at(x, y) == before.at(x, y));
            }
        }
        REQUIRE_FALSE(inv.contains(item));
        REQUIRE(inv.count() == 1);
    }

    SECTION("Overload reports the previous anchor") {
        REQUIRE(inv.place(item, 1, 0));
        GridPosition previous{-1, -1};
        REQUIRE(inv.remove(item, previous));
        REQUIRE(previous == GridPosition(1, 0));
    }

    SECTION("Absent or null items are not removed") {
        GridPosition untouched{7, 7};
        REQUIRE_FALSE(inv.remove(item));
        REQUIRE_FALSE(inv.remove(item, untouched));
        REQUIRE(untouched == GridPosition(7, 7));
        REQUIRE_FALSE(inv.remove(nullptr));
        REQUIRE(inv.count() == 1);
    }

    SECTION("Removed item can be placed again") {
        REQUIRE(inv.place(item, 2, 0));
        REQUIRE(inv.remove(item));
        REQUIRE(inv.place(item, 1, 0));
        REQUIRE(inv.get_position(item) == GridPosition(1, 0));
    }

    require_consistent(inv);
}

TEST_CASE("GridInventory clear", "[inventory][grid]") {
    GridInventory inv(3, 3);
    auto a = make_item("A", 1, 1);
    REQUIRE(inv.place_anywhere(a));
    REQUIRE(inv.place_anywhere(make_item("B", 2, 2)));

    inv.clear();

    REQUIRE(inv.empty());
    REQUIRE(inv.free_cell_count() == 9);
    REQUIRE_FALSE(inv.contains(a));
    REQUIRE(inv.begin() == inv.end());

    inv.clear();
    REQUIRE(inv.empty());

    REQUIRE(inv.place(a, 2, 2));
    REQUIRE(inv.count() == 1);
}

// ============================================================================
// Moving
// ============================================================================

TEST_CASE("GridInventory move_item", "[inventory][grid]") {
    SECTION("Rejected move preserves both items") {
        GridInventory inv(4, 2);
        auto first = make_item("First", 2, 2);
        auto second = make_item("Second", 2, 2);
        REQUIRE(inv.place(first, 0, 0));
        REQUIRE(inv.place(second, 2, 0));

        REQUIRE_FALSE(inv.move_item(first, {1, 0}));

        REQUIRE(inv.get_position(first) == GridPosition(0, 0));
        REQUIRE(inv.get_position(second) == GridPosition(2, 0));
        REQUIRE(inv.get_item(1, 1) == first);
        REQUIRE(inv.get_item(2, 1) == second);
        require_consistent(inv);
    }

    SECTION("Own footprint does not block the move") {
        GridInventory inv(3, 2);
        auto item = make_item("Crate", 2, 2);
        REQUIRE(inv.place(item, 0, 0));

        REQUIRE(inv.move_item(item, {1, 0}));

        REQUIRE(inv.get_position(item) == GridPosition(1, 0));
        REQUIRE(inv.is_free(0, 0));
        REQUIRE(inv.is_free(0, 1));
        REQUIRE(inv.get_item(2, 1) == item);
        require_consistent(inv);
    }

    SECTION("Out of bounds targets are rejected") {
        GridInventory inv(3, 3);
        auto item = make_item("Rod", 1, 2);
        REQUIRE(inv.place(item, 0, 0));

        REQUIRE_FALSE(inv.move_item(item, {0, 2}));
        REQUIRE_FALSE(inv.move_item(item, {-1, 0}));
        REQUIRE_FALSE(inv.move_item(item, {3, 0}));
        REQUIRE(inv.get_position(item) == GridPosition(0, 0));
        require_consistent(inv);
    }

    SECTION("Absent and null items cannot move") {
        GridInventory inv(3, 3);
        REQUIRE_FALSE(inv.move_item(make_item("Loose", 1, 1), {0, 0}));
        REQUIRE_FALSE(inv.move_item(nullptr, {0, 0}));
        REQUIRE(inv.empty());
    }

    SECTION("Moving onto the current anchor succeeds") {
        GridInventory inv(3, 3);
        auto item = make_item("Stone", 1, 1);
        REQUIRE(inv.place(item, 1, 1));
        REQUIRE(inv.move_item(item, {1, 1}));
        REQUIRE(inv.get_position(item) == GridPosition(1, 1));
    }
}

// ============================================================================
// Snapshots and iteration
// ============================================================================

TEST_CASE("GridInventory copy_to", "[inventory][grid]") {
    GridInventory inv(3, 2);
    auto item = make_item("Map", 2, 1);
    REQUIRE(inv.place(item, 1, 1));

    SECTION("Matching matrix receives the occupancy") {
        ItemMatrix matrix(3, 2);
        matrix.fill(make_item("Stale", 1, 1));
        inv.copy_to(matrix);

        REQUIRE(matrix.at(0, 0) == nullptr);
        REQUIRE(matrix.at(2, 0) == nullptr);
        REQUIRE(matrix.at(0, 1) == nullptr);
        REQUIRE(matrix.at(1, 1) == item);
        REQUIRE(matrix.at(2, 1) == item);
    }

    SECTION("Mismatched matrix is rejected") {
        ItemMatrix wrong(2, 3);
        REQUIRE(thrown_code([&] { inv.copy_to(wrong); }) == InventoryErrorCode::InvalidDimension);

        ItemMatrix unsized;
        REQUIRE(thrown_code([&] { inv.copy_to(unsized); }) == InventoryErrorCode::InvalidDimension);
    }

    SECTION("Snapshot is independent of later changes") {
        ItemMatrix snap = inv.snapshot();
        REQUIRE(inv.remove(item));
        REQUIRE(snap.at(1, 1) == item);
    }
}

TEST_CASE("GridInventory iteration", "[inventory][grid]") {
    GridInventory inv(4, 4);
    auto a = make_item("A", 1, 1);
    auto b = make_item("B", 1, 1);
    auto c = make_item("C", 1, 1);
    REQUIRE(inv.place_anywhere(a));
    REQUIRE(inv.place_anywhere(b));
    REQUIRE(inv.place_anywhere(c));

    auto collect = [&inv]() {
        std::vector<ItemPtr> out;
        for (const auto& item : inv) {
            out.push_back(item);
        }
        return out;
    };

    REQUIRE(collect() == std::vector<ItemPtr>{a, b, c});
    REQUIRE(collect() == std::vector<ItemPtr>{a, b, c});   // Restartable

    REQUIRE(inv.remove(a));
    REQUIRE(inv.place_anywhere(a));
    REQUIRE(collect() == std::vector<ItemPtr>{b, c, a});

    REQUIRE(std::distance(inv.begin(), inv.end()) == 3);
}

// ============================================================================
// Invariants under arbitrary operation sequences
// ============================================================================

TEST_CASE("GridInventory stays consistent under random operations", "[inventory][grid][invariant]") {
    constexpr int width = 7;
    constexpr int height = 5;
    GridInventory inv(width, height);

    std::mt19937 rng(20240517u);
    std::uniform_int_distribution<int> side(1, 3);
    std::uniform_int_distribution<int> op(0, 3);
    std::uniform_int_distribution<int> coord(-1, width);

    std::vector<ItemPtr> pool;
    for (int i = 0; i < 16; ++i) {
        pool.push_back(make_item("Item" + std::to_string(i), side(rng), side(rng)));
    }
    std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);

    for (int step = 0; step < 400; ++step) {
        const ItemPtr& item = pool[pick(rng)];
        GridPosition target{coord(rng), coord(rng)};

        switch (op(rng)) {
            case 0:
                (void)inv.place(item, target);
                break;
            case 1:
                (void)inv.place_anywhere(item);
                break;
            case 2:
                (void)inv.remove(item);
                break;
            default: {
                auto before = inv.try_get_position(item);
                if (!inv.move_item(item, target)) {
                    REQUIRE(inv.try_get_position(item) == before);
                } else {
                    REQUIRE(inv.get_position(item) == target);
                }
                break;
            }
        }

        require_consistent(inv);
    }
}
