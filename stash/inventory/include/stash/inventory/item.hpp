#pragma once

#include <stash/core/math.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stash::inventory {

using GridSize = core::IVec2;
using GridPosition = core::IVec2;

// ============================================================================
// Item Handle
// ============================================================================

// Identifies one item instance. Two items with the same name and size are
// still distinct items; two placements never share a handle.
struct ItemHandle {
    uint64_t id = UINT64_MAX;

    bool valid() const { return id != UINT64_MAX; }
    bool operator==(const ItemHandle& other) const { return id == other.id; }
    bool operator!=(const ItemHandle& other) const { return id != other.id; }
};

// ============================================================================
// Item
// ============================================================================

class Item;
using ItemPtr = std::shared_ptr<const Item>;

class Item {
    struct CreateTag {
        explicit CreateTag() = default;
    };

public:
    // The only way to obtain an item; every call issues a fresh handle.
    // Size is not validated here; the inventory rejects non-positive sizes
    // when the item is used.
    static ItemPtr create(const std::string& name, GridSize size);

    ItemHandle handle() const { return m_handle; }
    const std::string& name() const { return m_name; }
    GridSize size() const { return m_size; }
    int width() const { return m_size.x; }
    int height() const { return m_size.y; }

    int area() const { return core::area(m_size); }
    int longest_side() const { return core::longest_side(m_size); }
    bool has_valid_size() const { return m_size.x > 0 && m_size.y > 0; }

    // Callable only through create()
    Item(CreateTag, ItemHandle handle, std::string name, GridSize size);

    // A copy would share the original's handle
    Item(const Item&) = delete;
    Item& operator=(const Item&) = delete;

private:
    ItemHandle m_handle;
    std::string m_name;
    GridSize m_size;
};

// ============================================================================
// Item Definition
// ============================================================================

struct ItemDefinition {
    std::string item_id;                // Unique catalog key
    std::string display_name;           // Becomes Item::name()
    GridSize size{1, 1};
    std::vector<std::string> tags;

    bool has_tag(const std::string& tag) const;
};

// ============================================================================
// Item Catalog
// ============================================================================

class ItemCatalog {
public:
    ItemCatalog() = default;

    // Registration
    void register_item(const ItemDefinition& def);

    // Loads a JSON array of definitions: [{"id", "name", "size": [w, h], "tags"}]
    // Returns false if the file could not be read or any entry was rejected;
    // valid entries are registered either way.
    bool load(const std::string& path);
    bool load_from_json(const std::string& text);

    // Lookup
    const ItemDefinition* get(const std::string& item_id) const;
    bool exists(const std::string& item_id) const;
    size_t size() const { return m_items.size(); }

    // Creates a new item instance from a definition, or null for an unknown id
    ItemPtr create(const std::string& item_id) const;

    std::vector<std::string> get_all_item_ids() const;
    std::vector<std::string> get_items_by_tag(const std::string& tag) const;

    void clear();

private:
    std::unordered_map<std::string, ItemDefinition> m_items;
};

// Parses one catalog entry. Exposed for the settings loader and tests.
std::optional<ItemDefinition> parse_item_definition(const nlohmann::json& j, std::string& out_error);

} // namespace stash::inventory

template<>
struct std::hash<stash::inventory::ItemHandle> {
    size_t operator()(const stash::inventory::ItemHandle& handle) const noexcept {
        return std::hash<uint64_t>{}(handle.id);
    }
};
