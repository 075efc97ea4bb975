#include <stash/inventory/item.hpp>
#include <stash/data/json_loader.hpp>
#include <stash/core/log.hpp>
#include <algorithm>
#include <atomic>

namespace stash::inventory {

namespace {

std::atomic<uint64_t> s_next_item_id{0};

} // namespace

// ============================================================================
// Item
// ============================================================================

Item::Item(CreateTag, ItemHandle handle, std::string name, GridSize size)
    : m_handle(handle), m_name(std::move(name)), m_size(size) {}

ItemPtr Item::create(const std::string& name, GridSize size) {
    ItemHandle handle{s_next_item_id++};
    return std::make_shared<const Item>(CreateTag{}, handle, name, size);
}

// ============================================================================
// ItemDefinition
// ============================================================================

bool ItemDefinition::has_tag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

std::optional<ItemDefinition> parse_item_definition(const nlohmann::json& j, std::string& out_error) {
    using namespace data::json_helpers;

    if (!require_string(j, "id", out_error)) return std::nullopt;
    if (!require_ivec2(j, "size", out_error)) return std::nullopt;

    ItemDefinition def;
    def.item_id = j["id"].get<std::string>();
    def.display_name = get_string(j, "name", def.item_id);
    def.size = *get_ivec2(j, "size");
    def.tags = get_string_array(j, "tags");

    if (def.item_id.empty()) {
        out_error = "Field 'id' must not be empty";
        return std::nullopt;
    }
    if (def.size.x <= 0 || def.size.y <= 0) {
        out_error = "Item '" + def.item_id + "' has non-positive size";
        return std::nullopt;
    }
    return def;
}

// ============================================================================
// ItemCatalog
// ============================================================================

void ItemCatalog::register_item(const ItemDefinition& def) {
    if (def.item_id.empty()) {
        core::log_error("inventory", "Cannot register item with empty ID");
        return;
    }

    if (m_items.contains(def.item_id)) {
        core::log_warning("inventory", "Overwriting existing item definition: {}", def.item_id);
    }

    m_items[def.item_id] = def;
    core::log_debug("inventory", "Registered item: {} ({}x{})",
                    def.item_id, def.size.x, def.size.y);
}

bool ItemCatalog::load(const std::string& path) {
    core::log_info("inventory", "Loading items from: {}", path);

    auto result = data::load_json_array<ItemDefinition>(path, parse_item_definition);
    data::log_load_result(result, path, "inventory");

    for (const auto& def : result.items) {
        register_item(def);
    }
    return result.success();
}

bool ItemCatalog::load_from_json(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        core::log_error("inventory", "Invalid item catalog JSON: {}", e.what());
        return false;
    }

    auto result = data::parse_json_array<ItemDefinition>(root, parse_item_definition);
    data::log_load_result(result, "<memory>", "inventory");

    for (const auto& def : result.items) {
        register_item(def);
    }
    return result.success();
}

const ItemDefinition* ItemCatalog::get(const std::string& item_id) const {
    auto it = m_items.find(item_id);
    if (it != m_items.end()) {
        return &it->second;
    }
    return nullptr;
}

bool ItemCatalog::exists(const std::string& item_id) const {
    return m_items.contains(item_id);
}

ItemPtr ItemCatalog::create(const std::string& item_id) const {
    const auto* def = get(item_id);
    if (!def) {
        return nullptr;
    }
    return Item::create(def->display_name, def->size);
}

std::vector<std::string> ItemCatalog::get_all_item_ids() const {
    std::vector<std::string> result;
    result.reserve(m_items.size());
    for (const auto& [id, def] : m_items) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::string> ItemCatalog::get_items_by_tag(const std::string& tag) const {
    std::vector<std::string> result;
    for (const auto& [id, def] : m_items) {
        if (def.has_tag(tag)) {
            result.push_back(id);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

void ItemCatalog::clear() {
    m_items.clear();
    core::log_info("inventory", "Cleared item catalog");
}

} // namespace stash::inventory
