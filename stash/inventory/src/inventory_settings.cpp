#include <stash/inventory/inventory_settings.hpp>
#include <stash/data/json_loader.hpp>
#include <stash/core/log.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace stash::inventory {

using json = nlohmann::json;

namespace {

// Applies the keys present in `j` on top of `settings`
bool parse_settings(const json& j, InventorySettings& settings) {
    using namespace data::json_helpers;

    if (!j.is_object()) {
        core::log_error("settings", "Inventory settings root must be an object");
        return false;
    }

    settings.width = j.value("width", settings.width);
    settings.height = j.value("height", settings.height);
    settings.catalog_path = j.value("catalog", settings.catalog_path);

    if (j.contains("log_level")) {
        std::string level_name = get_string(j, "log_level");
        auto level = core::parse_log_level(level_name);
        if (level) {
            settings.log_level = *level;
        } else {
            core::log_warning("settings", "Unknown log level '{}', keeping {}",
                              level_name, core::get_log_level_name(settings.log_level));
        }
    }

    bool ok = true;

    if (j.contains("items")) {
        auto result = data::parse_json_array<ItemDefinition>(j, parse_item_definition, "items");
        data::log_load_result(result, "settings", "settings");
        settings.items = std::move(result.items);
        ok = result.success();
    }

    if (j.contains("seed")) {
        const auto& seed = j["seed"];
        if (!seed.is_array()) {
            core::log_error("settings", "'seed' must be an array");
            return false;
        }

        settings.seed.clear();
        for (const auto& entry : seed) {
            std::string error;
            if (!entry.is_object() || !require_string(entry, "item", error)) {
                core::log_warning("settings", "Skipping seed entry: {}",
                                  error.empty() ? std::string("not an object") : error);
                continue;
            }

            SeedEntry seed_entry;
            seed_entry.item_id = entry["item"].get<std::string>();
            if (entry.contains("position")) {
                seed_entry.position = get_ivec2(entry, "position");
                if (!seed_entry.position) {
                    core::log_warning("settings", "Seed '{}' has an invalid position, auto-placing",
                                      seed_entry.item_id);
                }
            }
            settings.seed.push_back(std::move(seed_entry));
        }
    }

    return ok;
}

} // namespace

bool InventorySettings::load(const std::string& path) {
    auto j = data::load_json_file(path);
    if (!j) {
        return false;
    }

    try {
        if (!parse_settings(*j, *this)) {
            return false;
        }
    } catch (const json::exception& e) {
        core::log_error("settings", "Invalid inventory settings in {}: {}", path, e.what());
        return false;
    }

    if (!catalog_path.empty()) {
        std::filesystem::path catalog(catalog_path);
        if (catalog.is_relative()) {
            catalog = std::filesystem::path(path).parent_path() / catalog;
        }
        catalog_path = catalog.string();
    }

    core::log_info("settings", "Loaded inventory settings from {} ({}x{}, {} seed entries)",
                   path, width, height, seed.size());
    return true;
}

bool InventorySettings::load_from_json(const std::string& text) {
    try {
        return parse_settings(json::parse(text), *this);
    } catch (const json::exception& e) {
        core::log_error("settings", "Invalid inventory settings: {}", e.what());
        return false;
    }
}

void InventorySettings::reset() {
    *this = InventorySettings{};
}

bool load_catalog(const InventorySettings& settings, ItemCatalog& catalog) {
    for (const auto& def : settings.items) {
        catalog.register_item(def);
    }

    if (settings.catalog_path.empty()) {
        return true;
    }
    return catalog.load(settings.catalog_path);
}

GridInventory create_inventory(const InventorySettings& settings, const ItemCatalog& catalog) {
    GridInventory inventory(settings.width, settings.height);

    for (const auto& entry : settings.seed) {
        ItemPtr item = catalog.create(entry.item_id);
        if (!item) {
            core::log_warning("settings", "Unknown seed item '{}'", entry.item_id);
            continue;
        }

        bool placed = entry.position ? inventory.place(item, *entry.position)
                                     : inventory.place_anywhere(item);
        if (!placed) {
            core::log_warning("settings", "Seed item '{}' does not fit, skipped", entry.item_id);
        }
    }

    return inventory;
}

} // namespace stash::inventory
