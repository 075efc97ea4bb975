#pragma once

#include <string>

namespace stash::cli {

// Command result codes
enum class Result {
    Success = 0,
    InvalidArgs = 1,
    LoadFailed = 2,
    NotFound = 3,
    RuntimeError = 4
};

// stash show <settings.json>
// Seeds an inventory from the settings file and prints its grid
Result cmd_show(const std::string& settings_path);

// stash reorganize <settings.json>
// Seeds, compacts, and prints the grid before and after plus any dropped items
Result cmd_reorganize(const std::string& settings_path);

// stash find <settings.json> <width> <height>
// Prints the first free anchor for an item of the given size
Result cmd_find(const std::string& settings_path, int width, int height);

// stash help
void cmd_help();

} // namespace stash::cli
