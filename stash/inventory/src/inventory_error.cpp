#include <stash/inventory/inventory_error.hpp>

namespace stash::inventory {

const char* get_error_code_name(InventoryErrorCode code) {
    switch (code) {
        case InventoryErrorCode::InvalidDimension: return "InvalidDimension";
        case InventoryErrorCode::InvalidSize:      return "InvalidSize";
        case InventoryErrorCode::NullItem:         return "NullItem";
        case InventoryErrorCode::NotFound:         return "NotFound";
        case InventoryErrorCode::OutOfBounds:      return "OutOfBounds";
        default:                                   return "Unknown";
    }
}

} // namespace stash::inventory
