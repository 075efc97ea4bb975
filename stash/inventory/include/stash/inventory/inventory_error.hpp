#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace stash::inventory {

// ============================================================================
// Inventory Error
// ============================================================================
//
// Thrown only for caller bugs (contract violations). Expected negative
// outcomes such as "cell occupied" or "no free position" are reported through
// return values instead.

enum class InventoryErrorCode : uint8_t {
    InvalidDimension,   // Grid or matrix dimensions <= 0 or mismatched
    InvalidSize,        // Item size not positive in both dimensions
    NullItem,           // Null item where one is required
    NotFound,           // Asserting lookup found nothing
    OutOfBounds         // Coordinate outside the grid
};

const char* get_error_code_name(InventoryErrorCode code);

class InventoryError : public std::runtime_error {
public:
    InventoryError(InventoryErrorCode code, const std::string& message)
        : std::runtime_error(std::string(get_error_code_name(code)) + ": " + message)
        , m_code(code) {}

    InventoryErrorCode code() const { return m_code; }

private:
    InventoryErrorCode m_code;
};

} // namespace stash::inventory
