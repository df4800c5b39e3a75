#include "core/types.hpp"

#include <type_traits>

// Implementation is entirely in the header for this simple types module.

namespace tether {

static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");
static_assert(std::is_nothrow_move_constructible_v<DeviceId>, "DeviceId should move without throwing");

} // namespace tether
