#pragma once

#include <cstdint>
#include <span>

namespace podkit {

// Borrowed, immutable, contiguous byte range. Never owned by podkit.
using bytes = std::span<const std::uint8_t>;

} // namespace podkit
