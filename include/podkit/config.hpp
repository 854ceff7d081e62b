#pragma once

#include <cstddef>
#include <cstdint>

namespace podkit::config {

/*
===============================================================================
podkit compile-time tuning
===============================================================================

All sizes are compile-time constants. None of them affects the wire format:
they only shape in-memory behavior (index growth, padding chunks, hashing).
===============================================================================
*/

// -----------------------------------------------------------------------------
// Writer
// -----------------------------------------------------------------------------
// Zero padding is emitted in chunks of this size so that large alignments
// never allocate.
inline constexpr std::size_t padding_chunk = 16;

// -----------------------------------------------------------------------------
// Offset index (in-memory dedup table)
// -----------------------------------------------------------------------------
inline constexpr std::size_t index_initial_capacity = 1 << 4; // 16, power of two

// Grow once occupancy would exceed num/den of the capacity.
inline constexpr std::size_t index_max_load_num = 7;
inline constexpr std::size_t index_max_load_den = 8;

// XXH64 seed for content hashes. Hashes never leave the process.
inline constexpr std::uint64_t hash_seed = 0;

// -----------------------------------------------------------------------------
// LEB128
// -----------------------------------------------------------------------------
// ceil(64 / 7): longest encoding of an unsigned 64-bit value.
inline constexpr std::size_t leb128_max_length = 10;

} // namespace podkit::config
