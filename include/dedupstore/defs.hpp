#ifndef DEDUPSTORE_DEFS_HPP
#define DEDUPSTORE_DEFS_HPP

#include <climits>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace dedupstore {

/// \defgroup defs Definitions
/// @{

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i64 = std::int64_t;

using byte = unsigned char;

using std::size_t;

/// An owned sequence of raw bytes (keys and values of the storage engine).
using bytes = std::vector<byte>;

/// Logical block address: the index of a block-sized region of the virtual device.
using lba_t = u64;

/// The only block size supported by the engine. Changing the block size
/// of an existing device requires a new store.
static constexpr u32 default_block_size = 4096;

static_assert(CHAR_BIT == 8, "Bytes with a size other than 8 bits are not supported.");

// Marks the passed arguments as "used" to shut up warnings.
template<typename... Args>
void unused(Args&&...) {}

/// @}

} // namespace dedupstore

#endif // DEDUPSTORE_DEFS_HPP
