#pragma once

#include <strata/land/land_public_consts.hpp>
#include <strata/land/voxel.hpp>
#include <strata/visibility.hpp>

#include <bitset>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace strata::land
{

// One bit per chunk column, indexed by `ChunkPlaneShape`
using ColumnMask = std::bitset<Consts::CHUNK_AREA_BLOCKS>;

} // namespace strata::land

namespace strata::land::Utils
{

// Visit all points in [0; N)^3 space in buffer order (X fastest, then Y, then Z), calling F(x, y, z)
template<uint32_t N, typename F>
inline void forXYZ(F &&fn) noexcept(std::is_nothrow_invocable_v<F, uint32_t, uint32_t, uint32_t>)
{
	for (uint32_t z = 0; z < N; z++) {
		for (uint32_t y = 0; y < N; y++) {
			for (uint32_t x = 0; x < N; x++) {
				fn(x, y, z);
			}
		}
	}
}

// Visit all points in [0; N)^2 space in plane order (X fastest, then Z), calling F(x, z)
template<uint32_t N, typename F>
inline void forXZ(F &&fn) noexcept(std::is_nothrow_invocable_v<F, uint32_t, uint32_t>)
{
	for (uint32_t z = 0; z < N; z++) {
		for (uint32_t x = 0; x < N; x++) {
			fn(x, z);
		}
	}
}

// Find the topmost solid voxel of every column of a full chunk buffer.
// Returns their linear buffer indices in plane order, columns without solid voxels are skipped.
//
// A solid voxel in the topmost layer counts as surface only if its column is
// open above (its bit is set in `open_above`). Pass null to treat all columns as open.
STRATA_API std::vector<uint32_t> findSurfaceIndices(std::span<const Voxel> voxels,
	const ColumnMask *open_above = nullptr);

} // namespace strata::land::Utils
