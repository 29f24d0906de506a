#include <strata/land/chunk_key.hpp>

#include "../../strata_test_common.hpp"

#include <fmt/format.h>

#include <unordered_set>

namespace strata::land
{

TEST_CASE("'ChunkKey' sanity check", "[strata::land::chunk_key]")
{
	ChunkKey ck(8, 4, 2);
	CHECK(ck.base() == glm::ivec3(8, 4, 2));
	CHECK(ck.blockOrigin() == glm::ivec3(256, 128, 64));

	CHECK(ChunkKey() == ChunkKey(0, 0, 0));
	CHECK(ChunkKey(glm::ivec3(8, 4, 2)) == ck);
	CHECK(ChunkKey(8, 4, 3) != ck);

	// Round-trip packing
	CHECK(ChunkKey(ck.packed()) == ck);
}

TEST_CASE("'ChunkKey' with negative values", "[strata::land::chunk_key]")
{
	ChunkKey ck(-8, -1, -3);
	CHECK(ck.base() == glm::ivec3(-8, -1, -3));
	CHECK(ck.blockOrigin() == glm::ivec3(-256, -32, -96));

	CHECK(ChunkKey(ck.packed()) == ck);

	// Extreme representable values
	ChunkKey lo(-(1 << 23), -(1 << 15), -(1 << 23));
	ChunkKey hi((1 << 23) - 1, (1 << 15) - 1, (1 << 23) - 1);
	CHECK(lo.base() == glm::ivec3(-(1 << 23), -(1 << 15), -(1 << 23)));
	CHECK(hi.base() == glm::ivec3((1 << 23) - 1, (1 << 15) - 1, (1 << 23) - 1));
	CHECK(ChunkKey(lo.packed()) == lo);
	CHECK(ChunkKey(hi.packed()) == hi);
}

TEST_CASE("'ChunkKey' hashing and ordering", "[strata::land::chunk_key]")
{
	std::unordered_set<ChunkKey> keys;

	for (int32_t z = -2; z <= 2; z++) {
		for (int32_t y = -2; y <= 2; y++) {
			for (int32_t x = -2; x <= 2; x++) {
				keys.emplace(x, y, z);
			}
		}
	}

	// No collisions even for close keys
	CHECK(keys.size() == 125);
	CHECK(keys.contains(ChunkKey(-2, 0, 2)));
	CHECK_FALSE(keys.contains(ChunkKey(3, 0, 0)));

	// Equal keys hash equally
	CHECK(ChunkKey(5, -6, 7).hash() == ChunkKey(glm::ivec3(5, -6, 7)).hash());
	CHECK(ChunkKey(5, -6, 7).hash() != ChunkKey(7, -6, 5).hash());

	// Strict weak ordering by packed value
	ChunkKey a(1, 2, 3);
	ChunkKey b(1, 2, 4);
	CHECK((a < b) != (b < a));
	CHECK_FALSE(a < a);
}

TEST_CASE("'ChunkKey' formatting", "[strata::land::chunk_key]")
{
	CHECK(fmt::format("{}", ChunkKey(1, -2, 3)) == "(1, -2, 3)");
	CHECK(fmt::format("[{:>12}]", ChunkKey(0, 0, 0)) == "[   (0, 0, 0)]");
}

} // namespace strata::land
