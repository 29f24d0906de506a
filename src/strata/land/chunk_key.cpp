#include <strata/land/chunk_key.hpp>

#include <fmt/format.h>

namespace fmt
{

format_context::iterator formatter<strata::land::ChunkKey>::format(strata::land::ChunkKey key,
	format_context &ctx) const
{
	char buf[64];
	auto result = fmt::format_to_n(buf, std::size(buf), "({}, {}, {})", int64_t(key.x), int64_t(key.y),
		int64_t(key.z));
	return formatter<string_view>::format(string_view(buf, result.size), ctx);
}

} // namespace fmt
