/**
 * @file hex/metrics.hpp
 * @brief Grid-wide constants consumed by coordinate conversions.
 */

#pragma once

#include <cstdint>

namespace hxg
{
	/**
	 * @brief Sizing and topology of one hex map.
	 *
	 * Passed explicitly to every operation which needs it, so that maps with
	 * different settings can coexist in one process. Default-constructed
	 * metrics describe a non-wrapping map with the standard cell size.
	 */
	struct hex_metrics final
	{
		/// Ratio of a hexagon's inner radius to its outer radius (sqrt(3) / 2).
		static constexpr float OUTER_TO_INNER = 0.866025404f;

		/// World space distance from a cell's centre to any of its corners.
		static constexpr float OUTER_RADIUS = 10.0f;

		/// World space distance from a cell's centre to the middle of an edge.
		static constexpr float INNER_RADIUS = OUTER_RADIUS * OUTER_TO_INNER;

		static constexpr float INNER_DIAMETER = INNER_RADIUS * 2.0f;

		/// Columns per chunk.
		static constexpr int32_t CHUNK_SIZE_X = 5;

		bool wrapping = false;
		/// Width of the map in columns; only meaningful if `wrapping` is set.
		int32_t wrap_size = 0;
		int32_t chunk_size_x = CHUNK_SIZE_X;
		float outer_to_inner = OUTER_TO_INNER;
		float outer_radius = OUTER_RADIUS;
		float inner_diameter = INNER_DIAMETER;

		/// @brief Standard metrics for a map `cell_count_x` columns wide.
		[[nodiscard]] static hex_metrics for_map(
			int32_t cell_count_x, bool wrapping) noexcept;

		/// @throws `std::invalid_argument` if any field is out of range.
		void validate() const;
	};
} // namespace hxg
