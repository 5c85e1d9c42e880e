/**
 * @file hex/metrics.cpp
 * @brief Grid-wide constants consumed by coordinate conversions.
 */

#include "metrics.hpp"

#include "../log.hpp"

#include <fmt/format.h>
#include <stdexcept>

hxg::hex_metrics hxg::hex_metrics::for_map(int32_t cell_count_x, bool wrapping) noexcept
{
	hex_metrics ret;
	ret.wrapping = wrapping;
	ret.wrap_size = wrapping ? cell_count_x : 0;
	return ret;
}

void hxg::hex_metrics::validate() const
{
	if (chunk_size_x <= 0)
	{
		throw std::invalid_argument(
			fmt::format("Chunk width must be positive; got {}.", chunk_size_x));
	}

	if (wrapping && wrap_size <= 0)
	{
		throw std::invalid_argument(fmt::format(
			"Wrapping map requires a positive wrap size; got {}.", wrap_size));
	}

	if (!(outer_to_inner > 0.0f) || !(outer_radius > 0.0f) || !(inner_diameter > 0.0f))
	{
		throw std::invalid_argument(fmt::format(
			"Cell sizing must be positive; got outer/inner ratio {}, outer radius {}, "
			"inner diameter {}.",
			outer_to_inner, outer_radius, inner_diameter));
	}

	HXG_DEBUGF(
		"Hex metrics: wrapping {} (size {}), chunk width {}, outer radius {}",
		wrapping, wrap_size, chunk_size_x, outer_radius);
}
