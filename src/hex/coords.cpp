/**
 * @file hex/coords.cpp
 * @brief `hex_coords`, the cube-coordinate position of one cell.
 */

#include "coords.hpp"

#include "../file.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <xxhash.h>

using namespace hxg;

hex_coords::hex_coords(int32_t x, int32_t z, const hex_metrics& metrics) noexcept
{
	if (metrics.wrapping)
	{
		// Truncating division; `-1 / 2 == 0` is relied upon here
		const int32_t ox = x + z / 2;

		if (ox < 0)
			x += metrics.wrap_size;
		else if (ox >= metrics.wrap_size)
			x -= metrics.wrap_size;
	}

	x_ = x;
	z_ = z;
}

float hex_coords::world_x() const noexcept
{
	return static_cast<float>(x_ + z_ / 2) + ((z_ & 1) == 0 ? 0.0f : 0.5f);
}

float hex_coords::world_z(const hex_metrics& metrics) const noexcept
{
	return static_cast<float>(z_) * metrics.outer_to_inner;
}

int32_t hex_coords::column_index(const hex_metrics& metrics) const noexcept
{
	return offset_x() / metrics.chunk_size_x;
}

int32_t hex_coords::distance_to(
	const hex_coords& other, const hex_metrics& metrics) const noexcept
{
	// |dx| + |dy| against `other` with its X shifted by `shift`.
	// Y is derived, so it moves opposite to X.
	const auto xy = [&](const int32_t shift) -> int32_t {
		const int32_t ox = other.x_ + shift;
		const int32_t oy = -ox - other.z_;
		return std::abs(x_ - ox) + std::abs(y() - oy);
	};

	int32_t partial = xy(0);

	if (metrics.wrapping)
		partial = std::min({ partial, xy(metrics.wrap_size), xy(-metrics.wrap_size) });

	return (partial + std::abs(z_ - other.z_)) / 2;
}

hex_coords hex_coords::step(hex_direction dir, const hex_metrics& metrics) const noexcept
{
	switch (dir)
	{
	case hex_direction::NE: return hex_coords(x_, z_ + 1, metrics);
	case hex_direction::E: return hex_coords(x_ + 1, z_, metrics);
	case hex_direction::SE: return hex_coords(x_ + 1, z_ - 1, metrics);
	case hex_direction::SW: return hex_coords(x_, z_ - 1, metrics);
	case hex_direction::W: return hex_coords(x_ - 1, z_, metrics);
	default: return hex_coords(x_ - 1, z_ + 1, metrics);
	}
}

hex_coords hex_coords::from_offset(int32_t x, int32_t z, const hex_metrics& metrics) noexcept
{
	return hex_coords(x - z / 2, z, metrics);
}

/// Far outside any map, but small enough that the correction below and the
/// offset/wrap arithmetic of the constructor cannot overflow.
static constexpr float ROUND_LIMIT = static_cast<float>(1 << 29);

/// Round half to even; NaN becomes 0, anything else is clamped to `ROUND_LIMIT`.
[[nodiscard]] static int32_t round_cube(const float f) noexcept
{
	if (std::isnan(f)) return 0;

	return static_cast<int32_t>(std::clamp(std::nearbyint(f), -ROUND_LIMIT, ROUND_LIMIT));
}

hex_coords hex_coords::from_position(const glm::vec3& pos, const hex_metrics& metrics) noexcept
{
	float x = pos.x / metrics.inner_diameter;
	float y = -x;

	const float offset = pos.z / (metrics.outer_radius * 3.0f);
	x -= offset;
	y -= offset;

	auto ix = round_cube(x);
	const auto iy = round_cube(y);
	auto iz = round_cube(-x - y);

	if (ix + iy + iz != 0)
	{
		const float dx = std::abs(x - static_cast<float>(ix));
		const float dy = std::abs(y - static_cast<float>(iy));
		const float dz = std::abs(-x - y - static_cast<float>(iz));

		// Ties never favour X, and Y wins a tie with Z
		if (dx > dy && dx > dz)
			ix = -iy - iz;
		else if (dz > dy)
			iz = -ix - iy;
		// Otherwise Y is the worst; it isn't stored, so there's nothing to fix
	}

	return hex_coords(ix, iz, metrics);
}

std::string hex_coords::to_string() const
{
	return fmt::format("({}, {}, {})", x_, y(), z_);
}

std::string hex_coords::to_string_multiline() const
{
	return fmt::format("{}\n{}\n{}", x_, y(), z_);
}

void hex_coords::save(vfs_writer& writer) const
{
	writer.write_i32(x_);
	writer.write_i32(z_);
}

hex_coords hex_coords::load(vfs_reader& reader)
{
	const int32_t x = reader.read_i32();
	const int32_t z = reader.read_i32();
	return hex_coords(raw_t(), x, z);
}

size_t std::hash<hex_coords>::operator()(const hex_coords& coords) const noexcept
{
	const std::array<int32_t, 2> pair = { coords.x(), coords.z() };
	return static_cast<size_t>(
		XXH64(reinterpret_cast<const void*>(pair.data()), sizeof(pair), 0));
}
