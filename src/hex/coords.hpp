/**
 * @file hex/coords.hpp
 * @brief `hex_coords`, the cube-coordinate position of one cell.
 */

#pragma once

#include "direction.hpp"
#include "metrics.hpp"

#include <cstddef>
#include <cstdint>
#include <glm/vec3.hpp>
#include <string>

namespace hxg
{
	class vfs_reader;
	class vfs_writer;

	/**
	 * @brief Immutable three-component hexagonal coordinates.
	 *
	 * Only X and Z are stored; Y is always `-x - z`, so `x + y + z == 0` holds
	 * for every instance. On a wrapping map, construction keeps the offset
	 * column `x + z / 2` within `[0, wrap_size)` by shifting X by at most one
	 * map width.
	 */
	class hex_coords final
	{
		int32_t x_ = 0, z_ = 0;

		struct raw_t final
		{
		};

		/// Stores the pair untouched.
		constexpr hex_coords(raw_t, int32_t x, int32_t z) noexcept : x_(x), z_(z) {}

	public:
		constexpr hex_coords() noexcept = default;
		hex_coords(int32_t x, int32_t z, const hex_metrics&) noexcept;

		[[nodiscard]] constexpr int32_t x() const noexcept { return x_; }
		[[nodiscard]] constexpr int32_t y() const noexcept { return -x_ - z_; }
		[[nodiscard]] constexpr int32_t z() const noexcept { return z_; }

		/// @brief Column of this cell in the rectangular array layout.
		[[nodiscard]] constexpr int32_t offset_x() const noexcept { return x_ + z_ / 2; }

		/// X position in hex space, where the distance between cell centres of
		/// east-west neighbours is one unit. Odd rows are shifted half a cell.
		[[nodiscard]] float world_x() const noexcept;

		/// Z position in hex space, scaled so rows pack like real hexagons.
		[[nodiscard]] float world_z(const hex_metrics&) const noexcept;

		/// @brief Index of the chunk column this cell falls into.
		[[nodiscard]] int32_t column_index(const hex_metrics&) const noexcept;

		/// @returns Distance in cells, taking wrapping into account.
		[[nodiscard]] int32_t distance_to(
			const hex_coords& other, const hex_metrics&) const noexcept;

		/// @returns The (wrapped) neighbour in the given direction.
		[[nodiscard]] hex_coords step(hex_direction, const hex_metrics&) const noexcept;

		/// @brief Create hex coordinates from array offset coordinates.
		[[nodiscard]] static hex_coords from_offset(
			int32_t x, int32_t z, const hex_metrics&) noexcept;

		/**
		 * @brief Create hex coordinates for the cell containing a position.
		 * @param pos Assumed to lie inside the map; nothing is bounds-checked,
		 * so an outside position yields a valid but meaningless coordinate.
		 * NaN components map to 0 and cube components beyond 2^29 are clamped.
		 */
		[[nodiscard]] static hex_coords from_position(
			const glm::vec3& pos, const hex_metrics&) noexcept;

		/// @returns A string of the form "(X, Y, Z)".
		[[nodiscard]] std::string to_string() const;
		/// @returns A string of the form "X\nY\nZ".
		[[nodiscard]] std::string to_string_multiline() const;

		/// @brief Writes X then Z as little-endian 32-bit integers.
		void save(vfs_writer&) const;

		/// @brief Inverse of `save()`. The values are trusted to have been
		/// normalized when saved and are not wrapped again.
		[[nodiscard]] static hex_coords load(vfs_reader&);

		[[nodiscard]] constexpr bool operator==(const hex_coords& o) const noexcept
		{
			return x_ == o.x_ && z_ == o.z_;
		}

		[[nodiscard]] constexpr bool operator!=(const hex_coords& o) const noexcept
		{
			return !(*this == o);
		}
	};
} // namespace hxg

namespace std
{
	template<>
	struct hash<hxg::hex_coords>
	{
		size_t operator()(const hxg::hex_coords& coords) const noexcept;
	};
} // namespace std
