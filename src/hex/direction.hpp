/**
 * @file hex/direction.hpp
 * @brief The six directions from a cell to its neighbours.
 */

#pragma once

#include <cstdint>
#include <magic_enum.hpp>
#include <string_view>

namespace hxg
{
	/// Clockwise, starting from north-east.
	enum class hex_direction : uint8_t
	{
		NE,
		E,
		SE,
		SW,
		W,
		NW
	};

	static constexpr uint8_t HEX_DIRECTION_COUNT = 6;

	[[nodiscard]] constexpr hex_direction opposite(const hex_direction dir) noexcept
	{
		const auto i = static_cast<uint8_t>(dir);
		return static_cast<hex_direction>(i < 3 ? i + 3 : i - 3);
	}

	/// @brief Rotate one step counter-clockwise.
	[[nodiscard]] constexpr hex_direction previous(const hex_direction dir) noexcept
	{
		return dir == hex_direction::NE
				   ? hex_direction::NW
				   : static_cast<hex_direction>(static_cast<uint8_t>(dir) - 1);
	}

	/// @brief Rotate one step clockwise.
	[[nodiscard]] constexpr hex_direction next(const hex_direction dir) noexcept
	{
		return dir == hex_direction::NW
				   ? hex_direction::NE
				   : static_cast<hex_direction>(static_cast<uint8_t>(dir) + 1);
	}

	[[nodiscard]] constexpr hex_direction previous2(const hex_direction dir) noexcept
	{
		const auto i = static_cast<uint8_t>(dir);
		return static_cast<hex_direction>(i >= 2 ? i - 2 : i + 4);
	}

	[[nodiscard]] constexpr hex_direction next2(const hex_direction dir) noexcept
	{
		const auto i = static_cast<uint8_t>(dir);
		return static_cast<hex_direction>(i <= 3 ? i + 2 : i - 4);
	}

	/// @returns e.g. "NE" for `hex_direction::NE`.
	[[nodiscard]] constexpr std::string_view direction_name(
		const hex_direction dir) noexcept
	{
		return magic_enum::enum_name(dir);
	}
} // namespace hxg
