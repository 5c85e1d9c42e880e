/** @file test/direction.cpp */

#include "hex/direction.hpp"

#include <gtest/gtest.h>
#include <magic_enum.hpp>

using hxg::hex_direction;

static_assert(hxg::opposite(hex_direction::NE) == hex_direction::SW);
static_assert(hxg::next(hex_direction::NW) == hex_direction::NE);

TEST(Direction, CountMatchesEnum)
{
	EXPECT_EQ(magic_enum::enum_count<hex_direction>(), hxg::HEX_DIRECTION_COUNT);
}

TEST(Direction, Opposite)
{
	EXPECT_EQ(hxg::opposite(hex_direction::NE), hex_direction::SW);
	EXPECT_EQ(hxg::opposite(hex_direction::E), hex_direction::W);
	EXPECT_EQ(hxg::opposite(hex_direction::SE), hex_direction::NW);
	EXPECT_EQ(hxg::opposite(hex_direction::W), hex_direction::E);

	for (const auto dir : magic_enum::enum_values<hex_direction>())
		EXPECT_EQ(hxg::opposite(hxg::opposite(dir)), dir);
}

TEST(Direction, RotationWrapsAround)
{
	EXPECT_EQ(hxg::previous(hex_direction::NE), hex_direction::NW);
	EXPECT_EQ(hxg::next(hex_direction::NW), hex_direction::NE);
	EXPECT_EQ(hxg::next(hex_direction::E), hex_direction::SE);

	EXPECT_EQ(hxg::previous2(hex_direction::E), hex_direction::NW);
	EXPECT_EQ(hxg::previous2(hex_direction::SE), hex_direction::NE);
	EXPECT_EQ(hxg::next2(hex_direction::SW), hex_direction::NW);
	EXPECT_EQ(hxg::next2(hex_direction::W), hex_direction::NE);

	for (const auto dir : magic_enum::enum_values<hex_direction>())
	{
		EXPECT_EQ(hxg::next(hxg::previous(dir)), dir);
		EXPECT_EQ(hxg::next2(dir), hxg::next(hxg::next(dir)));
		EXPECT_EQ(hxg::previous2(dir), hxg::previous(hxg::previous(dir)));
		EXPECT_EQ(hxg::next(hxg::next2(dir)), hxg::opposite(dir));
	}
}

TEST(Direction, Names)
{
	EXPECT_EQ(hxg::direction_name(hex_direction::NE), "NE");
	EXPECT_EQ(hxg::direction_name(hex_direction::SW), "SW");
	EXPECT_EQ(hxg::direction_name(hex_direction::NW), "NW");
}
