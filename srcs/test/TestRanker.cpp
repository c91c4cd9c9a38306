/*

         sitescout - find the nearest radio sites from a GPS fix
            Copyright (C) 2026 Thomas A. Early N7TAE

This program is free software; you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation; either version 2 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program; if not, write to the Free Software Foundation, Inc.,
51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.

*/

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>

#include "../Ranker.h"

// ten sites north of the origin at 0.1 degree steps, listed out of order,
// with "Twin" at the same spot as "Three"
static const std::string CSV_TEN {
	"RFSS,Site Dec,Site Hex,Site NAC,Description,County Name,Lat,Lon,Range,Frequencies\n"
	"1,1,1,1,Five,A,0.5,0.0,10,851.0c\n"
	"1,2,2,2,One,A,0.1,0.0,10,851.0c\n"
	"1,3,3,3,Three,A,0.3,0.0,10,851.0c\n"
	"1,4,4,4,Nine,A,0.9,0.0,10,851.0c\n"
	"1,5,5,5,Twin,A,0.3,0.0,10,851.0c\n"
	"1,6,6,6,Two,A,0.2,0.0,10,851.0c\n"
	"1,7,7,7,Seven,A,0.7,0.0,10,851.0c\n"
	"1,8,8,8,Four,A,0.4,0.0,10,851.0c\n"
	"1,9,9,9,Eight,A,0.8,0.0,10,851.0c\n"
	"1,10,A,A,Six,A,0.6,0.0,10,851.0c\n"
};

class TestRanker : public testing::Test
{
protected:
	void SetUp() override
	{
		std::istringstream is(CSV_TEN);
		ASSERT_FALSE(catalog.LoadCSV(is, "ten"));
		ASSERT_EQ(catalog.Size(), 10u);
		origin = CPosition::Make(0.0, 0.0, EFixMode::fix2D);
		ASSERT_NE(origin, nullptr);
	}

	CSiteCatalog catalog;
	std::unique_ptr<CPosition> origin;
};

TEST_F(TestRanker, nearestFive)
{
	auto ranked = CRanker::Nearest(*origin, catalog, EUnit::km, 5);
	ASSERT_EQ(ranked.size(), 5u);
	const char *expected[] { "One", "Two", "Three", "Twin", "Four" };
	for (std::size_t i=0; i<5; i++)
	{
		EXPECT_EQ(ranked[i].site->description, expected[i]);
		EXPECT_DOUBLE_EQ(ranked[i].bearing, 0.0);
		if (i)
			EXPECT_LE(ranked[i-1].distance, ranked[i].distance);
	}
	// 0.1 degree of arc
	EXPECT_NEAR(ranked[0].distance, 11.119, 0.001);
}

TEST_F(TestRanker, limitLargerThanCatalog)
{
	EXPECT_EQ(CRanker::Nearest(*origin, catalog, EUnit::mi, 100).size(), 10u);
	EXPECT_TRUE(CRanker::Nearest(*origin, catalog, EUnit::mi, 0).empty());
}

/// @test Ties keep catalog order
TEST_F(TestRanker, stableTies)
{
	auto ranked = CRanker::Nearest(*origin, catalog, EUnit::nm, 10);
	ASSERT_EQ(ranked.size(), 10u);
	EXPECT_EQ(ranked[2].site->description, "Three");
	EXPECT_EQ(ranked[3].site->description, "Twin");
	EXPECT_EQ(ranked[2].distance, ranked[3].distance);
	EXPECT_EQ(ranked[9].site->description, "Nine");
}

TEST_F(TestRanker, withinRange)
{
	// 0.4 degrees is about 27.6 miles
	auto inRange = CRanker::WithinRange(*origin, catalog, EUnit::mi, 30.0);
	ASSERT_EQ(inRange.size(), 5u);
	auto nearest = CRanker::Nearest(*origin, catalog, EUnit::mi, 10);
	for (std::size_t i=0; i<inRange.size(); i++)
	{
		EXPECT_EQ(inRange[i].site, nearest[i].site);
		EXPECT_LE(inRange[i].distance, 30.0);
	}
	EXPECT_GT(nearest[5].distance, 30.0);

	EXPECT_TRUE(CRanker::WithinRange(*origin, catalog, EUnit::mi, 1.0).empty());
	EXPECT_EQ(CRanker::WithinRange(*origin, catalog, EUnit::km, 20000.0).size(), 10u);
}

TEST_F(TestRanker, rangeNotANumber)
{
	EXPECT_TRUE(CRanker::WithinRange(*origin, catalog, EUnit::mi, std::nan("")).empty());
	EXPECT_TRUE(CRanker::WithinRange(*origin, catalog, EUnit::mi, std::numeric_limits<double>::infinity()).empty());
	EXPECT_TRUE(CRanker::WithinRange(*origin, catalog, EUnit::mi, -1.0).empty());
}

TEST_F(TestRanker, units)
{
	auto km = CRanker::Nearest(*origin, catalog, EUnit::km, 1);
	auto mi = CRanker::Nearest(*origin, catalog, EUnit::mi, 1);
	ASSERT_EQ(km.size(), 1u);
	ASSERT_EQ(mi.size(), 1u);
	EXPECT_NEAR(mi[0].distance, km[0].distance * CGeoMath::KmToMiles, 1.0e-9);
}

TEST_F(TestRanker, closest)
{
	SRankedSite best;
	ASSERT_FALSE(CRanker::Closest(*origin, catalog, EUnit::km, best));
	EXPECT_EQ(best.site->description, "One");

	// looking south, the bearing flips
	auto south = CPosition::Make(1.0, 0.0, EFixMode::fix2D);
	ASSERT_FALSE(CRanker::Closest(*south, catalog, EUnit::km, best));
	EXPECT_EQ(best.site->description, "Nine");
	EXPECT_DOUBLE_EQ(best.bearing, 180.0);

	CSiteCatalog empty;
	EXPECT_TRUE(CRanker::Closest(*origin, empty, EUnit::km, best));
	EXPECT_TRUE(CRanker::Nearest(*origin, empty, EUnit::km, 5).empty());
}
