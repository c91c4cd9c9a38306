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
#include <vector>

#include "../GeoMath.h"

class TestGeoMath : public testing::Test
{
protected:
	// a spread of points including the poles and the antimeridian
	const std::vector<SLatLon> points {
		{ 44.9778, -93.2650 }, { -33.8688, 151.2093 }, { 0.0, 0.0 }, { 90.0, 0.0 },
		{ -90.0, 45.0 }, { 51.5007, -0.1246 }, { 10.0, 180.0 }, { -10.0, -180.0 }, { 78.0, 15.0 }
	};
};

/// @test A point is no distance and bearing 0 from itself
TEST_F(TestGeoMath, samePoint)
{
	for (const auto &p : points)
	{
		double d = -1.0, b = -1.0;
		ASSERT_FALSE(CGeoMath::Distance(p, p, EUnit::km, d));
		ASSERT_FALSE(CGeoMath::Bearing(p, p, b));
		EXPECT_EQ(d, 0.0);
		EXPECT_EQ(b, 0.0);
	}
}

/// @test distance(a,b) == distance(b,a)
TEST_F(TestGeoMath, symmetry)
{
	for (const auto &a : points)
	{
		for (const auto &b : points)
		{
			double ab, ba;
			ASSERT_FALSE(CGeoMath::Distance(a, b, EUnit::mi, ab));
			ASSERT_FALSE(CGeoMath::Distance(b, a, EUnit::mi, ba));
			EXPECT_NEAR(ab, ba, 1.0e-9);
		}
	}
}

/// @test The fixture pair in Minneapolis is about 0.16 miles apart
TEST_F(TestGeoMath, knownFixture)
{
	const SLatLon a { 44.9778, -93.2650 };
	const SLatLon b { 44.9799654, -93.2638361 };
	double mi, km, nm, brg;
	ASSERT_FALSE(CGeoMath::Distance(a, b, EUnit::mi, mi));
	ASSERT_FALSE(CGeoMath::Distance(a, b, EUnit::km, km));
	ASSERT_FALSE(CGeoMath::Distance(a, b, EUnit::nm, nm));
	ASSERT_FALSE(CGeoMath::Bearing(a, b, brg));
	EXPECT_NEAR(mi, 0.16, 0.01);
	EXPECT_NEAR(km, 0.257598, 1.0e-5);
	EXPECT_NEAR(nm, km * CGeoMath::KmToNautical, 1.0e-12);
	EXPECT_NEAR(brg, 20.8168, 1.0e-3);
}

/// @test Bearings along a meridian and the equator reverse exactly
TEST_F(TestGeoMath, reverseBearing)
{
	struct SPair { SLatLon a, b; };
	const std::vector<SPair> pairs {
		{ { 10.0, 20.0 }, { 40.0, 20.0 } },
		{ { -45.0, -120.0 }, { 30.0, -120.0 } },
		{ { 0.0, 10.0 }, { 0.0, 50.0 } },
		{ { 0.0, -170.0 }, { 0.0, 170.0 } }
	};
	for (const auto &p : pairs)
	{
		double ab, ba;
		ASSERT_FALSE(CGeoMath::Bearing(p.a, p.b, ab));
		ASSERT_FALSE(CGeoMath::Bearing(p.b, p.a, ba));
		EXPECT_NEAR(fmod(fabs(ab - ba), 360.0), 180.0, 1.0e-9);
	}

	// short paths are close
	const SLatLon a { 44.9778, -93.2650 };
	const SLatLon b { 44.9799654, -93.2638361 };
	double ab, ba;
	ASSERT_FALSE(CGeoMath::Bearing(a, b, ab));
	ASSERT_FALSE(CGeoMath::Bearing(b, a, ba));
	EXPECT_NEAR(fmod(fabs(ab - ba), 360.0), 180.0, 0.01);
}

TEST_F(TestGeoMath, cardinalBearings)
{
	const SLatLon origin { 0.0, 0.0 };
	double b;
	ASSERT_FALSE(CGeoMath::Bearing(origin, SLatLon { 1.0, 0.0 }, b));
	EXPECT_NEAR(b, 0.0, 1.0e-9);
	ASSERT_FALSE(CGeoMath::Bearing(origin, SLatLon { 0.0, 1.0 }, b));
	EXPECT_NEAR(b, 90.0, 1.0e-9);
	ASSERT_FALSE(CGeoMath::Bearing(origin, SLatLon { -1.0, 0.0 }, b));
	EXPECT_NEAR(b, 180.0, 1.0e-9);
	ASSERT_FALSE(CGeoMath::Bearing(origin, SLatLon { 0.0, -1.0 }, b));
	EXPECT_NEAR(b, 270.0, 1.0e-9);

	// always in [0,360)
	for (const auto &p : points)
	{
		if (p.lat == 0.0 and p.lon == 0.0)
			continue;
		ASSERT_FALSE(CGeoMath::Bearing(origin, p, b));
		EXPECT_GE(b, 0.0);
		EXPECT_LT(b, 360.0);
	}
}

TEST_F(TestGeoMath, antipodes)
{
	double d;
	ASSERT_FALSE(CGeoMath::Distance(SLatLon { 0.0, 0.0 }, SLatLon { 0.0, 180.0 }, EUnit::km, d));
	EXPECT_NEAR(d, acos(-1.0) * CGeoMath::EarthRadiusKm, 1.0e-6);
	ASSERT_FALSE(CGeoMath::Distance(SLatLon { 90.0, 0.0 }, SLatLon { -90.0, 0.0 }, EUnit::km, d));
	EXPECT_NEAR(d, acos(-1.0) * CGeoMath::EarthRadiusKm, 1.0e-6);
	// across the antimeridian is the short way
	ASSERT_FALSE(CGeoMath::Distance(SLatLon { 0.0, 179.5 }, SLatLon { 0.0, -179.5 }, EUnit::km, d));
	EXPECT_NEAR(d, acos(-1.0) * CGeoMath::EarthRadiusKm / 180.0, 1.0e-6);
}

TEST_F(TestGeoMath, invalidCoordinates)
{
	const SLatLon good { 10.0, 10.0 };
	double v;
	EXPECT_TRUE(CGeoMath::Distance(good, SLatLon { 90.1, 0.0 }, EUnit::km, v));
	EXPECT_TRUE(CGeoMath::Distance(SLatLon { 0.0, -180.5 }, good, EUnit::km, v));
	EXPECT_TRUE(CGeoMath::Bearing(good, SLatLon { NAN, 0.0 }, v));
	EXPECT_TRUE(CGeoMath::Bearing(SLatLon { 0.0, INFINITY }, good, v));
	EXPECT_TRUE(CGeoMath::IsValid(SLatLon { -90.0, 180.0 }));
	EXPECT_FALSE(CGeoMath::IsValid(SLatLon { -90.0001, 0.0 }));
}

TEST_F(TestGeoMath, units)
{
	EXPECT_NEAR(CGeoMath::ConvertDistance(10.0, EUnit::mi, EUnit::km), 16.0934, 1.0e-9);
	EXPECT_NEAR(CGeoMath::ConvertDistance(50.0, EUnit::km, EUnit::mi), 31.06855, 1.0e-9);
	EXPECT_NEAR(CGeoMath::ConvertDistance(25.0, EUnit::nm, EUnit::km), 46.3, 1.0e-9);
	EXPECT_EQ(CGeoMath::ConvertDistance(7.0, EUnit::nm, EUnit::nm), 7.0);

	EUnit u;
	EXPECT_FALSE(CGeoMath::ParseUnit("nm", u));
	EXPECT_EQ(u, EUnit::nm);
	EXPECT_FALSE(CGeoMath::ParseUnit("km", u));
	EXPECT_EQ(u, EUnit::km);
	EXPECT_TRUE(CGeoMath::ParseUnit("furlongs", u));
	EXPECT_STREQ(CGeoMath::UnitName(EUnit::mi), "mi");
	EXPECT_STREQ(CGeoMath::UnitLabel(EUnit::nm), "nautical miles");
}

TEST_F(TestGeoMath, compassPoints)
{
	EXPECT_STREQ(CGeoMath::CardinalDirection(0.0), "N");
	EXPECT_STREQ(CGeoMath::CardinalDirection(359.0), "N");
	EXPECT_STREQ(CGeoMath::CardinalDirection(20.8), "NNE");
	EXPECT_STREQ(CGeoMath::CardinalDirection(90.0), "E");
	EXPECT_STREQ(CGeoMath::CardinalDirection(225.0), "SW");
	EXPECT_STREQ(CGeoMath::CardinalDirection(-90.0), "W");
}
