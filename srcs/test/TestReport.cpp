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
#include <sstream>
#include <string>

#include "../Report.h"

static SSite makeSite()
{
	SSite site;
	site.description = "Minneapolis";
	site.county = "Hennepin";
	site.latitude = 44.9799654;
	site.longitude = -93.2638361;
	site.frequencies = { { "852.975000", true }, { "853.250000", false }, { "853.500000", true } };
	site.attributes = { { "rfss", "1" }, { "site_dec", "1" }, { "site_hex", "001" }, { "nac", "1F1" }, { "range", "25" } };
	return site;
}

static bool contains(const std::string &text, const std::string &piece)
{
	return std::string::npos != text.find(piece);
}

TEST(TestReport, position)
{
	SFixData d;
	d.latitude = 44.9778;
	d.longitude = -93.265;
	d.hasAltitude = true;
	d.altitude = 264.0;
	d.hasSpeed = true;
	d.speed = 10.0;
	d.hasTrack = true;
	d.track = 84.4;
	d.mode = EFixMode::fix3D;
	auto pos = CPosition::Make(d);
	ASSERT_NE(pos, nullptr);

	std::ostringstream os;
	CReport::Position(os, *pos);
	const auto text = os.str();
	EXPECT_TRUE(contains(text, "GPS Position: 44.977800, -93.265000\n"));
	EXPECT_TRUE(contains(text, "  Altitude: 264.0 m (866 ft)\n"));
	EXPECT_TRUE(contains(text, "  Speed: 10.0 m/s (22.4 mph, 19.4 kn)\n"));
	EXPECT_TRUE(contains(text, "  Heading: 84.4 deg E\n"));
	EXPECT_TRUE(contains(text, "  Fix Quality: 3D Fix\n"));
}

TEST(TestReport, stationaryPosition)
{
	SFixData d;
	d.hasSpeed = true;
	d.speed = 0.1;
	d.hasTrack = true;
	d.track = 200.0;
	d.mode = EFixMode::fix2D;
	auto pos = CPosition::Make(d);
	std::ostringstream os;
	CReport::Position(os, *pos);
	const auto text = os.str();
	EXPECT_TRUE(contains(text, "  Speed: stationary\n"));
	EXPECT_FALSE(contains(text, "Heading"));
	EXPECT_FALSE(contains(text, "Altitude"));
	EXPECT_TRUE(contains(text, "2D Fix"));
}

TEST(TestReport, grid)
{
	auto pos = CPosition::Make(44.9778, -93.265, EFixMode::fix2D);
	std::ostringstream os;
	CReport::Grid(os, *pos);
	EXPECT_EQ(os.str(), "  UTM: Zone 15T E:479106 N:4980518\n  MGRS: 15T VK 79105 80518\n  Maidenhead: EN34ix\n");

	auto polar = CPosition::Make(88.0, 10.0, EFixMode::fix2D);
	std::ostringstream ps;
	CReport::Grid(ps, *polar);
	EXPECT_TRUE(contains(ps.str(), "  UTM: grid unavailable at this latitude\n"));
	EXPECT_TRUE(contains(ps.str(), "  MGRS: grid unavailable at this latitude\n"));
	EXPECT_TRUE(contains(ps.str(), "  Maidenhead: "));
}

TEST(TestReport, siteDetail)
{
	const auto site = makeSite();
	const SRankedSite ranked { &site, 0.160064, 20.8168 };
	std::ostringstream os;
	CReport::SiteDetail(os, ranked, EUnit::mi);
	const auto text = os.str();
	EXPECT_TRUE(contains(text, "Site: Minneapolis\n"));
	EXPECT_TRUE(contains(text, "County: Hennepin\n"));
	EXPECT_TRUE(contains(text, "Location: 44.979965, -93.263836\n"));
	EXPECT_TRUE(contains(text, "RFSS: 1, Site: 1 (0x001)\n"));
	EXPECT_TRUE(contains(text, "NAC: 1F1\n"));
	EXPECT_TRUE(contains(text, "Site Range: 25 miles\n"));
	EXPECT_TRUE(contains(text, "Distance from you: 0.16 mi (0.26 km, 0.16 mi, 0.14 nm)\n"));
	EXPECT_TRUE(contains(text, "Bearing: 20.8 deg NNE\n"));
	EXPECT_TRUE(contains(text, "Control Channels: 852.975000 MHz, 853.500000 MHz (2 total)\n"));
	EXPECT_TRUE(contains(text, "Total Frequencies: 3\n"));
}

TEST(TestReport, nearestList)
{
	const auto site = makeSite();
	SSite bare;
	bare.description = "Nowhere";
	bare.latitude = bare.longitude = 0.0;
	const std::vector<SRankedSite> ranked { { &site, 0.16, 20.8 }, { &bare, 123.456, 270.0 } };
	std::ostringstream os;
	CReport::NearestList(os, ranked, EUnit::km);
	std::istringstream lines(os.str());
	std::string first, second;
	ASSERT_TRUE(std::getline(lines, first));
	ASSERT_TRUE(std::getline(lines, second));
	EXPECT_EQ(first.substr(0, 30), " 1.    0.16 km NNE  20.8 - Min");
	EXPECT_TRUE(contains(first, "(Hennepin) NAC 1F1 CC 852.975000 MHz, 853.500000 MHz"));
	EXPECT_EQ(second.substr(0, 28), " 2.  123.46 km W   270.0 - N");
	EXPECT_FALSE(contains(second, "NAC"));
	EXPECT_FALSE(contains(second, "CC"));
}

TEST(TestReport, controlChannels)
{
	EXPECT_EQ(CReport::ControlChannels(makeSite()), "852.975000 MHz, 853.500000 MHz");
	SSite none;
	none.frequencies = { { "851.0", false } };
	EXPECT_TRUE(CReport::ControlChannels(none).empty());
}
