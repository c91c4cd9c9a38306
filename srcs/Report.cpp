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

#include <cstdio>

#include "Report.h"

void CReport::Position(std::ostream &os, const CPosition &position)
{
	char buf[128];
	snprintf(buf, sizeof(buf), "GPS Position: %.6f, %.6f", position.GetLatitude(), position.GetLongitude());
	os << buf << std::endl;

	if (position.HasAltitude())
	{
		snprintf(buf, sizeof(buf), "  Altitude: %.1f m (%.0f ft)", position.GetAltitude(), position.AltitudeFeet());
		os << buf << std::endl;
	}
	if (position.HasSpeed())
	{
		if (position.IsStationary())
			os << "  Speed: stationary" << std::endl;
		else
		{
			snprintf(buf, sizeof(buf), "  Speed: %.1f m/s (%.1f mph, %.1f kn)", position.GetSpeed(), position.SpeedMph(), position.SpeedKnots());
			os << buf << std::endl;
			if (position.HasTrack())
			{
				snprintf(buf, sizeof(buf), "  Heading: %.1f deg %s", position.GetTrack(), CGeoMath::CardinalDirection(position.GetTrack()));
				os << buf << std::endl;
			}
		}
	}
	os << "  Fix Quality: " << ToString(position.GetFixMode()) << std::endl;
}

void CReport::Grid(std::ostream &os, const CPosition &position)
{
	SGridRepresentation grid;
	const auto lat = position.GetLatitude();
	auto err = CGridConverter::ToGrid(position.GetLatLon(), grid);

	if (grid.utmValid)
		os << "  UTM: " << CGridConverter::FormatUTM(grid.utm, lat) << std::endl;
	else
		os << "  UTM: " << ToString(err) << std::endl;

	if (grid.mgrs.empty())
		os << "  MGRS: " << ToString(err) << std::endl;
	else
	{
		std::string square, coords;
		CGridConverter::SplitMGRS(grid.mgrs, square, coords);
		os << "  MGRS: " << square << ' ' << coords << std::endl;
	}

	if (not grid.maidenhead.empty())
		os << "  Maidenhead: " << grid.maidenhead << std::endl;
}

std::string CReport::ControlChannels(const SSite &site)
{
	std::string list;
	for (const auto &f : site.frequencies)
	{
		if (not f.isControl)
			continue;
		if (not list.empty())
			list.append(", ");
		list.append(f.text + " MHz");
	}
	return list;
}

void CReport::SiteDetail(std::ostream &os, const SRankedSite &ranked, EUnit unit)
{
	const SSite &site = *ranked.site;
	char buf[256];

	os << "Site: " << site.description << std::endl;
	os << "County: " << site.county << std::endl;
	snprintf(buf, sizeof(buf), "Location: %.6f, %.6f", site.latitude, site.longitude);
	os << buf << std::endl;
	if (not site.Attribute("rfss").empty() or not site.Attribute("site_dec").empty())
		os << "RFSS: " << site.Attribute("rfss") << ", Site: " << site.Attribute("site_dec") << " (0x" << site.Attribute("site_hex") << ")" << std::endl;
	if (not site.Attribute("nac").empty())
		os << "NAC: " << site.Attribute("nac") << std::endl;
	// the catalog gives the range in miles
	if (not site.Attribute("range").empty())
		os << "Site Range: " << site.Attribute("range") << " miles" << std::endl;

	snprintf(buf, sizeof(buf), "Distance from you: %.2f %s (%.2f km, %.2f mi, %.2f nm)", ranked.distance, CGeoMath::UnitName(unit),
		CGeoMath::ConvertDistance(ranked.distance, unit, EUnit::km),
		CGeoMath::ConvertDistance(ranked.distance, unit, EUnit::mi),
		CGeoMath::ConvertDistance(ranked.distance, unit, EUnit::nm));
	os << buf << std::endl;
	snprintf(buf, sizeof(buf), "Bearing: %.1f deg %s", ranked.bearing, CGeoMath::CardinalDirection(ranked.bearing));
	os << buf << std::endl;

	const auto cc = site.ControlCount();
	if (cc)
		os << "Control Channels: " << ControlChannels(site) << " (" << cc << " total)" << std::endl;
	if (not site.frequencies.empty())
		os << "Total Frequencies: " << site.frequencies.size() << std::endl;
}

void CReport::NearestList(std::ostream &os, const std::vector<SRankedSite> &ranked, EUnit unit)
{
	char buf[256];
	unsigned i = 0u;
	for (const auto &r : ranked)
	{
		const SSite &site = *r.site;
		snprintf(buf, sizeof(buf), "%2u. %7.2f %s %-3s %5.1f - %-40s (%s)", ++i, r.distance, CGeoMath::UnitName(unit),
			CGeoMath::CardinalDirection(r.bearing), r.bearing, site.description.c_str(), site.county.c_str());
		os << buf;
		if (not site.Attribute("nac").empty())
			os << " NAC " << site.Attribute("nac");
		const auto cc = ControlChannels(site);
		if (not cc.empty())
			os << " CC " << cc;
		os << std::endl;
	}
}
