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

#pragma once

#include <string>

#include "GeoMath.h"

enum class EGridError { none, invalidCoordinate, undefinedProjection };
enum class EHemisphere { north, south };

struct SUTM
{
	int zone;
	EHemisphere hemisphere;
	double easting, northing;	// meters
};

struct SGridRepresentation
{
	bool utmValid;	// false outside the UTM band, then utm and mgrs are unset
	SUTM utm;
	std::string mgrs;
	std::string maidenhead;
};

// a zone that doesn't follow the six degree rule
struct SZoneException
{
	double south, north;	// latitude band, south inclusive
	double west, east;		// longitude range, west inclusive
	int zone;
};

// WGS-84 grid conversions. These are pure functions, there is no cache.
class CGridConverter
{
public:
	static constexpr double MaxUTMLatitude  = 84.0;
	static constexpr double MinMGRSLatitude = -80.0;

	static EGridError ToUTM(const SLatLon &p, SUTM &utm);
	// precision is the number of digits in each of easting and northing, 0-5
	static EGridError ToMGRS(const SLatLon &p, std::string &mgrs, unsigned precision = 5u);
	// chars is 6 or 8
	static EGridError ToMaidenhead(const SLatLon &p, std::string &locator, unsigned chars = 6u);
	// Maidenhead is filled in even when the UTM band is exceeded
	static EGridError ToGrid(const SLatLon &p, SGridRepresentation &grid);

	// natural zone plus the Norway and Svalbard exceptions
	static int UTMZone(const SLatLon &p);
	static char LatitudeBand(double lat);
	static const SZoneException *FindZoneException(const SLatLon &p);

	// "Zone 15T E:479106 N:4980518"
	static std::string FormatUTM(const SUTM &utm, double lat);
	// "15TVK7910580518" -> "15T VK", "79105 80518"
	static void SplitMGRS(const std::string &mgrs, std::string &square, std::string &coords);
};

const char *ToString(EGridError err);
