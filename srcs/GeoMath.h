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

enum class EUnit { km, mi, nm };

struct SLatLon
{
	double lat, lon;	// decimal degrees
};

// Spherical geodesy. Every function that takes a point validates it first
// and the bool returning ones return true on failure.
class CGeoMath
{
public:
	static constexpr double EarthRadiusKm = 6371.0;
	static constexpr double KmToMiles     = 0.621371;
	static constexpr double KmToNautical  = 0.539957;

	static bool IsValid(const SLatLon &p);

	// great-circle (haversine) distance in the given unit
	static bool Distance(const SLatLon &a, const SLatLon &b, EUnit unit, double &distance);
	// initial true bearing from a to b in [0,360), 0 when a == b
	static bool Bearing(const SLatLon &a, const SLatLon &b, double &bearing);

	static double FromKm(double km, EUnit unit);
	static double ConvertDistance(double distance, EUnit from, EUnit to);

	static const char *UnitName(EUnit unit);	// "km", "mi" or "nm"
	static const char *UnitLabel(EUnit unit);	// "kilometers", ...
	// returns true on failure
	static bool ParseUnit(const std::string &name, EUnit &unit);

	// 16 point compass name for a bearing
	static const char *CardinalDirection(double bearing);

	static double Radians(double degrees);
	static double Degrees(double radians);
};
