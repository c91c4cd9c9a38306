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

#include <cmath>

#include "GeoMath.h"

constexpr double PI = 3.14159265358979323846;

double CGeoMath::Radians(double degrees)
{
	return degrees * PI / 180.0;
}

double CGeoMath::Degrees(double radians)
{
	return radians * 180.0 / PI;
}

bool CGeoMath::IsValid(const SLatLon &p)
{
	// NaN fails both comparisons
	return (p.lat >= -90.0 and p.lat <= 90.0) and (p.lon >= -180.0 and p.lon <= 180.0);
}

double CGeoMath::FromKm(double km, EUnit unit)
{
	switch (unit)
	{
		case EUnit::mi:
			return km * KmToMiles;
		case EUnit::nm:
			return km * KmToNautical;
		default:
			return km;
	}
}

bool CGeoMath::Distance(const SLatLon &a, const SLatLon &b, EUnit unit, double &distance)
{
	if (not IsValid(a) or not IsValid(b))
		return true;

	const double lat1 = Radians(a.lat);
	const double lat2 = Radians(b.lat);
	const double dlat = Radians(b.lat - a.lat);
	const double dlon = Radians(b.lon - a.lon);

	const double sdlat = sin(dlat / 2.0);
	const double sdlon = sin(dlon / 2.0);
	double h = sdlat * sdlat + cos(lat1) * cos(lat2) * sdlon * sdlon;
	if (h > 1.0)
		h = 1.0;	// rounding, near antipodal points
	const double c = 2.0 * atan2(sqrt(h), sqrt(1.0 - h));

	distance = FromKm(EarthRadiusKm * c, unit);
	return false;
}

bool CGeoMath::Bearing(const SLatLon &a, const SLatLon &b, double &bearing)
{
	if (not IsValid(a) or not IsValid(b))
		return true;

	if (a.lat == b.lat and a.lon == b.lon)
	{
		bearing = 0.0;
		return false;
	}

	const double lat1 = Radians(a.lat);
	const double lat2 = Radians(b.lat);
	const double dlon = Radians(b.lon - a.lon);

	const double x = sin(dlon) * cos(lat2);
	const double y = cos(lat1) * sin(lat2) - sin(lat1) * cos(lat2) * cos(dlon);

	double deg = fmod(Degrees(atan2(x, y)) + 360.0, 360.0);
	if (deg >= 360.0 or deg < 0.0)
		deg = 0.0;
	bearing = deg;
	return false;
}

double CGeoMath::ConvertDistance(double distance, EUnit from, EUnit to)
{
	if (from == to)
		return distance;

	// everything goes through kilometers
	double km;
	switch (from)
	{
		case EUnit::mi:
			km = distance * 1.60934;
			break;
		case EUnit::nm:
			km = distance * 1.852;
			break;
		default:
			km = distance;
			break;
	}
	return FromKm(km, to);
}

const char *CGeoMath::UnitName(EUnit unit)
{
	switch (unit)
	{
		case EUnit::mi: return "mi";
		case EUnit::nm: return "nm";
		default:        return "km";
	}
}

const char *CGeoMath::UnitLabel(EUnit unit)
{
	switch (unit)
	{
		case EUnit::mi: return "miles";
		case EUnit::nm: return "nautical miles";
		default:        return "kilometers";
	}
}

bool CGeoMath::ParseUnit(const std::string &name, EUnit &unit)
{
	if (0 == name.compare("km"))
		unit = EUnit::km;
	else if (0 == name.compare("mi"))
		unit = EUnit::mi;
	else if (0 == name.compare("nm"))
		unit = EUnit::nm;
	else
		return true;
	return false;
}

const char *CGeoMath::CardinalDirection(double bearing)
{
	static const char *points[16] { "N", "NNE", "NE", "ENE", "E", "ESE", "SE", "SSE", "S", "SSW", "SW", "WSW", "W", "WNW", "NW", "NNW" };
	double b = fmod(bearing, 360.0);
	if (b < 0.0)
		b += 360.0;
	return points[unsigned((b + 11.25) / 22.5) % 16u];
}
