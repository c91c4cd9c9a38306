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
#include <cstdio>

#include "GridConverter.h"

// WGS-84
constexpr double WGS84_A  = 6378137.0;
constexpr double WGS84_F  = 1.0 / 298.257223563;
constexpr double WGS84_E2 = WGS84_F * (2.0 - WGS84_F);
constexpr double UTM_K0   = 0.9996;
constexpr double FALSE_EASTING  = 500000.0;
constexpr double FALSE_NORTHING = 10000000.0;
constexpr double ONEHT    = 100000.0;
constexpr double EPSILON2 = 4.99e-4;	// keeps 0.9999999 m from truncating to 0

// Latitude bands are 8 degrees from 80S, X is stretched to 84N.
static const char *BAND_LETTERS = "CDEFGHJKLMNPQRSTUVWXX";

// 100 km column letters repeat every three zones, rows every two
static const char *COLUMN_SETS[3] { "ABCDEFGH", "JKLMNPQR", "STUVWXYZ" };
static const char *ROW_LETTERS = "ABCDEFGHJKLMNPQRSTUV";

// the irregular zones, 32V over southwest Norway and the four Svalbard zones
static const SZoneException ZONE_EXCEPTIONS[] {
	{ 56.0, 64.0,  3.0, 12.0, 32 },
	{ 72.0, 84.0,  0.0,  9.0, 31 },
	{ 72.0, 84.0,  9.0, 21.0, 33 },
	{ 72.0, 84.0, 21.0, 33.0, 35 },
	{ 72.0, 84.0, 33.0, 42.0, 37 }
};

// -180 is the same meridian as 180
static double normalizeLongitude(double lon)
{
	while (lon >= 180.0)
		lon -= 360.0;
	while (lon < -180.0)
		lon += 360.0;
	return lon;
}

const SZoneException *CGridConverter::FindZoneException(const SLatLon &p)
{
	const double lon = normalizeLongitude(p.lon);
	for (const auto &e : ZONE_EXCEPTIONS)
	{
		// the top band is closed at 84N
		const bool inBand = p.lat >= e.south and (p.lat < e.north or (p.lat == e.north and e.north == MaxUTMLatitude));
		if (inBand and lon >= e.west and lon < e.east)
			return &e;
	}
	return nullptr;
}

int CGridConverter::UTMZone(const SLatLon &p)
{
	auto e = FindZoneException(p);
	if (e)
		return e->zone;

	int zone = int(floor((normalizeLongitude(p.lon) + 180.0) / 6.0)) + 1;
	if (zone > 60)
		zone = 1;
	return zone;
}

char CGridConverter::LatitudeBand(double lat)
{
	if (lat < MinMGRSLatitude or lat > MaxUTMLatitude)
		return '\0';
	return BAND_LETTERS[int(floor((lat - MinMGRSLatitude) / 8.0))];
}

EGridError CGridConverter::ToUTM(const SLatLon &p, SUTM &utm)
{
	if (not CGeoMath::IsValid(p))
		return EGridError::invalidCoordinate;
	if (fabs(p.lat) > MaxUTMLatitude)
		return EGridError::undefinedProjection;

	const int zone = UTMZone(p);
	const double centralMeridian = (zone - 1) * 6.0 - 180.0 + 3.0;

	const double e2 = WGS84_E2;
	const double e4 = e2 * e2;
	const double e6 = e4 * e2;
	const double ep2 = e2 / (1.0 - e2);

	const double phi = CGeoMath::Radians(p.lat);
	const double sinphi = sin(phi);
	const double cosphi = cos(phi);
	const double tanphi = tan(phi);

	const double N = WGS84_A / sqrt(1.0 - e2 * sinphi * sinphi);
	const double T = tanphi * tanphi;
	const double C = ep2 * cosphi * cosphi;
	const double A = cosphi * CGeoMath::Radians(normalizeLongitude(p.lon - centralMeridian));

	// meridional arc
	const double M = WGS84_A * ((1.0 - e2 / 4.0 - 3.0 * e4 / 64.0 - 5.0 * e6 / 256.0) * phi
		- (3.0 * e2 / 8.0 + 3.0 * e4 / 32.0 + 45.0 * e6 / 1024.0) * sin(2.0 * phi)
		+ (15.0 * e4 / 256.0 + 45.0 * e6 / 1024.0) * sin(4.0 * phi)
		- (35.0 * e6 / 3072.0) * sin(6.0 * phi));

	const double A2 = A * A;
	const double A3 = A2 * A;
	const double A4 = A3 * A;
	const double A5 = A4 * A;
	const double A6 = A5 * A;

	utm.zone = zone;
	utm.easting = UTM_K0 * N * (A + (1.0 - T + C) * A3 / 6.0
		+ (5.0 - 18.0 * T + T * T + 72.0 * C - 58.0 * ep2) * A5 / 120.0) + FALSE_EASTING;
	utm.northing = UTM_K0 * (M + N * tanphi * (A2 / 2.0 + (5.0 - T + 9.0 * C + 4.0 * C * C) * A4 / 24.0
		+ (61.0 - 58.0 * T + T * T + 600.0 * C - 330.0 * ep2) * A6 / 720.0));

	if (p.lat < 0.0)
	{
		utm.hemisphere = EHemisphere::south;
		utm.northing += FALSE_NORTHING;
	}
	else
		utm.hemisphere = EHemisphere::north;

	return EGridError::none;
}

EGridError CGridConverter::ToMGRS(const SLatLon &p, std::string &mgrs, unsigned precision)
{
	SUTM utm;
	auto err = ToUTM(p, utm);
	if (EGridError::none != err)
		return err;
	// south of 80S is UPS territory
	const char band = LatitudeBand(p.lat);
	if ('\0' == band)
		return EGridError::undefinedProjection;
	if (precision > 5u)
		precision = 5u;

	const double easting  = utm.easting  + EPSILON2;
	const double northing = utm.northing + EPSILON2;

	const int column = int(floor(easting / ONEHT)) - 1;
	if (column < 0 or column > 7)
		return EGridError::undefinedProjection;
	const char colLetter = COLUMN_SETS[(utm.zone - 1) % 3][column];

	long row = long(floor(northing / ONEHT));
	if (0 == utm.zone % 2)
		row += 5;
	const char rowLetter = ROW_LETTERS[row % 20];

	long divisor = 1;
	for (unsigned i=precision; i<5u; i++)
		divisor *= 10;
	const long e = long(fmod(easting,  ONEHT)) / divisor;
	const long n = long(fmod(northing, ONEHT)) / divisor;

	char buf[24];
	if (precision)
		snprintf(buf, sizeof(buf), "%02d%c%c%c%0*ld%0*ld", utm.zone, band, colLetter, rowLetter, int(precision), e, int(precision), n);
	else
		snprintf(buf, sizeof(buf), "%02d%c%c%c", utm.zone, band, colLetter, rowLetter);
	mgrs.assign(buf);
	return EGridError::none;
}

EGridError CGridConverter::ToMaidenhead(const SLatLon &p, std::string &locator, unsigned chars)
{
	if (not CGeoMath::IsValid(p))
		return EGridError::invalidCoordinate;

	auto cell = [](double v, int max) { int i = int(v); return (i > max) ? max : i; };

	double lon = p.lon + 180.0;
	double lat = p.lat + 90.0;

	// field, 20x10 degrees
	const int flon = cell(lon / 20.0, 17);
	const int flat = cell(lat / 10.0, 17);
	lon -= flon * 20.0;
	lat -= flat * 10.0;

	// square, 2x1 degrees
	const int slon = cell(lon / 2.0, 9);
	const int slat = cell(lat, 9);
	lon = (lon - slon * 2.0) * 12.0;
	lat = (lat - slat) * 24.0;

	// subsquare, 5x2.5 minutes
	const int ulon = cell(lon, 23);
	const int ulat = cell(lat, 23);

	locator.clear();
	locator.push_back('A' + flon);
	locator.push_back('A' + flat);
	locator.push_back('0' + slon);
	locator.push_back('0' + slat);
	locator.push_back('a' + ulon);
	locator.push_back('a' + ulat);

	if (chars >= 8u)
	{
		locator.push_back('0' + cell((lon - ulon) * 10.0, 9));
		locator.push_back('0' + cell((lat - ulat) * 10.0, 9));
	}
	return EGridError::none;
}

EGridError CGridConverter::ToGrid(const SLatLon &p, SGridRepresentation &grid)
{
	grid.utmValid = false;
	grid.mgrs.clear();
	auto err = ToMaidenhead(p, grid.maidenhead);
	if (EGridError::none != err)
		return err;

	err = ToUTM(p, grid.utm);
	if (EGridError::none != err)
		return err;
	grid.utmValid = true;

	return ToMGRS(p, grid.mgrs);
}

std::string CGridConverter::FormatUTM(const SUTM &utm, double lat)
{
	char band = LatitudeBand(lat);
	if ('\0' == band)
		band = (EHemisphere::north == utm.hemisphere) ? 'N' : 'S';
	char buf[64];
	snprintf(buf, sizeof(buf), "Zone %d%c E:%.0f N:%.0f", utm.zone, band, utm.easting, utm.northing);
	return std::string(buf);
}

void CGridConverter::SplitMGRS(const std::string &mgrs, std::string &square, std::string &coords)
{
	square.clear();
	coords.clear();
	if (mgrs.size() < 5)
	{
		square.assign(mgrs);
		return;
	}
	square.assign(mgrs.substr(0, 3) + " " + mgrs.substr(3, 2));
	const auto digits = mgrs.substr(5);
	const auto half = digits.size() / 2;
	if (half)
		coords.assign(digits.substr(0, half) + " " + digits.substr(half));
}

const char *ToString(EGridError err)
{
	switch (err)
	{
		case EGridError::none:                return "no error";
		case EGridError::invalidCoordinate:   return "invalid coordinate";
		case EGridError::undefinedProjection: return "grid unavailable at this latitude";
		default:                              return "unknown grid error";
	}
}
