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

#include "Position.h"

constexpr double METERS_TO_FEET = 3.28084;
constexpr double MPS_TO_MPH     = 2.23694;
constexpr double MPS_TO_KNOTS   = 1.94384;

std::unique_ptr<CPosition> CPosition::Make(const SFixData &d)
{
	if (not CGeoMath::IsValid(SLatLon { d.latitude, d.longitude }))
		return nullptr;

	SFixData data(d);
	// a non-finite optional value is the same as no value
	if (data.hasAltitude and not std::isfinite(data.altitude))
		data.hasAltitude = false;
	if (data.hasSpeed and not std::isfinite(data.speed))
		data.hasSpeed = false;
	if (data.hasTrack and not std::isfinite(data.track))
		data.hasTrack = false;

	return std::unique_ptr<CPosition>(new CPosition(data));
}

std::unique_ptr<CPosition> CPosition::Make(double lat, double lon, EFixMode mode)
{
	SFixData data;
	data.latitude = lat;
	data.longitude = lon;
	data.mode = mode;
	return Make(data);
}

double CPosition::AltitudeFeet() const
{
	return data.altitude * METERS_TO_FEET;
}

double CPosition::SpeedMph() const
{
	return data.speed * MPS_TO_MPH;
}

double CPosition::SpeedKnots() const
{
	return data.speed * MPS_TO_KNOTS;
}

bool CPosition::IsStationary() const
{
	return (not data.hasSpeed) or data.speed < StationarySpeed;
}

void CPosition::GetPosition(std::string &la, std::string &lo) const
{
	char buf[16];
	snprintf(buf, 15, "%+.6f", data.latitude);
	la.assign(buf);
	snprintf(buf, 15, "%+.6f", data.longitude);
	lo.assign(buf);
}

const char *ToString(EFixMode mode)
{
	switch (mode)
	{
		case EFixMode::fix2D: return "2D Fix";
		case EFixMode::fix3D: return "3D Fix";
		default:              return "No Fix";
	}
}
