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

#include <memory>
#include <string>

#include "GeoMath.h"

enum class EFixMode { noFix, fix2D, fix3D };

// what a backend collects before asking for a CPosition
struct SFixData
{
	double latitude = 0.0, longitude = 0.0;
	bool hasAltitude = false;
	double altitude = 0.0;	// meters
	bool hasSpeed = false;
	double speed = 0.0;		// meters per second
	bool hasTrack = false;
	double track = 0.0;		// degrees true
	EFixMode mode = EFixMode::noFix;
};

class CPosition
{
public:
	static constexpr double StationarySpeed = 0.5;	// m/s

	CPosition() = delete;
	~CPosition() {}

	// returns nullptr if the latitude or longitude is out of range
	static std::unique_ptr<CPosition> Make(const SFixData &data);
	static std::unique_ptr<CPosition> Make(double lat, double lon, EFixMode mode);

	double GetLatitude() const { return data.latitude; }
	double GetLongitude() const { return data.longitude; }
	SLatLon GetLatLon() const { return SLatLon { data.latitude, data.longitude }; }
	EFixMode GetFixMode() const { return data.mode; }

	bool HasAltitude() const { return data.hasAltitude; }
	double GetAltitude() const { return data.altitude; }
	bool HasSpeed() const { return data.hasSpeed; }
	double GetSpeed() const { return data.speed; }
	bool HasTrack() const { return data.hasTrack; }
	double GetTrack() const { return data.track; }

	double AltitudeFeet() const;
	double SpeedMph() const;
	double SpeedKnots() const;
	// no speed counts as stationary, and then the track means nothing
	bool IsStationary() const;

	// "+44.977800", "-93.265000"
	void GetPosition(std::string &la, std::string &lo) const;

private:
	explicit CPosition(const SFixData &d) : data(d) {}

	const SFixData data;
};

const char *ToString(EFixMode mode);
