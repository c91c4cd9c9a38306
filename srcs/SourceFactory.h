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

#include <cstdint>
#include <memory>
#include <string>

#include "PositionSource.h"

enum class ESourceType { automatic, gpsd, nmea, file, manual };

struct SSourceSettings
{
	ESourceType type = ESourceType::automatic;
	std::string host;
	uint16_t port = 0;
	std::string device;
	unsigned baud = 0u;
	std::string file;
	double autoTimeout = 0.0;
	bool haveManual = false;
	double latitude = 0.0, longitude = 0.0;
};

// "auto", "gpsd", "nmea", "file" or "manual", returns true on failure
bool ParseSourceType(const std::string &name, ESourceType &type);
const char *ToString(ESourceType type);

// returns nullptr if the settings can't make the source
std::unique_ptr<CPositionSource> MakeSource(const SSourceSettings &settings);
