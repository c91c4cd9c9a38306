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
#include <vector>

#include "StreamSource.h"

// NMEA 0183 GGA, RMC and GSA from any talker. The fix mode from the last
// GSA qualifies later GGA and RMC fixes.
class CNmeaParser
{
public:
	CNmeaParser() { Reset(); }

	void Reset();
	EParseResult Parse(const std::string &sentence, SFixData &fix);

	// returns true if a checksum is present and wrong
	static bool BadChecksum(const std::string &sentence);
	// "4458.668", "N" -> 44.9778, returns true on failure
	static bool ParseCoordinate(const std::string &value, const std::string &hemisphere, double &degrees);

private:
	EParseResult parseGGA(const std::vector<std::string> &fields, SFixData &fix);
	EParseResult parseRMC(const std::vector<std::string> &fields, SFixData &fix);
	EParseResult parseGSA(const std::vector<std::string> &fields);
	EFixMode fixMode(EFixMode fallback) const;

	bool haveGSA;
	EFixMode gsaMode;
};
