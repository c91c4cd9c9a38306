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

#include <cstdlib>
#include <cmath>
#include <sstream>

#include "NmeaParser.h"
#include "Log.h"

constexpr double KNOTS_TO_MPS = 0.514444;

static inline void split(const std::string &s, char delim, std::vector<std::string> &v)
{
	std::istringstream iss(s);
	std::string item;
	while (std::getline(iss, item, delim))
		v.push_back(item);
	// getline drops a trailing empty field
	if (not s.empty() and delim == s.back())
		v.push_back(std::string());
}

// returns true on failure
static bool toDouble(const std::string &str, double &value)
{
	if (str.empty())
		return true;
	char *end = nullptr;
	value = std::strtod(str.c_str(), &end);
	return (end == str.c_str() or '\0' != *end or not std::isfinite(value));
}

void CNmeaParser::Reset()
{
	haveGSA = false;
	gsaMode = EFixMode::noFix;
}

bool CNmeaParser::BadChecksum(const std::string &sentence)
{
	auto star = sentence.find('*');
	if (std::string::npos == star)
		return false;
	if (sentence.size() < star + 3)
		return true;

	unsigned char sum = 0u;
	for (std::size_t i=1; i<star; i++)
		sum ^= (unsigned char)sentence[i];

	char *end = nullptr;
	const std::string hex(sentence.substr(star + 1, 2));
	const auto given = std::strtoul(hex.c_str(), &end, 16);
	if ('\0' != *end)
		return true;
	return given != sum;
}

bool CNmeaParser::ParseCoordinate(const std::string &value, const std::string &hemisphere, double &degrees)
{
	double raw;
	if (toDouble(value, raw) or raw < 0.0 or hemisphere.empty())
		return true;

	// dddmm.mmmm
	const double whole = std::floor(raw / 100.0);
	const double minutes = raw - whole * 100.0;
	if (minutes >= 60.0)
		return true;
	degrees = whole + minutes / 60.0;

	switch (hemisphere.at(0))
	{
		case 'N':
		case 'E':
			break;
		case 'S':
		case 'W':
			degrees = -degrees;
			break;
		default:
			return true;
	}
	return false;
}

EFixMode CNmeaParser::fixMode(EFixMode fallback) const
{
	return haveGSA ? gsaMode : fallback;
}

EParseResult CNmeaParser::Parse(const std::string &sentence, SFixData &fix)
{
	if (sentence.size() < 7 or '$' != sentence.at(0))
		return EParseResult::unrecognized;
	if (BadChecksum(sentence))
	{
		LogDebug("NMEA checksum error: %s", sentence.c_str());
		return EParseResult::unrecognized;
	}

	std::string body(sentence.substr(1));
	auto star = body.find('*');
	if (std::string::npos != star)
		body.resize(star);

	std::vector<std::string> fields;
	split(body, ',', fields);
	// talker is two letters, then the sentence type
	if (fields.empty() or 5 != fields[0].size())
		return EParseResult::unrecognized;

	const std::string type(fields[0].substr(2));
	if (0 == type.compare("GGA"))
		return parseGGA(fields, fix);
	if (0 == type.compare("RMC"))
		return parseRMC(fields, fix);
	if (0 == type.compare("GSA"))
		return parseGSA(fields);
	return EParseResult::unrecognized;
}

// $GPGGA,time,lat,N,lon,W,quality,sats,hdop,alt,M,...
EParseResult CNmeaParser::parseGGA(const std::vector<std::string> &fields, SFixData &fix)
{
	if (fields.size() < 10)
		return EParseResult::unrecognized;
	if (fields[6].empty() or '0' == fields[6].at(0))
		return EParseResult::noFix;
	if (ParseCoordinate(fields[2], fields[3], fix.latitude) or ParseCoordinate(fields[4], fields[5], fix.longitude))
		return EParseResult::noFix;

	fix.hasAltitude = not toDouble(fields[9], fix.altitude);
	fix.mode = fixMode(fix.hasAltitude ? EFixMode::fix3D : EFixMode::fix2D);
	return (EFixMode::noFix == fix.mode) ? EParseResult::noFix : EParseResult::fix;
}

// $GPRMC,time,status,lat,N,lon,W,knots,track,date,...
EParseResult CNmeaParser::parseRMC(const std::vector<std::string> &fields, SFixData &fix)
{
	if (fields.size() < 9)
		return EParseResult::unrecognized;
	if (0 != fields[2].compare("A"))
		return EParseResult::noFix;
	if (ParseCoordinate(fields[3], fields[4], fix.latitude) or ParseCoordinate(fields[5], fields[6], fix.longitude))
		return EParseResult::noFix;

	double knots;
	if (not toDouble(fields[7], knots))
	{
		fix.hasSpeed = true;
		fix.speed = knots * KNOTS_TO_MPS;
	}
	fix.hasTrack = not toDouble(fields[8], fix.track);
	fix.mode = fixMode(EFixMode::fix2D);
	return (EFixMode::noFix == fix.mode) ? EParseResult::noFix : EParseResult::fix;
}

// $GPGSA,selection,mode,...
EParseResult CNmeaParser::parseGSA(const std::vector<std::string> &fields)
{
	if (fields.size() < 3 or fields[2].empty())
		return EParseResult::unrecognized;
	switch (fields[2].at(0))
	{
		case '2':
			gsaMode = EFixMode::fix2D;
			break;
		case '3':
			gsaMode = EFixMode::fix3D;
			break;
		default:
			gsaMode = EFixMode::noFix;
			break;
	}
	haveGSA = true;
	// it carries no position, only mode 1 reports anything about the fix
	return (EFixMode::noFix == gsaMode) ? EParseResult::noFix : EParseResult::unrecognized;
}
