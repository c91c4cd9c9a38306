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

#include "SourceFactory.h"
#include "ManualSource.h"
#include "FileSource.h"
#include "DaemonSource.h"
#include "SerialSource.h"
#include "AutoSource.h"
#include "Log.h"

bool ParseSourceType(const std::string &name, ESourceType &type)
{
	if (0 == name.compare("auto"))
		type = ESourceType::automatic;
	else if (0 == name.compare("gpsd"))
		type = ESourceType::gpsd;
	else if (0 == name.compare("nmea"))
		type = ESourceType::nmea;
	else if (0 == name.compare("file"))
		type = ESourceType::file;
	else if (0 == name.compare("manual"))
		type = ESourceType::manual;
	else
		return true;
	return false;
}

const char *ToString(ESourceType type)
{
	switch (type)
	{
		case ESourceType::gpsd:   return "gpsd";
		case ESourceType::nmea:   return "nmea";
		case ESourceType::file:   return "file";
		case ESourceType::manual: return "manual";
		default:                  return "auto";
	}
}

std::unique_ptr<CPositionSource> MakeSource(const SSourceSettings &s)
{
	switch (s.type)
	{
		case ESourceType::manual:
			if (not s.haveManual)
			{
				LogError("Manual positioning needs both a latitude and a longitude");
				return nullptr;
			}
			return std::make_unique<CManualSource>(s.latitude, s.longitude);
		case ESourceType::file:
			if (s.file.empty())
			{
				LogError("No position file was given");
				return nullptr;
			}
			return std::make_unique<CFileSource>(s.file);
		case ESourceType::gpsd:
			return std::make_unique<CDaemonSource>(s.host, s.port);
		case ESourceType::nmea:
			if (s.device.empty())
			{
				LogError("No NMEA device was given");
				return nullptr;
			}
			return std::make_unique<CSerialSource>(s.device, s.baud);
		default:
			return std::make_unique<CAutoSource>(std::make_unique<CDaemonSource>(s.host, s.port), std::make_unique<CFileSource>(s.file), s.autoTimeout);
	}
}
