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

// configuration key names
// the string values have to be unique within each section
struct SJsonKeys
{
	struct GPS
	{
		const std::string section, source, host, port, device, baudRate, file, timeout, autoTimeout;
	}
	gps
	{
		"GPS", "Source", "Host", "Port", "Device", "BaudRate", "File", "Timeout", "AutoTimeout"
	};

	struct SITES
	{
		const std::string section, csvPath, jsonPath, unit, range, count;
	}
	sites
	{
		"Sites", "CsvPath", "JsonPath", "Unit", "Range", "Count"
	};

	struct LOG
	{
		const std::string section, level, filePath;
	}
	log
	{
		"Log", "Level", "FilePath"
	};
};
