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

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <algorithm>

#include "Configure.h"
#include "GeoMath.h"

// the global definition
SJsonKeys g_Keys;

static inline void split(const std::string &s, char delim, std::vector<std::string> &v)
{
	std::istringstream iss(s);
	std::string item;
	while (std::getline(iss, item, delim))
		v.push_back(item);
}

// trim from start (in place)
static inline void ltrim(std::string &s)
{
	s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) {
		return !std::isspace(ch);
	}));
}

// trim from end (in place)
static inline void rtrim(std::string &s)
{
	s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) {
		return !std::isspace(ch);
	}).base(), s.end());
}

// trim from both ends (in place)
static inline void trim(std::string &s)
{
	ltrim(s);
	rtrim(s);
}

CConfigure::CConfigure() : counter(0)
{
	SetDefaults();
}

void CConfigure::SetDefaults()
{
	data = nlohmann::json::object();
	data[g_Keys.gps.section][g_Keys.gps.source]      = "auto";
	data[g_Keys.gps.section][g_Keys.gps.host]        = "127.0.0.1";
	data[g_Keys.gps.section][g_Keys.gps.port]        = 2947u;
	data[g_Keys.gps.section][g_Keys.gps.device]      = "/dev/ttyUSB0";
	data[g_Keys.gps.section][g_Keys.gps.baudRate]    = 9600u;
	data[g_Keys.gps.section][g_Keys.gps.file]        = "gps_position.txt";
	data[g_Keys.gps.section][g_Keys.gps.timeout]     = 10.0f;
	data[g_Keys.gps.section][g_Keys.gps.autoTimeout] = 3.0f;

	data[g_Keys.sites.section][g_Keys.sites.csvPath]  = "trs_sites.csv";
	data[g_Keys.sites.section][g_Keys.sites.jsonPath] = "";
	data[g_Keys.sites.section][g_Keys.sites.unit]     = "mi";
	data[g_Keys.sites.section][g_Keys.sites.range]    = 30.0f;
	data[g_Keys.sites.section][g_Keys.sites.count]    = 10u;

	data[g_Keys.log.section][g_Keys.log.level]    = 4u;
	data[g_Keys.log.section][g_Keys.log.filePath] = "";
}

bool CConfigure::ReadData(const std::string &path)
{
	std::ifstream cfgfile(path.c_str(), std::ifstream::in);
	if (! cfgfile.is_open())
	{
		std::cerr << "ERROR: '" << path << "' was not found!" << std::endl;
		return true;
	}
	auto rval = ReadData(cfgfile, path);
	cfgfile.close();
	return rval;
}

bool CConfigure::ReadData(std::istream &is, const std::string &name)
{
	ESection section = ESection::none;
	counter = 0;

	std::string line;
	while (std::getline(is, line))
	{
		counter++;
		trim(line);
		if (3 > line.size())
			continue;	// can't be anything
		if ('#' == line.at(0))
			continue;	// skip comments

		// check for next section
		if ('[' == line.at(0))
		{
			std::string hname(line.substr(1));
			auto pos = hname.find(']');
			if (std::string::npos != pos)
				hname.resize(pos);
			if (0 == hname.compare(g_Keys.gps.section))
				section = ESection::gps;
			else if (0 == hname.compare(g_Keys.sites.section))
				section = ESection::sites;
			else if (0 == hname.compare(g_Keys.log.section))
				section = ESection::log;
			else
			{
				std::cerr << "WARNING: unknown ini file section: " << line << std::endl;
				section = ESection::none;
			}
			continue;
		}

		std::vector<std::string> tokens;
		split(line, '=', tokens);
		if (2 > tokens.size())
		{
			std::cout << "WARNING: " << name << " line #" << counter << ": '" << line << "' does not contain an equal sign, skipping" << std::endl;
			continue;
		}
		// check value for end-of-line comment
		auto pos = tokens[1].find('#');
		if (std::string::npos != pos)
			tokens[1].assign(tokens[1].substr(0, pos));
		// trim whitespace from around the '='
		trim(tokens[0]);
		trim(tokens[1]);
		const std::string key(tokens[0]);
		const std::string value(tokens[1]);
		if (key.empty() || value.empty())
		{
			std::cout << "WARNING: " << name << " line #" << counter << " '" << line << "' missing key or value, skipping" << std::endl;
			continue;
		}
		switch (section)
		{
			case ESection::gps:
				if (0 == key.compare(g_Keys.gps.source))
					data[g_Keys.gps.section][g_Keys.gps.source] = value;
				else if (0 == key.compare(g_Keys.gps.host))
					data[g_Keys.gps.section][g_Keys.gps.host] = value;
				else if (0 == key.compare(g_Keys.gps.port))
					data[g_Keys.gps.section][g_Keys.gps.port] = getUnsigned(value, "gpsd Port", 1u, 65535u, 2947u);
				else if (0 == key.compare(g_Keys.gps.device))
					data[g_Keys.gps.section][g_Keys.gps.device] = value;
				else if (0 == key.compare(g_Keys.gps.baudRate))
					data[g_Keys.gps.section][g_Keys.gps.baudRate] = getUnsigned(value, "NMEA Baud Rate", 4800u, 460800u, 9600u);
				else if (0 == key.compare(g_Keys.gps.file))
					data[g_Keys.gps.section][g_Keys.gps.file] = value;
				else if (0 == key.compare(g_Keys.gps.timeout))
					data[g_Keys.gps.section][g_Keys.gps.timeout] = getFloat(value, "GPS Timeout (s)", 0.5f, 600.0f, 10.0f);
				else if (0 == key.compare(g_Keys.gps.autoTimeout))
					data[g_Keys.gps.section][g_Keys.gps.autoTimeout] = getFloat(value, "gpsd Timeout in auto mode (s)", 0.5f, 60.0f, 3.0f);
				else
					badParam(g_Keys.gps.section, key);
				break;
			case ESection::sites:
				if (0 == key.compare(g_Keys.sites.csvPath))
					data[g_Keys.sites.section][g_Keys.sites.csvPath] = value;
				else if (0 == key.compare(g_Keys.sites.jsonPath))
					data[g_Keys.sites.section][g_Keys.sites.jsonPath] = value;
				else if (0 == key.compare(g_Keys.sites.unit))
					data[g_Keys.sites.section][g_Keys.sites.unit] = value;
				else if (0 == key.compare(g_Keys.sites.range))
					data[g_Keys.sites.section][g_Keys.sites.range] = getFloat(value, "Search Range", 0.1f, 20000.0f, 30.0f);
				else if (0 == key.compare(g_Keys.sites.count))
					data[g_Keys.sites.section][g_Keys.sites.count] = getUnsigned(value, "Nearest Site Count", 1u, 1000u, 10u);
				else
					badParam(g_Keys.sites.section, key);
				break;
			case ESection::log:
				if (0 == key.compare(g_Keys.log.level))
					data[g_Keys.log.section][g_Keys.log.level] = getUnsigned(value, "Log Level 0-6", 0u, 6u, 4u);
				else if (0 == key.compare(g_Keys.log.filePath))
					data[g_Keys.log.section][g_Keys.log.filePath] = value;
				else
					badParam(g_Keys.log.section, key);
				break;
			case ESection::none:
			default:
				std::cout << "WARNING: parameter '" << line << "' defined before any [section]" << std::endl;
				break;
		}
	}

	return Validate();
}

bool CConfigure::Validate() const
{
	bool rval = false;

	const auto source = GetString(g_Keys.gps.section, g_Keys.gps.source);
	if (source.compare("auto") and source.compare("gpsd") and source.compare("nmea") and source.compare("file") and source.compare("manual"))
	{
		std::cerr << "ERROR: [" << g_Keys.gps.section << ']' << g_Keys.gps.source << " '" << source << "' must be auto, gpsd, nmea, file or manual" << std::endl;
		rval = true;
	}
	if (0 == source.compare("nmea"))
	{
		const auto path = GetString(g_Keys.gps.section, g_Keys.gps.device);
		checkPath(g_Keys.gps.section, g_Keys.gps.device, path, std::filesystem::file_type::character);
	}

	const auto speed = GetUnsigned(g_Keys.gps.section, g_Keys.gps.baudRate);
	switch (speed)
	{
		case 4800u:
		case 9600u:
		case 19200u:
		case 38400u:
		case 57600u:
		case 115200u:
		case 230400u:
		case 460800u:
			break;
		default:
			std::cerr << "ERROR: Baud Rate of " << speed << " is not acceptable" << std::endl;
			rval = true;
	}

	EUnit unit;
	const auto unitname = GetString(g_Keys.sites.section, g_Keys.sites.unit);
	if (CGeoMath::ParseUnit(unitname, unit))
	{
		std::cerr << "ERROR: [" << g_Keys.sites.section << ']' << g_Keys.sites.unit << " '" << unitname << "' must be km, mi or nm" << std::endl;
		rval = true;
	}

	const auto jsonpath = GetString(g_Keys.sites.section, g_Keys.sites.jsonPath);
	if (jsonpath.empty())
	{
		const auto csvpath = GetString(g_Keys.sites.section, g_Keys.sites.csvPath);
		checkPath(g_Keys.sites.section, g_Keys.sites.csvPath, csvpath, std::filesystem::file_type::regular);
	}
	else
		checkPath(g_Keys.sites.section, g_Keys.sites.jsonPath, jsonpath, std::filesystem::file_type::regular);

	return rval;
}

float CConfigure::getFloat(const std::string &valuestr, const std::string &label, float min, float max, float def) const
{
	char *end = nullptr;
	auto f = std::strtof(valuestr.c_str(), &end);
	if (end == valuestr.c_str() || *end)
	{
		std::cout << "WARNING: line #" << counter << ": " << label << " '" << valuestr << "' is not a number. Reset to " << def << std::endl;
		return def;
	}
	if ( f < min || f > max )
	{
		std::cout << "WARNING: line #" << counter << ": " << label << " is out of range. Reset to " << def << std::endl;
		f = def;
	}
	return f;
}

unsigned CConfigure::getUnsigned(const std::string &valuestr, const std::string &label, unsigned min, unsigned max, unsigned def) const
{
	char *end = nullptr;
	auto i = std::strtoul(valuestr.c_str(), &end, 0);
	if (end == valuestr.c_str() || *end || '-' == valuestr.at(0))
	{
		std::cout << "WARNING: line #" << counter << ": " << label << " '" << valuestr << "' is not a number. Reset to " << def << std::endl;
		return def;
	}
	if ( i < min || i > max )
	{
		std::cout << "WARNING: line #" << counter << ": " << label << " is out of range. Reset to " << def << std::endl;
		i = def;
	}
	return unsigned(i);
}

void CConfigure::badParam(const std::string &section, const std::string &key) const
{
	std::cout << "WARNING: line #" << counter << ": Unexpected parameter [" << section << "]" << key << std::endl;
}

void CConfigure::checkPath(const std::string &section, const std::string &key, const std::string &filepath, const std::filesystem::file_type desired_type) const
{
	std::error_code ec;
	const auto rtype = std::filesystem::status(filepath, ec).type();	// follows symbolic links

	if (desired_type == rtype)
		return;

	std::cout << "WARNING: [" << section << ']' << key << " '" << filepath << "' was expected to be ";
	switch (desired_type)
	{
	case std::filesystem::file_type::character:
		std::cout << "a character device";
		break;
	case std::filesystem::file_type::directory:
		std::cout << "a directory";
		break;
	case std::filesystem::file_type::regular:
		std::cout << "a regular file";
		break;
	default:
		std::cout << "something else";
		break;
	}
	std::cout << ", but it ";
	switch (rtype)
	{
	case std::filesystem::file_type::directory:
		std::cout << "is a directory";
		break;
	case std::filesystem::file_type::character:
		std::cout << "is a character device";
		break;
	case std::filesystem::file_type::fifo:
		std::cout << "is a fifo";
		break;
	case std::filesystem::file_type::not_found:
		std::cout << "doesn't exist";
		break;
	case std::filesystem::file_type::regular:
		std::cout << "is a regular file";
		break;
	default:
		std::cout << "is an unexpected file type";
		break;
	}
	std::cout << std::endl;
}

void CConfigure::Dump() const
{
	std::cout << data.dump(4) << std::endl;
}

bool CConfigure::Contains(const std::string &section, const std::string &key) const
{
	return data.contains(section) && data[section].contains(key);
}

std::string CConfigure::GetString(const std::string &section, const std::string &key) const
{
	std::string str;
	if (Contains(section, key))
	{
		if (data[section][key].is_string())
			str.assign(data[section][key].get<std::string>());
		else
			std::cerr << "ERROR: GetString(): [" << section << ']' << key << " is not a string" << std::endl;
	}
	else
		std::cerr << "ERROR: GetString(): item [" << section << ']' << key << " is not defined" << std::endl;
	return str;
}

float CConfigure::GetFloat(const std::string &section, const std::string &key) const
{
	if (Contains(section, key))
	{
		if (data[section][key].is_number())
			return data[section][key].get<float>();
		std::cerr << "ERROR: GetFloat(): [" << section << ']' << key << " is not a number" << std::endl;
	}
	else
		std::cerr << "ERROR: GetFloat(): item [" << section << ']' << key << " is not defined" << std::endl;
	return 0.0f;
}

unsigned CConfigure::GetUnsigned(const std::string &section, const std::string &key) const
{
	if (Contains(section, key))
	{
		if (data[section][key].is_number_unsigned())
			return data[section][key].get<unsigned>();
		std::cerr << "ERROR: GetUnsigned(): [" << section << ']' << key << " is not an unsigned value" << std::endl;
	}
	else
		std::cerr << "ERROR: GetUnsigned(): item [" << section << ']' << key << " is not defined" << std::endl;
	return 0u;
}

void CConfigure::SetString(const std::string &section, const std::string &key, const std::string &value)
{
	data[section][key] = value;
}

void CConfigure::SetFloat(const std::string &section, const std::string &key, float value)
{
	data[section][key] = value;
}

void CConfigure::SetUnsigned(const std::string &section, const std::string &key, unsigned value)
{
	data[section][key] = value;
}
