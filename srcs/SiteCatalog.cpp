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
#include <cmath>
#include <fstream>
#include <algorithm>
#include <nlohmann/json.hpp>

#include "SiteCatalog.h"
#include "GeoMath.h"
#include "Log.h"

// the trs_sites column layout, frequencies start at FIRST_FREQ
enum ECsvColumn { RFSS, SITE_DEC, SITE_HEX, SITE_NAC, DESCRIPTION, COUNTY, LAT, LON, RANGE, FIRST_FREQ };

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

static inline void trim(std::string &s)
{
	ltrim(s);
	rtrim(s);
}

// returns true on failure
static bool toDouble(const std::string &str, double &value)
{
	if (str.empty())
		return true;
	char *end = nullptr;
	value = std::strtod(str.c_str(), &end);
	if (end == str.c_str() or '\0' != *end or not std::isfinite(value))
		return true;
	return false;
}

// a JSON coordinate can be a number or a numeric string
static bool jsonToDouble(const nlohmann::json &j, double &value)
{
	if (j.is_number())
	{
		value = j.get<double>();
		return false;
	}
	if (j.is_string())
	{
		auto s = j.get<std::string>();
		trim(s);
		return toDouble(s, value);
	}
	return true;
}

void CSiteCatalog::clear()
{
	m_sites.clear();
	m_warnings.clear();
}

void CSiteCatalog::skip(const std::string &name, unsigned record, const std::string &why)
{
	const std::string warning(name + " record " + std::to_string(record) + ": " + why + ", skipped");
	LogWarning("%s", warning.c_str());
	m_warnings.push_back(warning);
}

bool CSiteCatalog::ClassifyFrequency(const std::string &raw, SFrequency &freq)
{
	std::string text(raw);
	trim(text);
	if (text.empty())
		return true;

	const char last = text.back();
	freq.isControl = ('c' == last or 'C' == last);
	if (freq.isControl)
	{
		text.pop_back();
		rtrim(text);
	}

	double mhz;
	if (toDouble(text, mhz) or mhz <= 0.0)
		return true;

	freq.text.assign(text);
	return false;
}

void CSiteCatalog::addFrequency(SSite &site, const std::string &raw)
{
	SFrequency freq;
	if (ClassifyFrequency(raw, freq))
	{
		LogDebug("Ignoring frequency '%s' at %s", raw.c_str(), site.description.c_str());
		return;
	}
	site.frequencies.push_back(freq);
}

void CSiteCatalog::SplitCSV(const std::string &line, std::vector<std::string> &fields)
{
	fields.clear();
	std::string field;
	bool quoted = false;
	for (std::size_t i=0; i<line.size(); i++)
	{
		const char c = line[i];
		if (quoted)
		{
			if ('"' == c)
			{
				if (i+1 < line.size() and '"' == line[i+1])
				{
					field.push_back('"');
					i++;
				}
				else
					quoted = false;
			}
			else
				field.push_back(c);
		}
		else if ('"' == c)
			quoted = true;
		else if (',' == c)
		{
			fields.push_back(field);
			field.clear();
		}
		else if ('\r' != c)
			field.push_back(c);
	}
	fields.push_back(field);
}

bool CSiteCatalog::LoadCSV(const std::string &path)
{
	std::ifstream file(path);
	if (not file.is_open())
	{
		LogError("Could not open site file '%s'", path.c_str());
		return true;
	}
	return LoadCSV(file, path);
}

bool CSiteCatalog::LoadCSV(std::istream &is, const std::string &name)
{
	clear();
	std::string line;
	std::vector<std::string> fields;
	bool header = true;
	unsigned record = 0u;

	while (std::getline(is, line))
	{
		std::string check(line);
		trim(check);
		if (check.empty())
			continue;
		if (header)
		{
			// column names
			header = false;
			continue;
		}
		record++;

		SplitCSV(line, fields);
		for (auto &f : fields)
			trim(f);

		if (fields.size() <= LON or fields[LAT].empty() or fields[LON].empty())
		{
			skip(name, record, "missing latitude or longitude");
			continue;
		}

		SSite site;
		if (toDouble(fields[LAT], site.latitude) or toDouble(fields[LON], site.longitude))
		{
			skip(name, record, "unreadable coordinates '" + fields[LAT] + "," + fields[LON] + "'");
			continue;
		}
		if (not CGeoMath::IsValid(SLatLon { site.latitude, site.longitude }))
		{
			skip(name, record, "coordinates out of range");
			continue;
		}

		site.description.assign(fields[DESCRIPTION].empty() ? "Unknown" : fields[DESCRIPTION]);
		site.county.assign(fields[COUNTY]);
		site.attributes["rfss"]     = fields[RFSS];
		site.attributes["site_dec"] = fields[SITE_DEC];
		site.attributes["site_hex"] = fields[SITE_HEX];
		site.attributes["nac"]      = fields[SITE_NAC];
		site.attributes["range"]    = (fields.size() > RANGE) ? fields[RANGE] : std::string();

		for (std::size_t i=FIRST_FREQ; i<fields.size(); i++)
		{
			if (not fields[i].empty())
				addFrequency(site, fields[i]);
		}
		m_sites.push_back(std::move(site));
	}

	if (is.bad())
	{
		LogError("Read error in '%s'", name.c_str());
		return true;
	}
	LogInfo("Loaded %u sites from %s, %u skipped", unsigned(m_sites.size()), name.c_str(), unsigned(m_warnings.size()));
	return false;
}

bool CSiteCatalog::LoadJSON(const std::string &path)
{
	std::ifstream file(path);
	if (not file.is_open())
	{
		LogError("Could not open site file '%s'", path.c_str());
		return true;
	}
	return LoadJSON(file, path);
}

bool CSiteCatalog::LoadJSON(std::istream &is, const std::string &name)
{
	clear();
	auto doc = nlohmann::json::parse(is, nullptr, false);
	if (doc.is_discarded())
	{
		LogError("'%s' is not valid JSON", name.c_str());
		return true;
	}
	if (not doc.is_array())
	{
		LogError("'%s' should hold an array of sites", name.c_str());
		return true;
	}

	unsigned record = 0u;
	for (const auto &item : doc)
	{
		record++;
		if (not item.is_object())
		{
			skip(name, record, "not an object");
			continue;
		}
		if (not item.contains("latitude") or not item.contains("longitude"))
		{
			skip(name, record, "missing latitude or longitude");
			continue;
		}

		SSite site;
		if (jsonToDouble(item["latitude"], site.latitude) or jsonToDouble(item["longitude"], site.longitude))
		{
			skip(name, record, "unreadable coordinates");
			continue;
		}
		if (not CGeoMath::IsValid(SLatLon { site.latitude, site.longitude }))
		{
			skip(name, record, "coordinates out of range");
			continue;
		}

		site.description.assign("Unknown");
		for (const auto &member : item.items())
		{
			const auto &key = member.key();
			const auto &value = member.value();
			if (0 == key.compare("description"))
			{
				if (value.is_string())
					site.description.assign(value.get<std::string>());
			}
			else if (0 == key.compare("county"))
			{
				if (value.is_string())
					site.county.assign(value.get<std::string>());
			}
			else if (0 == key.compare("control_frequencies") or 0 == key.compare("frequencies"))
				continue;
			else if (0 == key.compare("latitude") or 0 == key.compare("longitude"))
				continue;
			else if (value.is_string())
				site.attributes[key] = value.get<std::string>();
			else if (value.is_primitive() and not value.is_null())
				site.attributes[key] = value.dump();
		}

		// "frequencies" is only used when "control_frequencies" is missing
		const char *listkey = item.contains("control_frequencies") ? "control_frequencies" : "frequencies";
		if (item.contains(listkey) and item[listkey].is_array())
		{
			for (const auto &f : item[listkey])
			{
				if (f.is_string())
					addFrequency(site, f.get<std::string>());
				else if (f.is_number())
					addFrequency(site, f.dump());
			}
		}
		m_sites.push_back(std::move(site));
	}

	LogInfo("Loaded %u sites from %s, %u skipped", unsigned(m_sites.size()), name.c_str(), unsigned(m_warnings.size()));
	return false;
}
