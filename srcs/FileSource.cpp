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
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <nlohmann/json.hpp>

#include "FileSource.h"
#include "Log.h"

static inline void trim(std::string &s)
{
	s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) {
		return !std::isspace(ch);
	}));
	s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) {
		return !std::isspace(ch);
	}).base(), s.end());
}

// returns true on failure
static bool toDouble(std::string str, double &value)
{
	trim(str);
	if (str.empty())
		return true;
	char *end = nullptr;
	value = std::strtod(str.c_str(), &end);
	return (end == str.c_str() or '\0' != *end or not std::isfinite(value));
}

// returns true on failure
static bool getNumber(const nlohmann::json &obj, const char *key, double &value)
{
	if (not obj.contains(key))
		return true;
	const auto &j = obj[key];
	if (j.is_number())
	{
		value = j.get<double>();
		return false;
	}
	if (j.is_string())
		return toDouble(j.get<std::string>(), value);
	return true;
}

EAcquireError CFileSource::Acquire(double /*timeout*/, std::unique_ptr<CPosition> &pos)
{
	pos.reset();
	if (m_cancelled)
		return EAcquireError::sourceUnavailable;

	std::ifstream file(m_path);
	if (not file.is_open())
	{
		if (ENOENT == errno)
		{
			LogDebug("Position file '%s' does not exist", m_path.c_str());
			notify(ESourceEvent::channelLost, "file not found");
			return EAcquireError::notFound;
		}
		LogWarning("Could not open position file '%s': %s", m_path.c_str(), strerror(errno));
		notify(ESourceEvent::channelLost, "file not readable");
		return EAcquireError::sourceUnavailable;
	}

	std::stringstream ss;
	ss << file.rdbuf();
	file.close();

	auto err = Parse(ss.str(), pos);
	if (EAcquireError::none == err)
	{
		LogDebug("Read %f,%f from %s", pos->GetLatitude(), pos->GetLongitude(), m_path.c_str());
		notify(ESourceEvent::resolved, m_path);
	}
	else
	{
		LogWarning("Position file '%s': %s", m_path.c_str(), ToString(err));
		notify(ESourceEvent::unrecognized, ss.str());
	}
	return err;
}

EAcquireError CFileSource::Parse(const std::string &content, std::unique_ptr<CPosition> &pos)
{
	pos.reset();
	std::string text(content);
	trim(text);
	if (text.empty())
		return EAcquireError::malformed;

	SFixData fix;
	auto doc = nlohmann::json::parse(text, nullptr, false);
	if (not doc.is_discarded() and doc.is_object())
	{
		if (doc.contains("latitude") or doc.contains("longitude"))
		{
			if (getNumber(doc, "latitude", fix.latitude) or getNumber(doc, "longitude", fix.longitude))
				return EAcquireError::malformed;
		}
		else if (getNumber(doc, "lat", fix.latitude) or getNumber(doc, "lon", fix.longitude))
			return EAcquireError::malformed;

		if (not getNumber(doc, "altitude", fix.altitude) or not getNumber(doc, "alt", fix.altitude))
			fix.hasAltitude = true;
	}
	else
	{
		// lat,lon
		auto comma = text.find(',');
		if (std::string::npos == comma)
			return EAcquireError::malformed;
		auto second = text.substr(comma + 1);
		auto next = second.find(',');
		if (std::string::npos != next)
			second.resize(next);
		if (toDouble(text.substr(0, comma), fix.latitude) or toDouble(second, fix.longitude))
			return EAcquireError::malformed;
	}

	fix.mode = fix.hasAltitude ? EFixMode::fix3D : EFixMode::fix2D;
	pos = CPosition::Make(fix);
	if (nullptr == pos)
		return EAcquireError::malformed;
	return EAcquireError::none;
}

bool CFileSource::Save(const std::string &path, const CPosition &position)
{
	nlohmann::json doc;
	doc["latitude"] = position.GetLatitude();
	doc["longitude"] = position.GetLongitude();
	if (position.HasAltitude())
		doc["altitude"] = position.GetAltitude();

	std::ofstream file(path, std::ofstream::out | std::ofstream::trunc);
	if (not file.is_open())
	{
		LogError("Could not open '%s' for writing: %s", path.c_str(), strerror(errno));
		return true;
	}
	file << doc.dump() << std::endl;
	file.close();
	if (file.fail())
	{
		LogError("Could not write the position to '%s'", path.c_str());
		return true;
	}
	LogInfo("Position saved to %s", path.c_str());
	return false;
}
