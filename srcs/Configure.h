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

#include <nlohmann/json.hpp>
#include <filesystem>
#include <istream>
#include <string>

#include "JsonKeys.h"

extern SJsonKeys g_Keys;

enum class ESection { none, gps, sites, log };

// Every key has a built-in default, an ini file only needs what it changes
// and the command line can override both.
class CConfigure
{
public:
	CConfigure();
	void SetDefaults();
	// these return true on failure
	bool ReadData(const std::string &path);
	bool ReadData(std::istream &is, const std::string &name);
	bool Validate() const;

	bool Contains(const std::string &section, const std::string &key) const;
	void Dump() const;
	std::string GetString(const std::string &section, const std::string &key) const;
	float GetFloat(const std::string &section, const std::string &key) const;
	unsigned GetUnsigned(const std::string &section, const std::string &key) const;
	const nlohmann::json &GetData() const { return data; }

	void SetString(const std::string &section, const std::string &key, const std::string &value);
	void SetFloat(const std::string &section, const std::string &key, float value);
	void SetUnsigned(const std::string &section, const std::string &key, unsigned value);

private:
	unsigned counter;
	nlohmann::json data;

	unsigned getUnsigned(const std::string &value, const std::string &label, unsigned min, unsigned max, unsigned defaultvalue) const;
	float getFloat(const std::string &value, const std::string &label, float min, float max, float defaultValue) const;
	void badParam(const std::string &section, const std::string &key) const;
	void checkPath(const std::string &section, const std::string &key, const std::string &filepath, const std::filesystem::file_type type) const;
};
